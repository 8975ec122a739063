#include "anim/playback_clock.hpp"

#include <algorithm>
#include <cmath>
#include <motionline/logger.hpp>

#include "timeline/timeline_model.hpp"

namespace motionline
{

namespace
{

constexpr double STEP_EPSILON = 1e-9;

}   // anonymous namespace

const char* playback_state_name(PlaybackState state)
{
    switch (state)
    {
        case PlaybackState::Stopped:
            return "stopped";
        case PlaybackState::Playing:
            return "playing";
        case PlaybackState::Paused:
            return "paused";
    }
    return "stopped";
}

PlaybackClock::PlaybackClock(TimelineModel& model) : model_(model) {}

PlaybackClock::PlaybackClock(TimelineModel& model, const TimelineConfig& config) : model_(model)
{
    if (std::isfinite(config.speed) && config.speed > 0.0)
        speed_ = config.speed;
    if (std::isfinite(config.tick_interval) && config.tick_interval > 0.0)
        tick_interval_ = config.tick_interval;
    fps_          = std::clamp(config.fps, 1.0, TimelineConfig::MAX_FPS);
    loop_enabled_ = config.loop_enabled;
    sync_source_  = config.sync_source;
}

// ─── Transport ───────────────────────────────────────────────────────────────

void PlaybackClock::play()
{
    std::optional<double> restart_at;
    PlaybackCallback      cb;
    {
        std::lock_guard lock(mutex_);
        if (state_ == PlaybackState::Playing)
            return;

        if (state_ == PlaybackState::Stopped)
        {
            double duration = model_.total_duration();
            double end      = loop_enabled_ ? effective_loop_out(duration) : duration;
            if (model_.current_time() >= end)
                restart_at = loop_enabled_ ? effective_loop_in(duration) : 0.0;
        }
        state_       = PlaybackState::Playing;
        accumulator_ = 0.0;
        last_pump_.reset();
        cb = on_state_change_;
    }

    if (restart_at)
    {
        model_.set_current_time(*restart_at);
        fire_time(model_.current_time());
    }
    MOTIONLINE_LOG_INFO("playback", "playing from {}s", model_.current_time());
    if (cb)
        cb(PlaybackState::Playing);
}

void PlaybackClock::pause()
{
    {
        std::lock_guard lock(mutex_);
        if (state_ != PlaybackState::Playing)
            return;
    }
    set_state(PlaybackState::Paused);
    MOTIONLINE_LOG_INFO("playback", "paused at {}s", model_.current_time());
}

void PlaybackClock::stop()
{
    set_state(PlaybackState::Stopped);
    model_.set_current_time(0.0);
    fire_time(0.0);
    MOTIONLINE_LOG_INFO("playback", "stopped");
}

void PlaybackClock::toggle_play()
{
    if (is_playing())
        pause();
    else
        play();
}

PlaybackState PlaybackClock::state() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

bool PlaybackClock::is_playing() const
{
    std::lock_guard lock(mutex_);
    return state_ == PlaybackState::Playing;
}

// ─── Playhead ────────────────────────────────────────────────────────────────

double PlaybackClock::current_time() const
{
    return model_.current_time();
}

void PlaybackClock::seek(double time)
{
    if (!std::isfinite(time))
        return;
    model_.set_current_time(time);
    fire_time(model_.current_time());
}

void PlaybackClock::step_forward()
{
    seek(current_time() + 1.0 / fps());
}

void PlaybackClock::step_backward()
{
    seek(current_time() - 1.0 / fps());
}

uint32_t PlaybackClock::current_frame() const
{
    return static_cast<uint32_t>(std::floor(current_time() * fps() + STEP_EPSILON));
}

// ─── Ticking ─────────────────────────────────────────────────────────────────

bool PlaybackClock::tick()
{
    double interval;
    {
        std::lock_guard lock(mutex_);
        interval = tick_interval_;
    }
    return advance(interval);
}

bool PlaybackClock::advance(double frame_delta)
{
    if (ticking_.exchange(true))
    {
        MOTIONLINE_LOG_TRACE("playback", "tick ignored: previous tick still running");
        return is_playing();
    }
    struct TickGuard
    {
        std::atomic<bool>& flag;
        ~TickGuard() { flag.store(false); }
    } guard{ticking_};

    double           next;
    bool             wrapped  = false;
    bool             finished = false;
    PlaybackCallback state_cb;
    {
        std::lock_guard lock(mutex_);
        if (state_ != PlaybackState::Playing)
            return false;
        if (sync_source_ == SyncSource::Audio)
            return true;
        if (!std::isfinite(frame_delta) || frame_delta < 0.0)
            return true;

        double duration = model_.total_duration();
        double start    = loop_enabled_ ? effective_loop_in(duration) : 0.0;
        double end      = loop_enabled_ ? effective_loop_out(duration) : duration;

        next = model_.current_time() + frame_delta * speed_;
        if (next >= end)
        {
            if (loop_enabled_)
            {
                double span = end - start;
                next        = span > 0.0 ? start + std::fmod(next - end, span) : start;
                wrapped     = true;
            }
            else
            {
                next     = end;
                state_   = PlaybackState::Stopped;
                finished = true;
                state_cb = on_state_change_;
            }
        }
    }

    model_.set_current_time(next);
    if (wrapped)
        MOTIONLINE_LOG_DEBUG("playback", "loop wrapped to {}s", next);
    if (finished)
    {
        MOTIONLINE_LOG_INFO("playback", "reached end at {}s", next);
        if (state_cb)
            state_cb(PlaybackState::Stopped);
    }
    fire_time(model_.current_time());
    return !finished;
}

size_t PlaybackClock::pump(std::chrono::steady_clock::time_point now)
{
    double interval;
    {
        std::lock_guard lock(mutex_);
        if (state_ != PlaybackState::Playing)
        {
            last_pump_.reset();
            accumulator_ = 0.0;
            return 0;
        }
        if (!last_pump_)
        {
            last_pump_ = now;
            return 0;
        }
        double elapsed = std::chrono::duration<double>(now - *last_pump_).count();
        last_pump_     = now;
        accumulator_ += std::clamp(elapsed, 0.0, MAX_CATCH_UP);
        interval = tick_interval_;
    }

    size_t ticks = 0;
    while (true)
    {
        {
            std::lock_guard lock(mutex_);
            if (accumulator_ + STEP_EPSILON < interval)
                break;
            accumulator_ -= interval;
        }
        ++ticks;
        if (!advance(interval))
        {
            std::lock_guard lock(mutex_);
            accumulator_ = 0.0;
            last_pump_.reset();
            break;
        }
    }
    return ticks;
}

double PlaybackClock::tick_interval() const
{
    std::lock_guard lock(mutex_);
    return tick_interval_;
}

bool PlaybackClock::set_tick_interval(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0)
        return false;
    std::lock_guard lock(mutex_);
    tick_interval_ = seconds;
    return true;
}

// ─── Speed ───────────────────────────────────────────────────────────────────

double PlaybackClock::speed() const
{
    std::lock_guard lock(mutex_);
    return speed_;
}

bool PlaybackClock::set_speed(double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0)
    {
        MOTIONLINE_LOG_WARN("playback", "rejected playback speed {}", factor);
        return false;
    }
    std::lock_guard lock(mutex_);
    speed_ = factor;
    return true;
}

double PlaybackClock::speed_up()
{
    std::lock_guard lock(mutex_);
    for (double step : SPEED_STEPS)
    {
        if (step > speed_ + STEP_EPSILON)
        {
            speed_ = step;
            break;
        }
    }
    return speed_;
}

double PlaybackClock::speed_down()
{
    std::lock_guard lock(mutex_);
    for (auto it = SPEED_STEPS.rbegin(); it != SPEED_STEPS.rend(); ++it)
    {
        if (*it < speed_ - STEP_EPSILON)
        {
            speed_ = *it;
            break;
        }
    }
    return speed_;
}

// ─── Loop ────────────────────────────────────────────────────────────────────

bool PlaybackClock::loop_enabled() const
{
    std::lock_guard lock(mutex_);
    return loop_enabled_;
}

void PlaybackClock::set_loop_enabled(bool enabled)
{
    std::lock_guard lock(mutex_);
    loop_enabled_ = enabled;
}

bool PlaybackClock::set_loop_region(double in, double out)
{
    if (!std::isfinite(in) || !std::isfinite(out))
        return false;

    double duration = model_.total_duration();
    in              = std::max(0.0, in);
    out             = std::min(out, duration);
    if (!(out > in))
        return false;

    std::lock_guard lock(mutex_);
    loop_in_         = in;
    loop_out_        = out;
    has_loop_region_ = true;
    return true;
}

void PlaybackClock::clear_loop_region()
{
    std::lock_guard lock(mutex_);
    has_loop_region_ = false;
    loop_in_         = 0.0;
    loop_out_        = 0.0;
}

bool PlaybackClock::has_loop_region() const
{
    std::lock_guard lock(mutex_);
    return has_loop_region_;
}

double PlaybackClock::loop_in() const
{
    double          duration = model_.total_duration();
    std::lock_guard lock(mutex_);
    return effective_loop_in(duration);
}

double PlaybackClock::loop_out() const
{
    double          duration = model_.total_duration();
    std::lock_guard lock(mutex_);
    return effective_loop_out(duration);
}

// ─── Frame rate ──────────────────────────────────────────────────────────────

double PlaybackClock::fps() const
{
    std::lock_guard lock(mutex_);
    return fps_;
}

void PlaybackClock::set_fps(double fps)
{
    if (!std::isfinite(fps))
        return;
    std::lock_guard lock(mutex_);
    fps_ = std::clamp(fps, 1.0, TimelineConfig::MAX_FPS);
}

// ─── Audio sync ──────────────────────────────────────────────────────────────

SyncSource PlaybackClock::sync_source() const
{
    std::lock_guard lock(mutex_);
    return sync_source_;
}

void PlaybackClock::set_sync_source(SyncSource source)
{
    {
        std::lock_guard lock(mutex_);
        sync_source_ = source;
        accumulator_ = 0.0;
        last_pump_.reset();
    }
    MOTIONLINE_LOG_DEBUG("playback", "sync source: {}", sync_source_name(source));
}

void PlaybackClock::on_audio_position(double seconds)
{
    if (!std::isfinite(seconds))
        return;

    bool playing;
    bool loop;
    {
        std::lock_guard lock(mutex_);
        if (sync_source_ != SyncSource::Audio)
            return;
        playing = state_ == PlaybackState::Playing;
        loop    = loop_enabled_;
    }

    model_.set_current_time(seconds);
    double now = model_.current_time();
    if (playing && !loop && now >= model_.total_duration())
    {
        set_state(PlaybackState::Stopped);
        MOTIONLINE_LOG_INFO("playback", "audio reached end at {}s", now);
    }
    fire_time(now);
}

bool PlaybackClock::on_audio_duration_known(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0)
    {
        MOTIONLINE_LOG_WARN("playback", "ignored audio duration {}", seconds);
        return false;
    }
    model_.set_total_duration(seconds);
    MOTIONLINE_LOG_INFO("playback", "audio duration {}s applied to timeline", seconds);
    return true;
}

// ─── Callbacks ───────────────────────────────────────────────────────────────

void PlaybackClock::set_on_state_change(PlaybackCallback cb)
{
    std::lock_guard lock(mutex_);
    on_state_change_ = std::move(cb);
}

void PlaybackClock::set_on_time_change(ClockTimeCallback cb)
{
    std::lock_guard lock(mutex_);
    on_time_change_ = std::move(cb);
}

// ─── Internal helpers ────────────────────────────────────────────────────────

double PlaybackClock::effective_loop_in(double duration) const
{
    // Caller must hold mutex_
    if (has_loop_region_ && loop_in_ < std::min(loop_out_, duration))
        return loop_in_;
    return 0.0;
}

double PlaybackClock::effective_loop_out(double duration) const
{
    // Caller must hold mutex_
    if (has_loop_region_ && loop_in_ < std::min(loop_out_, duration))
        return std::min(loop_out_, duration);
    return duration;
}

void PlaybackClock::set_state(PlaybackState state)
{
    PlaybackCallback cb;
    {
        std::lock_guard lock(mutex_);
        if (state_ == state)
            return;
        state_       = state;
        accumulator_ = 0.0;
        last_pump_.reset();
        cb = on_state_change_;
    }
    if (cb)
        cb(state);
}

void PlaybackClock::fire_time(double time)
{
    ClockTimeCallback cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_time_change_;
    }
    if (cb)
        cb(time);
}

}   // namespace motionline
