#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <motionline/fwd.hpp>
#include <mutex>
#include <optional>

#include "core/timeline_config.hpp"

namespace motionline
{

enum class PlaybackState
{
    Stopped,
    Playing,
    Paused,
};

const char* playback_state_name(PlaybackState state);

using PlaybackCallback  = std::function<void(PlaybackState)>;
using ClockTimeCallback = std::function<void(double time)>;

// PlaybackClock — advances the model's playhead in fixed ticks.
//
// Each tick moves the playhead by tick_interval * speed (50 ms at 1x by
// default), independent of the host's frame rate. pump() converts wall-clock
// time into whole ticks. At the end of the timeline (or of the loop region)
// the playhead wraps to the start when looping, otherwise it is clamped to
// the end and the clock stops.
//
// With SyncSource::Audio, ticks do not move time; the audio transport's
// position events do.
//
// Ticks are serialized: a tick requested from inside a tick callback is
// ignored. The model must outlive the clock.
class PlaybackClock
{
   public:
    static constexpr double DEFAULT_TICK_INTERVAL = 0.05;
    static constexpr double MAX_CATCH_UP          = 0.25;   // seconds of ticks per pump
    static constexpr std::array<double, 5> SPEED_STEPS{0.25, 0.5, 1.0, 1.5, 2.0};

    explicit PlaybackClock(TimelineModel& model);
    PlaybackClock(TimelineModel& model, const TimelineConfig& config);
    ~PlaybackClock() = default;

    PlaybackClock(const PlaybackClock&)            = delete;
    PlaybackClock& operator=(const PlaybackClock&) = delete;

    // ─── Transport ───────────────────────────────────────────────────────

    // From Stopped at (or past) the end, playback restarts at the loop start.
    void play();
    void pause();
    // Resets the playhead to 0.
    void stop();
    void toggle_play();

    PlaybackState state() const;
    bool          is_playing() const;

    // ─── Playhead ────────────────────────────────────────────────────────

    double current_time() const;

    // Move the playhead (clamped to [0, duration]); state is unchanged.
    void seek(double time);

    void step_forward();
    void step_backward();

    uint32_t current_frame() const;

    // ─── Ticking ─────────────────────────────────────────────────────────

    // One fixed tick. Returns true while still playing afterwards.
    bool tick();

    // Advance by frame_delta * speed. Returns true while still playing.
    bool advance(double frame_delta);

    // Run as many whole ticks as the wall-clock time since the previous
    // pump allows (at most MAX_CATCH_UP worth). Returns the tick count.
    size_t pump(std::chrono::steady_clock::time_point now);

    double tick_interval() const;
    bool   set_tick_interval(double seconds);   // false for <= 0

    // ─── Speed ───────────────────────────────────────────────────────────

    double speed() const;

    // Rejects (returns false, logs) factors <= 0 or non-finite.
    bool set_speed(double factor);

    // Next step up/down in SPEED_STEPS; returns the new speed.
    double speed_up();
    double speed_down();

    // ─── Loop ────────────────────────────────────────────────────────────

    bool loop_enabled() const;
    void set_loop_enabled(bool enabled);

    // Loop region [in, out), defaults to [0, duration]. Returns false when
    // the clamped region is empty.
    bool   set_loop_region(double in, double out);
    void   clear_loop_region();
    bool   has_loop_region() const;
    double loop_in() const;
    double loop_out() const;

    // ─── Frame rate ──────────────────────────────────────────────────────

    double fps() const;
    void   set_fps(double fps);   // clamped to [1, TimelineConfig::MAX_FPS]

    // ─── Audio sync ──────────────────────────────────────────────────────

    SyncSource sync_source() const;
    void       set_sync_source(SyncSource source);

    // Audio transport position; drives the playhead while synced to audio.
    void on_audio_position(double seconds);

    // Audio length became known; becomes the model duration. Returns false
    // (and logs) for a non-positive value.
    bool on_audio_duration_known(double seconds);

    // ─── Callbacks ───────────────────────────────────────────────────────

    void set_on_state_change(PlaybackCallback cb);

    // Fired after every tick and seek with the new playhead time.
    void set_on_time_change(ClockTimeCallback cb);

   private:
    TimelineModel& model_;

    mutable std::mutex mutex_;
    PlaybackState      state_         = PlaybackState::Stopped;
    double             speed_         = 1.0;
    double             tick_interval_ = DEFAULT_TICK_INTERVAL;
    double             fps_           = 30.0;
    bool               loop_enabled_  = false;
    SyncSource         sync_source_   = SyncSource::Internal;

    bool   has_loop_region_ = false;
    double loop_in_         = 0.0;
    double loop_out_        = 0.0;

    double                                               accumulator_ = 0.0;
    std::optional<std::chrono::steady_clock::time_point> last_pump_;

    std::atomic<bool> ticking_{false};

    PlaybackCallback  on_state_change_;
    ClockTimeCallback on_time_change_;

    // Caller must hold mutex_
    double effective_loop_in(double duration) const;
    double effective_loop_out(double duration) const;

    void set_state(PlaybackState state);
    void fire_time(double time);
};

}   // namespace motionline
