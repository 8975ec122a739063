#include "ui/timeline_interaction.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <motionline/errors.hpp>
#include <motionline/logger.hpp>
#include <optional>

#include "timeline/timeline_history.hpp"
#include "timeline/timeline_model.hpp"

namespace motionline
{

namespace
{

constexpr double INF = std::numeric_limits<double>::infinity();

// Start at or next to `start` from which start + span is exact, so a dragged
// segment keeps its duration bit for bit and still fits in [0, total].
std::optional<double> exact_drag_start(double start, double span, double total)
{
    auto fits = [&](double s) { return s >= 0.0 && s + span <= total && (s + span) - s == span; };
    if (fits(start))
        return start;

    double end  = start + span;
    double grid = std::nextafter(end, INF) - end;
    double base = std::floor(start / grid) * grid;
    for (double s : {base, base + grid, base - grid})
    {
        if (fits(s))
            return s;
    }
    return std::nullopt;
}

// Push a resized edge away from the fixed one until the gap is at least
// min_gap. nullopt when no such edge lies within [0, total].
std::optional<double> widen_to_gap(double edge, double fixed, double min_gap, double total)
{
    bool before = edge < fixed;
    auto gap    = [&] { return before ? fixed - edge : edge - fixed; };
    for (int i = 0; i < 4 && gap() < min_gap; ++i)
        edge = std::nextafter(edge, before ? -INF : INF);
    if (gap() < min_gap || edge < 0.0 || edge > total)
        return std::nullopt;
    return edge;
}

}   // anonymous namespace

const char* interaction_state_name(InteractionState state)
{
    switch (state)
    {
        case InteractionState::Idle:
            return "idle";
        case InteractionState::Selecting:
            return "selecting";
        case InteractionState::Dragging:
            return "dragging";
        case InteractionState::ResizingStart:
            return "resizing-start";
        case InteractionState::ResizingEnd:
            return "resizing-end";
        case InteractionState::CreatingSegment:
            return "creating";
    }
    return "idle";
}

TimelineInteractionController::TimelineInteractionController(TimelineModel&        model,
                                                             const TimelineConfig& config)
    : model_(model), config_(config)
{
    config_.sanitize();
}

// ─── Layout ──────────────────────────────────────────────────────────────────

double TimelineInteractionController::x_to_time(double x) const
{
    return view_start_ + x / config_.pixels_per_second;
}

double TimelineInteractionController::time_to_x(double time) const
{
    return (time - view_start_) * config_.pixels_per_second;
}

uint32_t TimelineInteractionController::track_count() const
{
    return std::max(config_.track_count, model_.used_track_count());
}

std::optional<uint32_t> TimelineInteractionController::y_to_track(double y) const
{
    if (!std::isfinite(y) || y < config_.ruler_height)
        return std::nullopt;

    double lane = config_.track_height + config_.track_spacing;
    double rel  = y - config_.ruler_height;
    double slot = std::floor(rel / lane);
    if (slot >= static_cast<double>(track_count()))
        return std::nullopt;

    // Inside the gap below a lane
    if (rel - slot * lane >= config_.track_height)
        return std::nullopt;
    return static_cast<uint32_t>(slot);
}

double TimelineInteractionController::track_top(uint32_t track_index) const
{
    return config_.ruler_height
           + static_cast<double>(track_index) * (config_.track_height + config_.track_spacing);
}

void TimelineInteractionController::set_zoom(double pixels_per_second)
{
    if (!std::isfinite(pixels_per_second))
        return;
    config_.pixels_per_second =
        std::clamp(pixels_per_second, TimelineConfig::MIN_ZOOM, TimelineConfig::MAX_ZOOM);
}

void TimelineInteractionController::zoom_in()
{
    set_zoom(config_.pixels_per_second * 1.25);
}

void TimelineInteractionController::zoom_out()
{
    set_zoom(config_.pixels_per_second / 1.25);
}

void TimelineInteractionController::set_view_start(double seconds)
{
    if (std::isfinite(seconds))
        view_start_ = std::max(0.0, seconds);
}

// ─── Snapping ────────────────────────────────────────────────────────────────

double TimelineInteractionController::snap_time(double time) const
{
    switch (config_.snap_mode)
    {
        case SnapMode::Frame:
            return std::round(time * config_.fps) / config_.fps;
        case SnapMode::Grid:
            return std::round(time / config_.time_precision) * config_.time_precision;
        case SnapMode::None:
            break;
    }
    return time;
}

double TimelineInteractionController::snapped(double time, const Modifiers& mods) const
{
    return mods.alt ? time : snap_time(time);
}

// ─── Hit testing ─────────────────────────────────────────────────────────────

HitResult TimelineInteractionController::hit_test(double x, double y) const
{
    HitResult hit;
    hit.time  = x_to_time(x);
    hit.track = y_to_track(y);
    if (!hit.track)
        return hit;

    // Edges first: the nearest edge within tolerance wins, earlier segments
    // win ties between segments, the end edge wins ties within one.
    double best = std::numeric_limits<double>::infinity();
    for (const auto& seg : model_.segments())
    {
        if (!seg.visible || seg.track_index != *hit.track)
            continue;

        double ds = std::abs(x - time_to_x(seg.start_time));
        double de = std::abs(x - time_to_x(seg.end_time));
        if (ds >= config_.edge_tolerance_px && de >= config_.edge_tolerance_px)
            continue;

        HitZone zone = de <= ds ? HitZone::EndEdge : HitZone::StartEdge;
        double  dist = std::min(ds, de);
        if (dist < best)
        {
            best     = dist;
            hit.id   = seg.id;
            hit.zone = zone;
        }
    }
    if (hit.id != INVALID_SEGMENT_ID)
        return hit;

    if (auto seg = model_.segment_at(hit.time, *hit.track))
    {
        hit.id   = seg->id;
        hit.zone = HitZone::Body;
    }
    return hit;
}

CursorShape TimelineInteractionController::cursor_at(double x, double y) const
{
    auto hit = hit_test(x, y);
    if (hit.id == INVALID_SEGMENT_ID)
        return CursorShape::Arrow;

    auto seg = model_.segment(hit.id);
    if (!seg || seg->locked)
        return CursorShape::Arrow;
    return hit.zone == HitZone::Body ? CursorShape::Move : CursorShape::ResizeHorizontal;
}

// ─── Pointer input ───────────────────────────────────────────────────────────

PointerResult TimelineInteractionController::pointer_down(const PointerEvent& ev)
{
    if (state_ != InteractionState::Idle)
        cancel();

    auto hit = hit_test(ev.x, ev.y);

    // Ruler, lane gaps and the area below the tracks seek the playhead
    if (!hit.track)
    {
        double t = std::clamp(hit.time, 0.0, model_.total_duration());
        model_.set_current_time(t);
        if (on_time_clicked_)
            on_time_clicked_(t);
        return result(true);
    }

    if (hit.id == INVALID_SEGMENT_ID)
    {
        model_.clear_selection();
        begin_create(ev.x, *hit.track, ev.modifiers);
        return result(true);
    }

    auto seg = model_.segment(hit.id);
    if (!seg)
        return result(false);

    model_.select(seg->id);
    if (on_selected_)
        on_selected_(seg->id);

    anchor_id_    = seg->id;
    anchor_x_     = ev.x;
    anchor_start_ = seg->start_time;
    anchor_end_   = seg->end_time;
    moved_        = false;
    preview_      = GesturePreview{seg->id, seg->track_index, seg->start_time, seg->end_time};

    bool stranded = seg->end_time > model_.total_duration();
    if (stranded)
        MOTIONLINE_LOG_DEBUG("interaction", "segment {} ends past the timeline; select only", seg->id);

    if (seg->locked || stranded || ev.modifiers.shift || ev.modifiers.ctrl)
        state_ = InteractionState::Selecting;
    else if (hit.zone == HitZone::StartEdge)
        state_ = InteractionState::ResizingStart;
    else if (hit.zone == HitZone::EndEdge)
        state_ = InteractionState::ResizingEnd;
    else
        state_ = InteractionState::Dragging;

    MOTIONLINE_LOG_DEBUG("interaction", "{} segment {}", interaction_state_name(state_), seg->id);
    auto r    = result(true);
    r.segment = seg->id;
    return r;
}

PointerResult TimelineInteractionController::pointer_move(const PointerEvent& ev)
{
    if (state_ == InteractionState::Idle)
    {
        auto r   = result(false);
        r.cursor = cursor_at(ev.x, ev.y);
        return r;
    }
    if (state_ == InteractionState::Selecting)
        return result(true);

    if (ev.x != anchor_x_)
        moved_ = true;

    // Edges follow the pointer's movement from the press, snapped only once
    // it has moved.
    double total = model_.total_duration();
    double gap   = config_.min_segment_duration;
    double delta = (ev.x - anchor_x_) / config_.pixels_per_second;
    auto   edge  = [&](double t) { return moved_ ? snapped(t, ev.modifiers) : t; };

    switch (state_)
    {
        case InteractionState::Dragging:
        {
            double span  = anchor_end_ - anchor_start_;
            double start = std::clamp(edge(anchor_start_ + delta), 0.0, std::max(0.0, total - span));
            if (auto exact = exact_drag_start(start, span, total))
                update_preview(*exact, *exact + span);
            break;
        }
        case InteractionState::ResizingStart:
        {
            double start = std::max(0.0, std::min(edge(anchor_start_ + delta), anchor_end_ - gap));
            if (auto widened = widen_to_gap(start, anchor_end_, gap, total))
                update_preview(*widened, anchor_end_);
            else
                update_preview(anchor_start_, anchor_end_);
            break;
        }
        case InteractionState::ResizingEnd:
        {
            double end = std::min(total, std::max(edge(anchor_end_ + delta), anchor_start_ + gap));
            if (auto widened = widen_to_gap(end, anchor_start_, gap, total))
                update_preview(anchor_start_, *widened);
            else
                update_preview(anchor_start_, anchor_end_);
            break;
        }
        case InteractionState::CreatingSegment:
        {
            if (!moved_)
                break;
            double t   = snapped(x_to_time(ev.x), ev.modifiers);
            double end = std::min(total, std::max(t, anchor_start_ + gap));
            if (auto widened = widen_to_gap(end, anchor_start_, gap, total))
                update_preview(anchor_start_, *widened);
            break;
        }
        default:
            break;
    }

    auto r    = result(true);
    r.segment = anchor_id_;
    return r;
}

PointerResult TimelineInteractionController::pointer_up(const PointerEvent& ev)
{
    switch (state_)
    {
        case InteractionState::Idle:
            return result(false);
        case InteractionState::Selecting:
        {
            SegmentId id = anchor_id_;
            reset_gesture();
            auto r    = result(true);
            r.segment = id;
            return r;
        }
        case InteractionState::CreatingSegment:
            pointer_move(ev);
            return commit_create();
        default:
            pointer_move(ev);
            return commit_range();
    }
}

SegmentId TimelineInteractionController::double_click(const PointerEvent& ev)
{
    auto hit = hit_test(ev.x, ev.y);
    if (hit.id != INVALID_SEGMENT_ID && on_double_clicked_)
        on_double_clicked_(hit.id);
    return hit.id;
}

bool TimelineInteractionController::cancel()
{
    if (state_ == InteractionState::Idle)
        return false;
    MOTIONLINE_LOG_DEBUG("interaction", "cancelled {}", interaction_state_name(state_));
    reset_gesture();
    return true;
}

// ─── Context actions ─────────────────────────────────────────────────────────

std::optional<SegmentId> TimelineInteractionController::duplicate_at(double x, double y)
{
    auto hit = hit_test(x, y);
    if (hit.id == INVALID_SEGMENT_ID)
        return std::nullopt;

    auto copy = model_.duplicate_segment(hit.id);
    if (!copy)
    {
        MOTIONLINE_LOG_DEBUG("interaction", "no room to duplicate segment {}", hit.id);
        return std::nullopt;
    }
    if (history_)
    {
        if (auto added = model_.segment(*copy))
            history_->record_add(model_, *added);
    }
    return copy;
}

std::optional<bool> TimelineInteractionController::toggle_lock_at(double x, double y)
{
    auto hit = hit_test(x, y);
    if (hit.id == INVALID_SEGMENT_ID)
        return std::nullopt;

    auto before = model_.segment(hit.id);
    bool locked = model_.toggle_segment_lock(hit.id);
    if (history_ && before)
    {
        auto after   = *before;
        after.locked = locked;
        history_->record_properties(model_, *before, after, locked ? "Lock segment" : "Unlock segment");
    }
    return locked;
}

bool TimelineInteractionController::delete_at(double x, double y)
{
    auto hit = hit_test(x, y);
    if (hit.id == INVALID_SEGMENT_ID)
        return false;
    return remove_recorded(hit.id);
}

bool TimelineInteractionController::delete_selected()
{
    auto id = model_.selected();
    if (!id)
        return false;
    return remove_recorded(*id);
}

bool TimelineInteractionController::remove_recorded(SegmentId id)
{
    auto seg = model_.segment(id);
    if (!seg)
        return false;
    if (seg->locked)
    {
        MOTIONLINE_LOG_DEBUG("interaction", "segment {} is locked; unlock it to delete", id);
        return false;
    }

    auto position = model_.index_of(id);
    model_.remove_segment(id);
    if (history_)
        history_->record_remove(model_, *seg, position);
    return true;
}

// ─── Gesture helpers ─────────────────────────────────────────────────────────

void TimelineInteractionController::begin_create(double x, uint32_t track, const Modifiers& mods)
{
    double time  = x_to_time(x);
    double total = model_.total_duration();
    double span  = creation_kind_ == SegmentKind::Marker ? config_.marker_duration
                                                         : config_.default_segment_duration;
    double start = std::clamp(snapped(time, mods),
                              0.0,
                              std::max(0.0, total - config_.min_segment_duration));
    double end   = std::min(start + span, total);
    if (auto widened = widen_to_gap(start, end, config_.min_segment_duration, total))
        start = *widened;

    state_        = InteractionState::CreatingSegment;
    anchor_id_    = INVALID_SEGMENT_ID;
    anchor_x_     = x;
    anchor_start_ = start;
    anchor_end_   = end;
    moved_        = false;
    preview_      = GesturePreview{INVALID_SEGMENT_ID, track, start, end};
    if (on_preview_)
        on_preview_(*preview_);
}

void TimelineInteractionController::update_preview(double start, double end)
{
    if (!preview_)
        return;
    if (preview_->start_time == start && preview_->end_time == end)
        return;
    preview_->start_time = start;
    preview_->end_time   = end;
    if (on_preview_)
        on_preview_(*preview_);
}

void TimelineInteractionController::reset_gesture()
{
    state_ = InteractionState::Idle;
    preview_.reset();
    anchor_id_    = INVALID_SEGMENT_ID;
    anchor_x_     = 0.0;
    anchor_start_ = 0.0;
    anchor_end_   = 0.0;
    moved_        = false;
}

PointerResult TimelineInteractionController::result(bool handled, bool model_changed) const
{
    PointerResult r;
    r.handled       = handled;
    r.model_changed = model_changed;
    r.state         = state_;
    if (state_ == InteractionState::Dragging)
        r.cursor = CursorShape::Move;
    else if (state_ == InteractionState::ResizingStart || state_ == InteractionState::ResizingEnd)
        r.cursor = CursorShape::ResizeHorizontal;
    return r;
}

PointerResult TimelineInteractionController::commit_range()
{
    GesturePreview   p         = *preview_;
    InteractionState gesture   = state_;
    double           old_start = anchor_start_;
    double           old_end   = anchor_end_;
    bool             moved     = moved_;
    reset_gesture();

    auto r    = result(true);
    r.segment = p.id;
    if (!moved || (p.start_time == old_start && p.end_time == old_end))
        return r;

    bool applied = false;
    try
    {
        applied = model_.update_segment_time(p.id, p.start_time, p.end_time);
    }
    catch (const NotFoundError& e)
    {
        MOTIONLINE_LOG_WARN("interaction", "gesture dropped: {}", e.what());
        return r;
    }
    if (!applied)
    {
        MOTIONLINE_LOG_DEBUG("interaction", "model rejected range for segment {}", p.id);
        return r;
    }

    auto seg = model_.segment(p.id);
    if (!seg)
        return r;

    bool dragged = gesture == InteractionState::Dragging;
    if (history_)
    {
        history_->record_time_change(model_,
                                     p.id,
                                     old_start,
                                     old_end,
                                     seg->start_time,
                                     seg->end_time,
                                     dragged ? "Move segment" : "Resize segment");
    }

    MOTIONLINE_LOG_DEBUG("interaction",
                         "segment {} now [{}, {}]",
                         p.id,
                         seg->start_time,
                         seg->end_time);
    if (dragged && on_moved_)
        on_moved_(p.id, seg->start_time, seg->end_time);
    else if (!dragged && on_resized_)
        on_resized_(p.id, seg->start_time, seg->end_time);

    r.model_changed = true;
    return r;
}

PointerResult TimelineInteractionController::commit_create()
{
    GesturePreview p = *preview_;
    reset_gesture();

    auto seg = make_segment(p.start_time,
                            p.end_time,
                            creation_kind_,
                            p.track_index,
                            std::string("New ") + kind_name(creation_kind_));

    SegmentId id;
    try
    {
        id = model_.add_segment(std::move(seg));
    }
    catch (const InvalidRangeError& e)
    {
        MOTIONLINE_LOG_WARN("interaction", "segment not created: {}", e.what());
        return result(true);
    }

    model_.select(id);
    if (history_)
    {
        if (auto added = model_.segment(id))
            history_->record_add(model_, *added);
    }

    MOTIONLINE_LOG_DEBUG("interaction", "created segment {} on track {}", id, p.track_index);
    if (on_created_)
        on_created_(id);

    auto r    = result(true, true);
    r.segment = id;
    return r;
}

}   // namespace motionline
