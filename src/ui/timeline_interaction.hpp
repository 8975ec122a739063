#pragma once

#include <cstdint>
#include <functional>
#include <motionline/fwd.hpp>
#include <optional>

#include "core/timeline_config.hpp"
#include "timeline/timeline_segment.hpp"

namespace motionline
{

// ─── TimelineInteractionController ───────────────────────────────────────────
// Pointer-event state machine that turns raw panel coordinates into
// TimelineModel edits. Toolkit independent: the host forwards press, move,
// release and double-click events in panel-local pixels.
//
// State machine:
//
//   Idle ──press on segment body──────────────► Dragging
//    │   ──press within edge tolerance─────────► ResizingStart / ResizingEnd
//    │   ──press on locked segment, or with
//    │     Shift/Ctrl held─────────────────────► Selecting
//    │   ──press on empty track space──────────► CreatingSegment
//    │   ──press on ruler / outside tracks─────► Idle (playhead seek)
//    │
//   any gesture ──release──► commit to the model ──► Idle
//   any gesture ──cancel()─► Idle (model untouched)
//
// During a gesture only a preview range is updated; the model changes once,
// on release, through TimelineModel::update_segment_time (or add_segment for
// a creation). Drag positions are recomputed from the press anchor on every
// move, so a gesture never accumulates rounding drift.
//
// Layout (top to bottom): a ruler of ruler_height pixels, then one lane per
// track of track_height pixels separated by track_spacing pixels. Time maps
// to x as (time - view_start) * pixels_per_second.
//
// Not thread-safe: call from the UI thread only.

enum class InteractionState
{
    Idle,
    Selecting,
    Dragging,
    ResizingStart,
    ResizingEnd,
    CreatingSegment,
};

const char* interaction_state_name(InteractionState state);

struct Modifiers
{
    bool shift = false;
    bool ctrl  = false;
    bool alt   = false;   // bypasses snapping
};

struct PointerEvent
{
    double    x = 0.0;   // panel-local pixels
    double    y = 0.0;
    Modifiers modifiers;
};

enum class CursorShape
{
    Arrow,
    Move,
    ResizeHorizontal,
};

enum class HitZone
{
    None,
    Body,
    StartEdge,
    EndEdge,
};

struct HitResult
{
    SegmentId               id   = INVALID_SEGMENT_ID;
    HitZone                 zone = HitZone::None;
    std::optional<uint32_t> track;   // nullopt over the ruler or lane gaps
    double                  time = 0.0;
};

// Range shown while a gesture is in progress. id is INVALID_SEGMENT_ID for
// a segment being created.
struct GesturePreview
{
    SegmentId id          = INVALID_SEGMENT_ID;
    uint32_t  track_index = 0;
    double    start_time  = 0.0;
    double    end_time    = 0.0;
};

// Outcome of one pointer event.
struct PointerResult
{
    bool             handled       = false;   // the event started, moved or ended a gesture
    bool             model_changed = false;
    InteractionState state         = InteractionState::Idle;
    SegmentId        segment       = INVALID_SEGMENT_ID;
    CursorShape      cursor        = CursorShape::Arrow;
};

class TimelineInteractionController
{
   public:
    using SegmentEventCallback = std::function<void(SegmentId id)>;
    using RangeEventCallback   = std::function<void(SegmentId id, double start, double end)>;
    using TimeEventCallback    = std::function<void(double time)>;
    using PreviewCallback      = std::function<void(const GesturePreview& preview)>;

    explicit TimelineInteractionController(TimelineModel& model, const TimelineConfig& config = {});
    ~TimelineInteractionController() = default;

    TimelineInteractionController(const TimelineInteractionController&)            = delete;
    TimelineInteractionController& operator=(const TimelineInteractionController&) = delete;

    // Committed gestures and context actions are recorded here when set.
    void             set_history(TimelineHistory* history) { history_ = history; }
    TimelineHistory* history() const { return history_; }

    // ─── Pointer input ───────────────────────────────────────────────────

    PointerResult pointer_down(const PointerEvent& ev);
    PointerResult pointer_move(const PointerEvent& ev);
    PointerResult pointer_up(const PointerEvent& ev);

    // Reports the segment under the pointer through the double-click event.
    // Returns its id, or INVALID_SEGMENT_ID over empty space.
    SegmentId double_click(const PointerEvent& ev);

    // Abort the active gesture (Escape). Returns false when idle.
    bool cancel();

    // ─── Context actions ─────────────────────────────────────────────────

    // Duplicate the segment under (x, y); nullopt over empty space or when
    // no room remains after it.
    std::optional<SegmentId> duplicate_at(double x, double y);

    // Toggle the lock of the segment under (x, y); returns the new state.
    std::optional<bool> toggle_lock_at(double x, double y);

    // Delete the segment under (x, y). Returns false over empty space.
    bool delete_at(double x, double y);

    // Delete the selected segment. Returns false without a selection.
    // Locked segments are never deleted interactively.
    bool delete_selected();

    // ─── Queries ─────────────────────────────────────────────────────────

    InteractionState              state() const { return state_; }
    bool                          is_active() const { return state_ != InteractionState::Idle; }
    std::optional<GesturePreview> preview() const { return preview_; }

    HitResult   hit_test(double x, double y) const;
    CursorShape cursor_at(double x, double y) const;

    // ─── Layout ──────────────────────────────────────────────────────────

    double x_to_time(double x) const;
    double time_to_x(double time) const;

    // Track lane under y, or nullopt over the ruler, a lane gap or below the
    // last track.
    std::optional<uint32_t> y_to_track(double y) const;
    double                  track_top(uint32_t track_index) const;
    // Configured lanes, or more when the model uses higher track indices.
    uint32_t track_count() const;

    double pixels_per_second() const { return config_.pixels_per_second; }
    // Clamped to [TimelineConfig::MIN_ZOOM, TimelineConfig::MAX_ZOOM].
    void set_zoom(double pixels_per_second);
    void zoom_in();
    void zoom_out();

    double view_start() const { return view_start_; }
    void   set_view_start(double seconds);

    const TimelineConfig& config() const { return config_; }

    // ─── Snapping & creation ─────────────────────────────────────────────

    SnapMode snap_mode() const { return config_.snap_mode; }
    void     set_snap_mode(SnapMode mode) { config_.snap_mode = mode; }

    // Round time to the active snap grid.
    double snap_time(double time) const;

    SegmentKind creation_kind() const { return creation_kind_; }
    void        set_creation_kind(SegmentKind kind) { creation_kind_ = kind; }

    // ─── Events ──────────────────────────────────────────────────────────

    void set_on_segment_selected(SegmentEventCallback cb) { on_selected_ = std::move(cb); }
    void set_on_segment_moved(RangeEventCallback cb) { on_moved_ = std::move(cb); }
    void set_on_segment_resized(RangeEventCallback cb) { on_resized_ = std::move(cb); }
    void set_on_segment_created(SegmentEventCallback cb) { on_created_ = std::move(cb); }
    void set_on_segment_double_clicked(SegmentEventCallback cb) { on_double_clicked_ = std::move(cb); }
    void set_on_time_clicked(TimeEventCallback cb) { on_time_clicked_ = std::move(cb); }
    void set_on_preview(PreviewCallback cb) { on_preview_ = std::move(cb); }

   private:
    TimelineModel&   model_;
    TimelineHistory* history_ = nullptr;
    TimelineConfig   config_;

    double      view_start_    = 0.0;
    SegmentKind creation_kind_ = SegmentKind::Animation;

    // Active gesture
    InteractionState              state_ = InteractionState::Idle;
    std::optional<GesturePreview> preview_;
    SegmentId                     anchor_id_    = INVALID_SEGMENT_ID;
    double                        anchor_x_     = 0.0;
    double                        anchor_start_ = 0.0;
    double                        anchor_end_   = 0.0;
    bool                          moved_        = false;

    SegmentEventCallback on_selected_;
    RangeEventCallback   on_moved_;
    RangeEventCallback   on_resized_;
    SegmentEventCallback on_created_;
    SegmentEventCallback on_double_clicked_;
    TimeEventCallback    on_time_clicked_;
    PreviewCallback      on_preview_;

    double snapped(double time, const Modifiers& mods) const;
    void   begin_create(double x, uint32_t track, const Modifiers& mods);
    void   update_preview(double start, double end);
    void   reset_gesture();
    bool   remove_recorded(SegmentId id);

    PointerResult result(bool handled, bool model_changed = false) const;
    PointerResult commit_range();
    PointerResult commit_create();
};

}   // namespace motionline
