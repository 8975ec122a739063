#pragma once

#include <cstdint>
#include <functional>
#include <motionline/fwd.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "timeline/timeline_segment.hpp"

namespace motionline
{

// Callback types for model change notifications. Callbacks run on the
// mutating thread after the model's lock has been released, so they may
// query (or mutate) the model again.
using SegmentCallback   = std::function<void(SegmentId id)>;
using SelectionCallback = std::function<void(std::optional<SegmentId> selected)>;
using TimeCallback      = std::function<void(double seconds)>;

// TimelineModel — owns every segment across all tracks, the total duration
// and the playhead.
//
// Segments are kept in insertion order; that order is the documented
// tie-break of segment_at(). Segments on the same track may overlap; use
// find_overlaps() to detect that if a caller needs exclusive lanes.
//
// Thread-safe: readers take a shared lock, writers an exclusive one, so a
// background exporter may call snapshot() while the UI thread edits.
class TimelineModel
{
   public:
    struct Snapshot
    {
        double                       total_duration = 0.0;
        double                       current_time   = 0.0;
        std::optional<SegmentId>     selected;
        std::vector<TimelineSegment> segments;
    };

    // Throws InvalidRangeError when total_duration <= 0.
    explicit TimelineModel(double total_duration = 30.0);
    ~TimelineModel() = default;

    TimelineModel(const TimelineModel&)            = delete;
    TimelineModel& operator=(const TimelineModel&) = delete;

    // ─── Segments ────────────────────────────────────────────────────────

    // Validate 0 <= start < end <= duration, assign a fresh id and append.
    // The id field of the argument is ignored. Throws InvalidRangeError.
    SegmentId add_segment(TimelineSegment segment);

    // Add a segment of the kind's default span (2 s, markers 0.1 s) starting
    // at time, with its end clamped to the duration. Throws InvalidRangeError
    // when no positive span fits.
    SegmentId add_segment_at_time(double time, SegmentKind kind, uint32_t track_index = 0);

    // Copy of a segment placed right after it on the same track. Returns
    // nullopt when the source already ends at the duration. Throws
    // NotFoundError.
    std::optional<SegmentId> duplicate_segment(SegmentId id);

    // Throws NotFoundError. Clears the selection if it pointed at id.
    void remove_segment(SegmentId id);

    // Clamp new_start to >= 0 and new_end to <= duration, then apply.
    // Returns false (and changes nothing) when the clamped range is empty or
    // inverted, or a bound is not finite. Throws NotFoundError.
    bool update_segment_time(SegmentId id, double new_start, double new_end);

    // Re-insert a segment keeping its id, at position (insertion order) or
    // at the end. Used by undo and import. Throws InvalidRangeError for a bad
    // range and TimelineError when the id is invalid or already present.
    void reinsert_segment(const TimelineSegment& segment, std::optional<size_t> position = std::nullopt);

    // Overwrite every field of an existing segment except its id.
    // Throws NotFoundError or InvalidRangeError.
    void apply_properties(const TimelineSegment& segment);

    // Project clear: drops all segments and the selection.
    void clear();

    // Replace duration and every segment in one step, keeping the given ids.
    // Everything is validated before anything changes: throws
    // InvalidRangeError for a bad duration or range and TimelineError for a
    // missing or repeated id. Clears the selection and clamps the playhead.
    void replace_contents(double total_duration, std::vector<TimelineSegment> segments);

    std::optional<TimelineSegment> segment(SegmentId id) const;
    bool                           contains(SegmentId id) const;
    std::optional<size_t>          index_of(SegmentId id) const;
    std::vector<TimelineSegment>   segments() const;
    size_t                         segment_count() const;

    // ─── Property edits (programmatic; ignore the locked flag) ───────────
    // All throw NotFoundError for an unknown id.

    void rename_segment(SegmentId id, const std::string& name);
    void set_segment_kind(SegmentId id, SegmentKind kind);
    void set_segment_color(SegmentId id, Color color);
    void set_segment_description(SegmentId id, const std::string& description);
    void set_segment_locked(SegmentId id, bool locked);
    bool toggle_segment_lock(SegmentId id);   // returns the new state
    void set_segment_visible(SegmentId id, bool visible);
    void set_segment_track(SegmentId id, uint32_t track_index);

    // ─── Queries ─────────────────────────────────────────────────────────

    // First visible segment on track whose [start, end] contains time, in
    // insertion order.
    std::optional<TimelineSegment> segment_at(double time, uint32_t track_index) const;

    // Every segment (any track, hidden included) intersecting [start, end).
    std::vector<TimelineSegment> segments_in_range(double start, double end) const;

    // Pairs of same-track segments whose open intervals intersect.
    std::vector<std::pair<SegmentId, SegmentId>> find_overlaps() const;

    // Segments ending after the current duration (left behind by a shrink).
    std::vector<SegmentId> segments_beyond_duration() const;

    // Highest track index in use + 1 (0 for an empty model).
    uint32_t used_track_count() const;

    Snapshot snapshot() const;

    // ─── Duration & playhead ─────────────────────────────────────────────

    double total_duration() const;

    // Throws InvalidRangeError when seconds <= 0. Existing segments are not
    // trimmed; see segments_beyond_duration(). The playhead is clamped.
    void set_total_duration(double seconds);

    double current_time() const;

    // Clamped to [0, duration]. Non-finite values are ignored.
    void set_current_time(double seconds);

    // ─── Selection ───────────────────────────────────────────────────────

    void                     select(SegmentId id);   // throws NotFoundError
    void                     clear_selection();
    std::optional<SegmentId> selected() const;

    // ─── Callbacks ───────────────────────────────────────────────────────

    void set_on_segment_added(SegmentCallback cb);
    void set_on_segment_removed(SegmentCallback cb);
    void set_on_segment_changed(SegmentCallback cb);
    void set_on_selection_change(SelectionCallback cb);
    void set_on_duration_change(TimeCallback cb);
    void set_on_time_change(TimeCallback cb);

   private:
    mutable std::shared_mutex mutex_;

    std::vector<TimelineSegment> segments_;   // insertion order
    SegmentId                    next_id_        = 1;
    double                       total_duration_ = 30.0;
    double                       current_time_   = 0.0;
    std::optional<SegmentId>     selected_;

    SegmentCallback   on_segment_added_;
    SegmentCallback   on_segment_removed_;
    SegmentCallback   on_segment_changed_;
    SelectionCallback on_selection_change_;
    TimeCallback      on_duration_change_;
    TimeCallback      on_time_change_;

    // Caller must hold mutex_
    TimelineSegment*       find_unlocked(SegmentId id);
    const TimelineSegment* find_unlocked(SegmentId id) const;
    TimelineSegment&       require_unlocked(SegmentId id);

    // Apply edit to segment id under the exclusive lock, then notify.
    void edit_segment(SegmentId id, const std::function<void(TimelineSegment&)>& edit);

    void notify_changed(SegmentId id);
    void notify_selection(std::optional<SegmentId> selected);
};

// Throws InvalidRangeError unless 0 <= start < end <= total_duration and all
// three values are finite.
void validate_segment_range(double start, double end, double total_duration);

}   // namespace motionline
