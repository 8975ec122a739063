#pragma once

#include <cstddef>
#include <functional>
#include <motionline/fwd.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "timeline/timeline_segment.hpp"

namespace motionline
{

// A single undoable timeline edit with forward (redo) and backward (undo)
// operations.
struct HistoryAction
{
    std::string           description;   // e.g. "Move segment"
    std::function<void()> undo_fn;       // restores the previous state
    std::function<void()> redo_fn;       // re-applies the edit
};

// Undo/redo stack for timeline edits.
// Thread-safe: push/undo/redo may be called from any thread. Actions run
// outside the internal lock, so they may call back into the history.
// Capped at MAX_STACK_SIZE entries; the oldest entry is dropped first.
class TimelineHistory
{
   public:
    static constexpr size_t MAX_STACK_SIZE = 100;

    TimelineHistory() = default;
    ~TimelineHistory() = default;

    TimelineHistory(const TimelineHistory&)            = delete;
    TimelineHistory& operator=(const TimelineHistory&) = delete;

    // Push an already-applied edit. Clears the redo stack.
    void push(HistoryAction action);

    // Convenience: setter is called with before on undo and after on redo.
    template <typename T>
    void push_value(const std::string&            description,
                    T                             before,
                    T                             after,
                    std::function<void(const T&)> setter)
    {
        HistoryAction action;
        action.description = description;
        action.undo_fn     = [setter, before]() { setter(before); };
        action.redo_fn     = [setter, after]() { setter(after); };
        push(std::move(action));
    }

    // ─── Timeline edit recorders ─────────────────────────────────────────
    // Each records an edit that has already been applied to model. The model
    // must outlive the history entries.

    void record_add(TimelineModel& model, const TimelineSegment& added);
    void record_remove(TimelineModel&         model,
                       const TimelineSegment& removed,
                       std::optional<size_t>  position);
    void record_time_change(TimelineModel&     model,
                            SegmentId          id,
                            double             old_start,
                            double             old_end,
                            double             new_start,
                            double             new_end,
                            const std::string& description);
    void record_properties(TimelineModel&         model,
                           const TimelineSegment& before,
                           const TimelineSegment& after,
                           const std::string&     description = "Edit segment");

    // ─── Undo / Redo ─────────────────────────────────────────────────────

    // Returns false if nothing to undo/redo.
    bool undo();
    bool redo();

    // Undo/redo up to count steps; returns how many ran.
    size_t undo_multiple(size_t count);
    size_t redo_multiple(size_t count);

    bool can_undo() const;
    bool can_redo() const;

    std::string undo_description() const;
    std::string redo_description() const;

    size_t undo_count() const;
    size_t redo_count() const;

    // Descriptions of the undo stack, oldest first.
    std::vector<std::string> history() const;

    void clear();

    // ─── Grouping ────────────────────────────────────────────────────────
    // Pushes between begin_group/end_group become one undoable action.

    void begin_group(const std::string& description);
    void end_group();
    bool in_group() const;

    // ─── Save tracking ───────────────────────────────────────────────────

    // Remember the current position as the saved state.
    void mark_saved();

    // True when undo/redo/push moved away from the saved position.
    bool has_unsaved_changes() const;

   private:
    mutable std::mutex         mutex_;
    std::vector<HistoryAction> undo_stack_;
    std::vector<HistoryAction> redo_stack_;

    // Group state
    bool                       grouping_ = false;
    std::string                group_description_;
    std::vector<HistoryAction> group_actions_;

    // Number of actions applied since the history began (undo decrements);
    // saved_revision_ is nullopt once the saved state dropped off the stack.
    size_t                revision_       = 0;
    std::optional<size_t> saved_revision_ = 0;

    void push_unlocked(HistoryAction action);
};

}   // namespace motionline
