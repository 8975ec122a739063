#include "timeline/timeline_history.hpp"

#include <algorithm>
#include <motionline/errors.hpp>
#include <motionline/logger.hpp>
#include <string>

#include "timeline/timeline_model.hpp"

namespace motionline
{

namespace
{

// Put a segment back on an exact range. A range the model would clamp or
// refuse means the timeline changed underneath the entry.
void restore_range(TimelineModel& model, SegmentId id, double start, double end)
{
    if (start < 0.0 || end > model.total_duration() || !model.update_segment_time(id, start, end))
    {
        throw InvalidRangeError("segment " + std::to_string(id) + " cannot return to ["
                                + std::to_string(start) + ", " + std::to_string(end) + "]");
    }
}

}   // anonymous namespace

// ─── Push ────────────────────────────────────────────────────────────────────

void TimelineHistory::push(HistoryAction action)
{
    std::lock_guard lock(mutex_);

    if (grouping_)
    {
        group_actions_.push_back(std::move(action));
        return;
    }
    push_unlocked(std::move(action));
}

void TimelineHistory::push_unlocked(HistoryAction action)
{
    // A saved state that lived on the redo stack is no longer reachable
    if (saved_revision_ && *saved_revision_ > revision_)
        saved_revision_.reset();

    redo_stack_.clear();
    undo_stack_.push_back(std::move(action));
    ++revision_;

    if (undo_stack_.size() > MAX_STACK_SIZE)
    {
        undo_stack_.erase(undo_stack_.begin());
        if (saved_revision_ && *saved_revision_ < revision_ - undo_stack_.size())
            saved_revision_.reset();
    }
}

// ─── Timeline edit recorders ─────────────────────────────────────────────────

void TimelineHistory::record_add(TimelineModel& model, const TimelineSegment& added)
{
    HistoryAction action;
    action.description = "Add " + std::string(kind_name(added.kind));
    action.undo_fn     = [&model, id = added.id]() { model.remove_segment(id); };
    action.redo_fn     = [&model, added]() { model.reinsert_segment(added); };
    push(std::move(action));
}

void TimelineHistory::record_remove(TimelineModel&         model,
                                    const TimelineSegment& removed,
                                    std::optional<size_t>  position)
{
    HistoryAction action;
    action.description = "Delete " + std::string(kind_name(removed.kind));
    action.undo_fn     = [&model, removed, position]() { model.reinsert_segment(removed, position); };
    action.redo_fn     = [&model, id = removed.id]() { model.remove_segment(id); };
    push(std::move(action));
}

void TimelineHistory::record_time_change(TimelineModel&     model,
                                         SegmentId          id,
                                         double             old_start,
                                         double             old_end,
                                         double             new_start,
                                         double             new_end,
                                         const std::string& description)
{
    HistoryAction action;
    action.description = description;
    action.undo_fn     = [&model, id, old_start, old_end]()
    { restore_range(model, id, old_start, old_end); };
    action.redo_fn = [&model, id, new_start, new_end]()
    { restore_range(model, id, new_start, new_end); };
    push(std::move(action));
}

void TimelineHistory::record_properties(TimelineModel&         model,
                                        const TimelineSegment& before,
                                        const TimelineSegment& after,
                                        const std::string&     description)
{
    HistoryAction action;
    action.description = description;
    action.undo_fn     = [&model, before]() { model.apply_properties(before); };
    action.redo_fn     = [&model, after]() { model.apply_properties(after); };
    push(std::move(action));
}

// ─── Undo / Redo ─────────────────────────────────────────────────────────────

bool TimelineHistory::undo()
{
    HistoryAction action;
    {
        std::lock_guard lock(mutex_);
        if (undo_stack_.empty())
            return false;
        action = std::move(undo_stack_.back());
        undo_stack_.pop_back();
    }

    // Execute outside lock
    try
    {
        if (action.undo_fn)
            action.undo_fn();
    }
    catch (const TimelineError& e)
    {
        // The model moved on underneath this entry; it cannot be replayed
        MOTIONLINE_LOG_ERROR("history", "undo of '{}' failed: {}", action.description, e.what());
        return false;
    }

    std::lock_guard lock(mutex_);
    --revision_;
    redo_stack_.push_back(std::move(action));
    return true;
}

bool TimelineHistory::redo()
{
    HistoryAction action;
    {
        std::lock_guard lock(mutex_);
        if (redo_stack_.empty())
            return false;
        action = std::move(redo_stack_.back());
        redo_stack_.pop_back();
    }

    try
    {
        if (action.redo_fn)
            action.redo_fn();
    }
    catch (const TimelineError& e)
    {
        MOTIONLINE_LOG_ERROR("history", "redo of '{}' failed: {}", action.description, e.what());
        return false;
    }

    std::lock_guard lock(mutex_);
    ++revision_;
    undo_stack_.push_back(std::move(action));
    return true;
}

size_t TimelineHistory::undo_multiple(size_t count)
{
    size_t done = 0;
    while (done < count && undo())
        ++done;
    return done;
}

size_t TimelineHistory::redo_multiple(size_t count)
{
    size_t done = 0;
    while (done < count && redo())
        ++done;
    return done;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool TimelineHistory::can_undo() const
{
    std::lock_guard lock(mutex_);
    return !undo_stack_.empty();
}

bool TimelineHistory::can_redo() const
{
    std::lock_guard lock(mutex_);
    return !redo_stack_.empty();
}

std::string TimelineHistory::undo_description() const
{
    std::lock_guard lock(mutex_);
    return undo_stack_.empty() ? "" : undo_stack_.back().description;
}

std::string TimelineHistory::redo_description() const
{
    std::lock_guard lock(mutex_);
    return redo_stack_.empty() ? "" : redo_stack_.back().description;
}

size_t TimelineHistory::undo_count() const
{
    std::lock_guard lock(mutex_);
    return undo_stack_.size();
}

size_t TimelineHistory::redo_count() const
{
    std::lock_guard lock(mutex_);
    return redo_stack_.size();
}

std::vector<std::string> TimelineHistory::history() const
{
    std::lock_guard          lock(mutex_);
    std::vector<std::string> result;
    result.reserve(undo_stack_.size());
    for (const auto& a : undo_stack_)
        result.push_back(a.description);
    return result;
}

void TimelineHistory::clear()
{
    std::lock_guard lock(mutex_);
    undo_stack_.clear();
    redo_stack_.clear();
    grouping_ = false;
    group_actions_.clear();
    revision_       = 0;
    saved_revision_ = 0;
    MOTIONLINE_LOG_DEBUG("history", "history cleared");
}

// ─── Grouping ────────────────────────────────────────────────────────────────

void TimelineHistory::begin_group(const std::string& description)
{
    std::lock_guard lock(mutex_);
    grouping_          = true;
    group_description_ = description;
    group_actions_.clear();
}

void TimelineHistory::end_group()
{
    std::lock_guard lock(mutex_);
    if (!grouping_)
        return;
    grouping_ = false;

    if (group_actions_.empty())
        return;

    auto actions = std::move(group_actions_);
    group_actions_.clear();

    HistoryAction combined;
    combined.description = std::move(group_description_);
    combined.undo_fn     = [actions]()
    {
        // Undo in reverse order
        for (auto it = actions.rbegin(); it != actions.rend(); ++it)
        {
            if (it->undo_fn)
                it->undo_fn();
        }
    };
    combined.redo_fn = [actions]()
    {
        for (const auto& a : actions)
        {
            if (a.redo_fn)
                a.redo_fn();
        }
    };

    push_unlocked(std::move(combined));
}

bool TimelineHistory::in_group() const
{
    std::lock_guard lock(mutex_);
    return grouping_;
}

// ─── Save tracking ───────────────────────────────────────────────────────────

void TimelineHistory::mark_saved()
{
    std::lock_guard lock(mutex_);
    saved_revision_ = revision_;
}

bool TimelineHistory::has_unsaved_changes() const
{
    std::lock_guard lock(mutex_);
    return !saved_revision_ || *saved_revision_ != revision_;
}

}   // namespace motionline
