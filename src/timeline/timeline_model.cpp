#include "timeline/timeline_model.hpp"

#include <algorithm>
#include <cmath>
#include <motionline/errors.hpp>
#include <motionline/logger.hpp>
#include <mutex>

namespace motionline
{

namespace
{

std::string range_text(double start, double end)
{
    return "[" + std::to_string(start) + ", " + std::to_string(end) + "]";
}

}   // anonymous namespace

void validate_segment_range(double start, double end, double total_duration)
{
    if (!std::isfinite(start) || !std::isfinite(end) || !std::isfinite(total_duration))
    {
        throw InvalidRangeError("segment bounds must be finite");
    }
    if (start < 0.0)
    {
        throw InvalidRangeError("segment " + range_text(start, end) + " starts before 0");
    }
    if (start >= end)
    {
        throw InvalidRangeError("segment " + range_text(start, end) + " is empty or inverted");
    }
    if (end > total_duration)
    {
        throw InvalidRangeError("segment " + range_text(start, end) + " ends past duration "
                                + std::to_string(total_duration));
    }
}

TimelineModel::TimelineModel(double total_duration)
{
    if (!std::isfinite(total_duration) || total_duration <= 0.0)
    {
        throw InvalidRangeError("total duration must be > 0");
    }
    total_duration_ = total_duration;
}

// ─── Internal lookup ─────────────────────────────────────────────────────────

TimelineSegment* TimelineModel::find_unlocked(SegmentId id)
{
    for (auto& seg : segments_)
    {
        if (seg.id == id)
            return &seg;
    }
    return nullptr;
}

const TimelineSegment* TimelineModel::find_unlocked(SegmentId id) const
{
    for (const auto& seg : segments_)
    {
        if (seg.id == id)
            return &seg;
    }
    return nullptr;
}

TimelineSegment& TimelineModel::require_unlocked(SegmentId id)
{
    auto* seg = find_unlocked(id);
    if (!seg)
    {
        throw NotFoundError(id);
    }
    return *seg;
}

void TimelineModel::notify_changed(SegmentId id)
{
    SegmentCallback cb;
    {
        std::shared_lock lock(mutex_);
        cb = on_segment_changed_;
    }
    if (cb)
        cb(id);
}

void TimelineModel::notify_selection(std::optional<SegmentId> selected)
{
    SelectionCallback cb;
    {
        std::shared_lock lock(mutex_);
        cb = on_selection_change_;
    }
    if (cb)
        cb(selected);
}

void TimelineModel::edit_segment(SegmentId id, const std::function<void(TimelineSegment&)>& edit)
{
    {
        std::unique_lock lock(mutex_);
        edit(require_unlocked(id));
    }
    notify_changed(id);
}

// ─── Segments ────────────────────────────────────────────────────────────────

SegmentId TimelineModel::add_segment(TimelineSegment segment)
{
    SegmentId       id;
    SegmentCallback cb;
    {
        std::unique_lock lock(mutex_);
        validate_segment_range(segment.start_time, segment.end_time, total_duration_);
        id         = next_id_++;
        segment.id = id;
        segments_.push_back(std::move(segment));
        cb = on_segment_added_;
    }

    MOTIONLINE_LOG_DEBUG("timeline", "added segment {}", id);
    if (cb)
        cb(id);
    return id;
}

SegmentId TimelineModel::add_segment_at_time(double time, SegmentKind kind, uint32_t track_index)
{
    double duration = total_duration();
    double start    = std::clamp(time, 0.0, duration);
    double end      = std::min(start + default_span(kind), duration);

    auto seg = make_segment(start, end, kind, track_index);
    seg.name = std::string("New ") + kind_name(kind);
    return add_segment(std::move(seg));
}

std::optional<SegmentId> TimelineModel::duplicate_segment(SegmentId id)
{
    TimelineSegment copy;
    {
        std::shared_lock lock(mutex_);
        const auto&      src  = require_unlocked(id);
        double           span = src.duration();
        copy                  = src;
        copy.start_time       = src.end_time;
        copy.end_time         = std::min(copy.start_time + span, total_duration_);
        if (!(copy.end_time > copy.start_time))
        {
            return std::nullopt;
        }
        copy.name   = src.name + " copy";
        copy.locked = false;
    }
    return add_segment(std::move(copy));
}

void TimelineModel::remove_segment(SegmentId id)
{
    SegmentCallback removed_cb;
    bool            selection_cleared = false;
    {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(segments_.begin(),
                               segments_.end(),
                               [id](const TimelineSegment& s) { return s.id == id; });
        if (it == segments_.end())
        {
            throw NotFoundError(id);
        }
        segments_.erase(it);
        if (selected_ && *selected_ == id)
        {
            selected_.reset();
            selection_cleared = true;
        }
        removed_cb = on_segment_removed_;
    }

    MOTIONLINE_LOG_DEBUG("timeline", "removed segment {}", id);
    if (removed_cb)
        removed_cb(id);
    if (selection_cleared)
        notify_selection(std::nullopt);
}

bool TimelineModel::update_segment_time(SegmentId id, double new_start, double new_end)
{
    {
        std::unique_lock lock(mutex_);
        auto&            seg = require_unlocked(id);

        if (!std::isfinite(new_start) || !std::isfinite(new_end))
        {
            return false;
        }

        double start = std::max(0.0, new_start);
        double end   = std::min(total_duration_, new_end);
        if (start >= end)
        {
            MOTIONLINE_LOG_DEBUG("timeline",
                                 "rejected update of segment {}: empty range after clamping",
                                 id);
            return false;
        }
        if (seg.start_time == start && seg.end_time == end)
        {
            return true;
        }
        seg.start_time = start;
        seg.end_time   = end;
    }
    notify_changed(id);
    return true;
}

void TimelineModel::reinsert_segment(const TimelineSegment& segment, std::optional<size_t> position)
{
    SegmentCallback cb;
    {
        std::unique_lock lock(mutex_);
        if (segment.id == INVALID_SEGMENT_ID)
        {
            throw TimelineError("cannot insert a segment without an id");
        }
        if (find_unlocked(segment.id))
        {
            throw TimelineError("segment " + std::to_string(segment.id) + " already exists");
        }
        validate_segment_range(segment.start_time, segment.end_time, total_duration_);

        size_t index = position ? std::min(*position, segments_.size()) : segments_.size();
        segments_.insert(segments_.begin() + static_cast<std::ptrdiff_t>(index), segment);
        next_id_ = std::max(next_id_, segment.id + 1);
        cb       = on_segment_added_;
    }
    if (cb)
        cb(segment.id);
}

void TimelineModel::apply_properties(const TimelineSegment& segment)
{
    edit_segment(segment.id,
                 [this, &segment](TimelineSegment& seg)
                 {
                     validate_segment_range(segment.start_time, segment.end_time, total_duration_);
                     seg = segment;
                 });
}

void TimelineModel::clear()
{
    std::vector<SegmentId> removed;
    SegmentCallback        removed_cb;
    bool                   selection_cleared = false;
    {
        std::unique_lock lock(mutex_);
        removed.reserve(segments_.size());
        for (const auto& seg : segments_)
            removed.push_back(seg.id);
        segments_.clear();
        selection_cleared = selected_.has_value();
        selected_.reset();
        removed_cb = on_segment_removed_;
    }

    MOTIONLINE_LOG_INFO("timeline", "cleared {} segment(s)", removed.size());
    if (removed_cb)
    {
        for (SegmentId id : removed)
            removed_cb(id);
    }
    if (selection_cleared)
        notify_selection(std::nullopt);
}

void TimelineModel::replace_contents(double total_duration, std::vector<TimelineSegment> segments)
{
    if (!std::isfinite(total_duration) || total_duration <= 0.0)
    {
        throw InvalidRangeError("total duration must be > 0, got " + std::to_string(total_duration));
    }

    SegmentId max_id = 0;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        const auto& seg = segments[i];
        if (seg.id == INVALID_SEGMENT_ID)
        {
            throw TimelineError("segment at index " + std::to_string(i) + " has no id");
        }
        for (size_t j = 0; j < i; ++j)
        {
            if (segments[j].id == seg.id)
                throw TimelineError("segment id " + std::to_string(seg.id) + " is repeated");
        }
        validate_segment_range(seg.start_time, seg.end_time, total_duration);
        max_id = std::max(max_id, seg.id);
    }

    std::vector<SegmentId> removed;
    std::vector<SegmentId> added;
    SegmentCallback        removed_cb;
    SegmentCallback        added_cb;
    TimeCallback           duration_cb;
    TimeCallback           time_cb;
    bool                   selection_cleared = false;
    bool                   time_clamped      = false;
    double                 clamped_time      = 0.0;
    {
        std::unique_lock lock(mutex_);
        for (const auto& seg : segments_)
            removed.push_back(seg.id);
        for (const auto& seg : segments)
            added.push_back(seg.id);

        segments_         = std::move(segments);
        total_duration_   = total_duration;
        next_id_          = std::max(next_id_, max_id + 1);
        selection_cleared = selected_.has_value();
        selected_.reset();
        if (current_time_ > total_duration_)
        {
            current_time_ = total_duration_;
            time_clamped  = true;
        }
        clamped_time = current_time_;

        removed_cb  = on_segment_removed_;
        added_cb    = on_segment_added_;
        duration_cb = on_duration_change_;
        time_cb     = on_time_change_;
    }

    MOTIONLINE_LOG_INFO("timeline",
                        "loaded {} segment(s), duration {}s",
                        added.size(),
                        total_duration);
    if (removed_cb)
    {
        for (SegmentId id : removed)
            removed_cb(id);
    }
    if (duration_cb)
        duration_cb(total_duration);
    if (added_cb)
    {
        for (SegmentId id : added)
            added_cb(id);
    }
    if (selection_cleared)
        notify_selection(std::nullopt);
    if (time_clamped && time_cb)
        time_cb(clamped_time);
}

std::optional<TimelineSegment> TimelineModel::segment(SegmentId id) const
{
    std::shared_lock lock(mutex_);
    const auto*      seg = find_unlocked(id);
    if (!seg)
        return std::nullopt;
    return *seg;
}

bool TimelineModel::contains(SegmentId id) const
{
    std::shared_lock lock(mutex_);
    return find_unlocked(id) != nullptr;
}

std::optional<size_t> TimelineModel::index_of(SegmentId id) const
{
    std::shared_lock lock(mutex_);
    for (size_t i = 0; i < segments_.size(); ++i)
    {
        if (segments_[i].id == id)
            return i;
    }
    return std::nullopt;
}

std::vector<TimelineSegment> TimelineModel::segments() const
{
    std::shared_lock lock(mutex_);
    return segments_;
}

size_t TimelineModel::segment_count() const
{
    std::shared_lock lock(mutex_);
    return segments_.size();
}

// ─── Property edits ──────────────────────────────────────────────────────────

void TimelineModel::rename_segment(SegmentId id, const std::string& name)
{
    edit_segment(id, [&name](TimelineSegment& seg) { seg.name = name; });
}

void TimelineModel::set_segment_kind(SegmentId id, SegmentKind kind)
{
    edit_segment(id,
                 [kind](TimelineSegment& seg)
                 {
                     // Custom colours survive a kind change
                     if (seg.color == default_color(seg.kind))
                         seg.color = default_color(kind);
                     seg.kind = kind;
                 });
}

void TimelineModel::set_segment_color(SegmentId id, Color color)
{
    edit_segment(id, [color](TimelineSegment& seg) { seg.color = color; });
}

void TimelineModel::set_segment_description(SegmentId id, const std::string& description)
{
    edit_segment(id, [&description](TimelineSegment& seg) { seg.description = description; });
}

void TimelineModel::set_segment_locked(SegmentId id, bool locked)
{
    edit_segment(id, [locked](TimelineSegment& seg) { seg.locked = locked; });
}

bool TimelineModel::toggle_segment_lock(SegmentId id)
{
    bool now_locked = false;
    edit_segment(id,
                 [&now_locked](TimelineSegment& seg)
                 {
                     seg.locked = !seg.locked;
                     now_locked = seg.locked;
                 });
    return now_locked;
}

void TimelineModel::set_segment_visible(SegmentId id, bool visible)
{
    edit_segment(id, [visible](TimelineSegment& seg) { seg.visible = visible; });
}

void TimelineModel::set_segment_track(SegmentId id, uint32_t track_index)
{
    edit_segment(id, [track_index](TimelineSegment& seg) { seg.track_index = track_index; });
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<TimelineSegment> TimelineModel::segment_at(double time, uint32_t track_index) const
{
    std::shared_lock lock(mutex_);
    for (const auto& seg : segments_)
    {
        if (seg.visible && seg.track_index == track_index && seg.contains_time(time))
            return seg;
    }
    return std::nullopt;
}

std::vector<TimelineSegment> TimelineModel::segments_in_range(double start, double end) const
{
    std::vector<TimelineSegment> result;
    if (!(start < end))
        return result;

    std::shared_lock lock(mutex_);
    for (const auto& seg : segments_)
    {
        if (seg.intersects(start, end))
            result.push_back(seg);
    }
    return result;
}

std::vector<std::pair<SegmentId, SegmentId>> TimelineModel::find_overlaps() const
{
    std::vector<std::pair<SegmentId, SegmentId>> result;

    std::shared_lock lock(mutex_);
    for (size_t i = 0; i < segments_.size(); ++i)
    {
        for (size_t j = i + 1; j < segments_.size(); ++j)
        {
            const auto& a = segments_[i];
            const auto& b = segments_[j];
            if (a.track_index == b.track_index && a.overlaps(b))
                result.emplace_back(a.id, b.id);
        }
    }
    return result;
}

std::vector<SegmentId> TimelineModel::segments_beyond_duration() const
{
    std::vector<SegmentId> result;

    std::shared_lock lock(mutex_);
    for (const auto& seg : segments_)
    {
        if (seg.end_time > total_duration_)
            result.push_back(seg.id);
    }
    return result;
}

uint32_t TimelineModel::used_track_count() const
{
    std::shared_lock lock(mutex_);
    uint32_t         count = 0;
    for (const auto& seg : segments_)
    {
        count = std::max(count, seg.track_index + 1);
    }
    return count;
}

TimelineModel::Snapshot TimelineModel::snapshot() const
{
    std::shared_lock lock(mutex_);
    Snapshot         snap;
    snap.total_duration = total_duration_;
    snap.current_time   = current_time_;
    snap.selected       = selected_;
    snap.segments       = segments_;
    return snap;
}

// ─── Duration & playhead ─────────────────────────────────────────────────────

double TimelineModel::total_duration() const
{
    std::shared_lock lock(mutex_);
    return total_duration_;
}

void TimelineModel::set_total_duration(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0)
    {
        throw InvalidRangeError("total duration must be > 0, got " + std::to_string(seconds));
    }

    TimeCallback duration_cb;
    TimeCallback time_cb;
    bool         time_clamped = false;
    double       clamped_time = 0.0;
    size_t       stranded     = 0;
    {
        std::unique_lock lock(mutex_);
        if (total_duration_ == seconds)
            return;
        total_duration_ = seconds;
        if (current_time_ > seconds)
        {
            current_time_ = seconds;
            time_clamped  = true;
        }
        clamped_time = current_time_;
        for (const auto& seg : segments_)
        {
            if (seg.end_time > seconds)
                ++stranded;
        }
        duration_cb = on_duration_change_;
        time_cb     = on_time_change_;
    }

    if (stranded > 0)
    {
        MOTIONLINE_LOG_WARN("timeline",
                            "duration set to {}s; {} segment(s) now extend past the end",
                            seconds,
                            stranded);
    }
    if (duration_cb)
        duration_cb(seconds);
    if (time_clamped && time_cb)
        time_cb(clamped_time);
}

double TimelineModel::current_time() const
{
    std::shared_lock lock(mutex_);
    return current_time_;
}

void TimelineModel::set_current_time(double seconds)
{
    if (!std::isfinite(seconds))
        return;

    TimeCallback cb;
    double       applied;
    {
        std::unique_lock lock(mutex_);
        applied = std::clamp(seconds, 0.0, total_duration_);
        if (applied == current_time_)
            return;
        current_time_ = applied;
        cb            = on_time_change_;
    }
    if (cb)
        cb(applied);
}

// ─── Selection ───────────────────────────────────────────────────────────────

void TimelineModel::select(SegmentId id)
{
    {
        std::unique_lock lock(mutex_);
        require_unlocked(id);
        if (selected_ && *selected_ == id)
            return;
        selected_ = id;
    }
    notify_selection(id);
}

void TimelineModel::clear_selection()
{
    {
        std::unique_lock lock(mutex_);
        if (!selected_)
            return;
        selected_.reset();
    }
    notify_selection(std::nullopt);
}

std::optional<SegmentId> TimelineModel::selected() const
{
    std::shared_lock lock(mutex_);
    return selected_;
}

// ─── Callbacks ───────────────────────────────────────────────────────────────

void TimelineModel::set_on_segment_added(SegmentCallback cb)
{
    std::unique_lock lock(mutex_);
    on_segment_added_ = std::move(cb);
}

void TimelineModel::set_on_segment_removed(SegmentCallback cb)
{
    std::unique_lock lock(mutex_);
    on_segment_removed_ = std::move(cb);
}

void TimelineModel::set_on_segment_changed(SegmentCallback cb)
{
    std::unique_lock lock(mutex_);
    on_segment_changed_ = std::move(cb);
}

void TimelineModel::set_on_selection_change(SelectionCallback cb)
{
    std::unique_lock lock(mutex_);
    on_selection_change_ = std::move(cb);
}

void TimelineModel::set_on_duration_change(TimeCallback cb)
{
    std::unique_lock lock(mutex_);
    on_duration_change_ = std::move(cb);
}

void TimelineModel::set_on_time_change(TimeCallback cb)
{
    std::unique_lock lock(mutex_);
    on_time_change_ = std::move(cb);
}

}   // namespace motionline
