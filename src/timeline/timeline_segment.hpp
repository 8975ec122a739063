#pragma once

#include <cstdint>
#include <motionline/color.hpp>
#include <motionline/fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace motionline
{

// Closed set of segment kinds. Color and icon selection switch on this.
enum class SegmentKind : uint8_t
{
    Animation,
    Pause,
    Transition,
    Marker,
    Audio,
    Video,
};

inline constexpr SegmentKind ALL_SEGMENT_KINDS[] = {
    SegmentKind::Animation,
    SegmentKind::Pause,
    SegmentKind::Transition,
    SegmentKind::Marker,
    SegmentKind::Audio,
    SegmentKind::Video,
};

// Lowercase tag used in the export model ("animation", "pause", ...).
const char* kind_name(SegmentKind kind);

std::optional<SegmentKind> parse_kind(std::string_view name);

// Default display color of a kind.
Color default_color(SegmentKind kind);

// Span given to segments created by a click (2 s, markers 0.1 s).
double default_span(SegmentKind kind);

// A named, time-bounded region on one track.
//
// Invariant while owned by a TimelineModel: 0 <= start_time < end_time <=
// total duration (see TimelineModel::set_total_duration for the one
// documented exception).
struct TimelineSegment
{
    SegmentId   id          = INVALID_SEGMENT_ID;
    uint32_t    track_index = 0;
    double      start_time  = 0.0;
    double      end_time    = 0.0;
    std::string name;
    SegmentKind kind  = SegmentKind::Animation;
    Color       color = default_color(SegmentKind::Animation);
    std::string description;
    bool        locked  = false;   // blocks drag/resize, not programmatic edits
    bool        visible = true;    // hidden segments are skipped by hit-testing

    double duration() const { return end_time - start_time; }

    // Closed interval test: both edges count as inside.
    bool contains_time(double time) const { return start_time <= time && time <= end_time; }

    // True when the open intervals intersect; touching edges do not overlap.
    bool overlaps(const TimelineSegment& other) const
    {
        return !(end_time <= other.start_time || start_time >= other.end_time);
    }

    // True when the segment intersects the half-open window [start, end).
    bool intersects(double start, double end) const { return start_time < end && end_time > start; }
};

// Convenience constructor: colour follows the kind.
TimelineSegment make_segment(double      start_time,
                             double      end_time,
                             SegmentKind kind        = SegmentKind::Animation,
                             uint32_t    track_index = 0,
                             std::string name        = {});

}   // namespace motionline
