#include "timeline/timeline_segment.hpp"

namespace motionline
{

const char* kind_name(SegmentKind kind)
{
    switch (kind)
    {
        case SegmentKind::Animation:
            return "animation";
        case SegmentKind::Pause:
            return "pause";
        case SegmentKind::Transition:
            return "transition";
        case SegmentKind::Marker:
            return "marker";
        case SegmentKind::Audio:
            return "audio";
        case SegmentKind::Video:
            return "video";
    }
    return "animation";
}

std::optional<SegmentKind> parse_kind(std::string_view name)
{
    for (SegmentKind kind : ALL_SEGMENT_KINDS)
    {
        if (name == kind_name(kind))
            return kind;
    }
    return std::nullopt;
}

Color default_color(SegmentKind kind)
{
    switch (kind)
    {
        case SegmentKind::Animation:
            return rgb_hex(0x2196F3);   // blue
        case SegmentKind::Pause:
            return rgb_hex(0xFF9800);   // orange
        case SegmentKind::Transition:
            return rgb_hex(0x4CAF50);   // green
        case SegmentKind::Marker:
            return rgb_hex(0xF44336);   // red
        case SegmentKind::Audio:
            return rgb_hex(0x9C27B0);   // purple
        case SegmentKind::Video:
            return rgb_hex(0x00BCD4);   // teal
    }
    return colors::neutral_gray;
}

double default_span(SegmentKind kind)
{
    return kind == SegmentKind::Marker ? 0.1 : 2.0;
}

TimelineSegment make_segment(double      start_time,
                             double      end_time,
                             SegmentKind kind,
                             uint32_t    track_index,
                             std::string name)
{
    TimelineSegment seg;
    seg.start_time  = start_time;
    seg.end_time    = end_time;
    seg.kind        = kind;
    seg.color       = default_color(kind);
    seg.track_index = track_index;
    seg.name        = std::move(name);
    return seg;
}

}   // namespace motionline
