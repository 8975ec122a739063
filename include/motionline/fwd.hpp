#pragma once

#include <cstdint>

namespace motionline
{

// Stable segment identifier, assigned by TimelineModel and never reused
// within one model instance.
using SegmentId = uint64_t;

// Sentinel value for "no segment".
inline constexpr SegmentId INVALID_SEGMENT_ID = 0;

struct Color;
struct TimelineSegment;
struct AnimatedElement;
struct AnimationDescriptor;
struct TimelineConfig;
struct TimelineExport;

class Logger;
class KeyframeInterpolator;
class PlaybackClock;
class TimelineModel;
class TimelineHistory;
class TimelineInteractionController;

}   // namespace motionline
