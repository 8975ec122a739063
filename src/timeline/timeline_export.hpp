#pragma once

#include <motionline/fwd.hpp>
#include <string>
#include <vector>

#include "timeline/timeline_segment.hpp"

namespace motionline
{

// Round-trippable object model of a timeline, handed to project persistence
// and exporters. audio_file_ref is opaque to this library.
struct TimelineExport
{
    static constexpr int FORMAT_VERSION = 1;

    double                       duration = 0.0;
    std::vector<TimelineSegment> segments;
    std::string                  audio_file_ref;
};

// Capture the model (segments in insertion order, ids preserved).
TimelineExport export_timeline(const TimelineModel& model, std::string audio_file_ref = {});

// Replace the model's duration and segments with doc. Atomic: the model is
// untouched if any segment violates 0 <= start < end <= duration or ids are
// missing or repeated (InvalidRangeError / TimelineError).
void import_timeline(TimelineModel& model, const TimelineExport& doc);

// JSON text form, colors as "#RRGGBB".
std::string serialize_timeline(const TimelineExport& doc);

// Throws TimelineError on a malformed document (missing duration, unknown
// kind, bad color, missing segment bounds or a newer format version).
// Ranges are checked by import_timeline, not here.
TimelineExport deserialize_timeline(const std::string& json);

// File helpers. save returns false when the file cannot be written; load
// throws TimelineError when it cannot be read or parsed.
bool           save_timeline(const TimelineExport& doc, const std::string& path);
TimelineExport load_timeline(const std::string& path);

}   // namespace motionline
