#include "timeline/timeline_export.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <motionline/errors.hpp>
#include <motionline/logger.hpp>
#include <optional>
#include <sstream>

#include "core/json_util.hpp"
#include "timeline/timeline_model.hpp"

namespace motionline
{

// ─── Object model ────────────────────────────────────────────────────────────

TimelineExport export_timeline(const TimelineModel& model, std::string audio_file_ref)
{
    auto snap = model.snapshot();

    TimelineExport doc;
    doc.duration       = snap.total_duration;
    doc.segments       = std::move(snap.segments);
    doc.audio_file_ref = std::move(audio_file_ref);
    return doc;
}

void import_timeline(TimelineModel& model, const TimelineExport& doc)
{
    model.replace_contents(doc.duration, doc.segments);
    MOTIONLINE_LOG_INFO("export", "imported timeline with {} segment(s)", doc.segments.size());
}

// ─── JSON ────────────────────────────────────────────────────────────────────

std::string serialize_timeline(const TimelineExport& doc)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << TimelineExport::FORMAT_VERSION << ",\n";
    os << "  \"duration\": " << json::format_number(doc.duration) << ",\n";
    os << "  \"audioFileRef\": \"" << json::escape(doc.audio_file_ref) << "\",\n";
    os << "  \"segments\": [\n";
    for (size_t i = 0; i < doc.segments.size(); ++i)
    {
        const auto& s = doc.segments[i];
        os << "    {\n";
        os << "      \"id\": " << s.id << ",\n";
        os << "      \"name\": \"" << json::escape(s.name) << "\",\n";
        os << "      \"kind\": \"" << kind_name(s.kind) << "\",\n";
        os << "      \"startTime\": " << json::format_number(s.start_time) << ",\n";
        os << "      \"endTime\": " << json::format_number(s.end_time) << ",\n";
        os << "      \"color\": \"" << to_hex(s.color) << "\",\n";
        os << "      \"description\": \"" << json::escape(s.description) << "\",\n";
        os << "      \"locked\": " << (s.locked ? "true" : "false") << ",\n";
        os << "      \"visible\": " << (s.visible ? "true" : "false") << ",\n";
        os << "      \"trackIndex\": " << s.track_index << "\n";
        os << "    }";
        if (i + 1 < doc.segments.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// A JSON number that is an exact, in-range value of the unsigned type T.
template <typename T>
static std::optional<T> whole_number(double value)
{
    if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value
        || value >= std::ldexp(1.0, std::numeric_limits<T>::digits))
    {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

static TimelineSegment parse_segment(const std::string& obj, size_t index)
{
    auto fail = [index](const std::string& what)
    { return TimelineError("segment " + std::to_string(index) + ": " + what); };

    TimelineSegment seg;

    auto number = json::read_number(obj, "id");
    if (!number)
        throw fail("missing id");
    auto id = whole_number<SegmentId>(*number);
    if (!id || *id == INVALID_SEGMENT_ID)
        throw fail("invalid id " + json::format_number(*number));
    seg.id = *id;

    auto start = json::read_number(obj, "startTime");
    auto end   = json::read_number(obj, "endTime");
    if (!start || !end)
        throw fail("missing startTime/endTime");
    seg.start_time = *start;
    seg.end_time   = *end;

    if (auto kind_text = json::read_string(obj, "kind"))
    {
        auto kind = parse_kind(*kind_text);
        if (!kind)
            throw fail("unknown kind '" + *kind_text + "'");
        seg.kind = *kind;
    }

    if (auto color_text = json::read_string(obj, "color"))
    {
        auto color = parse_hex(*color_text);
        if (!color)
            throw fail("bad color '" + *color_text + "'");
        seg.color = *color;
    }
    else
    {
        seg.color = default_color(seg.kind);
    }

    seg.name        = json::read_string(obj, "name").value_or("");
    seg.description = json::read_string(obj, "description").value_or("");
    seg.locked      = json::read_bool(obj, "locked").value_or(false);
    seg.visible     = json::read_bool(obj, "visible").value_or(true);

    auto track_number = json::read_number(obj, "trackIndex").value_or(0.0);
    auto track        = whole_number<uint32_t>(track_number);
    if (!track)
        throw fail("invalid trackIndex " + json::format_number(track_number));
    seg.track_index = *track;
    return seg;
}

TimelineExport deserialize_timeline(const std::string& json_text)
{
    if (json_text.empty())
        throw TimelineError("empty timeline document");

    std::string top = json::without_array(json_text, "segments");

    if (auto version = json::read_number(top, "version"))
    {
        if (*version > TimelineExport::FORMAT_VERSION)
        {
            throw TimelineError("timeline format version " + json::format_number(*version)
                                + " is newer than supported");
        }
    }

    auto duration = json::read_number(top, "duration");
    if (!duration)
        throw TimelineError("timeline document has no duration");

    TimelineExport doc;
    doc.duration       = *duration;
    doc.audio_file_ref = json::read_string(top, "audioFileRef").value_or("");

    auto objects = json::read_object_array(json_text, "segments");
    doc.segments.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i)
    {
        doc.segments.push_back(parse_segment(objects[i], i));
    }
    return doc;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool save_timeline(const TimelineExport& doc, const std::string& path)
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path);
    if (!f.is_open())
    {
        MOTIONLINE_LOG_ERROR("export", "cannot open '{}' for writing", path);
        return false;
    }
    f << serialize_timeline(doc);
    return f.good();
}

TimelineExport load_timeline(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw TimelineError("cannot open timeline file '" + path + "'");
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize_timeline(text);
}

}   // namespace motionline
