#include "core/timeline_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <motionline/logger.hpp>
#include <sstream>

#include "core/json_util.hpp"

namespace motionline
{

const char* snap_mode_name(SnapMode mode)
{
    switch (mode)
    {
        case SnapMode::None:
            return "none";
        case SnapMode::Frame:
            return "frame";
        case SnapMode::Grid:
            return "grid";
    }
    return "none";
}

std::optional<SnapMode> parse_snap_mode(std::string_view name)
{
    if (name == "none")
        return SnapMode::None;
    if (name == "frame")
        return SnapMode::Frame;
    if (name == "grid")
        return SnapMode::Grid;
    return std::nullopt;
}

const char* sync_source_name(SyncSource source)
{
    return source == SyncSource::Audio ? "audio" : "internal";
}

std::optional<SyncSource> parse_sync_source(std::string_view name)
{
    if (name == "internal")
        return SyncSource::Internal;
    if (name == "audio")
        return SyncSource::Audio;
    return std::nullopt;
}

// ─── Validation ──────────────────────────────────────────────────────────────

static bool clamp_field(double& value, double lo, double hi, double fallback, const char* name)
{
    double fixed = std::isfinite(value) ? std::clamp(value, lo, hi) : fallback;
    if (fixed == value)
        return false;
    MOTIONLINE_LOG_WARN("config", "{} = {} out of range, using {}", name, value, fixed);
    value = fixed;
    return true;
}

int TimelineConfig::sanitize()
{
    int changed = 0;
    changed += clamp_field(total_duration, 0.1, 86400.0, 30.0, "total_duration");
    changed += clamp_field(fps, 1.0, MAX_FPS, 30.0, "fps");
    changed += clamp_field(time_precision, 0.001, 10.0, 0.1, "time_precision");
    changed += clamp_field(pixels_per_second, MIN_ZOOM, MAX_ZOOM, 50.0, "pixels_per_second");
    changed += clamp_field(ruler_height, 0.0, 200.0, 30.0, "ruler_height");
    changed += clamp_field(track_height, 4.0, 400.0, 40.0, "track_height");
    changed += clamp_field(track_spacing, 0.0, 100.0, 5.0, "track_spacing");
    changed += clamp_field(edge_tolerance_px, 1.0, 50.0, 8.0, "edge_tolerance_px");
    changed += clamp_field(min_segment_duration, 0.001, 10.0, 0.1, "min_segment_duration");
    changed += clamp_field(default_segment_duration, 0.001, 3600.0, 2.0, "default_segment_duration");
    changed += clamp_field(marker_duration, 0.001, 10.0, 0.1, "marker_duration");
    changed += clamp_field(tick_interval, 0.001, 1.0, 0.05, "tick_interval");
    changed += clamp_field(speed, 0.25, 2.0, 1.0, "speed");

    if (track_count == 0)
    {
        MOTIONLINE_LOG_WARN("config", "track_count = 0 out of range, using 1");
        track_count = 1;
        ++changed;
    }
    return changed;
}

void TimelineConfig::apply_log_level() const
{
    Logger::instance().set_level(log_level);
}

std::string TimelineConfig::track_name(uint32_t index) const
{
    if (index < track_names.size() && !track_names[index].empty())
        return track_names[index];
    return "Track " + std::to_string(index + 1);
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string TimelineConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << VERSION << ",\n";
    os << "  \"total_duration\": " << json::format_number(total_duration) << ",\n";
    os << "  \"fps\": " << json::format_number(fps) << ",\n";
    os << "  \"time_precision\": " << json::format_number(time_precision) << ",\n";
    os << "  \"track_count\": " << track_count << ",\n";
    os << "  \"track_names\": [";
    for (size_t i = 0; i < track_names.size(); ++i)
    {
        os << "\"" << json::escape(track_names[i]) << "\"";
        if (i + 1 < track_names.size())
            os << ", ";
    }
    os << "],\n";
    os << "  \"pixels_per_second\": " << json::format_number(pixels_per_second) << ",\n";
    os << "  \"ruler_height\": " << json::format_number(ruler_height) << ",\n";
    os << "  \"track_height\": " << json::format_number(track_height) << ",\n";
    os << "  \"track_spacing\": " << json::format_number(track_spacing) << ",\n";
    os << "  \"edge_tolerance_px\": " << json::format_number(edge_tolerance_px) << ",\n";
    os << "  \"min_segment_duration\": " << json::format_number(min_segment_duration) << ",\n";
    os << "  \"default_segment_duration\": " << json::format_number(default_segment_duration)
       << ",\n";
    os << "  \"marker_duration\": " << json::format_number(marker_duration) << ",\n";
    os << "  \"snap_mode\": \"" << snap_mode_name(snap_mode) << "\",\n";
    os << "  \"tick_interval\": " << json::format_number(tick_interval) << ",\n";
    os << "  \"speed\": " << json::format_number(speed) << ",\n";
    os << "  \"loop_enabled\": " << (loop_enabled ? "true" : "false") << ",\n";
    os << "  \"sync_source\": \"" << sync_source_name(sync_source) << "\",\n";
    os << "  \"log_level\": \"" << log_level_name(log_level) << "\"\n";
    os << "}\n";
    return os.str();
}

bool TimelineConfig::deserialize(const std::string& text)
{
    if (text.empty())
        return false;

    if (auto ver = json::read_number(text, "version"); ver && *ver > VERSION)
    {
        MOTIONLINE_LOG_WARN("config", "config version {} is newer than supported", *ver);
        return false;
    }

    auto read = [&text](const char* key, double& field)
    {
        if (auto v = json::read_number(text, key))
            field = *v;
    };

    read("total_duration", total_duration);
    read("fps", fps);
    read("time_precision", time_precision);
    read("pixels_per_second", pixels_per_second);
    read("ruler_height", ruler_height);
    read("track_height", track_height);
    read("track_spacing", track_spacing);
    read("edge_tolerance_px", edge_tolerance_px);
    read("min_segment_duration", min_segment_duration);
    read("default_segment_duration", default_segment_duration);
    read("marker_duration", marker_duration);
    read("tick_interval", tick_interval);
    read("speed", speed);

    if (auto v = json::read_number(text, "track_count"))
        track_count = *v >= 0.0 && *v <= 4294967295.0 ? static_cast<uint32_t>(*v) : 0;

    auto names = json::read_string_array(text, "track_names");
    if (!names.empty())
        track_names = std::move(names);

    if (auto v = json::read_bool(text, "loop_enabled"))
        loop_enabled = *v;

    if (auto v = json::read_string(text, "snap_mode"))
    {
        if (auto mode = parse_snap_mode(*v))
            snap_mode = *mode;
        else
            MOTIONLINE_LOG_WARN("config", "unknown snap_mode '{}'", *v);
    }
    if (auto v = json::read_string(text, "sync_source"))
    {
        if (auto source = parse_sync_source(*v))
            sync_source = *source;
        else
            MOTIONLINE_LOG_WARN("config", "unknown sync_source '{}'", *v);
    }
    if (auto v = json::read_string(text, "log_level"))
    {
        if (auto level = parse_log_level(*v))
            log_level = *level;
        else
            MOTIONLINE_LOG_WARN("config", "unknown log_level '{}'", *v);
    }

    sanitize();
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool TimelineConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path);
    if (!f.is_open())
    {
        MOTIONLINE_LOG_ERROR("config", "cannot write config '{}'", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool TimelineConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    bool        ok = deserialize(text);
    if (ok)
        MOTIONLINE_LOG_INFO("config", "loaded timeline config from '{}'", path);
    return ok;
}

std::string TimelineConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "timeline.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "motionline";
    return (dir / "timeline.json").string();
}

}   // namespace motionline
