#pragma once

#include <cstdint>
#include <motionline/logger.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motionline
{

// Snap behavior for interactive drag/resize/create.
enum class SnapMode : uint8_t
{
    None,
    Frame,   // snap to 1/fps
    Grid,    // snap to time_precision
};

// Where PlaybackClock takes its time from.
enum class SyncSource : uint8_t
{
    Internal,   // free-running fixed ticks
    Audio,      // follows the audio transport's position events
};

const char*               snap_mode_name(SnapMode mode);
std::optional<SnapMode>   parse_snap_mode(std::string_view name);
const char*               sync_source_name(SyncSource source);
std::optional<SyncSource> parse_sync_source(std::string_view name);

// Persistent timeline settings: project defaults, pixel layout, interaction
// tolerances and playback cadence. Saved as JSON at
// ~/.config/motionline/timeline.json.
struct TimelineConfig
{
    static constexpr int    VERSION  = 1;
    static constexpr double MIN_ZOOM = 10.0;   // px per second
    static constexpr double MAX_ZOOM = 200.0;
    static constexpr double MAX_FPS  = 240.0;

    // Timeline
    double                   total_duration = 30.0;
    double                   fps            = 30.0;
    double                   time_precision = 0.1;
    uint32_t                 track_count    = 4;
    std::vector<std::string> track_names{"Main", "Audio", "Effects", "Markers"};

    // Layout
    double pixels_per_second = 50.0;
    double ruler_height      = 30.0;
    double track_height      = 40.0;
    double track_spacing     = 5.0;

    // Interaction
    double   edge_tolerance_px        = 8.0;
    double   min_segment_duration     = 0.1;
    double   default_segment_duration = 2.0;
    double   marker_duration          = 0.1;
    SnapMode snap_mode                = SnapMode::None;

    // Playback
    double     tick_interval = 0.05;
    double     speed         = 1.0;
    bool       loop_enabled  = false;
    SyncSource sync_source   = SyncSource::Internal;

    // Diagnostics
    LogLevel log_level = LogLevel::Info;

    // Clamp every field into its valid range, logging each correction at
    // Warning. Returns the number of fields changed.
    int sanitize();

    // Push log_level to the process logger.
    void apply_log_level() const;

    // Name shown for a track; falls back to "Track N".
    std::string track_name(uint32_t index) const;

    std::string serialize() const;

    // Missing keys keep their current value, unknown keys are ignored.
    // Returns false on empty input or a newer version.
    bool deserialize(const std::string& json);

    // Returns true on success; load returns false when the file is missing.
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    static std::string default_path();
};

}   // namespace motionline
