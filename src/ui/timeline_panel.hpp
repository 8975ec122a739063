#pragma once

#include <cstdint>
#include <motionline/color.hpp>
#include <motionline/fwd.hpp>
#include <string>
#include <vector>

namespace motionline
{

// Screen-space rectangle of one segment, in panel-local pixels.
struct SegmentRect
{
    SegmentId   id       = INVALID_SEGMENT_ID;   // INVALID for a creation preview
    float       x0       = 0.0f;
    float       y0       = 0.0f;
    float       x1       = 0.0f;
    float       y1       = 0.0f;
    Color       fill;
    Color       label_color;
    std::string label;
    bool        selected = false;
    bool        locked   = false;
    bool        preview  = false;   // range comes from an active gesture
};

struct RulerTick
{
    float  x     = 0.0f;
    double time  = 0.0;
    bool   major = false;   // labelled
};

// TimelinePanel — draws the model through the interaction controller's
// layout and forwards mouse input to it.
//
// The layout computations are always available; the ImGui drawing is
// compiled only with MOTIONLINE_USE_IMGUI.
class TimelinePanel
{
   public:
    TimelinePanel(TimelineModel&                 model,
                  TimelineInteractionController& controller,
                  PlaybackClock&                 clock);

    // Visible segments intersecting the viewport of the given pixel width,
    // with the active gesture's preview range substituted for its segment
    // (or appended, while creating).
    std::vector<SegmentRect> layout_segments(float width) const;

    // Ruler ticks across the viewport; spacing widens as the zoom drops.
    std::vector<RulerTick> ruler_ticks(float width) const;

    // Seconds between ticks at the current zoom.
    double tick_spacing() const;

    // "mm:ss.d" readout of a time.
    static std::string format_time(double seconds);

#ifdef MOTIONLINE_USE_IMGUI
    // Draw the transport bar, ruler, lanes, segments and playhead. Call once
    // per frame.
    void draw(float width, float height);
#endif

   private:
    TimelineModel&                 model_;
    TimelineInteractionController& controller_;
    PlaybackClock&                 clock_;
};

}   // namespace motionline
