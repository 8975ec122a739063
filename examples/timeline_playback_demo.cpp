#include <motionline/motionline.hpp>
#include <string>
#include <vector>

#include "anim/keyframe_interpolator.hpp"
#include "anim/playback_clock.hpp"
#include "core/timeline_config.hpp"
#include "timeline/timeline_export.hpp"
#include "timeline/timeline_history.hpp"
#include "timeline/timeline_model.hpp"
#include "ui/timeline_interaction.hpp"

using namespace motionline;

// Headless walk through the engine: build a timeline, edit it with
// simulated pointer input, play it back and export it.
int main()
{
    TimelineConfig config;
    bool           have_config = config.load(TimelineConfig::default_path());
    config.apply_log_level();
    Logger::instance().set_category_level("interaction", LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());
    if (!have_config)
        MOTIONLINE_LOG_INFO("example", "no config at '{}', using defaults", TimelineConfig::default_path());

    TimelineModel model(6.0);
    model.add_segment(make_segment(0.0, 2.0, SegmentKind::Animation, 0, "Title in"));
    model.add_segment(make_segment(2.0, 2.5, SegmentKind::Pause, 0, "Hold"));
    auto fade = model.add_segment(make_segment(2.5, 4.0, SegmentKind::Transition, 0, "Fade"));

    TimelineHistory               history;
    TimelineInteractionController controller(model);
    controller.set_history(&history);

    // Drag "Fade" half a second later: 50 px/s, lane 0 at y 30..70
    PointerEvent ev;
    ev.y = 50.0;
    ev.x = controller.time_to_x(3.0);
    controller.pointer_down(ev);
    ev.x += 25.0;
    controller.pointer_move(ev);
    controller.pointer_up(ev);

    auto moved = model.segment(fade);
    MOTIONLINE_LOG_INFO("example", "'Fade' now spans {}s..{}s", moved->start_time, moved->end_time);
    MOTIONLINE_LOG_INFO("example", "undo available: {}", history.undo_description());

    // Evaluate an element while the clock runs.
    AnimatedElement title;
    title.id            = "title";
    title.initial_state = {{"x", 0.0}, {"opacity", 0.0}, {"text", std::string("Hello")}};
    title.animation     = AnimationDescriptor{
        0.0, 2.0, "ease_out", {{"x", 320.0}, {"opacity", 1.0}, {"text", std::string("World")}}};

    for (const auto& problem : KeyframeInterpolator::validate(title))
        MOTIONLINE_LOG_WARN("example", "element '{}': {}", title.id, problem);

    KeyframeInterpolator interp;
    PlaybackClock        clock(model);
    clock.set_on_state_change(
        [](PlaybackState s)
        { MOTIONLINE_LOG_INFO("example", "playback {}", playback_state_name(s)); });

    clock.play();
    int ticks = 0;
    while (clock.tick())
    {
        if (++ticks % 10 == 0)
        {
            auto state = interp.state_at(title, clock.current_time());
            MOTIONLINE_LOG_INFO("example",
                                "t={} x={} opacity={} text={}",
                                clock.current_time(),
                                std::get<double>(state["x"]),
                                std::get<double>(state["opacity"]),
                                std::get<std::string>(state["text"]));
        }
    }

    auto doc = export_timeline(model, "soundtrack.ogg");
    if (save_timeline(doc, "timeline_demo.json"))
        MOTIONLINE_LOG_INFO("example", "wrote {} segments to timeline_demo.json", doc.segments.size());

    return 0;
}
