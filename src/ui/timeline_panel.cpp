#include "ui/timeline_panel.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "anim/playback_clock.hpp"
#include "timeline/timeline_model.hpp"
#include "ui/timeline_interaction.hpp"

#ifdef MOTIONLINE_USE_IMGUI
    #include "imgui.h"
#endif

namespace motionline
{

TimelinePanel::TimelinePanel(TimelineModel&                 model,
                             TimelineInteractionController& controller,
                             PlaybackClock&                 clock)
    : model_(model), controller_(controller), clock_(clock)
{
}

// ─── Layout ──────────────────────────────────────────────────────────────────

static SegmentRect make_rect(const TimelineInteractionController& ctl,
                             SegmentId                            id,
                             uint32_t                             track,
                             double                               start,
                             double                               end)
{
    const auto& cfg = ctl.config();
    float       top = static_cast<float>(ctl.track_top(track));

    SegmentRect r;
    r.id = id;
    r.x0 = static_cast<float>(ctl.time_to_x(start));
    r.x1 = static_cast<float>(ctl.time_to_x(end));
    r.y0 = top;
    r.y1 = top + static_cast<float>(cfg.track_height);
    return r;
}

std::vector<SegmentRect> TimelinePanel::layout_segments(float width) const
{
    std::vector<SegmentRect> rects;

    double view_start = controller_.view_start();
    double view_end   = controller_.x_to_time(width);
    auto   selected   = model_.selected();
    auto   preview    = controller_.preview();

    for (const auto& seg : model_.segments_in_range(view_start, view_end))
    {
        if (!seg.visible)
            continue;

        double start   = seg.start_time;
        double end     = seg.end_time;
        bool   preview_of_seg = preview && preview->id == seg.id;
        if (preview_of_seg)
        {
            start = preview->start_time;
            end   = preview->end_time;
        }

        auto r        = make_rect(controller_, seg.id, seg.track_index, start, end);
        r.fill        = seg.locked ? lighter(seg.color) : seg.color;
        r.label_color = lightness(r.fill) > 128 ? colors::black : colors::white;
        r.label       = seg.name;
        r.selected    = selected && *selected == seg.id;
        r.locked      = seg.locked;
        r.preview     = preview_of_seg;
        rects.push_back(std::move(r));
    }

    if (preview && preview->id == INVALID_SEGMENT_ID)
    {
        auto kind = controller_.creation_kind();
        auto r    = make_rect(controller_,
                           INVALID_SEGMENT_ID,
                           preview->track_index,
                           preview->start_time,
                           preview->end_time);
        r.fill        = default_color(kind);
        r.label_color = colors::white;
        r.label       = kind_name(kind);
        r.preview     = true;
        rects.push_back(std::move(r));
    }
    return rects;
}

double TimelinePanel::tick_spacing() const
{
    double pps = controller_.pixels_per_second();
    if (pps >= 100.0)
        return 0.5;
    if (pps >= 50.0)
        return 1.0;
    if (pps >= 25.0)
        return 2.0;
    return 5.0;
}

std::vector<RulerTick> TimelinePanel::ruler_ticks(float width) const
{
    std::vector<RulerTick> ticks;

    double spacing  = tick_spacing();
    double view_end = std::min(controller_.x_to_time(width), model_.total_duration());
    auto   first    = static_cast<long>(std::ceil(controller_.view_start() / spacing));
    for (long i = first; static_cast<double>(i) * spacing <= view_end; ++i)
    {
        RulerTick tick;
        tick.time  = static_cast<double>(i) * spacing;
        tick.x     = static_cast<float>(controller_.time_to_x(tick.time));
        tick.major = i % 5 == 0;
        ticks.push_back(tick);
    }
    return ticks;
}

std::string TimelinePanel::format_time(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0)
        seconds = 0.0;
    auto   tenths  = static_cast<long>(std::floor(seconds * 10.0 + 1e-6));
    long   minutes = tenths / 600;
    double rest    = static_cast<double>(tenths % 600) / 10.0;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%04.1f", minutes, rest);
    return buf;
}

// ─── ImGui drawing ───────────────────────────────────────────────────────────

#ifdef MOTIONLINE_USE_IMGUI

static ImU32 to_imu32(const Color& c)
{
    return IM_COL32(c.r, c.g, c.b, c.a);
}

void TimelinePanel::draw(float width, float height)
{
    const auto& cfg           = controller_.config();
    const float header_height = 28.0f;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    ImGui::BeginChild("##motionline_timeline", ImVec2(width, height), true);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    ImVec2      origin    = ImGui::GetCursorScreenPos();

    // ─── Transport controls bar ──────────────────────────────────────
    ImGui::Indent(4.0f);
    ImGui::SetCursorPosY(ImGui::GetCursorPosY() + 4.0f);
    if (ImGui::SmallButton(clock_.is_playing() ? "||" : ">"))
        clock_.toggle_play();
    ImGui::SameLine();
    if (ImGui::SmallButton("[]"))
        clock_.stop();
    ImGui::SameLine();
    if (ImGui::SmallButton("|<"))
        clock_.step_backward();
    ImGui::SameLine();
    if (ImGui::SmallButton(">|"))
        clock_.step_forward();
    ImGui::SameLine();
    bool loop = clock_.loop_enabled();
    if (ImGui::Checkbox("Loop", &loop))
        clock_.set_loop_enabled(loop);
    ImGui::SameLine();
    ImGui::Text("%s / %s  %.2fx",
                format_time(clock_.current_time()).c_str(),
                format_time(model_.total_duration()).c_str(),
                clock_.speed());
    ImGui::Unindent(4.0f);

    ImVec2 canvas(origin.x, origin.y + header_height);
    float  canvas_h = height - header_height;

    // ─── Time ruler ──────────────────────────────────────────────────
    draw_list->AddRectFilled(canvas,
                             ImVec2(canvas.x + width, canvas.y + static_cast<float>(cfg.ruler_height)),
                             IM_COL32(40, 40, 40, 255));
    for (const auto& tick : ruler_ticks(width))
    {
        float px     = canvas.x + tick.x;
        float tick_h = static_cast<float>(cfg.ruler_height) * (tick.major ? 0.6f : 0.3f);
        float bottom = canvas.y + static_cast<float>(cfg.ruler_height);
        draw_list->AddLine(ImVec2(px, bottom - tick_h), ImVec2(px, bottom), IM_COL32(120, 120, 120, 255));
        if (tick.major)
        {
            draw_list->AddText(ImVec2(px + 2, canvas.y + 2),
                               IM_COL32(180, 180, 180, 255),
                               format_time(tick.time).c_str());
        }
    }

    // ─── Lanes ───────────────────────────────────────────────────────
    for (uint32_t i = 0; i < controller_.track_count(); ++i)
    {
        float y  = canvas.y + static_cast<float>(controller_.track_top(i));
        ImU32 bg = (i % 2 == 0) ? IM_COL32(30, 30, 30, 255) : IM_COL32(35, 35, 35, 255);
        draw_list->AddRectFilled(ImVec2(canvas.x, y),
                                 ImVec2(canvas.x + width, y + static_cast<float>(cfg.track_height)),
                                 bg);
        draw_list->AddText(ImVec2(canvas.x + 4, y + 2),
                           IM_COL32(90, 90, 90, 255),
                           cfg.track_name(i).c_str());
    }

    // ─── Segments ────────────────────────────────────────────────────
    for (const auto& r : layout_segments(width))
    {
        ImVec2 a(canvas.x + r.x0, canvas.y + r.y0 + 2);
        ImVec2 b(canvas.x + r.x1, canvas.y + r.y1 - 2);
        ImU32  fill = to_imu32(r.fill);
        if (r.preview)
            fill = (fill & ~IM_COL32_A_MASK) | IM_COL32(0, 0, 0, 170);
        draw_list->AddRectFilled(a, b, fill, 3.0f);

        if (r.selected)
            draw_list->AddRect(a, b, to_imu32(colors::selection), 3.0f, 0, 2.0f);
        else
            draw_list->AddRect(a, b, to_imu32(darker(r.fill)), 3.0f);

        if (r.x1 - r.x0 > 24.0f)
        {
            draw_list->PushClipRect(a, b, true);
            draw_list->AddText(ImVec2(a.x + 4, a.y + 4), to_imu32(r.label_color), r.label.c_str());
            draw_list->PopClipRect();
        }
    }

    // ─── Playhead ────────────────────────────────────────────────────
    float ph_px = canvas.x + static_cast<float>(controller_.time_to_x(clock_.current_time()));
    draw_list->AddLine(ImVec2(ph_px, canvas.y), ImVec2(ph_px, canvas.y + canvas_h), to_imu32(colors::playhead), 2.0f);
    draw_list->AddTriangleFilled(ImVec2(ph_px - 8, canvas.y),
                                 ImVec2(ph_px + 8, canvas.y),
                                 ImVec2(ph_px, canvas.y + 16),
                                 to_imu32(colors::playhead));

    // ─── Input ───────────────────────────────────────────────────────
    ImGui::SetCursorScreenPos(canvas);
    ImGui::InvisibleButton("##timeline_canvas", ImVec2(width, canvas_h));

    const ImGuiIO& io = ImGui::GetIO();
    PointerEvent   ev;
    ev.x                   = io.MousePos.x - canvas.x;
    ev.y                   = io.MousePos.y - canvas.y;
    ev.modifiers.shift     = io.KeyShift;
    ev.modifiers.ctrl      = io.KeyCtrl;
    ev.modifiers.alt       = io.KeyAlt;

    if (ImGui::IsItemHovered() && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left))
    {
        controller_.double_click(ev);
    }
    else if (ImGui::IsItemClicked(ImGuiMouseButton_Left))
    {
        controller_.pointer_down(ev);
    }

    if (controller_.is_active())
    {
        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left))
            controller_.pointer_up(ev);
        else if (ImGui::IsKeyPressed(ImGuiKey_Escape))
            controller_.cancel();
        else
            controller_.pointer_move(ev);
    }
    else if (ImGui::IsItemHovered())
    {
        auto cursor = controller_.pointer_move(ev).cursor;
        if (cursor == CursorShape::Move)
            ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeAll);
        else if (cursor == CursorShape::ResizeHorizontal)
            ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeEW);

        if (ImGui::IsKeyPressed(ImGuiKey_Delete))
            controller_.delete_selected();
    }

    ImGui::EndChild();
    ImGui::PopStyleVar();
}

#endif   // MOTIONLINE_USE_IMGUI

}   // namespace motionline
