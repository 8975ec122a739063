#include <gtest/gtest.h>

#include <vector>

#include "timeline/timeline_history.hpp"
#include "timeline/timeline_model.hpp"
#include "ui/timeline_interaction.hpp"

using namespace motionline;

// Default layout: 50 px/s, 30 px ruler, 40 px lanes with 5 px gaps, so
// track 0 spans y in [30, 70) and track 1 spans [75, 115).

namespace
{

constexpr double TRACK0_Y = 50.0;
constexpr double TRACK1_Y = 95.0;
constexpr double RULER_Y  = 10.0;

PointerEvent at(double x, double y, Modifiers mods = {})
{
    PointerEvent ev;
    ev.x         = x;
    ev.y         = y;
    ev.modifiers = mods;
    return ev;
}

Modifiers shift()
{
    Modifiers m;
    m.shift = true;
    return m;
}

Modifiers alt()
{
    Modifiers m;
    m.alt = true;
    return m;
}

}   // anonymous namespace

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST(TimelineInteractionLayout, PixelTimeMapping)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    EXPECT_DOUBLE_EQ(ctl.x_to_time(100.0), 2.0);
    EXPECT_DOUBLE_EQ(ctl.time_to_x(2.0), 100.0);

    ctl.set_view_start(1.0);
    EXPECT_DOUBLE_EQ(ctl.x_to_time(100.0), 3.0);
    EXPECT_DOUBLE_EQ(ctl.time_to_x(3.0), 100.0);
}

TEST(TimelineInteractionLayout, TrackLanes)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    EXPECT_FALSE(ctl.y_to_track(RULER_Y).has_value());
    EXPECT_EQ(ctl.y_to_track(30.0), 0u);
    EXPECT_EQ(ctl.y_to_track(69.9), 0u);
    EXPECT_FALSE(ctl.y_to_track(72.0).has_value());   // lane gap
    EXPECT_EQ(ctl.y_to_track(TRACK1_Y), 1u);
    EXPECT_FALSE(ctl.y_to_track(1000.0).has_value());
    EXPECT_DOUBLE_EQ(ctl.track_top(1), 75.0);
}

TEST(TimelineInteractionLayout, TrackCountFollowsModel)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    EXPECT_EQ(ctl.track_count(), 4u);
    model.add_segment(make_segment(0.0, 1.0, SegmentKind::Audio, 6));
    EXPECT_EQ(ctl.track_count(), 7u);
}

TEST(TimelineInteractionLayout, ZoomIsClamped)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    ctl.zoom_in();
    EXPECT_DOUBLE_EQ(ctl.pixels_per_second(), 62.5);
    ctl.set_zoom(500.0);
    EXPECT_DOUBLE_EQ(ctl.pixels_per_second(), TimelineConfig::MAX_ZOOM);
    ctl.set_zoom(1.0);
    EXPECT_DOUBLE_EQ(ctl.pixels_per_second(), TimelineConfig::MIN_ZOOM);
    ctl.zoom_out();
    EXPECT_DOUBLE_EQ(ctl.pixels_per_second(), TimelineConfig::MIN_ZOOM);
}

// ─── Hit testing ─────────────────────────────────────────────────────────────

TEST(TimelineInteractionHitTest, BodyAndEdges)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    auto body = ctl.hit_test(175.0, TRACK0_Y);
    EXPECT_EQ(body.id, id);
    EXPECT_EQ(body.zone, HitZone::Body);

    EXPECT_EQ(ctl.hit_test(104.0, TRACK0_Y).zone, HitZone::StartEdge);
    EXPECT_EQ(ctl.hit_test(96.0, TRACK0_Y).zone, HitZone::StartEdge);
    EXPECT_EQ(ctl.hit_test(247.0, TRACK0_Y).zone, HitZone::EndEdge);

    auto miss = ctl.hit_test(400.0, TRACK0_Y);
    EXPECT_EQ(miss.id, INVALID_SEGMENT_ID);
    EXPECT_EQ(miss.track, 0u);

    EXPECT_EQ(ctl.hit_test(175.0, TRACK1_Y).id, INVALID_SEGMENT_ID);
    EXPECT_FALSE(ctl.hit_test(175.0, RULER_Y).track.has_value());
}

TEST(TimelineInteractionHitTest, TouchingSegmentsPreferEarlier)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          a = model.add_segment(make_segment(0.0, 2.0));
    model.add_segment(make_segment(2.0, 4.0));

    auto hit = ctl.hit_test(100.0, TRACK0_Y);
    EXPECT_EQ(hit.id, a);
    EXPECT_EQ(hit.zone, HitZone::EndEdge);
}

TEST(TimelineInteractionHitTest, NarrowSegmentPrefersEndEdge)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 2.1));

    auto hit = ctl.hit_test(102.5, TRACK0_Y);
    EXPECT_EQ(hit.id, id);
    EXPECT_EQ(hit.zone, HitZone::EndEdge);
}

TEST(TimelineInteractionHitTest, HiddenSegmentsIgnored)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));
    model.set_segment_visible(id, false);
    EXPECT_EQ(ctl.hit_test(175.0, TRACK0_Y).id, INVALID_SEGMENT_ID);
    EXPECT_EQ(ctl.hit_test(100.0, TRACK0_Y).id, INVALID_SEGMENT_ID);
}

TEST(TimelineInteractionHitTest, CursorShapes)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    EXPECT_EQ(ctl.cursor_at(175.0, TRACK0_Y), CursorShape::Move);
    EXPECT_EQ(ctl.cursor_at(250.0, TRACK0_Y), CursorShape::ResizeHorizontal);
    EXPECT_EQ(ctl.cursor_at(400.0, TRACK0_Y), CursorShape::Arrow);

    model.set_segment_locked(id, true);
    EXPECT_EQ(ctl.cursor_at(175.0, TRACK0_Y), CursorShape::Arrow);
    EXPECT_EQ(ctl.pointer_move(at(250.0, TRACK0_Y)).cursor, CursorShape::Arrow);
}

// ─── Dragging ────────────────────────────────────────────────────────────────

TEST(TimelineInteractionDrag, MovesOnRelease)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    std::vector<double> moved;
    ctl.set_on_segment_moved([&](SegmentId, double s, double e) { moved = {s, e}; });

    auto down = ctl.pointer_down(at(175.0, TRACK0_Y));
    EXPECT_TRUE(down.handled);
    EXPECT_EQ(down.state, InteractionState::Dragging);
    EXPECT_EQ(down.segment, id);
    EXPECT_EQ(model.selected(), id);

    ctl.pointer_move(at(225.0, TRACK0_Y));
    ASSERT_TRUE(ctl.preview().has_value());
    EXPECT_DOUBLE_EQ(ctl.preview()->start_time, 3.0);
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);   // untouched until release

    auto up = ctl.pointer_up(at(225.0, TRACK0_Y));
    EXPECT_TRUE(up.model_changed);
    EXPECT_EQ(ctl.state(), InteractionState::Idle);
    EXPECT_FALSE(ctl.preview().has_value());
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 3.0);
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 6.0);
    ASSERT_EQ(moved.size(), 2u);
    EXPECT_DOUBLE_EQ(moved[0], 3.0);
}

TEST(TimelineInteractionDrag, PreservesDuration)
{
    for (double dx : {-500.0, -37.0, 0.5, 13.0, 61.0, 1000.0})
    {
        TimelineModel                 model(10.0);
        TimelineInteractionController ctl(model);
        auto                          id = model.add_segment(make_segment(2.0, 5.0));

        ctl.pointer_down(at(175.0, TRACK0_Y));
        ctl.pointer_up(at(175.0 + dx, TRACK0_Y));

        auto seg = model.segment(id);
        SCOPED_TRACE(dx);
        EXPECT_EQ(seg->end_time - seg->start_time, 5.0 - 2.0);
        EXPECT_GE(seg->start_time, 0.0);
        EXPECT_LE(seg->end_time, 10.0);
    }
}

TEST(TimelineInteractionDrag, DurationIsBitExact)
{
    TimelineConfig cfg;
    cfg.edge_tolerance_px = 2.0;   // 0.3 s segments are only 15 px wide

    for (int k = 0; k < 199; ++k)
    {
        TimelineModel                 model(25.0);
        TimelineInteractionController ctl(model, cfg);
        double                        old_start = 0.1 * k;
        double                        old_end   = 0.1 * k + 0.3;
        auto                          id        = model.add_segment(make_segment(old_start, old_end));

        double x = ctl.time_to_x((old_start + old_end) / 2.0);
        ASSERT_EQ(ctl.pointer_down(at(x, TRACK0_Y)).state, InteractionState::Dragging);
        ctl.pointer_up(at(x + 7.0, TRACK0_Y));

        auto seg = model.segment(id);
        SCOPED_TRACE(k);
        EXPECT_EQ(seg->end_time - seg->start_time, old_end - old_start);
        EXPECT_GE(seg->start_time, old_start);
        EXPECT_LE(seg->end_time, 25.0);
    }
}

TEST(TimelineInteractionDrag, ClickDoesNotSnap)
{
    TimelineModel  model(10.0);
    TimelineConfig cfg;
    cfg.snap_mode = SnapMode::Grid;
    TimelineInteractionController ctl(model, cfg);
    auto                          id = model.add_segment(make_segment(2.03, 5.03));

    ctl.pointer_down(at(175.0, TRACK0_Y));
    auto up = ctl.pointer_up(at(175.0, TRACK0_Y));
    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(model.segment(id)->start_time, 2.03);
    EXPECT_EQ(model.segment(id)->end_time, 5.03);
}

TEST(TimelineInteractionDrag, SegmentPastDurationOnlySelects)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(6.0, 9.0));
    model.set_total_duration(5.0);

    EXPECT_EQ(ctl.pointer_down(at(375.0, TRACK0_Y)).state, InteractionState::Selecting);
    auto up = ctl.pointer_up(at(200.0, TRACK0_Y));
    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(model.selected(), id);
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 6.0);
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 9.0);
}

TEST(TimelineInteractionDrag, ClampsAtTimelineEnds)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_up(at(1000.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 7.0);
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 10.0);

    ctl.pointer_down(at(400.0, TRACK0_Y));
    ctl.pointer_up(at(-1000.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 0.0);
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 3.0);
}

TEST(TimelineInteractionDrag, NoMoveNoChange)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    model.add_segment(make_segment(2.0, 5.0));
    int changes = 0;
    model.set_on_segment_changed([&](SegmentId) { ++changes; });

    ctl.pointer_down(at(175.0, TRACK0_Y));
    auto up = ctl.pointer_up(at(175.0, TRACK0_Y));
    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(changes, 0);
}

TEST(TimelineInteractionDrag, CancelLeavesModelUntouched)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_move(at(300.0, TRACK0_Y));
    EXPECT_TRUE(ctl.cancel());
    EXPECT_EQ(ctl.state(), InteractionState::Idle);
    EXPECT_FALSE(ctl.cancel());

    EXPECT_FALSE(ctl.pointer_up(at(300.0, TRACK0_Y)).handled);
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);
}

TEST(TimelineInteractionDrag, GridSnapAndAltBypass)
{
    TimelineModel  model(10.0);
    TimelineConfig cfg;
    cfg.snap_mode      = SnapMode::Grid;
    cfg.time_precision = 0.5;
    TimelineInteractionController ctl(model, cfg);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_up(at(186.0, TRACK0_Y));   // +0.22 s
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_up(at(190.0, TRACK0_Y));   // +0.3 s
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.5);

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_up(at(180.0, TRACK0_Y, alt()));   // +0.1 s, unsnapped
    EXPECT_NEAR(model.segment(id)->start_time, 2.6, 1e-9);
}

// ─── Resizing ────────────────────────────────────────────────────────────────

TEST(TimelineInteractionResize, EndEdgeKeepsMinimumGap)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    auto down = ctl.pointer_down(at(250.0, TRACK0_Y));
    EXPECT_EQ(down.state, InteractionState::ResizingEnd);
    EXPECT_EQ(down.cursor, CursorShape::ResizeHorizontal);

    ctl.pointer_move(at(150.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(ctl.preview()->end_time, 3.0);
    ctl.pointer_up(at(50.0, TRACK0_Y));

    auto seg = model.segment(id);
    EXPECT_DOUBLE_EQ(seg->start_time, 2.0);
    EXPECT_NEAR(seg->end_time, 2.1, 1e-9);
    EXPECT_GE(seg->end_time - seg->start_time, 0.1);
}

TEST(TimelineInteractionResize, ClickNearEdgeChangesNothing)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));
    int                           changes = 0;
    model.set_on_segment_changed([&](SegmentId) { ++changes; });

    EXPECT_EQ(ctl.pointer_down(at(244.0, TRACK0_Y)).state, InteractionState::ResizingEnd);
    auto up = ctl.pointer_up(at(244.0, TRACK0_Y));
    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(changes, 0);
    EXPECT_EQ(model.segment(id)->end_time, 5.0);
}

TEST(TimelineInteractionResize, EdgeFollowsPointerMovement)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(244.0, TRACK0_Y));   // 6 px inside the end edge
    ctl.pointer_up(at(294.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 6.0);

    ctl.pointer_down(at(104.0, TRACK0_Y));   // 4 px inside the start edge
    ctl.pointer_up(at(79.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 1.5);
}

TEST(TimelineInteractionResize, NoRoomForGapKeepsRange)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(9.95, 10.0));

    // 2.5 px wide: the end edge is nearest anywhere on it
    EXPECT_EQ(ctl.pointer_down(at(499.0, TRACK0_Y)).state, InteractionState::ResizingEnd);
    auto up = ctl.pointer_up(at(300.0, TRACK0_Y));
    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(model.segment(id)->start_time, 9.95);
    EXPECT_EQ(model.segment(id)->end_time, 10.0);
}

TEST(TimelineInteractionResize, EndEdgeClampsToDuration)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(250.0, TRACK0_Y));
    ctl.pointer_up(at(2000.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->end_time, 10.0);
}

TEST(TimelineInteractionResize, StartEdgeKeepsMinimumGap)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    std::vector<double> resized;
    ctl.set_on_segment_resized([&](SegmentId, double s, double e) { resized = {s, e}; });

    EXPECT_EQ(ctl.pointer_down(at(100.0, TRACK0_Y)).state, InteractionState::ResizingStart);
    ctl.pointer_up(at(400.0, TRACK0_Y));

    auto seg = model.segment(id);
    EXPECT_NEAR(seg->start_time, 4.9, 1e-9);
    EXPECT_DOUBLE_EQ(seg->end_time, 5.0);
    EXPECT_GE(seg->end_time - seg->start_time, 0.1);
    ASSERT_EQ(resized.size(), 2u);
    EXPECT_NEAR(resized[0], 4.9, 1e-9);

    ctl.pointer_down(at(245.0, TRACK0_Y));   // start edge is now at x = 245
    ctl.pointer_up(at(-100.0, TRACK0_Y));
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 0.0);
}

// ─── Selection ───────────────────────────────────────────────────────────────

TEST(TimelineInteractionSelect, LockedSegmentOnlySelects)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));
    model.set_segment_locked(id, true);

    SegmentId selected = INVALID_SEGMENT_ID;
    ctl.set_on_segment_selected([&](SegmentId s) { selected = s; });

    EXPECT_EQ(ctl.pointer_down(at(175.0, TRACK0_Y)).state, InteractionState::Selecting);
    ctl.pointer_move(at(300.0, TRACK0_Y));
    auto up = ctl.pointer_up(at(300.0, TRACK0_Y));

    EXPECT_FALSE(up.model_changed);
    EXPECT_EQ(selected, id);
    EXPECT_EQ(model.selected(), id);
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);

    EXPECT_EQ(ctl.pointer_down(at(250.0, TRACK0_Y)).state, InteractionState::Selecting);
}

TEST(TimelineInteractionSelect, ShiftPressSelects)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    EXPECT_EQ(ctl.pointer_down(at(175.0, TRACK0_Y, shift())).state, InteractionState::Selecting);
    ctl.pointer_up(at(300.0, TRACK0_Y, shift()));
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);
}

TEST(TimelineInteractionSelect, RulerClickSeeks)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    double                        clicked = -1.0;
    ctl.set_on_time_clicked([&](double t) { clicked = t; });

    auto r = ctl.pointer_down(at(100.0, RULER_Y));
    EXPECT_TRUE(r.handled);
    EXPECT_EQ(r.state, InteractionState::Idle);
    EXPECT_DOUBLE_EQ(model.current_time(), 2.0);
    EXPECT_DOUBLE_EQ(clicked, 2.0);

    ctl.pointer_down(at(5000.0, RULER_Y));
    EXPECT_DOUBLE_EQ(model.current_time(), 10.0);
}

TEST(TimelineInteractionSelect, DoubleClickReportsSegment)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));

    SegmentId clicked = INVALID_SEGMENT_ID;
    ctl.set_on_segment_double_clicked([&](SegmentId s) { clicked = s; });

    EXPECT_EQ(ctl.double_click(at(175.0, TRACK0_Y)), id);
    EXPECT_EQ(clicked, id);
    EXPECT_EQ(ctl.double_click(at(450.0, TRACK0_Y)), INVALID_SEGMENT_ID);
}

// ─── Creation ────────────────────────────────────────────────────────────────

TEST(TimelineInteractionCreate, ClickCreatesDefaultSpan)
{
    TimelineModel                 model(20.0);
    TimelineInteractionController ctl(model);

    SegmentId created = INVALID_SEGMENT_ID;
    ctl.set_on_segment_created([&](SegmentId s) { created = s; });

    auto down = ctl.pointer_down(at(200.0, TRACK1_Y));
    EXPECT_EQ(down.state, InteractionState::CreatingSegment);
    ASSERT_TRUE(ctl.preview().has_value());
    EXPECT_EQ(ctl.preview()->id, INVALID_SEGMENT_ID);

    auto up = ctl.pointer_up(at(200.0, TRACK1_Y));
    EXPECT_TRUE(up.model_changed);
    ASSERT_NE(created, INVALID_SEGMENT_ID);
    EXPECT_EQ(up.segment, created);

    auto seg = model.segment(created);
    EXPECT_DOUBLE_EQ(seg->start_time, 4.0);
    EXPECT_DOUBLE_EQ(seg->end_time, 6.0);
    EXPECT_EQ(seg->track_index, 1u);
    EXPECT_EQ(seg->name, "New animation");
    EXPECT_EQ(model.selected(), created);
}

TEST(TimelineInteractionCreate, DragSetsEnd)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    ctl.set_creation_kind(SegmentKind::Pause);

    ctl.pointer_down(at(300.0, TRACK0_Y));
    ctl.pointer_move(at(350.0, TRACK0_Y));
    auto up = ctl.pointer_up(at(350.0, TRACK0_Y));

    auto seg = model.segment(up.segment);
    ASSERT_TRUE(seg.has_value());
    EXPECT_DOUBLE_EQ(seg->start_time, 6.0);
    EXPECT_DOUBLE_EQ(seg->end_time, 7.0);
    EXPECT_EQ(seg->kind, SegmentKind::Pause);
}

TEST(TimelineInteractionCreate, ClampedAtTimelineEnd)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);

    ctl.pointer_down(at(475.0, TRACK0_Y));   // 9.5 s
    auto up  = ctl.pointer_up(at(475.0, TRACK0_Y));
    auto seg = model.segment(up.segment);
    ASSERT_TRUE(seg.has_value());
    EXPECT_DOUBLE_EQ(seg->start_time, 9.5);
    EXPECT_DOUBLE_EQ(seg->end_time, 10.0);
}

TEST(TimelineInteractionCreate, PressClearsSelection)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    auto                          id = model.add_segment(make_segment(2.0, 5.0));
    model.select(id);

    ctl.pointer_down(at(400.0, TRACK0_Y));
    EXPECT_FALSE(model.selected().has_value());
    ctl.cancel();
    EXPECT_EQ(model.segment_count(), 1u);
}

// ─── Context actions & history ───────────────────────────────────────────────

TEST(TimelineInteractionHistory, DragUndoRedo)
{
    TimelineModel                 model(10.0);
    TimelineHistory               history;
    TimelineInteractionController ctl(model);
    ctl.set_history(&history);
    auto id = model.add_segment(make_segment(2.0, 5.0));

    ctl.pointer_down(at(175.0, TRACK0_Y));
    ctl.pointer_up(at(225.0, TRACK0_Y));
    EXPECT_EQ(history.undo_description(), "Move segment");

    ASSERT_TRUE(history.undo());
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 2.0);
    ASSERT_TRUE(history.redo());
    EXPECT_DOUBLE_EQ(model.segment(id)->start_time, 3.0);
}

TEST(TimelineInteractionHistory, CreateUndo)
{
    TimelineModel                 model(10.0);
    TimelineHistory               history;
    TimelineInteractionController ctl(model);
    ctl.set_history(&history);

    ctl.pointer_down(at(100.0, TRACK0_Y));
    auto id = ctl.pointer_up(at(100.0, TRACK0_Y)).segment;
    ASSERT_TRUE(model.contains(id));

    history.undo();
    EXPECT_FALSE(model.contains(id));
    history.redo();
    EXPECT_TRUE(model.contains(id));
}

TEST(TimelineInteractionHistory, DeleteRespectsLock)
{
    TimelineModel                 model(10.0);
    TimelineHistory               history;
    TimelineInteractionController ctl(model);
    ctl.set_history(&history);
    auto id = model.add_segment(make_segment(2.0, 5.0));

    EXPECT_FALSE(ctl.delete_selected());
    model.select(id);
    model.set_segment_locked(id, true);
    EXPECT_FALSE(ctl.delete_selected());
    EXPECT_TRUE(model.contains(id));

    model.set_segment_locked(id, false);
    EXPECT_TRUE(ctl.delete_selected());
    EXPECT_FALSE(model.contains(id));

    history.undo();
    EXPECT_TRUE(model.contains(id));
    EXPECT_FALSE(ctl.delete_at(450.0, TRACK0_Y));
    EXPECT_TRUE(ctl.delete_at(175.0, TRACK0_Y));
}

TEST(TimelineInteractionHistory, DuplicateAndToggleLock)
{
    TimelineModel                 model(10.0);
    TimelineHistory               history;
    TimelineInteractionController ctl(model);
    ctl.set_history(&history);
    auto id = model.add_segment(make_segment(2.0, 5.0));

    auto copy = ctl.duplicate_at(175.0, TRACK0_Y);
    ASSERT_TRUE(copy.has_value());
    EXPECT_DOUBLE_EQ(model.segment(*copy)->start_time, 5.0);

    auto locked = ctl.toggle_lock_at(175.0, TRACK0_Y);
    ASSERT_TRUE(locked.has_value());
    EXPECT_TRUE(*locked);
    EXPECT_EQ(history.undo_description(), "Lock segment");

    history.undo();
    EXPECT_FALSE(model.segment(id)->locked);
    history.undo();
    EXPECT_FALSE(model.contains(*copy));

    EXPECT_FALSE(ctl.duplicate_at(450.0, TRACK0_Y).has_value());
    EXPECT_FALSE(ctl.toggle_lock_at(450.0, TRACK0_Y).has_value());
}

// ─── Snapping ────────────────────────────────────────────────────────────────

TEST(TimelineInteractionSnap, Modes)
{
    TimelineModel                 model(10.0);
    TimelineInteractionController ctl(model);
    EXPECT_DOUBLE_EQ(ctl.snap_time(1.234), 1.234);

    ctl.set_snap_mode(SnapMode::Frame);
    EXPECT_NEAR(ctl.snap_time(1.234), 37.0 / 30.0, 1e-12);

    ctl.set_snap_mode(SnapMode::Grid);
    EXPECT_NEAR(ctl.snap_time(1.234), 1.2, 1e-12);
    EXPECT_NEAR(ctl.snap_time(1.26), 1.3, 1e-12);
}

TEST(TimelineInteractionSnap, StateNames)
{
    EXPECT_STREQ(interaction_state_name(InteractionState::Idle), "idle");
    EXPECT_STREQ(interaction_state_name(InteractionState::ResizingEnd), "resizing-end");
    EXPECT_STREQ(interaction_state_name(InteractionState::CreatingSegment), "creating");
}
