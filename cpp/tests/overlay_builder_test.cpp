#include "tests/markup_test_common.h"
#include "markup/render/overlay_builder.h"
#include <algorithm>

using namespace markup;
using namespace markup_test;

namespace {

OverlayFrame buildFrame(Rig& rig, bool withInteraction = true) {
    OverlayBuilder builder(rig.mapper, rig.pick, rig.calibration);
    const VisibleSet visible = rig.visibility.collect(rig.store, rig.controller.playbackTime());
    return builder.build(rig.store, visible, withInteraction ? &rig.controller : nullptr);
}

std::size_t countKind(const OverlayFrame& frame, OverlayKind kind) {
    return static_cast<std::size_t>(std::count_if(frame.primitives.begin(), frame.primitives.end(),
        [kind](const OverlayPrimitive& p) { return p.kind == kind; }));
}

const OverlayLabel* findLabel(const OverlayFrame& frame, OverlayLabelKind kind) {
    for (const auto& l : frame.labels) {
        if (l.kind == kind) return &l;
    }
    return nullptr;
}

} // namespace

TEST(OverlayBuilderTest, EmptyStoreEmptyFrame) {
    Rig rig;
    EXPECT_TRUE(buildFrame(rig).empty());
}

TEST(OverlayBuilderTest, GridLineCounts) {
    Rig rig;
    GridUpdate grid;
    grid.show = true;
    grid.spacingPx = 50.0f;
    rig.store.updateGrid(grid);

    OverlayFrame frame = buildFrame(rig);
    // Horizontal y = 0..350, vertical x = 0..450
    EXPECT_EQ(frame.primitives.size(), 18u);
    for (const auto& p : frame.primitives) {
        EXPECT_EQ(p.flags & OverlayFlagGrid, OverlayFlagGrid);
    }

    grid.mode = GridMode::Horizontal;
    rig.store.updateGrid(grid);
    frame = buildFrame(rig);
    EXPECT_EQ(frame.primitives.size(), 8u);
    expectNear(frame.point(frame.primitives[1], 0), Point2{0.0f, 50.0f});
    expectNear(frame.point(frame.primitives[1], 1), Point2{400.0f, 50.0f});
}

TEST(OverlayBuilderTest, GridSpacingHasFloorAndOriginOffset) {
    Rig rig;
    GridUpdate grid;
    grid.show = true;
    grid.mode = GridMode::Vertical;
    grid.spacingPx = 2.0f;
    grid.originX = -5.0f;
    rig.store.updateGrid(grid);

    const OverlayFrame frame = buildFrame(rig);
    ASSERT_FALSE(frame.primitives.empty());
    // Spacing floors at 10px; origin -5 starts the first line at x = 5.
    EXPECT_NEAR(frame.point(frame.primitives[0], 0).x, 5.0f, kEps);
    EXPECT_NEAR(frame.point(frame.primitives[1], 0).x, 15.0f, kEps);
}

TEST(OverlayBuilderTest, HorizontalLineAngleLabel) {
    Rig rig;
    MarkupLine line;
    line.p1 = Point2{0.25f, 0.5f};
    line.p2 = Point2{0.75f, 0.5f};
    line.showAngle = true;
    rig.store.addLine(line);

    const OverlayFrame frame = buildFrame(rig);
    ASSERT_EQ(countKind(frame, OverlayKind::Segment), 1u);
    const OverlayLabel* label = findLabel(frame, OverlayLabelKind::LineAngle);
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->text, "0.0\xC2\xB0");
    expectNear(label->pos, Point2{200.0f, 140.0f});
    EXPECT_EQ(findLabel(frame, OverlayLabelKind::Measurement), nullptr);
}

TEST(OverlayBuilderTest, SelectedLineHasHandles) {
    Rig rig;
    const std::uint32_t id = rig.addLine(Point2{0.25f, 0.5f}, Point2{0.75f, 0.5f});
    EXPECT_EQ(countKind(buildFrame(rig), OverlayKind::Handle), 0u);

    rig.store.setSelection(EntityRef{EntityKind::Line, id});
    const OverlayFrame frame = buildFrame(rig);
    EXPECT_EQ(countKind(frame, OverlayKind::Handle), 2u);
    EXPECT_EQ(frame.primitives[0].flags & OverlayFlagSelected, OverlayFlagSelected);
}

TEST(OverlayBuilderTest, MeasurementLabelBelowMidpoint) {
    Rig rig;
    MarkupLine ref;
    ref.p1 = Point2{0.0f, 0.5f};
    ref.p2 = Point2{0.25f, 0.5f};
    ref.isMeasurement = true;
    ref.referenceLength = 10.0f;
    ref.unit = "m";
    rig.store.addLine(ref);

    const OverlayFrame frame = buildFrame(rig);
    const OverlayLabel* label = findLabel(frame, OverlayLabelKind::Measurement);
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->text, "Ref 10 m");
    expectNear(label->pos, Point2{50.0f, 164.0f});
}

TEST(OverlayBuilderTest, AngleArcSweepAndLabel) {
    Rig rig;
    MarkupAngle angle;
    angle.p1 = Point2{0.75f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.5f, 0.1f};
    rig.store.addAngle(angle);

    OverlayFrame frame = buildFrame(rig);
    EXPECT_EQ(countKind(frame, OverlayKind::Segment), 2u);
    EXPECT_EQ(countKind(frame, OverlayKind::Marker), 3u);
    ASSERT_EQ(countKind(frame, OverlayKind::Arc), 1u);

    const auto arc = std::find_if(frame.primitives.begin(), frame.primitives.end(),
        [](const OverlayPrimitive& p) { return p.kind == OverlayKind::Arc; });
    // p1 to the right, p2 above: counter-clockwise on screen
    EXPECT_EQ(arc->flags & OverlayFlagSweep, 0);
    EXPECT_FLOAT_EQ(arc->width2, interaction_constants::ANGLE_ARC_RADIUS_PX);
    expectNear(frame.point(*arc, 1), Point2{222.0f, 150.0f});
    expectNear(frame.point(*arc, 2), Point2{200.0f, 128.0f});

    const OverlayLabel* label = findLabel(frame, OverlayLabelKind::AngleValue);
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->text, "90.0\xC2\xB0");
    const float d = interaction_constants::ANGLE_LABEL_DISTANCE_PX / std::sqrt(2.0f);
    expectNear(label->pos, Point2{200.0f + d, 150.0f - d}, 1e-3f);

    // Mirrored: p2 below
    AngleUpdate update;
    update.p2 = Point2{0.5f, 0.9f};
    rig.store.updateAngle(rig.store.angles()[0].id, update);
    frame = buildFrame(rig);
    const auto arc2 = std::find_if(frame.primitives.begin(), frame.primitives.end(),
        [](const OverlayPrimitive& p) { return p.kind == OverlayKind::Arc; });
    EXPECT_EQ(arc2->flags & OverlayFlagSweep, OverlayFlagSweep);
}

TEST(OverlayBuilderTest, DegenerateAngleHasNoArc) {
    Rig rig;
    MarkupAngle angle;
    angle.p1 = Point2{0.5f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.5f, 0.1f};
    rig.store.addAngle(angle);
    EXPECT_EQ(countKind(buildFrame(rig), OverlayKind::Arc), 0u);
}

TEST(OverlayBuilderTest, TextLabelAndBackground) {
    Rig rig;
    MarkupText text;
    text.pos = Point2{0.5f, 0.5f};
    text.content = "Hello";
    text.size = 20.0f;
    text.boxWidth = 0.25f;
    text.backgroundColor = Color{0x000000CCu};
    rig.store.addText(text);

    const OverlayFrame frame = buildFrame(rig);
    ASSERT_EQ(countKind(frame, OverlayKind::Rect), 1u);
    expectNear(frame.point(frame.primitives[0], 0), Point2{200.0f, 130.0f});
    expectNear(frame.point(frame.primitives[0], 1), Point2{300.0f, 154.0f});

    const OverlayLabel* label = findLabel(frame, OverlayLabelKind::AnnotationText);
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->text, "Hello");
    EXPECT_FLOAT_EQ(label->wrapWidthPx, 100.0f);
    ASSERT_TRUE(label->background.has_value());
}

TEST(OverlayBuilderTest, HiddenDrawsNothing) {
    Rig rig;
    rig.addLine(Point2{0.25f, 0.5f}, Point2{0.75f, 0.5f});
    GridUpdate grid;
    grid.show = true;
    rig.store.updateGrid(grid);
    rig.store.setHidden(true);
    EXPECT_TRUE(buildFrame(rig).empty());
}

TEST(OverlayBuilderTest, ExpiredItemsAreNotDrawn) {
    Rig rig;
    MarkupAngle angle;
    angle.p1 = Point2{0.75f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.5f, 0.1f};
    angle.createdAt = 0.0;
    rig.store.addAngle(angle);

    rig.controller.setPlaybackTime(1.0);
    EXPECT_FALSE(buildFrame(rig).empty());
    rig.controller.setPlaybackTime(5.0);
    EXPECT_TRUE(buildFrame(rig).empty());
}

TEST(OverlayBuilderTest, LinePreviewAndSnapHint) {
    Rig rig;
    rig.controller.selectTool(MarkupTool::Line);
    rig.clickAt(100.0f, 150.0f);
    rig.controller.pointerMove(PointerEvent{300.0f, 160.0f});

    OverlayFrame frame = buildFrame(rig);
    ASSERT_EQ(countKind(frame, OverlayKind::DashedSegment), 1u);
    EXPECT_EQ(countKind(frame, OverlayKind::Marker), 2u);
    EXPECT_EQ(findLabel(frame, OverlayLabelKind::SnapHint), nullptr);

    rig.controller.pointerMove(PointerEvent{300.0f, 160.0f, ModifierShift});
    frame = buildFrame(rig);
    const OverlayLabel* hint = findLabel(frame, OverlayLabelKind::SnapHint);
    ASSERT_NE(hint, nullptr);
    expectNear(hint->pos, Point2{108.0f, 144.0f});

    const auto dashed = std::find_if(frame.primitives.begin(), frame.primitives.end(),
        [](const OverlayPrimitive& p) { return p.kind == OverlayKind::DashedSegment; });
    EXPECT_NEAR(frame.point(*dashed, 1).y, 150.0f, 1e-2f);
    EXPECT_EQ(dashed->flags & OverlayFlagPreview, OverlayFlagPreview);

    // Nothing from previews without the controller
    EXPECT_TRUE(buildFrame(rig, false).empty());
}

TEST(OverlayBuilderTest, AnglePreviewShowsLiveAngle) {
    Rig rig;
    rig.controller.selectTool(MarkupTool::Angle);
    rig.clickAt(300.0f, 150.0f);
    rig.clickAt(200.0f, 150.0f);
    rig.controller.pointerMove(PointerEvent{200.0f, 50.0f});

    const OverlayFrame frame = buildFrame(rig);
    const OverlayLabel* live = findLabel(frame, OverlayLabelKind::LiveAngle);
    ASSERT_NE(live, nullptr);
    EXPECT_EQ(live->text, "90.0\xC2\xB0");
    expectNear(live->pos, Point2{210.0f, 140.0f});
    EXPECT_EQ(countKind(frame, OverlayKind::Segment), 1u);
}

TEST(OverlayBuilderTest, TextToolHoverCursor) {
    Rig rig;
    rig.controller.selectTool(MarkupTool::Text);
    rig.controller.pointerMove(PointerEvent{50.0f, 60.0f});
    const OverlayFrame frame = buildFrame(rig);
    const OverlayLabel* cursor = findLabel(frame, OverlayLabelKind::TextCursor);
    ASSERT_NE(cursor, nullptr);
    EXPECT_EQ(cursor->text, "T");
    expectNear(cursor->pos, Point2{54.0f, 60.0f});
}

TEST(OverlayBuilderTest, FormatDegrees) {
    EXPECT_EQ(OverlayBuilder::formatDegrees(45.0f), "45.0\xC2\xB0");
    EXPECT_EQ(OverlayBuilder::formatDegrees(33.333f), "33.3\xC2\xB0");
}
