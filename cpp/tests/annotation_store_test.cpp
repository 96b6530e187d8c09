#include "tests/markup_test_common.h"

using namespace markup;
using namespace markup_test;

TEST(AnnotationStoreTest, IdsAreSharedAndMonotonic) {
    AnnotationStore store;
    const std::uint32_t a = store.addLine(MarkupLine{});
    const std::uint32_t b = store.addAngle(MarkupAngle{});
    const std::uint32_t c = store.addText(MarkupText{});
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);

    ASSERT_TRUE(store.removeItem(EntityKind::Text, c));
    const std::uint32_t d = store.addText(MarkupText{});
    EXPECT_GT(d, c);
}

TEST(AnnotationStoreTest, AddIgnoresCallerId) {
    AnnotationStore store;
    MarkupLine line;
    line.id = 999;
    const std::uint32_t id = store.addLine(line);
    EXPECT_NE(id, 999u);
    EXPECT_NE(store.findLine(id), nullptr);
    EXPECT_EQ(store.findLine(999), nullptr);
}

TEST(AnnotationStoreTest, RemoveStaleIdIsNoop) {
    AnnotationStore store;
    store.addLine(MarkupLine{});
    EXPECT_FALSE(store.removeItem(EntityKind::Line, 42));
    EXPECT_FALSE(store.removeItem(EntityKind::Angle, 1));
    EXPECT_EQ(store.lines().size(), 1u);
    EXPECT_EQ(store.history().undoDepth(), 1u);
}

TEST(AnnotationStoreTest, RemoveClearsMatchingSelection) {
    AnnotationStore store;
    const std::uint32_t id = store.addLine(MarkupLine{});
    store.setSelection(EntityRef{EntityKind::Line, id});
    ASSERT_TRUE(store.removeItem(EntityKind::Line, id));
    EXPECT_FALSE(store.selection().has_value());
}

TEST(AnnotationStoreTest, UndoRedoDuality) {
    AnnotationStore store;
    const MarkupSnap empty = store.snapshot();
    const std::uint32_t id = store.addLine(MarkupLine{});
    ASSERT_TRUE(store.canUndo());

    ASSERT_TRUE(store.undo());
    EXPECT_EQ(store.lines().size(), empty.lines.size());
    ASSERT_TRUE(store.redo());
    ASSERT_EQ(store.lines().size(), 1u);
    EXPECT_EQ(store.lines()[0].id, id);
}

TEST(AnnotationStoreTest, UndoAndRedoBothClearSelection) {
    AnnotationStore store;
    const std::uint32_t keep = store.addLine(MarkupLine{});
    store.addLine(MarkupLine{});

    store.setSelection(EntityRef{EntityKind::Line, keep});
    ASSERT_TRUE(store.undo());
    EXPECT_FALSE(store.selection().has_value());

    store.setSelection(EntityRef{EntityKind::Line, keep});
    ASSERT_TRUE(store.redo());
    ASSERT_NE(store.findLine(keep), nullptr);
    EXPECT_FALSE(store.selection().has_value());
}

TEST(AnnotationStoreTest, MutationAfterUndoClearsRedo) {
    AnnotationStore store;
    store.addLine(MarkupLine{});
    ASSERT_TRUE(store.undo());
    ASSERT_TRUE(store.canRedo());
    store.addText(MarkupText{});
    EXPECT_FALSE(store.canRedo());
}

TEST(AnnotationStoreTest, UpdateClearsRedoWithoutSnapshot) {
    AnnotationStore store;
    const std::uint32_t id = store.addLine(MarkupLine{});
    store.addLine(MarkupLine{});
    ASSERT_TRUE(store.undo());
    const std::size_t depth = store.history().undoDepth();

    LineUpdate update;
    update.color = 0x112233FFu;
    ASSERT_TRUE(store.updateLine(id, update));
    EXPECT_FALSE(store.canRedo());
    EXPECT_EQ(store.history().undoDepth(), depth);
    EXPECT_EQ(store.findLine(id)->color, 0x112233FFu);
}

TEST(AnnotationStoreTest, UpdateStaleIdFails) {
    AnnotationStore store;
    EXPECT_FALSE(store.updateLine(7, LineUpdate{}));
    EXPECT_FALSE(store.updateAngle(7, AngleUpdate{}));
    EXPECT_FALSE(store.updateText(7, TextUpdate{}));
}

TEST(AnnotationStoreTest, UndoDepthIsBounded) {
    MarkupConfig config;
    config.maxUndo = 3;
    AnnotationStore store(config);
    for (int i = 0; i < 6; ++i) store.addLine(MarkupLine{});

    int undone = 0;
    while (store.undo()) ++undone;
    EXPECT_EQ(undone, 3);
    EXPECT_EQ(store.lines().size(), 3u);
}

TEST(AnnotationStoreTest, AngleIsMeasuredInVisualSpace) {
    Rig rig;
    rig.mapper.setMediaAspect(kAspect16x9);

    // Equal normalized offsets are not equal pixel offsets under letterboxing.
    MarkupAngle angle;
    angle.p1 = Point2{0.6f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.6f, 0.4f};
    const std::uint32_t id = rig.store.addAngle(angle);

    const MarkupAngle* stored = rig.store.findAngle(id);
    ASSERT_NE(stored, nullptr);
    // dx = 40px, dy = 22.5px
    const float expected = std::atan2(22.5f, 40.0f) * 57.29577951308232f;
    EXPECT_NEAR(stored->angleDeg, expected, 1e-3f);
}

TEST(AnnotationStoreTest, UpdateAngleRecomputesOnlyWhenPointsMove) {
    Rig rig;
    MarkupAngle angle;
    angle.p1 = Point2{0.6f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.5f, 0.3f};
    const std::uint32_t id = rig.store.addAngle(angle);
    EXPECT_NEAR(rig.store.findAngle(id)->angleDeg, 90.0f, 1e-3f);

    AngleUpdate color;
    color.color = 0x00FF00FFu;
    rig.store.updateAngle(id, color);
    EXPECT_NEAR(rig.store.findAngle(id)->angleDeg, 90.0f, 1e-3f);

    AngleUpdate move;
    move.p2 = Point2{0.4f, 0.5f};
    rig.store.updateAngle(id, move);
    EXPECT_NEAR(rig.store.findAngle(id)->angleDeg, 180.0f, 1e-2f);

    AngleUpdate explicitDeg;
    explicitDeg.p2 = Point2{0.5f, 0.3f};
    explicitDeg.angleDeg = 12.5f;
    rig.store.updateAngle(id, explicitDeg);
    EXPECT_FLOAT_EQ(rig.store.findAngle(id)->angleDeg, 12.5f);
}

TEST(AnnotationStoreTest, SingleReferenceLine) {
    AnnotationStore store;
    const std::uint32_t a = store.addLine(MarkupLine{});
    const std::uint32_t b = store.addLine(MarkupLine{});
    ASSERT_TRUE(store.setReferenceLength(a, 100.0f, "mm"));
    ASSERT_TRUE(store.setReferenceLength(b, 3.0f, "in"));

    EXPECT_FALSE(store.findLine(a)->referenceLength.has_value());
    ASSERT_NE(store.referenceLine(), nullptr);
    EXPECT_EQ(store.referenceLine()->id, b);
    EXPECT_EQ(store.referenceLine()->unit, "in");
    EXPECT_FALSE(store.setReferenceLength(b, -1.0f, "in"));
}

TEST(AnnotationStoreTest, ClearReferenceKeepsLine) {
    AnnotationStore store;
    const std::uint32_t a = store.addLine(MarkupLine{});
    const std::uint32_t b = store.addLine(MarkupLine{});
    EXPECT_FALSE(store.clearReference(a));
    ASSERT_TRUE(store.setReferenceLength(a, 100.0f, "mm"));

    EXPECT_FALSE(store.clearReference(b));
    ASSERT_TRUE(store.clearReference(a));
    EXPECT_EQ(store.referenceLine(), nullptr);
    ASSERT_NE(store.findLine(a), nullptr);
    EXPECT_FALSE(store.clearReference(a));
    EXPECT_FALSE(store.clearReference(77));
}

TEST(AnnotationStoreTest, ClearAllResetsGridAndIsUndoable) {
    AnnotationStore store;
    store.addLine(MarkupLine{});
    GridUpdate grid;
    grid.show = true;
    grid.spacingPx = 25.0f;
    store.updateGrid(grid);

    store.clearAll();
    EXPECT_TRUE(store.lines().empty());
    EXPECT_FALSE(store.grid().show);
    EXPECT_FLOAT_EQ(store.grid().spacingPx, 50.0f);

    ASSERT_TRUE(store.undo());
    EXPECT_EQ(store.lines().size(), 1u);
    EXPECT_TRUE(store.grid().show);
}

TEST(AnnotationStoreTest, LoadSnapBumpsIdsAndClearsHistory) {
    AnnotationStore store;
    store.addLine(MarkupLine{});

    MarkupSnap snap;
    MarkupText text;
    text.id = 40;
    text.content = "hello";
    snap.texts.push_back(text);
    store.loadSnap(snap);

    EXPECT_FALSE(store.canUndo());
    EXPECT_TRUE(store.lines().empty());
    EXPECT_GT(store.addLine(MarkupLine{}), 40u);
}

TEST(AnnotationStoreTest, LoadSnapRestoresUniqueIdsAndSingleReference) {
    MarkupSnap snap;
    MarkupLine first;
    first.id = 1;
    first.referenceLength = 10.0f;
    first.unit = "m";
    snap.lines.push_back(first);
    MarkupLine second;
    second.id = 2;
    second.referenceLength = 99.0f;
    second.unit = "cm";
    snap.lines.push_back(second);
    MarkupLine repeat;
    repeat.id = 2;
    repeat.showAngle = true;
    snap.lines.push_back(repeat);

    AnnotationStore store;
    store.loadSnap(snap);

    ASSERT_EQ(store.lines().size(), 2u);
    EXPECT_FALSE(store.lines()[1].showAngle);
    ASSERT_NE(store.referenceLine(), nullptr);
    EXPECT_EQ(store.referenceLine()->id, 1u);
    EXPECT_FALSE(store.findLine(2)->referenceLength.has_value());

    ASSERT_TRUE(store.removeItem(EntityKind::Line, 2));
    EXPECT_EQ(store.findLine(2), nullptr);
}

TEST(AnnotationStoreTest, RejectsInvalidStyle) {
    AnnotationStore store;
    EXPECT_FALSE(store.setLineWidth(0.0f));
    EXPECT_FALSE(store.setTextSize(-2.0f));
    EXPECT_TRUE(store.setLineWidth(4.0f));
    EXPECT_FLOAT_EQ(store.lineWidth(), 4.0f);
}
