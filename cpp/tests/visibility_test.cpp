#include "tests/markup_test_common.h"

using namespace markup;
using namespace markup_test;

TEST(VisibilityTest, MissingTimestampIsAlwaysVisible) {
    EXPECT_TRUE(VisibilityFilter::inWindow(std::nullopt, DisplayDuration::forSeconds(1.0f), 0.0));
    EXPECT_TRUE(VisibilityFilter::inWindow(std::nullopt, DisplayDuration::forSeconds(1.0f), 1e6));
}

TEST(VisibilityTest, TimedWindowIsInclusive) {
    const auto d = DisplayDuration::forSeconds(2.0f);
    EXPECT_FALSE(VisibilityFilter::inWindow(10.0, d, 9.999));
    EXPECT_TRUE(VisibilityFilter::inWindow(10.0, d, 10.0));
    EXPECT_TRUE(VisibilityFilter::inWindow(10.0, d, 12.0));
    EXPECT_FALSE(VisibilityFilter::inWindow(10.0, d, 12.001));
}

TEST(VisibilityTest, PersistentVisibleFromTimestampOnwards) {
    const auto d = DisplayDuration::persistent();
    EXPECT_FALSE(VisibilityFilter::inWindow(5.0, d, 4.9));
    EXPECT_TRUE(VisibilityFilter::inWindow(5.0, d, 5.0));
    EXPECT_TRUE(VisibilityFilter::inWindow(5.0, d, 5000.0));
}

TEST(VisibilityTest, PerKindDefaults) {
    VisibilityFilter filter;
    EXPECT_EQ(filter.effective(EntityKind::Line, DisplayDuration::typeDefault()), DisplayDuration::persistent());
    EXPECT_EQ(filter.effective(EntityKind::Angle, DisplayDuration::typeDefault()), DisplayDuration::forSeconds(2.0f));
    EXPECT_EQ(filter.effective(EntityKind::Text, DisplayDuration::typeDefault()), DisplayDuration::forSeconds(5.0f));

    // An explicit override wins over the default.
    EXPECT_EQ(filter.effective(EntityKind::Angle, DisplayDuration::persistent()), DisplayDuration::persistent());
}

TEST(VisibilityTest, TypedItemsUseTheirDefault) {
    VisibilityFilter filter;
    MarkupAngle angle;
    angle.createdAt = 1.0;
    EXPECT_TRUE(filter.visible(angle, 3.0));
    EXPECT_FALSE(filter.visible(angle, 3.5));

    MarkupText text;
    text.createdAt = 1.0;
    EXPECT_TRUE(filter.visible(text, 6.0));
    EXPECT_FALSE(filter.visible(text, 6.5));

    MarkupLine line;
    line.createdAt = 1.0;
    EXPECT_TRUE(filter.visible(line, 600.0));
}

TEST(VisibilityTest, ConfiguredDefaults) {
    DisplayDurationDefaults defaults;
    defaults.line = DisplayDuration::forSeconds(1.0f);
    VisibilityFilter filter(defaults);

    MarkupLine line;
    line.createdAt = 0.0;
    EXPECT_TRUE(filter.visible(line, 1.0));
    EXPECT_FALSE(filter.visible(line, 1.5));
}

TEST(VisibilityTest, CollectRespectsWindowsAndHiddenFlag) {
    Rig rig;
    MarkupLine early;
    early.createdAt = 0.0;
    MarkupLine late;
    late.createdAt = 10.0;
    MarkupAngle angle;
    angle.createdAt = 0.0;
    rig.store.addLine(early);
    rig.store.addLine(late);
    rig.store.addAngle(angle);

    VisibleSet set = rig.visibility.collect(rig.store, 1.0);
    EXPECT_EQ(set.lines.size(), 1u);
    EXPECT_EQ(set.angles.size(), 1u);

    set = rig.visibility.collect(rig.store, 11.0);
    EXPECT_EQ(set.lines.size(), 2u);
    EXPECT_TRUE(set.angles.empty());

    rig.store.setHidden(true);
    EXPECT_TRUE(rig.visibility.collect(rig.store, 11.0).empty());
    EXPECT_FALSE(rig.visibility.isVisible(rig.store, EntityRef{EntityKind::Line, rig.store.lines()[0].id}, 11.0));
}
