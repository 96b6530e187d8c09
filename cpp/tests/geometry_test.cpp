#include <gtest/gtest.h>
#include "markup/core/geometry.h"
#include <cmath>

using namespace markup;

TEST(GeometryTest, RightAngle) {
    EXPECT_NEAR(calcAngleDeg(Point2{10.0f, 0.0f}, Point2{0.0f, 0.0f}, Point2{0.0f, 10.0f}), 90.0f, 1e-4f);
}

TEST(GeometryTest, AngleIsSymmetric) {
    const Point2 a{3.0f, 7.0f};
    const Point2 v{1.0f, 1.0f};
    const Point2 b{-4.0f, 2.5f};
    EXPECT_FLOAT_EQ(calcAngleDeg(a, v, b), calcAngleDeg(b, v, a));
}

TEST(GeometryTest, SameArmGivesZero) {
    const Point2 p{5.0f, 5.0f};
    EXPECT_NEAR(calcAngleDeg(p, Point2{0.0f, 0.0f}, p), 0.0f, 1e-3f);
}

TEST(GeometryTest, DegenerateArmGivesZero) {
    const Point2 v{2.0f, 2.0f};
    EXPECT_FLOAT_EQ(calcAngleDeg(v, v, Point2{4.0f, 2.0f}), 0.0f);
}

TEST(GeometryTest, StraightAngleIsClamped) {
    const float deg = calcAngleDeg(Point2{-1.0f, 0.0f}, Point2{0.0f, 0.0f}, Point2{1.0f, 0.0f});
    EXPECT_NEAR(deg, 180.0f, 1e-3f);
    EXPECT_FALSE(std::isnan(deg));
}

TEST(GeometryTest, LineAngleToHorizontalIsAcute) {
    EXPECT_NEAR(lineAngleToHorizontalDeg(Point2{0.0f, 0.0f}, Point2{10.0f, 0.0f}), 0.0f, 1e-4f);
    EXPECT_NEAR(lineAngleToHorizontalDeg(Point2{0.0f, 0.0f}, Point2{-10.0f, 10.0f}), 45.0f, 1e-4f);
    EXPECT_NEAR(lineAngleToHorizontalDeg(Point2{0.0f, 0.0f}, Point2{0.0f, -3.0f}), 90.0f, 1e-4f);
}

TEST(GeometryTest, SegmentDistance) {
    const Point2 a{0.0f, 0.0f};
    const Point2 b{10.0f, 0.0f};
    EXPECT_FLOAT_EQ(pointToSegmentDistanceSq(Point2{5.0f, 3.0f}, a, b), 9.0f);
    EXPECT_FLOAT_EQ(pointToSegmentDistanceSq(Point2{13.0f, 4.0f}, a, b), 25.0f);
    EXPECT_FLOAT_EQ(pointToSegmentDistanceSq(Point2{1.0f, 1.0f}, a, a), 2.0f);
}

TEST(GeometryTest, SnapDirectionKeepsLength) {
    const Point2 from{0.0f, 0.0f};
    const Point2 snapped = snapDirection(from, Point2{10.0f, 1.0f}, 0.785398163f);
    EXPECT_NEAR(snapped.y, 0.0f, 1e-4f);
    EXPECT_NEAR(snapped.x, std::hypot(10.0f, 1.0f), 1e-4f);
}

TEST(GeometryTest, SnapDirectionCoincidentReturnsTarget) {
    const Point2 p{4.0f, 4.0f};
    const Point2 out = snapDirection(p, p, 0.785398163f);
    EXPECT_FLOAT_EQ(out.x, 4.0f);
    EXPECT_FLOAT_EQ(out.y, 4.0f);
}
