#include "markup/core/geometry.h"
#include <algorithm>
#include <cmath>

namespace markup {

namespace {
constexpr float kDegenerateLength = 1e-6f;
constexpr float kRadToDeg = 57.29577951308232f;
}

float distSq(const Point2& a, const Point2& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return dx * dx + dy * dy;
}

float distance(const Point2& a, const Point2& b) {
    return std::sqrt(distSq(a, b));
}

float pointToSegmentDistanceSq(const Point2& p, const Point2& a, const Point2& b) {
    const float l2 = distSq(a, b);
    if (l2 == 0.0f) return distSq(p, a);
    float t = ((p.x - a.x) * (b.x - a.x) + (p.y - a.y) * (b.y - a.y)) / l2;
    t = std::max(0.0f, std::min(1.0f, t));
    return distSq(p, Point2{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)});
}

float calcAngleDeg(const Point2& p1, const Point2& v, const Point2& p2) {
    const float v1x = p1.x - v.x;
    const float v1y = p1.y - v.y;
    const float v2x = p2.x - v.x;
    const float v2y = p2.y - v.y;
    const float m1 = std::hypot(v1x, v1y);
    const float m2 = std::hypot(v2x, v2y);
    if (m1 < kDegenerateLength || m2 < kDegenerateLength) return 0.0f;

    const float cosine = std::max(-1.0f, std::min(1.0f, (v1x * v2x + v1y * v2y) / (m1 * m2)));
    return std::acos(cosine) * kRadToDeg;
}

float lineAngleToHorizontalDeg(const Point2& a, const Point2& b) {
    const float dx = std::fabs(b.x - a.x);
    const float dy = std::fabs(b.y - a.y);
    if (dx < kDegenerateLength && dy < kDegenerateLength) return 0.0f;
    return std::atan2(dy, dx) * kRadToDeg;
}

Point2 snapDirection(const Point2& from, const Point2& to, float stepRad) {
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    const float len = std::hypot(dx, dy);
    if (len < kDegenerateLength || !(stepRad > 0.0f)) return to;

    const float snapped = std::round(std::atan2(dy, dx) / stepRad) * stepRad;
    return Point2{from.x + len * std::cos(snapped), from.y + len * std::sin(snapped)};
}

Point2 midpoint(const Point2& a, const Point2& b) {
    return Point2{(a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f};
}

} // namespace markup
