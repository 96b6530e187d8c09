#pragma once

#include "markup/core/types.h"

namespace markup {

// =============================================================================
// Geometry Helpers
// =============================================================================

float distSq(const Point2& a, const Point2& b);
float distance(const Point2& a, const Point2& b);

/**
 * Squared distance from point p to segment a -> b.
 */
float pointToSegmentDistanceSq(const Point2& p, const Point2& a, const Point2& b);

/**
 * Interior angle at vertex v between rays v->p1 and v->p2, in degrees [0, 180].
 * Zero-length rays yield 0.
 */
float calcAngleDeg(const Point2& p1, const Point2& v, const Point2& p2);

/**
 * Acute angle between segment a -> b and the horizontal axis, in degrees [0, 90].
 */
float lineAngleToHorizontalDeg(const Point2& a, const Point2& b);

/**
 * Round the direction from -> to to the nearest multiple of stepRad, keeping
 * the distance. Returns `to` unchanged when the two points coincide.
 */
Point2 snapDirection(const Point2& from, const Point2& to, float stepRad);

Point2 midpoint(const Point2& a, const Point2& b);

} // namespace markup
