#pragma once

#include "markup/core/types.h"

namespace markup {

class CoordinateMapper;

struct SnapOptions {
    bool enabled{false};
    float stepRad{0.785398163f};
};

struct SnapResult {
    Point2 point{0.0f, 0.0f}; // normalized
    bool snapped{false};
};

/**
 * Quantize the direction anchor -> cursor to a multiple of options.stepRad.
 * The rounding happens on visual (post-transform) positions so the drawn
 * segment is exactly horizontal / vertical / diagonal on screen under any
 * letterboxing. Coincident points return the cursor unchanged.
 */
SnapResult computeDirectionSnap(
    const SnapOptions& options,
    const Point2& anchorNorm,
    const Point2& cursorNorm,
    const CoordinateMapper& mapper);

} // namespace markup
