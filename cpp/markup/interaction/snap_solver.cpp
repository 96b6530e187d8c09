#include "markup/interaction/snap_solver.h"
#include "markup/core/geometry.h"
#include "markup/view/coordinate_mapper.h"

namespace markup {

SnapResult computeDirectionSnap(
    const SnapOptions& options,
    const Point2& anchorNorm,
    const Point2& cursorNorm,
    const CoordinateMapper& mapper) {
    SnapResult result{cursorNorm, false};
    if (!options.enabled) return result;

    const Point2 anchor = mapper.toVisual(anchorNorm);
    const Point2 cursor = mapper.toVisual(cursorNorm);
    const Point2 snapped = snapDirection(anchor, cursor, options.stepRad);
    if (snapped == cursor) return result;

    result.point = mapper.toNormalized(snapped);
    result.snapped = true;
    return result;
}

} // namespace markup
