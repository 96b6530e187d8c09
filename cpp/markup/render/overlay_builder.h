#pragma once

#include "markup/entity/markup_types.h"
#include "markup/render/overlay_types.h"
#include <string>

namespace markup {

class AnnotationStore;
class CalibrationEngine;
class CoordinateMapper;
class InteractionController;
class PickSystem;
struct VisibleSet;

/**
 * OverlayBuilder: lays out everything the host draws above the media for one
 * frame, in surface pixels.
 *
 * Order: grid, lines, angles, texts, then placement previews. Only the visible
 * subset is drawn; nothing at all is drawn while the store is hidden.
 */
class OverlayBuilder {
public:
    OverlayBuilder(const CoordinateMapper& mapper, const PickSystem& pick, const CalibrationEngine& calibration);

    /**
     * @param interaction Optional; when given, pending placement previews and
     *        the hover marker are appended.
     */
    OverlayFrame build(
        const AnnotationStore& store,
        const VisibleSet& visible,
        const InteractionController* interaction) const;

    void appendGrid(const GridSettings& grid, OverlayFrame& frame) const;
    void appendLine(const MarkupLine& line, bool selected, OverlayFrame& frame) const;
    void appendAngle(const MarkupAngle& angle, bool selected, OverlayFrame& frame) const;
    void appendText(const MarkupText& text, bool selected, OverlayFrame& frame) const;
    void appendPreview(const AnnotationStore& store, const InteractionController& interaction, OverlayFrame& frame) const;

    static std::string formatDegrees(float degrees);

    /**
     * Label position for an angle: on the bisector at `dist` from the vertex.
     * Degenerate arms place it to the right, opposite arms above.
     */
    static Point2 angleLabelPos(const Point2& vertex, const Point2& p1, const Point2& p2, float dist);

private:
    const CoordinateMapper& mapper_;
    const PickSystem& pick_;
    const CalibrationEngine& calibration_;
};

} // namespace markup
