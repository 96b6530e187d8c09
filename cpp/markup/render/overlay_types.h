#pragma once

#include "markup/core/color.h"
#include "markup/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace markup {

// =============================================================================
// Overlay Types (surface pixel space)
// =============================================================================

enum class OverlayKind : std::uint16_t {
    Segment = 1,       // 2 points
    DashedSegment = 2, // 2 points
    Arc = 3,           // 3 points: center, start, end; radius in `width2`
    Rect = 4,          // 2 points: min corner, max corner
    Handle = 5,        // 1 point; radius in `width2`
    Marker = 6,        // 1 point; filled dot, radius in `width2`
};

enum OverlayFlags : std::uint16_t {
    OverlayFlagNone = 0,
    OverlayFlagSelected = 1 << 0,
    OverlayFlagSweep = 1 << 1,   // arc runs clockwise on screen
    OverlayFlagFilled = 1 << 2,
    OverlayFlagPreview = 1 << 3, // placement preview, not a stored item
    OverlayFlagGrid = 1 << 4,
};

struct OverlayPrimitive {
    OverlayKind kind;
    std::uint16_t flags;
    std::uint32_t count;  // number of points
    std::uint32_t offset; // float offset into data buffer
    Color color;
    float width;          // stroke width
    float width2;         // radius for arcs / handles / markers
    std::uint32_t ownerId; // 0 = not an annotation
};

enum class OverlayLabelKind : std::uint8_t {
    AnnotationText = 0,
    LineAngle = 1,
    Measurement = 2,
    AngleValue = 3,
    LiveAngle = 4,
    SnapHint = 5,
    TextCursor = 6,
};

struct OverlayLabel {
    OverlayLabelKind kind;
    std::string text;
    Point2 pos;         // baseline-left for annotation text, center otherwise
    float fontSize;
    Color color;
    std::optional<Color> background;
    float wrapWidthPx;  // 0 = single line
    std::uint32_t ownerId;
};

/**
 * One rendered overlay: primitives index into `data` (x, y pairs).
 * Draw order is the vector order.
 */
struct OverlayFrame {
    std::vector<OverlayPrimitive> primitives;
    std::vector<float> data;
    std::vector<OverlayLabel> labels;

    bool empty() const { return primitives.empty() && labels.empty(); }

    Point2 point(const OverlayPrimitive& prim, std::uint32_t i) const {
        const std::size_t o = prim.offset + static_cast<std::size_t>(i) * 2;
        return Point2{data[o], data[o + 1]};
    }
};

} // namespace markup
