#include "markup/render/overlay_builder.h"
#include "markup/core/geometry.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_constants.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/interaction/pick_system.h"
#include "markup/measure/calibration_engine.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>

namespace markup {

namespace {

constexpr float kLineLabelOffsetPx = 10.0f;
constexpr float kMeasurementLabelOffsetPx = 14.0f;
constexpr float kLineLabelFontPx = 12.0f;
constexpr float kAngleLabelFontPx = 13.0f;
constexpr float kSnapHintFontPx = 10.0f;
constexpr float kPendingMarkerRadiusPx = 4.0f;
constexpr float kHoverMarkerRadiusPx = 3.0f;
constexpr float kAngleVertexDotRadiusPx = 3.0f;
constexpr float kPreviewOpacity = 0.75f;
constexpr float kHoverOpacity = 0.5f;
constexpr float kGripWidthPx = 8.0f;
constexpr float kGripHeightPx = 20.0f;
constexpr const char* kSnapHint = "Snap 0\xC2\xB0 / 45\xC2\xB0 / 90\xC2\xB0";

void pushPrimitive(
    OverlayFrame& frame,
    OverlayKind kind,
    std::uint16_t flags,
    Color color,
    float width,
    float width2,
    std::uint32_t ownerId,
    std::initializer_list<Point2> points) {
    const std::uint32_t offset = static_cast<std::uint32_t>(frame.data.size());
    for (const Point2& p : points) {
        frame.data.push_back(p.x);
        frame.data.push_back(p.y);
    }
    frame.primitives.push_back(OverlayPrimitive{
        kind,
        flags,
        static_cast<std::uint32_t>(points.size()),
        offset,
        color,
        width,
        width2,
        ownerId,
    });
}

void pushLabel(
    OverlayFrame& frame,
    OverlayLabelKind kind,
    std::string text,
    const Point2& pos,
    float fontSize,
    Color color,
    std::uint32_t ownerId) {
    frame.labels.push_back(OverlayLabel{kind, std::move(text), pos, fontSize, color, std::nullopt, 0.0f, ownerId});
}

bool unitVector(const Point2& from, const Point2& to, Point2& out) {
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    const float mag = std::sqrt(dx * dx + dy * dy);
    if (mag == 0.0f) return false;
    out = Point2{dx / mag, dy / mag};
    return true;
}

} // namespace

OverlayBuilder::OverlayBuilder(const CoordinateMapper& mapper, const PickSystem& pick, const CalibrationEngine& calibration)
    : mapper_(mapper), pick_(pick), calibration_(calibration) {}

std::string OverlayBuilder::formatDegrees(float degrees) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f\xC2\xB0", static_cast<double>(degrees));
    return std::string(buf);
}

Point2 OverlayBuilder::angleLabelPos(const Point2& vertex, const Point2& p1, const Point2& p2, float dist) {
    Point2 u1{}, u2{};
    if (!unitVector(vertex, p1, u1) || !unitVector(vertex, p2, u2)) {
        return Point2{vertex.x + dist, vertex.y};
    }
    const float bx = u1.x + u2.x;
    const float by = u1.y + u2.y;
    const float bmag = std::sqrt(bx * bx + by * by);
    if (bmag == 0.0f) return Point2{vertex.x, vertex.y - dist};
    return Point2{vertex.x + (bx / bmag) * dist, vertex.y + (by / bmag) * dist};
}

OverlayFrame OverlayBuilder::build(
    const AnnotationStore& store,
    const VisibleSet& visible,
    const InteractionController* interaction) const {
    OverlayFrame frame;
    if (store.hidden()) return frame;

    appendGrid(store.grid(), frame);
    for (const MarkupLine* line : visible.lines) {
        appendLine(*line, store.isSelected(EntityKind::Line, line->id), frame);
    }
    for (const MarkupAngle* angle : visible.angles) {
        appendAngle(*angle, store.isSelected(EntityKind::Angle, angle->id), frame);
    }
    for (const MarkupText* text : visible.texts) {
        appendText(*text, store.isSelected(EntityKind::Text, text->id), frame);
    }
    if (interaction) {
        appendPreview(store, *interaction, frame);
    }
    return frame;
}

// =============================================================================
// Grid
// =============================================================================

void OverlayBuilder::appendGrid(const GridSettings& grid, OverlayFrame& frame) const {
    if (!grid.show) return;
    const float W = mapper_.surfaceWidth();
    const float H = mapper_.surfaceHeight();
    const float sp = std::max(interaction_constants::GRID_MIN_SPACING_PX, grid.spacingPx);
    const Color color = withOpacity(grid.color, grid.opacity);

    if (grid.mode == GridMode::Horizontal || grid.mode == GridMode::Both) {
        float y = std::fmod(grid.originY, sp);
        if (y < 0.0f) y += sp;
        for (; y <= H + sp; y += sp) {
            pushPrimitive(frame, OverlayKind::Segment, OverlayFlagGrid, color, 1.0f, 0.0f, 0, {Point2{0.0f, y}, Point2{W, y}});
        }
    }
    if (grid.mode == GridMode::Vertical || grid.mode == GridMode::Both) {
        float x = std::fmod(grid.originX, sp);
        if (x < 0.0f) x += sp;
        for (; x <= W + sp; x += sp) {
            pushPrimitive(frame, OverlayKind::Segment, OverlayFlagGrid, color, 1.0f, 0.0f, 0, {Point2{x, 0.0f}, Point2{x, H}});
        }
    }
}

// =============================================================================
// Annotations
// =============================================================================

void OverlayBuilder::appendLine(const MarkupLine& line, bool selected, OverlayFrame& frame) const {
    const Point2 p1 = mapper_.toVisual(line.p1);
    const Point2 p2 = mapper_.toVisual(line.p2);
    const Point2 mid = midpoint(p1, p2);
    const std::uint16_t flags = selected ? OverlayFlagSelected : OverlayFlagNone;

    pushPrimitive(frame, OverlayKind::Segment, flags, line.color, line.width, 0.0f, line.id, {p1, p2});

    if (line.showAngle && distance(p1, p2) > 1e-6f) {
        pushLabel(frame, OverlayLabelKind::LineAngle, formatDegrees(lineAngleToHorizontalDeg(p1, p2)),
            Point2{mid.x, mid.y - kLineLabelOffsetPx}, kLineLabelFontPx, line.color, line.id);
    }

    std::string measurement = calibration_.label(line);
    if (!measurement.empty()) {
        pushLabel(frame, OverlayLabelKind::Measurement, std::move(measurement),
            Point2{mid.x, mid.y + kMeasurementLabelOffsetPx}, kLineLabelFontPx, line.color, line.id);
    }

    if (selected) {
        const float r = pick_.handleRadius();
        pushPrimitive(frame, OverlayKind::Handle, flags, line.color, 2.0f, r, line.id, {p1});
        pushPrimitive(frame, OverlayKind::Handle, flags, line.color, 2.0f, r, line.id, {p2});
    }
}

void OverlayBuilder::appendAngle(const MarkupAngle& angle, bool selected, OverlayFrame& frame) const {
    using namespace interaction_constants;
    const Point2 vp1 = mapper_.toVisual(angle.p1);
    const Point2 vvx = mapper_.toVisual(angle.vertex);
    const Point2 vp2 = mapper_.toVisual(angle.p2);
    const std::uint16_t flags = selected ? OverlayFlagSelected : OverlayFlagNone;

    pushPrimitive(frame, OverlayKind::Segment, flags, angle.color, angle.width, 0.0f, angle.id, {vp1, vvx});
    pushPrimitive(frame, OverlayKind::Segment, flags, angle.color, angle.width, 0.0f, angle.id, {vvx, vp2});

    Point2 u1{}, u2{};
    if (unitVector(vvx, vp1, u1) && unitVector(vvx, vp2, u2)) {
        const float r = ANGLE_ARC_RADIUS_PX;
        const float cross = (vp1.x - vvx.x) * (vp2.y - vvx.y) - (vp1.y - vvx.y) * (vp2.x - vvx.x);
        const std::uint16_t arcFlags = static_cast<std::uint16_t>(flags | (cross > 0.0f ? OverlayFlagSweep : 0));
        pushPrimitive(frame, OverlayKind::Arc, arcFlags, angle.color, std::max(1.0f, angle.width * 0.75f), r, angle.id, {
            vvx,
            Point2{vvx.x + u1.x * r, vvx.y + u1.y * r},
            Point2{vvx.x + u2.x * r, vvx.y + u2.y * r},
        });
    }

    // The label tracks the live visual angle, not the stored value.
    pushLabel(frame, OverlayLabelKind::AngleValue, formatDegrees(calcAngleDeg(vp1, vvx, vp2)),
        angleLabelPos(vvx, vp1, vp2, ANGLE_LABEL_DISTANCE_PX), kAngleLabelFontPx, angle.color, angle.id);

    if (selected) {
        for (const Point2& p : {vp1, vvx, vp2}) {
            pushPrimitive(frame, OverlayKind::Handle, flags, angle.color, 2.0f, pick_.handleRadius(), angle.id, {p});
        }
    } else {
        for (const Point2& p : {vp1, vvx, vp2}) {
            pushPrimitive(frame, OverlayKind::Marker, OverlayFlagFilled, angle.color, 0.0f, kAngleVertexDotRadiusPx, angle.id, {p});
        }
    }
}

void OverlayBuilder::appendText(const MarkupText& text, bool selected, OverlayFrame& frame) const {
    using namespace interaction_constants;
    const TextGeometry g = pick_.textGeometry(text, mapper_);
    const float drawnWidth = g.hasBox ? g.widthPx : std::max(TEXT_MIN_WIDTH_PX, g.widthPx);
    const std::uint16_t flags = selected ? OverlayFlagSelected : OverlayFlagNone;

    if (text.backgroundColor) {
        pushPrimitive(frame, OverlayKind::Rect, OverlayFlagFilled, *text.backgroundColor, 0.0f, 0.0f, text.id, {
            Point2{g.anchor.x, g.anchor.y - text.size},
            Point2{g.anchor.x + drawnWidth, g.anchor.y - text.size + g.heightPx},
        });
    }

    frame.labels.push_back(OverlayLabel{
        OverlayLabelKind::AnnotationText,
        text.content,
        g.anchor,
        text.size,
        text.color,
        text.backgroundColor,
        g.hasBox ? g.widthPx : 0.0f,
        text.id,
    });

    if (!selected) return;

    pushPrimitive(frame, OverlayKind::Handle, flags, text.color, 2.0f, pick_.handleRadius(), text.id, {g.anchor});

    // Wrap boundary and its grip
    const float gx = g.resizeGrip.x;
    pushPrimitive(frame, OverlayKind::DashedSegment, flags, withOpacity(text.color, 0.6f), 1.0f, 0.0f, text.id, {
        Point2{gx, g.anchor.y - text.size * 1.15f},
        Point2{gx, g.anchor.y + text.size * 0.2f},
    });
    pushPrimitive(frame, OverlayKind::Rect, flags, text.color, 1.5f, 0.0f, text.id, {
        Point2{gx - kGripWidthPx * 0.5f, g.resizeGrip.y - kGripHeightPx * 0.5f},
        Point2{gx + kGripWidthPx * 0.5f, g.resizeGrip.y + kGripHeightPx * 0.5f},
    });
}

// =============================================================================
// Placement previews
// =============================================================================

void OverlayBuilder::appendPreview(
    const AnnotationStore& store,
    const InteractionController& interaction,
    OverlayFrame& frame) const {
    const MarkupTool tool = store.tool();
    if (tool == MarkupTool::None) return;

    const Color color = store.activeColor();
    const Color faded = withOpacity(color, kPreviewOpacity);
    const std::uint16_t flags = OverlayFlagPreview;
    const auto& pending = interaction.pendingPoints();
    const auto& hover = interaction.hoverPoint();
    const std::optional<Point2> placed = interaction.placementPreview();
    const bool showHint = interaction.snapModifierHeld() && hover.has_value();

    std::vector<Point2> vpts;
    vpts.reserve(pending.size());
    for (const Point2& p : pending) vpts.push_back(mapper_.toVisual(p));
    const std::optional<Point2> hp = placed ? std::optional<Point2>(mapper_.toVisual(*placed)) : std::nullopt;

    if ((tool == MarkupTool::Line || tool == MarkupTool::Measure) && vpts.size() == 1) {
        pushPrimitive(frame, OverlayKind::Marker, flags | OverlayFlagFilled, color, 0.0f, kPendingMarkerRadiusPx, 0, {vpts[0]});
        if (hp) {
            pushPrimitive(frame, OverlayKind::DashedSegment, flags, faded, store.lineWidth(), 0.0f, 0, {vpts[0], *hp});
        }
        if (showHint) {
            pushLabel(frame, OverlayLabelKind::SnapHint, kSnapHint,
                Point2{vpts[0].x + 8.0f, vpts[0].y - 6.0f}, kSnapHintFontPx, color, 0);
        }
    }

    if (tool == MarkupTool::Angle && !vpts.empty()) {
        for (const Point2& p : vpts) {
            pushPrimitive(frame, OverlayKind::Marker, flags | OverlayFlagFilled, color, 0.0f, kPendingMarkerRadiusPx, 0, {p});
        }
        if (vpts.size() == 1) {
            if (hp) {
                pushPrimitive(frame, OverlayKind::DashedSegment, flags, faded, 2.0f, 0.0f, 0, {vpts[0], *hp});
            }
            if (showHint) {
                pushLabel(frame, OverlayLabelKind::SnapHint, kSnapHint,
                    Point2{vpts[0].x + 8.0f, vpts[0].y - 6.0f}, kSnapHintFontPx, color, 0);
            }
        } else if (vpts.size() == 2) {
            pushPrimitive(frame, OverlayKind::Segment, flags, color, 2.0f, 0.0f, 0, {vpts[0], vpts[1]});
            if (hp) {
                pushPrimitive(frame, OverlayKind::DashedSegment, flags, faded, 2.0f, 0.0f, 0, {vpts[1], *hp});
                pushLabel(frame, OverlayLabelKind::LiveAngle, formatDegrees(calcAngleDeg(vpts[0], vpts[1], *hp)),
                    Point2{vpts[1].x + 10.0f, vpts[1].y - 10.0f}, kAngleLabelFontPx, color, 0);
            }
            if (showHint) {
                pushLabel(frame, OverlayLabelKind::SnapHint, kSnapHint,
                    Point2{vpts[1].x + 8.0f, vpts[1].y - 22.0f}, kSnapHintFontPx, color, 0);
            }
        }
    }

    if (!hover) return;
    const Point2 hv = mapper_.toVisual(*hover);
    if (tool == MarkupTool::Text) {
        pushLabel(frame, OverlayLabelKind::TextCursor, "T", Point2{hv.x + 4.0f, hv.y},
            store.textSize() * 0.6f, withOpacity(color, kHoverOpacity), 0);
    } else {
        pushPrimitive(frame, OverlayKind::Marker, flags | OverlayFlagFilled, withOpacity(color, kHoverOpacity),
            0.0f, kHoverMarkerRadiusPx, 0, {hv});
    }
}

} // namespace markup
