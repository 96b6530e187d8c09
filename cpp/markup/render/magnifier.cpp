#include "markup/render/magnifier.h"
#include "markup/view/coordinate_mapper.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace markup {

namespace {
constexpr float kCrosshairHalfLengthPx = 14.0f;
}

MagnifierPreview::MagnifierPreview(const CoordinateMapper& mapper, const MagnifierSettings& settings)
    : mapper_(mapper), settings_(settings) {}

bool MagnifierPreview::activeFor(MarkupTool tool) {
    return tool == MarkupTool::Line || tool == MarkupTool::Angle || tool == MarkupTool::Measure;
}

std::optional<MagnifierView> MagnifierPreview::sample(MarkupTool tool, const std::optional<Point2>& cursorVisual) const {
    if (!activeFor(tool) || !cursorVisual) return std::nullopt;

    const float W = mapper_.surfaceWidth();
    const float H = mapper_.surfaceHeight();
    const float sw = settings_.sourceRadiusPx * 2.0f;
    const float sh = sw;
    if (sw <= 0.0f || settings_.viewSizePx <= 0.0f) return std::nullopt;

    // Keep the source rectangle inside the surface; the crosshair moves
    // off-center near the edges instead.
    const float sx = std::max(0.0f, std::min(W - sw, cursorVisual->x - settings_.sourceRadiusPx));
    const float sy = std::max(0.0f, std::min(H - sh, cursorVisual->y - settings_.sourceRadiusPx));
    const float size = settings_.viewSizePx;

    MagnifierView view{};
    view.sourceX = sx;
    view.sourceY = sy;
    view.sourceW = sw;
    view.sourceH = sh;
    view.viewSizePx = size;
    view.crosshair = Point2{
        std::round(((cursorVisual->x - sx) / sw) * size),
        std::round(((cursorVisual->y - sy) / sh) * size),
    };
    view.crosshairHalfLengthPx = kCrosshairHalfLengthPx;
    return view;
}

void MagnifierPreview::attach(FrameScheduler& scheduler, CursorSource source) {
    detach();
    if (!source) return;
    task_ = scheduler.schedule([this, source = std::move(source)](double) {
        const auto cursor = source();
        latest_ = sample(cursor.first, cursor.second);
        ++frames_;
    });
}

void MagnifierPreview::detach() {
    task_.cancel();
    latest_.reset();
}

} // namespace markup
