#include "markup/view/coordinate_mapper.h"
#include <cmath>

namespace markup {

namespace {
float normalizeScale(float scale) {
    return (std::isfinite(scale) && scale > 1e-6f) ? scale : 1.0f;
}
} // namespace

CoordinateMapper::CoordinateMapper()
    : surfaceW_(kDefaultSurfaceWidth),
      surfaceH_(kDefaultSurfaceHeight) {
    recompute();
}

bool CoordinateMapper::setSurfaceSize(float width, float height) {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0f || height <= 0.0f) {
        return false;
    }
    surfaceW_ = width;
    surfaceH_ = height;
    recompute();
    return true;
}

void CoordinateMapper::setMediaAspect(float aspect) {
    aspect_ = (std::isfinite(aspect) && aspect > 0.0f) ? aspect : 0.0f;
    recompute();
}

void CoordinateMapper::setTransform(const MediaTransform& transform) {
    transform_ = transform;
    if (!std::isfinite(transform_.translateX)) transform_.translateX = 0.0f;
    if (!std::isfinite(transform_.translateY)) transform_.translateY = 0.0f;
}

void CoordinateMapper::setCorrectionScale(float scale) {
    correction_ = normalizeScale(scale);
    recompute();
}

float CoordinateMapper::effectiveScale() const {
    return normalizeScale(transform_.scale);
}

ContentBox CoordinateMapper::computeContentBox(float surfaceWidth, float surfaceHeight, float aspect) {
    if (!(aspect > 0.0f) || !std::isfinite(aspect)) {
        return ContentBox{0.0f, 0.0f, surfaceWidth, surfaceHeight};
    }
    const float surfaceAspect = surfaceWidth / surfaceHeight;
    if (surfaceAspect > aspect) {
        // Pillarbox
        const float w = surfaceHeight * aspect;
        return ContentBox{(surfaceWidth - w) * 0.5f, 0.0f, w, surfaceHeight};
    }
    // Letterbox
    const float h = surfaceWidth / aspect;
    return ContentBox{0.0f, (surfaceHeight - h) * 0.5f, surfaceWidth, h};
}

void CoordinateMapper::recompute() {
    ContentBox fit = computeContentBox(surfaceW_, surfaceH_, aspect_);
    if (correction_ != 1.0f) {
        const float cx = fit.x + fit.w * 0.5f;
        const float cy = fit.y + fit.h * 0.5f;
        fit.w *= correction_;
        fit.h *= correction_;
        fit.x = cx - fit.w * 0.5f;
        fit.y = cy - fit.h * 0.5f;
    }
    box_ = fit;
}

Point2 CoordinateMapper::toVisual(const Point2& normalized) const {
    const float s = effectiveScale();
    const float cx = surfaceW_ * 0.5f;
    const float cy = surfaceH_ * 0.5f;
    const float px = box_.x + normalized.x * box_.w;
    const float py = box_.y + normalized.y * box_.h;
    return Point2{
        cx + transform_.translateX + s * (px - cx),
        cy - transform_.translateY + s * (py - cy),
    };
}

Point2 CoordinateMapper::toNormalized(const Point2& visual) const {
    const float s = effectiveScale();
    const float cx = surfaceW_ * 0.5f;
    const float cy = surfaceH_ * 0.5f;
    const float px = cx + (visual.x - cx - transform_.translateX) / s;
    const float py = cy + (visual.y - cy + transform_.translateY) / s;
    const float w = box_.w > 0.0f ? box_.w : 1.0f;
    const float h = box_.h > 0.0f ? box_.h : 1.0f;
    return Point2{(px - box_.x) / w, (py - box_.y) / h};
}

} // namespace markup
