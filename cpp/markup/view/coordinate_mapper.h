#pragma once

#include "markup/core/types.h"

namespace markup {

/**
 * Pan/zoom applied to the media element. Translation is in surface pixels,
 * applied about the surface center and not multiplied by scale. Positive
 * translateY moves content up (screen Y is inverted).
 */
struct MediaTransform {
    float scale{1.0f};
    float translateX{0.0f};
    float translateY{0.0f};
};

// Rectangle the media occupies inside the surface before the transform.
struct ContentBox {
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};
};

/**
 * CoordinateMapper: converts between normalized content coordinates and
 * surface pixel coordinates.
 *
 * The content box is the letterboxed / pillarboxed fit of the media aspect
 * ratio inside the surface, optionally shrunk by a correction scale around its
 * own center. toVisual() then applies the media transform so overlay geometry
 * lands on the same pixels as the rendered media.
 */
class CoordinateMapper {
public:
    static constexpr float kDefaultSurfaceWidth = 400.0f;
    static constexpr float kDefaultSurfaceHeight = 300.0f;

    CoordinateMapper();

    // =========================================================================
    // Inputs
    // =========================================================================

    /**
     * Report the surface pixel size. Non-positive or non-finite sizes are
     * ignored (the surface is mid-layout).
     * @return True if the size was applied
     */
    bool setSurfaceSize(float width, float height);

    /**
     * Set the media aspect ratio (width / height). 0 or non-finite means
     * unknown: the content box fills the surface.
     */
    void setMediaAspect(float aspect);

    void setTransform(const MediaTransform& transform);

    /**
     * Uniform scale of the content box around its own center.
     * Non-positive or non-finite values reset to 1.
     */
    void setCorrectionScale(float scale);

    // =========================================================================
    // Queries
    // =========================================================================

    float surfaceWidth() const { return surfaceW_; }
    float surfaceHeight() const { return surfaceH_; }
    float mediaAspect() const { return aspect_; }
    float correctionScale() const { return correction_; }
    const MediaTransform& transform() const { return transform_; }
    const ContentBox& contentBox() const { return box_; }

    /** Scale actually applied by toVisual (invalid scales read as 1). */
    float effectiveScale() const;

    Point2 toVisual(const Point2& normalized) const;
    Point2 toNormalized(const Point2& visual) const;

    static ContentBox computeContentBox(float surfaceWidth, float surfaceHeight, float aspect);

private:
    void recompute();

    float surfaceW_;
    float surfaceH_;
    float aspect_{0.0f};
    float correction_{1.0f};
    MediaTransform transform_;
    ContentBox box_;
};

} // namespace markup
