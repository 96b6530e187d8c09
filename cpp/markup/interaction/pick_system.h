#pragma once

#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include <cstdint>
#include <optional>

namespace markup {

class CoordinateMapper;
struct VisibleSet;
namespace text { class TextMeasure; }

struct AABB {
    float minX, minY, maxX, maxY;

    bool contains(const Point2& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }
};

enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    Endpoint = 2,
    ResizeHandle = 3,
};

struct PickResult {
    EntityKind kind;
    std::uint32_t id;
    PickSubTarget subTarget;
    std::int32_t subIndex; // endpoint index (line 0-1, angle 0-2), -1 otherwise
    float distance;
};

// Internal candidate during picking
struct PickCandidate {
    PickResult result;
    std::uint32_t order; // collection order: lines, then angles, then texts

    // Sort order:
    // 1. SubTarget Priority: ResizeHandle > Endpoint > Body
    // 2. Distance: Closer is better
    // 3. Collection order: earlier is better
    bool operator<(const PickCandidate& other) const {
        auto priority = [](PickSubTarget t) {
            switch (t) {
                case PickSubTarget::ResizeHandle: return 10;
                case PickSubTarget::Endpoint: return 8;
                case PickSubTarget::Body: return 1;
                default: return 0;
            }
        };
        const int p1 = priority(result.subTarget);
        const int p2 = priority(other.result.subTarget);
        if (p1 != p2) return p1 > p2;
        if (result.distance != other.result.distance) return result.distance < other.result.distance;
        return order < other.order;
    }
};

/**
 * Surface-pixel geometry of a text annotation.
 */
struct TextGeometry {
    Point2 anchor;     // visual baseline-left
    float widthPx;     // wrap box width or measured single-line width
    float heightPx;    // one line box
    bool hasBox;
    AABB hitBox;
    Point2 resizeGrip; // center of the wrap-width grip
};

/**
 * PickSystem: hit-testing in surface pixel space.
 *
 * Only handles of the selected item are live (endpoint circles and the text
 * wrap grip). Bodies are tested against the visible subset: segment
 * distance for lines and angle arms, bounding box for text.
 */
class PickSystem {
public:
    PickSystem(float hitThresholdPx, float handleRadiusPx);

    void setTextMeasure(const text::TextMeasure* measure) { measure_ = measure; }

    std::optional<PickResult> pick(
        const Point2& visual,
        const VisibleSet& visible,
        const CoordinateMapper& mapper,
        const std::optional<EntityRef>& selection) const;

    std::optional<PickResult> pickHandle(
        const Point2& visual,
        const VisibleSet& visible,
        const CoordinateMapper& mapper,
        const EntityRef& selection) const;

    std::optional<PickResult> pickBody(
        const Point2& visual,
        const VisibleSet& visible,
        const CoordinateMapper& mapper) const;

    TextGeometry textGeometry(const MarkupText& text, const CoordinateMapper& mapper) const;

    float hitThreshold() const { return hitThresholdPx_; }
    float handleRadius() const { return handleRadiusPx_; }

private:
    float hitThresholdPx_;
    float handleRadiusPx_;
    const text::TextMeasure* measure_{nullptr};
};

} // namespace markup
