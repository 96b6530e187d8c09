#include "markup/interaction/pick_system.h"
#include "markup/core/geometry.h"
#include "markup/interaction/interaction_constants.h"
#include "markup/text/text_measure.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace markup {

namespace {

constexpr float kGripHalfHeightPx = 10.0f;

float aabbDistance(const AABB& box, const Point2& p) {
    const float dx = std::max({box.minX - p.x, 0.0f, p.x - box.maxX});
    const float dy = std::max({box.minY - p.y, 0.0f, p.y - box.maxY});
    return std::hypot(dx, dy);
}

bool tryEndpoint(const Point2& p, const Point2& handle, float radius, float& bestDist) {
    const float d = distance(p, handle);
    if (d <= radius && d < bestDist) {
        bestDist = d;
        return true;
    }
    return false;
}

} // namespace

PickSystem::PickSystem(float hitThresholdPx, float handleRadiusPx)
    : hitThresholdPx_(hitThresholdPx), handleRadiusPx_(handleRadiusPx) {}

TextGeometry PickSystem::textGeometry(const MarkupText& text, const CoordinateMapper& mapper) const {
    using namespace interaction_constants;
    TextGeometry g{};
    g.anchor = mapper.toVisual(text.pos);
    g.hasBox = text.boxWidth > 0.0f;
    if (g.hasBox) {
        g.widthPx = text.boxWidth * mapper.contentBox().w * mapper.effectiveScale();
    } else {
        g.widthPx = measure_ ? measure_->measureWidth(text.content, text.size)
                             : text::TextMeasure::estimateWidth(text.content, text.size);
    }
    g.heightPx = text.size * TEXT_LINE_HEIGHT_FACTOR;
    g.hitBox = AABB{g.anchor.x, g.anchor.y - g.heightPx, g.anchor.x + g.widthPx, g.anchor.y + TEXT_DESCENT_PX};

    const float gripX = g.hasBox ? g.anchor.x + g.widthPx : g.anchor.x + std::max(TEXT_MIN_WIDTH_PX, g.widthPx);
    g.resizeGrip = Point2{gripX, g.anchor.y - text.size * 0.5f};
    return g;
}

std::optional<PickResult> PickSystem::pickHandle(
    const Point2& visual,
    const VisibleSet& visible,
    const CoordinateMapper& mapper,
    const EntityRef& selection) const {
    float best = std::numeric_limits<float>::infinity();
    std::optional<PickResult> out;

    switch (selection.kind) {
        case EntityKind::Line:
            for (const MarkupLine* line : visible.lines) {
                if (line->id != selection.id) continue;
                const Point2 ends[2] = {mapper.toVisual(line->p1), mapper.toVisual(line->p2)};
                for (int i = 0; i < 2; ++i) {
                    if (tryEndpoint(visual, ends[i], handleRadiusPx_, best)) {
                        out = PickResult{EntityKind::Line, line->id, PickSubTarget::Endpoint, i, best};
                    }
                }
            }
            break;
        case EntityKind::Angle:
            for (const MarkupAngle* angle : visible.angles) {
                if (angle->id != selection.id) continue;
                const Point2 pts[3] = {
                    mapper.toVisual(angle->p1),
                    mapper.toVisual(angle->vertex),
                    mapper.toVisual(angle->p2),
                };
                for (int i = 0; i < 3; ++i) {
                    if (tryEndpoint(visual, pts[i], handleRadiusPx_, best)) {
                        out = PickResult{EntityKind::Angle, angle->id, PickSubTarget::Endpoint, i, best};
                    }
                }
            }
            break;
        case EntityKind::Text:
            for (const MarkupText* text : visible.texts) {
                if (text->id != selection.id) continue;
                const TextGeometry g = textGeometry(*text, mapper);
                const float dx = std::fabs(visual.x - g.resizeGrip.x);
                const float dy = std::fabs(visual.y - g.resizeGrip.y);
                if (dx <= handleRadiusPx_ && dy <= kGripHalfHeightPx) {
                    out = PickResult{EntityKind::Text, text->id, PickSubTarget::ResizeHandle, -1, dx};
                }
            }
            break;
    }
    return out;
}

std::optional<PickResult> PickSystem::pickBody(
    const Point2& visual,
    const VisibleSet& visible,
    const CoordinateMapper& mapper) const {
    std::vector<PickCandidate> candidates;
    std::uint32_t order = 0;

    for (const MarkupLine* line : visible.lines) {
        const float d = std::sqrt(pointToSegmentDistanceSq(visual, mapper.toVisual(line->p1), mapper.toVisual(line->p2)));
        if (d <= hitThresholdPx_) {
            candidates.push_back({PickResult{EntityKind::Line, line->id, PickSubTarget::Body, -1, d}, order});
        }
        ++order;
    }
    for (const MarkupAngle* angle : visible.angles) {
        const Point2 p1 = mapper.toVisual(angle->p1);
        const Point2 v = mapper.toVisual(angle->vertex);
        const Point2 p2 = mapper.toVisual(angle->p2);
        const float d = std::sqrt(std::min(
            pointToSegmentDistanceSq(visual, p1, v),
            pointToSegmentDistanceSq(visual, v, p2)));
        if (d <= hitThresholdPx_) {
            candidates.push_back({PickResult{EntityKind::Angle, angle->id, PickSubTarget::Body, -1, d}, order});
        }
        ++order;
    }
    for (const MarkupText* text : visible.texts) {
        const TextGeometry g = textGeometry(*text, mapper);
        if (g.hitBox.contains(visual)) {
            candidates.push_back({PickResult{EntityKind::Text, text->id, PickSubTarget::Body, -1, aabbDistance(g.hitBox, visual)}, order});
        }
        ++order;
    }

    if (candidates.empty()) return std::nullopt;
    std::sort(candidates.begin(), candidates.end());
    return candidates.front().result;
}

std::optional<PickResult> PickSystem::pick(
    const Point2& visual,
    const VisibleSet& visible,
    const CoordinateMapper& mapper,
    const std::optional<EntityRef>& selection) const {
    if (selection) {
        if (auto handle = pickHandle(visual, visible, mapper, *selection)) {
            return handle;
        }
    }
    return pickBody(visual, visible, mapper);
}

} // namespace markup
