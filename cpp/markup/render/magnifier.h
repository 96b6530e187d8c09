#pragma once

#include "markup/core/frame_scheduler.h"
#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include "markup/interaction/interaction_constants.h"
#include <functional>
#include <optional>
#include <utility>

namespace markup {

class CoordinateMapper;

struct MagnifierSettings {
    float viewSizePx{interaction_constants::MAGNIFIER_VIEW_SIZE_PX};
    float zoom{interaction_constants::MAGNIFIER_ZOOM};
    float sourceRadiusPx{interaction_constants::MAGNIFIER_SOURCE_RADIUS_PX};
};

/**
 * One magnifier sample. The host copies the source rectangle of the composed
 * surface (media after transform) into a viewSize x viewSize view and draws a
 * crosshair at `crosshair` (view pixels).
 */
struct MagnifierView {
    float sourceX;
    float sourceY;
    float sourceW;
    float sourceH;
    float viewSizePx;
    Point2 crosshair;
    float crosshairHalfLengthPx;
};

/**
 * MagnifierPreview: zoomed view under the cursor while points are being
 * placed with the line, measure or angle tool.
 *
 * attach() registers a per-frame sampling task; the task only reads the
 * mapper and the supplied cursor state. detach() or destruction cancels it.
 */
class MagnifierPreview {
public:
    // Returns the tool and the hover point in surface pixels, if any.
    using CursorSource = std::function<std::pair<MarkupTool, std::optional<Point2>>()>;

    explicit MagnifierPreview(const CoordinateMapper& mapper, const MagnifierSettings& settings = MagnifierSettings{});

    const MagnifierSettings& settings() const { return settings_; }

    static bool activeFor(MarkupTool tool);

    std::optional<MagnifierView> sample(MarkupTool tool, const std::optional<Point2>& cursorVisual) const;

    void attach(FrameScheduler& scheduler, CursorSource source);
    void detach();
    bool attached() const { return task_.active(); }

    /** Most recent sample taken by the scheduled task. */
    const std::optional<MagnifierView>& latest() const { return latest_; }
    std::uint64_t frameCount() const { return frames_; }

private:
    const CoordinateMapper& mapper_;
    MagnifierSettings settings_;
    FrameScheduler::TaskHandle task_;
    std::optional<MagnifierView> latest_;
    std::uint64_t frames_{0};
};

} // namespace markup
