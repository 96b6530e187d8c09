#pragma once

#include "markup/config/markup_config.h"
#include "markup/core/frame_scheduler.h"
#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include "markup/interaction/interaction_types.h"
#include "markup/persistence/snapshot.h"
#include "markup/render/magnifier.h"
#include "markup/render/overlay_types.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace markup {

class AnnotationStore;
class CalibrationEngine;
class InteractionController;
class PickSystem;
class OverlayBuilder;
struct SurfaceState;

/**
 * MarkupSurface: everything needed to annotate one media element.
 *
 * Owns the coordinate mapper, annotation store, visibility filter,
 * calibration, picking, interaction controller, overlay builder and
 * magnifier, wired together for a single surface. Nothing is shared between
 * surfaces.
 */
class MarkupSurface {
public:
    explicit MarkupSurface(const MarkupConfig& config = MarkupConfig{});
    ~MarkupSurface();

    MarkupSurface(const MarkupSurface&) = delete;
    MarkupSurface& operator=(const MarkupSurface&) = delete;

    const MarkupConfig& config() const;

    // =========================================================================
    // Host inputs
    // =========================================================================
    bool setSurfaceSize(float width, float height);
    void setMediaAspect(float aspect);
    void setTransform(const MediaTransform& transform);
    void setCorrectionScale(float scale);
    void setPlaybackTime(double seconds);
    double playbackTime() const;

    /**
     * Load a font used to measure annotation text. Without one, text width
     * falls back to an estimate.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFont(const std::uint8_t* data, std::size_t size);

    // =========================================================================
    // Components
    // =========================================================================
    CoordinateMapper& mapper();
    const CoordinateMapper& mapper() const;
    AnnotationStore& store();
    const AnnotationStore& store() const;
    VisibilityFilter& visibility();
    CalibrationEngine& calibration();
    const PickSystem& pick() const;
    InteractionController& controller();
    const InteractionController& controller() const;
    MagnifierPreview& magnifier();

    // =========================================================================
    // Frame output
    // =========================================================================
    VisibleSet visible() const;
    OverlayFrame buildFrame() const;

    void attachMagnifier(FrameScheduler& scheduler);
    void detachMagnifier();

    // =========================================================================
    // Persistence
    // =========================================================================
    std::vector<std::uint8_t> saveSnapshot() const;

    /** Replace all annotation state from MSNP bytes. State is untouched on error. */
    MarkupError loadSnapshot(const std::uint8_t* bytes, std::uint32_t byteCount);
    SnapDigest digest() const;

    /**
     * New media was loaded into this surface: drop annotations, history and
     * any in-progress interaction. Grid and hidden flag are kept.
     */
    void replaceMedia();

private:
    std::unique_ptr<SurfaceState> state_;
};

} // namespace markup
