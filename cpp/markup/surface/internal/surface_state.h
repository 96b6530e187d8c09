#pragma once

#include "markup/config/markup_config.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/interaction/pick_system.h"
#include "markup/measure/calibration_engine.h"
#include "markup/render/magnifier.h"
#include "markup/render/overlay_builder.h"
#include "markup/text/font_manager.h"
#include "markup/text/text_measure.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"

namespace markup {

// Member order is construction order: each component only refers to the
// ones declared above it.
struct SurfaceState {
    explicit SurfaceState(const MarkupConfig& config);

    SurfaceState(const SurfaceState&) = delete;
    SurfaceState& operator=(const SurfaceState&) = delete;

    MarkupConfig config;
    CoordinateMapper mapper;
    AnnotationStore store;
    VisibilityFilter visibility;
    CalibrationEngine calibration;
    text::FontManager fonts;
    text::TextMeasure textMeasure;
    PickSystem pick;
    InteractionController controller;
    OverlayBuilder overlay;
    MagnifierPreview magnifier;

    double playbackTime{0.0};
};

} // namespace markup
