#pragma once

#include "markup/core/color.h"
#include "markup/entity/markup_types.h"
#include "markup/interaction/interaction_constants.h"
#include <cstddef>

namespace markup {

/**
 * Default display window per annotation kind, used when an item carries
 * DisplayDuration::Mode::TypeDefault.
 */
struct DisplayDurationDefaults {
    DisplayDuration line{DisplayDuration::persistent()};
    DisplayDuration angle{DisplayDuration::forSeconds(2.0f)};
    DisplayDuration text{DisplayDuration::forSeconds(5.0f)};
};

/**
 * Runtime configuration for one markup surface.
 */
struct MarkupConfig {
    std::size_t maxUndo{50};
    float hitThresholdPx{interaction_constants::HIT_THRESHOLD_PX};
    float handleRadiusPx{interaction_constants::HANDLE_RADIUS_PX};
    float snapStepRad{interaction_constants::SNAP_ANGLE_STEP_RAD};
    DisplayDurationDefaults durations;
    GridSettings defaultGrid;
    Color defaultColor{kColorYellow};
    float defaultLineWidth{2.0f};
    float defaultTextSize{18.0f};
};

} // namespace markup
