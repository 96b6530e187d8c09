#pragma once

#include <gtest/gtest.h>
#include "markup/config/markup_config.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/interaction/pick_system.h"
#include "markup/measure/calibration_engine.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <cmath>
#include <vector>

namespace markup_test {

inline constexpr float kSurfaceW = 400.0f;
inline constexpr float kSurfaceH = 300.0f;
inline constexpr float kAspect16x9 = 16.0f / 9.0f;
inline constexpr float kEps = 1e-4f;

// Store, mapper and controller wired the way a surface wires them, without
// fonts. 400x300 surface, no media aspect (content box fills the surface).
struct Rig {
    markup::MarkupConfig config;
    markup::CoordinateMapper mapper;
    markup::AnnotationStore store;
    markup::VisibilityFilter visibility;
    markup::CalibrationEngine calibration;
    markup::PickSystem pick;
    markup::InteractionController controller;

    explicit Rig(const markup::MarkupConfig& cfg = markup::MarkupConfig{})
        : config(cfg),
          store(cfg),
          visibility(cfg.durations),
          calibration(store, mapper),
          pick(cfg.hitThresholdPx, cfg.handleRadiusPx),
          controller(store, mapper, calibration, pick, visibility) {
        mapper.setSurfaceSize(kSurfaceW, kSurfaceH);
        store.setMapper(&mapper);
    }

    markup::Point2 vis(float nx, float ny) const { return mapper.toVisual(markup::Point2{nx, ny}); }

    void clickAt(float x, float y, std::uint32_t modifiers = markup::ModifierNone) {
        controller.click(markup::PointerEvent{x, y, modifiers});
    }

    void dragFromTo(float x0, float y0, float x1, float y1) {
        controller.pointerDown(markup::PointerEvent{x0, y0, markup::ModifierNone});
        controller.pointerMove(markup::PointerEvent{x1, y1, markup::ModifierNone});
        controller.pointerUp(markup::PointerEvent{x1, y1, markup::ModifierNone});
    }

    std::uint32_t addLine(markup::Point2 a, markup::Point2 b) {
        markup::MarkupLine line;
        line.p1 = a;
        line.p2 = b;
        return store.addLine(line);
    }

    bool hasEvent(const std::vector<markup::InteractionEvent>& events, markup::InteractionEventType type) const {
        for (const auto& e : events) {
            if (e.type == type) return true;
        }
        return false;
    }
};

inline void expectNear(const markup::Point2& a, const markup::Point2& b, float eps = kEps) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
}

} // namespace markup_test
