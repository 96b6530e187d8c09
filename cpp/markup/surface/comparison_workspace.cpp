#include "markup/surface/comparison_workspace.h"
#include "markup/core/logging.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/surface/markup_surface.h"
#include <algorithm>

namespace markup {

namespace {

GridUpdate fullGridUpdate(const GridSettings& g) {
    GridUpdate u;
    u.show = g.show;
    u.mode = g.mode;
    u.spacingPx = g.spacingPx;
    u.color = g.color;
    u.opacity = g.opacity;
    u.originX = g.originX;
    u.originY = g.originY;
    return u;
}

float clampf(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace

ComparisonWorkspace::ComparisonWorkspace(const MarkupConfig& config) : config_(config) {
    for (std::uint32_t i = 0; i < kSlotCount; ++i) {
        slots_[i] = std::make_unique<MarkupSurface>(config_);
        router_.attach(i, slots_[i].get());
    }
}

ComparisonWorkspace::~ComparisonWorkspace() = default;

MarkupSurface* ComparisonWorkspace::surface(std::uint32_t slot) {
    return slot < kSlotCount ? slots_[slot].get() : nullptr;
}

const MarkupSurface* ComparisonWorkspace::surface(std::uint32_t slot) const {
    return slot < kSlotCount ? slots_[slot].get() : nullptr;
}

bool ComparisonWorkspace::recreateSurface(std::uint32_t slot) {
    MarkupSurface* old = surface(slot);
    if (!old) return false;

    auto fresh = std::make_unique<MarkupSurface>(config_);

    const CoordinateMapper& m = old->mapper();
    if (!fresh->setSurfaceSize(m.surfaceWidth(), m.surfaceHeight())) {
        MARKUP_LOG_DEBUG("recreateSurface: slot %u has no layout size yet", slot);
    }
    fresh->setMediaAspect(m.mediaAspect());
    fresh->setCorrectionScale(m.correctionScale());
    fresh->setTransform(m.transform());
    fresh->setPlaybackTime(old->playbackTime());

    const AnnotationStore& from = old->store();
    AnnotationStore& to = fresh->store();
    to.loadSnap(from.snapshot());
    to.setTool(from.tool());
    to.setActiveColor(from.activeColor());
    if (!to.setLineWidth(from.lineWidth()) || !to.setTextSize(from.textSize())) {
        MARKUP_LOG_WARN("recreateSurface: slot %u style reset to defaults", slot);
    }

    // The old surface's late detach finds the slot rebound and is ignored.
    router_.attach(slot, fresh.get());
    slots_[slot] = std::move(fresh);
    return true;
}

bool ComparisonWorkspace::replaceMedia(std::uint32_t slot) {
    MarkupSurface* s = surface(slot);
    if (!s) return false;
    s->replaceMedia();
    return true;
}

void ComparisonWorkspace::setGridSync(bool enabled, std::uint32_t source) {
    gridSync_ = enabled;
    if (!enabled) return;
    MarkupSurface* src = surface(source);
    if (!src) return;
    const GridUpdate all = fullGridUpdate(src->store().grid());
    src->store().updateGrid(all);
    slots_[other(source)]->store().updateGrid(all);
}

bool ComparisonWorkspace::updateGrid(std::uint32_t slot, const GridUpdate& update) {
    MarkupSurface* s = surface(slot);
    if (!s) return false;
    s->store().updateGrid(update);
    if (gridSync_) slots_[other(slot)]->store().updateGrid(update);
    return true;
}

void ComparisonWorkspace::setTransformSync(bool enabled, std::uint32_t source) {
    transformSync_ = enabled;
    if (!enabled) return;
    MarkupSurface* src = surface(source);
    if (!src) return;
    slots_[other(source)]->setTransform(src->mapper().transform());
}

bool ComparisonWorkspace::setTransform(std::uint32_t slot, const MediaTransform& transform) {
    MarkupSurface* s = surface(slot);
    if (!s) return false;
    s->setTransform(transform);
    if (transformSync_) slots_[other(slot)]->setTransform(transform);
    return true;
}

bool ComparisonWorkspace::toggleTool(MarkupSurface& s, MarkupTool tool) {
    const MarkupTool next = s.store().tool() == tool ? MarkupTool::None : tool;
    s.controller().selectTool(next);
    return true;
}

bool ComparisonWorkspace::applyShortcut(WorkspaceShortcut shortcut) {
    switch (shortcut) {
        case WorkspaceShortcut::ActivateFirst:
            router_.setActiveSlot(0);
            return true;
        case WorkspaceShortcut::ActivateSecond:
            router_.setActiveSlot(1);
            return true;
        default:
            break;
    }

    const std::uint32_t slot = router_.activeSlot();
    MarkupSurface* s = surface(slot);
    if (!s) return false;
    AnnotationStore& store = s->store();

    switch (shortcut) {
        case WorkspaceShortcut::Undo:
            return store.undo();
        case WorkspaceShortcut::Redo:
            return store.redo();
        case WorkspaceShortcut::ToggleGrid: {
            GridUpdate u;
            u.show = !store.grid().show;
            return updateGrid(slot, u);
        }
        case WorkspaceShortcut::ToggleLineTool:
            return toggleTool(*s, MarkupTool::Line);
        case WorkspaceShortcut::ToggleAngleTool:
            return toggleTool(*s, MarkupTool::Angle);
        case WorkspaceShortcut::ToggleTextTool:
            return toggleTool(*s, MarkupTool::Text);
        case WorkspaceShortcut::ToggleHidden:
            store.setHidden(!store.hidden());
            return true;
        case WorkspaceShortcut::ZoomIn:
        case WorkspaceShortcut::ZoomOut: {
            MediaTransform t = s->mapper().transform();
            const float delta = shortcut == WorkspaceShortcut::ZoomIn ? kZoomStep : -kZoomStep;
            t.scale = clampf(t.scale + delta, kMinZoom, kMaxZoom);
            return setTransform(slot, t);
        }
        case WorkspaceShortcut::PanLeft:
        case WorkspaceShortcut::PanRight:
        case WorkspaceShortcut::PanUp:
        case WorkspaceShortcut::PanDown: {
            MediaTransform t = s->mapper().transform();
            float dx = 0.0f;
            float dy = 0.0f;
            if (shortcut == WorkspaceShortcut::PanLeft) dx = -kPanStepPx;
            if (shortcut == WorkspaceShortcut::PanRight) dx = kPanStepPx;
            if (shortcut == WorkspaceShortcut::PanUp) dy = kPanStepPx;
            if (shortcut == WorkspaceShortcut::PanDown) dy = -kPanStepPx;
            t.translateX = clampf(t.translateX + dx, -kMaxPanPx, kMaxPanPx);
            t.translateY = clampf(t.translateY + dy, -kMaxPanPx, kMaxPanPx);
            return setTransform(slot, t);
        }
        default:
            break;
    }
    MARKUP_LOG_DEBUG("applyShortcut: unhandled shortcut %u", static_cast<unsigned>(shortcut));
    return false;
}

} // namespace markup
