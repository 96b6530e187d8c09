#include "markup/surface/input_router.h"
#include "markup/core/logging.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/surface/markup_surface.h"

namespace markup {

void InputRouter::attach(std::uint32_t slot, MarkupSurface* target) {
    if (!target) {
        targets_.erase(slot);
        return;
    }
    const auto it = targets_.find(slot);
    if (it != targets_.end() && it->second != target && captureSlot_ == slot) {
        // The surface holding the capture went away.
        captureSlot_.reset();
    }
    targets_[slot] = target;
}

bool InputRouter::detach(std::uint32_t slot, const MarkupSurface* target) {
    const auto it = targets_.find(slot);
    if (it == targets_.end() || it->second != target) {
        MARKUP_LOG_DEBUG("InputRouter::detach: slot %u already rebound", slot);
        return false;
    }
    targets_.erase(it);
    if (captureSlot_ == slot) captureSlot_.reset();
    return true;
}

MarkupSurface* InputRouter::target(std::uint32_t slot) const {
    const auto it = targets_.find(slot);
    return it == targets_.end() ? nullptr : it->second;
}

bool InputRouter::pointerDown(std::uint32_t slot, const PointerEvent& e) {
    MarkupSurface* t = target(slot);
    if (!t) return false;
    activeSlot_ = slot;
    captureSlot_ = slot;
    t->controller().pointerDown(e);
    return true;
}

bool InputRouter::pointerMove(std::uint32_t slot, const PointerEvent& e) {
    // While captured, moves keep driving the capturing surface's drag.
    const std::uint32_t routed = captureSlot_.value_or(slot);
    MarkupSurface* t = target(routed);
    if (!t) return false;
    t->controller().pointerMove(e);
    return true;
}

bool InputRouter::pointerLeave(std::uint32_t slot) {
    MarkupSurface* t = target(slot);
    if (!t) return false;
    t->controller().pointerLeave();
    return true;
}

bool InputRouter::click(std::uint32_t slot, const PointerEvent& e) {
    MarkupSurface* t = target(slot);
    if (!t) return false;
    t->controller().click(e);
    return true;
}

bool InputRouter::doubleClick(std::uint32_t slot, const PointerEvent& e) {
    MarkupSurface* t = target(slot);
    if (!t) return false;
    t->controller().doubleClick(e);
    return true;
}

bool InputRouter::pointerUp(const PointerEvent& e) {
    if (!captureSlot_) return false;
    const std::uint32_t slot = *captureSlot_;
    captureSlot_.reset();
    MarkupSurface* t = target(slot);
    if (!t) return false;
    t->controller().pointerUp(e);
    return true;
}

bool InputRouter::keyDown(const KeyEvent& e) {
    MarkupSurface* t = activeTarget();
    if (!t) return false;
    return t->controller().keyDown(e);
}

void InputRouter::keyUp(const KeyEvent& e) {
    for (const auto& entry : targets_) {
        entry.second->controller().keyUp(e);
    }
}

} // namespace markup
