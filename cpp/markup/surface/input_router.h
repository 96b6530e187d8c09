#pragma once

#include "markup/interaction/interaction_types.h"
#include <cstdint>
#include <map>
#include <optional>

namespace markup {

class MarkupSurface;

/**
 * InputRouter: forwards host input to the surface attached under a logical
 * slot id.
 *
 * Slot ids are stable across surface recreation (e.g. a layout switch): the
 * new surface attaches under the same id and a late detach from the old one
 * is ignored. Keys go to the active slot, which follows the last pointer-down.
 * Pointer-up is delivered to the slot that received the matching down.
 */
class InputRouter {
public:
    void attach(std::uint32_t slot, MarkupSurface* target);

    /** Detach only if `target` is still the surface attached to `slot`. */
    bool detach(std::uint32_t slot, const MarkupSurface* target);

    MarkupSurface* target(std::uint32_t slot) const;
    std::size_t attachedCount() const { return targets_.size(); }

    void setActiveSlot(std::uint32_t slot) { activeSlot_ = slot; }
    std::uint32_t activeSlot() const { return activeSlot_; }
    MarkupSurface* activeTarget() const { return target(activeSlot_); }

    // Return false when no surface is attached to the slot.
    bool pointerDown(std::uint32_t slot, const PointerEvent& e);
    bool pointerMove(std::uint32_t slot, const PointerEvent& e);
    bool pointerLeave(std::uint32_t slot);
    bool click(std::uint32_t slot, const PointerEvent& e);
    bool doubleClick(std::uint32_t slot, const PointerEvent& e);

    /** Global release; goes to the slot holding the pointer capture. */
    bool pointerUp(const PointerEvent& e);

    /** @return True if the active surface consumed the key */
    bool keyDown(const KeyEvent& e);

    /** Key releases reach every surface so modifier state never sticks. */
    void keyUp(const KeyEvent& e);

private:
    std::map<std::uint32_t, MarkupSurface*> targets_;
    std::uint32_t activeSlot_{0};
    std::optional<std::uint32_t> captureSlot_;
};

} // namespace markup
