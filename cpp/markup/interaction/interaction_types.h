#pragma once

#include "markup/core/types.h"
#include <cstdint>
#include <string>

namespace markup {

enum ModifierFlags : std::uint32_t {
    ModifierNone = 0,
    ModifierShift = 1u << 0,
    ModifierCtrl = 1u << 1,
    ModifierAlt = 1u << 2,
    ModifierMeta = 1u << 3,
};

// Pointer position is already in surface pixel space.
struct PointerEvent {
    float x{0.0f};
    float y{0.0f};
    std::uint32_t modifiers{ModifierNone};
};

enum class Key : std::uint8_t {
    Other = 0,
    Escape = 1,
    Delete = 2,
    Backspace = 3,
    Enter = 4,
    Shift = 5,
};

struct KeyEvent {
    Key key{Key::Other};
    // True when keyboard focus is in a host text field
    bool inTextInput{false};
};

enum class InteractionMode : std::uint8_t {
    Idle = 0,
    PlacingLine = 1,
    PlacingAngle = 2,
    PlacingText = 3,
    PlacingMeasurement = 4,
    Dragging = 5,
};

enum class DragKind : std::uint8_t {
    LineEndpoint = 0,
    AngleEndpoint = 1,
    LineBody = 2,
    AngleBody = 3,
    TextBody = 4,
    TextBoxResize = 5,
};

// Notifications for the host UI, drained by the caller after each input.
enum class InteractionEventType : std::uint8_t {
    OpenToolPanel = 1,
    ClosePanelRequested = 2,
    ReferenceInputRequested = 3,
    TextEditOpened = 4,
    TextEditClosed = 5,
};

struct InteractionEvent {
    InteractionEventType type;
    EntityKind kind{EntityKind::Line};
    std::uint32_t id{0};
    Point2 anchor{0.0f, 0.0f}; // surface pixels
};

/**
 * Inline text editor state. id == 0 means the commit creates a new text at
 * `anchor` (normalized); otherwise it edits that text's content.
 */
struct TextEditState {
    std::uint32_t id{0};
    Point2 anchor{0.0f, 0.0f};
    std::string value;
};

} // namespace markup
