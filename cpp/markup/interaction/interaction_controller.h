#pragma once

#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include "markup/interaction/interaction_types.h"
#include "markup/interaction/snap_solver.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace markup {

class AnnotationStore;
class CalibrationEngine;
class CoordinateMapper;
class PickSystem;
class VisibilityFilter;

/**
 * InteractionController: turns pointer and key input on one surface into
 * annotation commands.
 *
 * The host forwards pointer-down / move / up (up is captured globally so a
 * release outside the surface still ends a drag), click and double-click,
 * key down / up, and the inline text editor's value. Notifications for the
 * host UI are queued and collected with drainEvents().
 */
class InteractionController {
public:
    InteractionController(
        AnnotationStore& store,
        const CoordinateMapper& mapper,
        CalibrationEngine& calibration,
        const PickSystem& pickSystem,
        const VisibilityFilter& visibility);

    // ==============================================================================
    // Host state
    // ==============================================================================
    void setPlaybackTime(double seconds) { playbackTime_ = seconds; }
    double playbackTime() const { return playbackTime_; }

    /** Switch tools; pending points, hover and any open text edit are dropped. */
    void selectTool(MarkupTool tool);

    // ==============================================================================
    // Pointer / key input
    // ==============================================================================
    void pointerDown(const PointerEvent& e);
    void pointerMove(const PointerEvent& e);
    void pointerUp(const PointerEvent& e);
    void pointerLeave();
    void click(const PointerEvent& e);
    void doubleClick(const PointerEvent& e);

    /** @return True if the key was consumed */
    bool keyDown(const KeyEvent& e);
    void keyUp(const KeyEvent& e);

    // ==============================================================================
    // Inline text edit
    // ==============================================================================
    bool isEditingText() const { return textEdit_.has_value(); }
    const std::optional<TextEditState>& textEdit() const { return textEdit_; }
    void setTextEditValue(std::string value);

    /**
     * Commit the open edit. Blank content creates nothing (new text) or keeps
     * the previous content (existing text) and returns EmptyContent.
     */
    MarkupError commitTextEdit();
    void cancelTextEdit();

    // Forwarded to the calibration engine's pending capture.
    MarkupError submitReference(std::string_view value, std::string_view unit);

    // ==============================================================================
    // State Query
    // ==============================================================================
    InteractionMode mode() const;
    bool isDragging() const noexcept { return drag_.has_value(); }
    std::optional<DragKind> dragKind() const;
    const std::vector<Point2>& pendingPoints() const { return pending_; }
    const std::optional<Point2>& hoverPoint() const { return hover_; }
    bool snapModifierHeld() const noexcept { return shiftHeld_; }

    /** Hover point as it would be placed (snapped when the modifier is held). */
    std::optional<Point2> placementPreview() const;

    std::vector<InteractionEvent> drainEvents();

private:
    struct DragSession {
        DragKind kind;
        std::uint32_t id;
        std::int32_t index;
        Point2 startVisual;
        Point2 orig[3];
        float origBoxWidth;
    };

    // Placement
    void placePoint(const PointerEvent& e);
    std::size_t requiredPoints() const;
    bool sameAsPreviousPending(const Point2& n) const;
    Point2 snappedFromLast(const Point2& n, bool snap) const;
    void commitLine(const Point2& a, const Point2& b, bool measurement);
    void commitAngle();
    void openTextEdit(std::uint32_t id, const Point2& anchorNorm, std::string value);

    // Idle picking and drags (interaction_controller_drag.cpp)
    void beginDragAt(const PointerEvent& e);
    bool beginDragFromPick(EntityKind kind, std::uint32_t id, DragKind dragKind, std::int32_t index, const Point2& visual);
    void updateDrag(const Point2& visual);
    void endDrag();
    bool dragTargetAlive() const;

    bool handleEscape();
    void emit(InteractionEventType type, EntityKind kind, std::uint32_t id, const Point2& anchor);

    AnnotationStore& store_;
    const CoordinateMapper& mapper_;
    CalibrationEngine& calibration_;
    const PickSystem& pick_;
    const VisibilityFilter& visibility_;

    double playbackTime_{0.0};
    std::vector<Point2> pending_;
    std::optional<Point2> hover_;
    std::optional<TextEditState> textEdit_;
    std::optional<DragSession> drag_;
    bool shiftHeld_{false};
    bool shiftKeyDown_{false};
    std::vector<InteractionEvent> events_;
};

} // namespace markup
