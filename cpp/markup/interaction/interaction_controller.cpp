#include "markup/interaction/interaction_controller.h"
#include "markup/core/geometry.h"
#include "markup/core/logging.h"
#include "markup/core/string_utils.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_constants.h"
#include "markup/interaction/pick_system.h"
#include "markup/measure/calibration_engine.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <utility>

namespace markup {

InteractionController::InteractionController(
    AnnotationStore& store,
    const CoordinateMapper& mapper,
    CalibrationEngine& calibration,
    const PickSystem& pickSystem,
    const VisibilityFilter& visibility)
    : store_(store),
      mapper_(mapper),
      calibration_(calibration),
      pick_(pickSystem),
      visibility_(visibility) {}

// ==============================================================================
// Tools and state
// ==============================================================================

void InteractionController::selectTool(MarkupTool tool) {
    store_.setTool(tool);
    pending_.clear();
    hover_.reset();
    if (textEdit_) cancelTextEdit();
}

InteractionMode InteractionController::mode() const {
    if (drag_) return InteractionMode::Dragging;
    switch (store_.tool()) {
        case MarkupTool::None: return InteractionMode::Idle;
        case MarkupTool::Line: return InteractionMode::PlacingLine;
        case MarkupTool::Angle: return InteractionMode::PlacingAngle;
        case MarkupTool::Text: return InteractionMode::PlacingText;
        case MarkupTool::Measure: return InteractionMode::PlacingMeasurement;
    }
    return InteractionMode::Idle;
}

std::optional<DragKind> InteractionController::dragKind() const {
    if (!drag_) return std::nullopt;
    return drag_->kind;
}

std::vector<InteractionEvent> InteractionController::drainEvents() {
    std::vector<InteractionEvent> out;
    out.swap(events_);
    return out;
}

void InteractionController::emit(InteractionEventType type, EntityKind kind, std::uint32_t id, const Point2& anchor) {
    events_.push_back(InteractionEvent{type, kind, id, anchor});
}

std::size_t InteractionController::requiredPoints() const {
    switch (store_.tool()) {
        case MarkupTool::Line:
        case MarkupTool::Measure:
            return 2;
        case MarkupTool::Angle:
            return 3;
        default:
            return 0;
    }
}

Point2 InteractionController::snappedFromLast(const Point2& n, bool snap) const {
    if (!snap || pending_.empty()) return n;
    const SnapOptions options{true, store_.config().snapStepRad};
    return computeDirectionSnap(options, pending_.back(), n, mapper_).point;
}

std::optional<Point2> InteractionController::placementPreview() const {
    if (!hover_) return std::nullopt;
    return snappedFromLast(*hover_, shiftHeld_);
}

bool InteractionController::sameAsPreviousPending(const Point2& n) const {
    if (pending_.empty()) return false;
    return distance(mapper_.toVisual(pending_.back()), mapper_.toVisual(n))
        < interaction_constants::SAME_POINT_EPSILON_PX;
}

// ==============================================================================
// Pointer input
// ==============================================================================

void InteractionController::pointerDown(const PointerEvent& e) {
    shiftHeld_ = (e.modifiers & ModifierShift) != 0 || shiftKeyDown_;

    // Pressing outside the inline editor commits it
    if (textEdit_) {
        const MarkupError err = commitTextEdit();
        if (err != MarkupError::Ok) {
            MARKUP_LOG_DEBUG("pointerDown: text edit closed (%s)", markupErrorName(err));
        }
    }

    if (store_.tool() == MarkupTool::None) {
        beginDragAt(e);
    }
}

void InteractionController::pointerMove(const PointerEvent& e) {
    shiftHeld_ = (e.modifiers & ModifierShift) != 0 || shiftKeyDown_;
    const Point2 visual{e.x, e.y};

    if (drag_) {
        updateDrag(visual);
        return;
    }
    if (store_.tool() != MarkupTool::None) {
        hover_ = mapper_.toNormalized(visual);
    }
}

void InteractionController::pointerUp(const PointerEvent&) {
    endDrag();
}

void InteractionController::pointerLeave() {
    hover_.reset();
}

void InteractionController::click(const PointerEvent& e) {
    shiftHeld_ = (e.modifiers & ModifierShift) != 0 || shiftKeyDown_;
    if (store_.tool() == MarkupTool::None) return;

    // A drawing tool never starts over a selected item; the click only unselects.
    if (store_.selection()) {
        store_.clearSelection();
        return;
    }
    placePoint(e);
}

void InteractionController::doubleClick(const PointerEvent& e) {
    if (store_.tool() != MarkupTool::None) return;
    endDrag();

    const Point2 visual{e.x, e.y};
    const VisibleSet visible = visibility_.collect(store_, playbackTime_);
    const auto hit = pick_.pickBody(visual, visible, mapper_);
    if (!hit) return;

    store_.setSelection(EntityRef{hit->kind, hit->id});
    emit(InteractionEventType::OpenToolPanel, hit->kind, hit->id, visual);

    if (hit->kind == EntityKind::Text) {
        const MarkupText* text = store_.findText(hit->id);
        if (text) openTextEdit(text->id, text->pos, text->content);
    }
}

// ==============================================================================
// Placement
// ==============================================================================

void InteractionController::placePoint(const PointerEvent& e) {
    const Point2 raw = mapper_.toNormalized(Point2{e.x, e.y});

    if (store_.tool() == MarkupTool::Text) {
        openTextEdit(0, raw, std::string());
        return;
    }

    const Point2 n = snappedFromLast(raw, (e.modifiers & ModifierShift) != 0);
    if (sameAsPreviousPending(n)) {
        MARKUP_LOG_DEBUG("placePoint: discarded repeated point");
        return;
    }
    pending_.push_back(n);
    if (pending_.size() < requiredPoints()) return;

    switch (store_.tool()) {
        case MarkupTool::Line:
            commitLine(pending_[0], pending_[1], false);
            break;
        case MarkupTool::Measure:
            commitLine(pending_[0], pending_[1], true);
            break;
        case MarkupTool::Angle:
            commitAngle();
            break;
        default:
            break;
    }
    pending_.clear();
    hover_.reset();
    store_.setTool(MarkupTool::None);
}

void InteractionController::commitLine(const Point2& a, const Point2& b, bool measurement) {
    MarkupLine line;
    line.p1 = a;
    line.p2 = b;
    line.color = store_.activeColor();
    line.width = store_.lineWidth();
    line.createdAt = playbackTime_;
    line.isMeasurement = measurement;
    const std::uint32_t id = store_.addLine(line);

    if (measurement && !store_.referenceLine() && !calibration_.hasPendingReference()) {
        if (calibration_.beginReferenceCapture(id)) {
            const auto& pending = calibration_.pendingReference();
            emit(InteractionEventType::ReferenceInputRequested, EntityKind::Line, id, pending->anchor);
        }
    }
}

void InteractionController::commitAngle() {
    MarkupAngle angle;
    angle.p1 = pending_[0];
    angle.vertex = pending_[1];
    angle.p2 = pending_[2];
    angle.color = store_.activeColor();
    angle.width = store_.lineWidth();
    angle.createdAt = playbackTime_;
    store_.addAngle(angle);
}

// ==============================================================================
// Inline text edit
// ==============================================================================

void InteractionController::openTextEdit(std::uint32_t id, const Point2& anchorNorm, std::string value) {
    textEdit_ = TextEditState{id, anchorNorm, std::move(value)};
    emit(InteractionEventType::TextEditOpened, EntityKind::Text, id, mapper_.toVisual(anchorNorm));
}

void InteractionController::setTextEditValue(std::string value) {
    if (textEdit_) textEdit_->value = std::move(value);
}

MarkupError InteractionController::commitTextEdit() {
    if (!textEdit_) return MarkupError::StaleReference;
    TextEditState edit = std::move(*textEdit_);
    textEdit_.reset();
    emit(InteractionEventType::TextEditClosed, EntityKind::Text, edit.id, mapper_.toVisual(edit.anchor));

    if (isBlank(edit.value)) return MarkupError::EmptyContent;

    if (edit.id != 0) {
        TextUpdate update;
        update.content = std::move(edit.value);
        return store_.updateText(edit.id, update) ? MarkupError::Ok : MarkupError::StaleReference;
    }

    MarkupText text;
    text.pos = edit.anchor;
    text.content = std::move(edit.value);
    text.size = store_.textSize();
    text.color = store_.activeColor();
    text.createdAt = playbackTime_;
    store_.addText(text);
    store_.setTool(MarkupTool::None);
    hover_.reset();
    return MarkupError::Ok;
}

void InteractionController::cancelTextEdit() {
    if (!textEdit_) return;
    const TextEditState edit = std::move(*textEdit_);
    textEdit_.reset();
    emit(InteractionEventType::TextEditClosed, EntityKind::Text, edit.id, mapper_.toVisual(edit.anchor));
}

MarkupError InteractionController::submitReference(std::string_view value, std::string_view unit) {
    return calibration_.submitReference(value, unit);
}

// ==============================================================================
// Keys
// ==============================================================================

bool InteractionController::handleEscape() {
    if (drag_) {
        endDrag();
        return true;
    }
    if (textEdit_) {
        cancelTextEdit();
        return true;
    }
    if (calibration_.cancelReferenceCapture()) {
        return true;
    }
    if (store_.selection()) {
        store_.clearSelection();
        return true;
    }
    if (!pending_.empty()) {
        pending_.clear();
        return true;
    }
    emit(InteractionEventType::ClosePanelRequested, EntityKind::Line, 0, Point2{0.0f, 0.0f});
    return true;
}

bool InteractionController::keyDown(const KeyEvent& e) {
    switch (e.key) {
        case Key::Shift:
            shiftKeyDown_ = true;
            shiftHeld_ = true;
            return false;
        case Key::Escape:
            return handleEscape();
        case Key::Enter:
            if (textEdit_) {
                const MarkupError err = commitTextEdit();
                if (err != MarkupError::Ok) {
                    MARKUP_LOG_DEBUG("keyDown: text edit closed (%s)", markupErrorName(err));
                }
                return true;
            }
            return false;
        case Key::Delete:
        case Key::Backspace: {
            if (e.inTextInput || textEdit_) return false;
            const auto selection = store_.selection();
            if (!selection) return false;
            if (drag_ && drag_->id == selection->id) endDrag();
            const auto& pendingRef = calibration_.pendingReference();
            if (pendingRef && selection->kind == EntityKind::Line && pendingRef->lineId == selection->id) {
                calibration_.cancelReferenceCapture();
            }
            return store_.removeItem(selection->kind, selection->id);
        }
        case Key::Other:
            break;
    }
    return false;
}

void InteractionController::keyUp(const KeyEvent& e) {
    if (e.key == Key::Shift) {
        shiftKeyDown_ = false;
        shiftHeld_ = false;
    }
}

} // namespace markup
