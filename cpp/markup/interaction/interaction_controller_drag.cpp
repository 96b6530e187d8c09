#include "markup/interaction/interaction_controller.h"
#include "markup/core/logging.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_constants.h"
#include "markup/interaction/pick_system.h"
#include "markup/view/coordinate_mapper.h"
#include "markup/visibility/visibility_filter.h"
#include <algorithm>

namespace markup {

namespace {

DragKind endpointDragKind(EntityKind kind) {
    return kind == EntityKind::Angle ? DragKind::AngleEndpoint : DragKind::LineEndpoint;
}

DragKind bodyDragKind(EntityKind kind) {
    switch (kind) {
        case EntityKind::Line: return DragKind::LineBody;
        case EntityKind::Angle: return DragKind::AngleBody;
        case EntityKind::Text: return DragKind::TextBody;
    }
    return DragKind::LineBody;
}

EntityKind dragEntityKind(DragKind kind) {
    switch (kind) {
        case DragKind::LineEndpoint:
        case DragKind::LineBody:
            return EntityKind::Line;
        case DragKind::AngleEndpoint:
        case DragKind::AngleBody:
            return EntityKind::Angle;
        case DragKind::TextBody:
        case DragKind::TextBoxResize:
            return EntityKind::Text;
    }
    return EntityKind::Line;
}

Point2 offset(const Point2& p, float dx, float dy) {
    return Point2{p.x + dx, p.y + dy};
}

} // namespace

void InteractionController::beginDragAt(const PointerEvent& e) {
    const Point2 visual{e.x, e.y};
    const VisibleSet visible = visibility_.collect(store_, playbackTime_);
    const auto hit = pick_.pick(visual, visible, mapper_, store_.selection());
    if (!hit) {
        store_.clearSelection();
        return;
    }

    switch (hit->subTarget) {
        case PickSubTarget::Endpoint:
            beginDragFromPick(hit->kind, hit->id, endpointDragKind(hit->kind), hit->subIndex, visual);
            break;
        case PickSubTarget::ResizeHandle:
            beginDragFromPick(hit->kind, hit->id, DragKind::TextBoxResize, -1, visual);
            break;
        case PickSubTarget::Body:
            store_.setSelection(EntityRef{hit->kind, hit->id});
            beginDragFromPick(hit->kind, hit->id, bodyDragKind(hit->kind), -1, visual);
            break;
        case PickSubTarget::None:
            break;
    }
}

bool InteractionController::beginDragFromPick(
    EntityKind kind,
    std::uint32_t id,
    DragKind dragKind,
    std::int32_t index,
    const Point2& visual) {
    DragSession session{dragKind, id, index, visual, {}, 0.0f};

    switch (kind) {
        case EntityKind::Line: {
            const MarkupLine* line = store_.findLine(id);
            if (!line) return false;
            session.orig[0] = line->p1;
            session.orig[1] = line->p2;
            break;
        }
        case EntityKind::Angle: {
            const MarkupAngle* angle = store_.findAngle(id);
            if (!angle) return false;
            session.orig[0] = angle->p1;
            session.orig[1] = angle->vertex;
            session.orig[2] = angle->p2;
            break;
        }
        case EntityKind::Text: {
            const MarkupText* text = store_.findText(id);
            if (!text) return false;
            session.orig[0] = text->pos;
            session.origBoxWidth = text->boxWidth;
            if (dragKind == DragKind::TextBoxResize && session.origBoxWidth <= 0.0f) {
                // Single-line text: the grip sits at the rendered width, start from there
                const float span = mapper_.contentBox().w * mapper_.effectiveScale();
                const float widthPx = std::max(interaction_constants::TEXT_MIN_WIDTH_PX,
                                               pick_.textGeometry(*text, mapper_).widthPx);
                session.origBoxWidth = span > 0.0f ? widthPx / span : 0.0f;
            }
            break;
        }
    }

    // One undo step for the whole gesture
    store_.snapshotForUndo();
    drag_ = session;
    return true;
}

bool InteractionController::dragTargetAlive() const {
    return drag_ && store_.contains(EntityRef{dragEntityKind(drag_->kind), drag_->id});
}

void InteractionController::updateDrag(const Point2& visual) {
    if (!drag_) return;
    if (!dragTargetAlive()) {
        MARKUP_LOG_WARN("drag target %u vanished; abandoning drag", drag_->id);
        drag_.reset();
        return;
    }

    const DragSession& d = *drag_;
    const ContentBox& box = mapper_.contentBox();
    const float scale = mapper_.effectiveScale();
    const float spanX = box.w > 0.0f ? scale * box.w : 1.0f;
    const float spanY = box.h > 0.0f ? scale * box.h : 1.0f;
    const float dx = (visual.x - d.startVisual.x) / spanX;
    const float dy = (visual.y - d.startVisual.y) / spanY;

    switch (d.kind) {
        case DragKind::LineEndpoint: {
            LineUpdate update;
            const Point2 n = mapper_.toNormalized(visual);
            if (d.index == 0) update.p1 = n;
            else update.p2 = n;
            store_.updateLine(d.id, update);
            break;
        }
        case DragKind::AngleEndpoint: {
            AngleUpdate update;
            const Point2 n = mapper_.toNormalized(visual);
            if (d.index == 0) update.p1 = n;
            else if (d.index == 1) update.vertex = n;
            else update.p2 = n;
            store_.updateAngle(d.id, update);
            break;
        }
        case DragKind::LineBody: {
            LineUpdate update;
            update.p1 = offset(d.orig[0], dx, dy);
            update.p2 = offset(d.orig[1], dx, dy);
            store_.updateLine(d.id, update);
            break;
        }
        case DragKind::AngleBody: {
            AngleUpdate update;
            update.p1 = offset(d.orig[0], dx, dy);
            update.vertex = offset(d.orig[1], dx, dy);
            update.p2 = offset(d.orig[2], dx, dy);
            store_.updateAngle(d.id, update);
            break;
        }
        case DragKind::TextBody: {
            TextUpdate update;
            update.pos = offset(d.orig[0], dx, dy);
            store_.updateText(d.id, update);
            break;
        }
        case DragKind::TextBoxResize: {
            TextUpdate update;
            update.boxWidth = std::max(interaction_constants::TEXT_MIN_BOX_WIDTH, d.origBoxWidth + dx);
            store_.updateText(d.id, update);
            break;
        }
    }
}

void InteractionController::endDrag() {
    drag_.reset();
}

} // namespace markup
