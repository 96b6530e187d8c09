#include "markup/entity/annotation_store.h"
#include "markup/core/geometry.h"
#include "markup/core/logging.h"
#include "markup/view/coordinate_mapper.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace markup {

namespace {

template <typename T>
T* findById(std::vector<T>& items, std::uint32_t id) {
    for (auto& item : items) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

template <typename T>
const T* findById(const std::vector<T>& items, std::uint32_t id) {
    for (const auto& item : items) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

// Later records with an id already seen are dropped.
template <typename T>
void dropDuplicateIds(std::vector<T>& items) {
    std::unordered_set<std::uint32_t> seen;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&seen](const T& item) { return !seen.insert(item.id).second; }), items.end());
}

template <typename T>
bool eraseById(std::vector<T>& items, std::uint32_t id) {
    auto it = std::find_if(items.begin(), items.end(), [id](const T& item) { return item.id == id; });
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

bool isPositiveFinite(float v) {
    return std::isfinite(v) && v > 0.0f;
}

} // namespace

AnnotationStore::AnnotationStore(const MarkupConfig& config)
    : config_(config),
      activeColor_(config.defaultColor),
      lineWidth_(config.defaultLineWidth),
      textSize_(config.defaultTextSize),
      grid_(config.defaultGrid),
      history_(config.maxUndo) {}

bool AnnotationStore::setLineWidth(float width) {
    if (!isPositiveFinite(width)) return false;
    lineWidth_ = width;
    return true;
}

bool AnnotationStore::setTextSize(float size) {
    if (!isPositiveFinite(size)) return false;
    textSize_ = size;
    return true;
}

bool AnnotationStore::isSelected(EntityKind kind, std::uint32_t id) const {
    return selection_ && selection_->kind == kind && selection_->id == id;
}

const MarkupLine* AnnotationStore::findLine(std::uint32_t id) const { return findById(lines_, id); }
const MarkupAngle* AnnotationStore::findAngle(std::uint32_t id) const { return findById(angles_, id); }
const MarkupText* AnnotationStore::findText(std::uint32_t id) const { return findById(texts_, id); }

MarkupLine* AnnotationStore::findLineMutable(std::uint32_t id) { return findById(lines_, id); }
MarkupAngle* AnnotationStore::findAngleMutable(std::uint32_t id) { return findById(angles_, id); }
MarkupText* AnnotationStore::findTextMutable(std::uint32_t id) { return findById(texts_, id); }

bool AnnotationStore::contains(const EntityRef& ref) const {
    switch (ref.kind) {
        case EntityKind::Line: return findLine(ref.id) != nullptr;
        case EntityKind::Angle: return findAngle(ref.id) != nullptr;
        case EntityKind::Text: return findText(ref.id) != nullptr;
    }
    return false;
}

const MarkupLine* AnnotationStore::referenceLine() const {
    for (const auto& line : lines_) {
        if (line.referenceLength) return &line;
    }
    return nullptr;
}

float AnnotationStore::visualAngleDeg(const Point2& p1, const Point2& vertex, const Point2& p2) const {
    if (!mapper_) return calcAngleDeg(p1, vertex, p2);
    return calcAngleDeg(mapper_->toVisual(p1), mapper_->toVisual(vertex), mapper_->toVisual(p2));
}

std::uint32_t AnnotationStore::allocateId() {
    return nextId_++;
}

void AnnotationStore::bumpNextIdPast(std::uint32_t id) {
    if (id >= nextId_) nextId_ = id + 1;
}

// =============================================================================
// Content mutations
// =============================================================================

std::uint32_t AnnotationStore::addLine(const MarkupLine& line) {
    history_.push(snapshot());
    MarkupLine rec = line;
    rec.id = allocateId();
    if (rec.referenceLength) {
        for (auto& other : lines_) {
            other.referenceLength.reset();
        }
    }
    lines_.push_back(std::move(rec));
    return lines_.back().id;
}

std::uint32_t AnnotationStore::addAngle(const MarkupAngle& angle) {
    history_.push(snapshot());
    MarkupAngle rec = angle;
    rec.id = allocateId();
    rec.angleDeg = visualAngleDeg(rec.p1, rec.vertex, rec.p2);
    angles_.push_back(std::move(rec));
    return angles_.back().id;
}

std::uint32_t AnnotationStore::addText(const MarkupText& text) {
    history_.push(snapshot());
    MarkupText rec = text;
    rec.id = allocateId();
    texts_.push_back(std::move(rec));
    return texts_.back().id;
}

bool AnnotationStore::removeItem(EntityKind kind, std::uint32_t id) {
    if (!contains(EntityRef{kind, id})) {
        MARKUP_LOG_DEBUG("removeItem: stale id %u", id);
        return false;
    }
    history_.push(snapshot());
    switch (kind) {
        case EntityKind::Line: eraseById(lines_, id); break;
        case EntityKind::Angle: eraseById(angles_, id); break;
        case EntityKind::Text: eraseById(texts_, id); break;
    }
    if (isSelected(kind, id)) selection_.reset();
    return true;
}

void AnnotationStore::clearAll() {
    history_.push(snapshot());
    lines_.clear();
    angles_.clear();
    texts_.clear();
    grid_ = config_.defaultGrid;
    selection_.reset();
}

// =============================================================================
// Field updates
// =============================================================================

bool AnnotationStore::updateLine(std::uint32_t id, const LineUpdate& update) {
    MarkupLine* line = findLineMutable(id);
    if (!line) {
        MARKUP_LOG_DEBUG("updateLine: stale id %u", id);
        return false;
    }
    if (update.p1) line->p1 = *update.p1;
    if (update.p2) line->p2 = *update.p2;
    if (update.color) line->color = *update.color;
    if (update.width && isPositiveFinite(*update.width)) line->width = *update.width;
    if (update.showAngle) line->showAngle = *update.showAngle;
    if (update.name) line->name = *update.name;
    if (update.displayDuration) line->displayDuration = *update.displayDuration;
    if (update.isMeasurement) line->isMeasurement = *update.isMeasurement;
    history_.clearRedo();
    return true;
}

bool AnnotationStore::updateAngle(std::uint32_t id, const AngleUpdate& update) {
    MarkupAngle* angle = findAngleMutable(id);
    if (!angle) {
        MARKUP_LOG_DEBUG("updateAngle: stale id %u", id);
        return false;
    }
    const bool pointsChanged = update.p1 || update.vertex || update.p2;
    if (update.p1) angle->p1 = *update.p1;
    if (update.vertex) angle->vertex = *update.vertex;
    if (update.p2) angle->p2 = *update.p2;
    if (update.color) angle->color = *update.color;
    if (update.width && isPositiveFinite(*update.width)) angle->width = *update.width;
    if (update.name) angle->name = *update.name;
    if (update.displayDuration) angle->displayDuration = *update.displayDuration;

    if (update.angleDeg) {
        angle->angleDeg = *update.angleDeg;
    } else if (pointsChanged) {
        angle->angleDeg = visualAngleDeg(angle->p1, angle->vertex, angle->p2);
    }
    history_.clearRedo();
    return true;
}

bool AnnotationStore::updateText(std::uint32_t id, const TextUpdate& update) {
    MarkupText* text = findTextMutable(id);
    if (!text) {
        MARKUP_LOG_DEBUG("updateText: stale id %u", id);
        return false;
    }
    if (update.pos) text->pos = *update.pos;
    if (update.content) text->content = *update.content;
    if (update.size && isPositiveFinite(*update.size)) text->size = *update.size;
    if (update.color) text->color = *update.color;
    if (update.backgroundColor) text->backgroundColor = *update.backgroundColor;
    if (update.boxWidth && std::isfinite(*update.boxWidth)) text->boxWidth = std::max(0.0f, *update.boxWidth);
    if (update.name) text->name = *update.name;
    if (update.displayDuration) text->displayDuration = *update.displayDuration;
    history_.clearRedo();
    return true;
}

void AnnotationStore::updateGrid(const GridUpdate& update) {
    if (update.show) grid_.show = *update.show;
    if (update.mode) grid_.mode = *update.mode;
    if (update.spacingPx && isPositiveFinite(*update.spacingPx)) grid_.spacingPx = *update.spacingPx;
    if (update.color) grid_.color = *update.color;
    if (update.opacity) grid_.opacity = std::max(0.0f, std::min(1.0f, *update.opacity));
    if (update.originX) grid_.originX = *update.originX;
    if (update.originY) grid_.originY = *update.originY;
}

bool AnnotationStore::setReferenceLength(std::uint32_t lineId, float length, const std::string& unit) {
    if (!isPositiveFinite(length)) return false;
    MarkupLine* line = findLineMutable(lineId);
    if (!line) return false;
    for (auto& other : lines_) {
        if (other.id != lineId) other.referenceLength.reset();
    }
    line->referenceLength = length;
    line->unit = unit;
    line->isMeasurement = true;
    history_.clearRedo();
    return true;
}

bool AnnotationStore::clearReference(std::uint32_t lineId) {
    MarkupLine* line = findLineMutable(lineId);
    if (!line || !line->referenceLength) return false;
    line->referenceLength.reset();
    history_.clearRedo();
    return true;
}

// =============================================================================
// History
// =============================================================================

MarkupSnap AnnotationStore::snapshot() const {
    MarkupSnap snap;
    snap.lines = lines_;
    snap.angles = angles_;
    snap.texts = texts_;
    snap.grid = grid_;
    snap.hidden = hidden_;
    return snap;
}

void AnnotationStore::restore(MarkupSnap&& snap) {
    lines_ = std::move(snap.lines);
    angles_ = std::move(snap.angles);
    texts_ = std::move(snap.texts);
    grid_ = snap.grid;
    hidden_ = snap.hidden;
}

void AnnotationStore::snapshotForUndo() {
    history_.push(snapshot());
}

bool AnnotationStore::undo() {
    MarkupSnap target;
    if (!history_.undo(snapshot(), target)) return false;
    restore(std::move(target));
    selection_.reset();
    return true;
}

bool AnnotationStore::redo() {
    MarkupSnap target;
    if (!history_.redo(snapshot(), target)) return false;
    restore(std::move(target));
    selection_.reset();
    return true;
}

void AnnotationStore::loadSnap(const MarkupSnap& snap) {
    MarkupSnap copy = snap;
    dropDuplicateIds(copy.lines);
    dropDuplicateIds(copy.angles);
    dropDuplicateIds(copy.texts);
    bool haveReference = false;
    for (auto& l : copy.lines) {
        if (!l.referenceLength) continue;
        if (haveReference) {
            MARKUP_LOG_WARN("loadSnap: dropping extra reference on line %u", l.id);
            l.referenceLength.reset();
        }
        haveReference = true;
    }
    for (const auto& l : copy.lines) bumpNextIdPast(l.id);
    for (const auto& a : copy.angles) bumpNextIdPast(a.id);
    for (const auto& t : copy.texts) bumpNextIdPast(t.id);
    restore(std::move(copy));
    selection_.reset();
    history_.clear();
}

} // namespace markup
