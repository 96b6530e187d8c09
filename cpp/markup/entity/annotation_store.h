#pragma once

#include "markup/config/markup_config.h"
#include "markup/entity/markup_types.h"
#include "markup/history/history_manager.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace markup {

class CoordinateMapper;

/**
 * AnnotationStore: owns the annotation collections, grid, hidden flag,
 * selection and active drawing style for one media surface, plus the
 * undo/redo history.
 *
 * Content-mutating operations (add*, removeItem, clearAll) record the
 * pre-mutation snapshot. Field updates (update*) do not; callers that drive
 * continuous edits take one snapshotForUndo() before the first update.
 *
 * Ids come from a single counter shared by all kinds and are never reused
 * within the store's lifetime.
 */
class AnnotationStore {
public:
    explicit AnnotationStore(const MarkupConfig& config = MarkupConfig{});

    /**
     * Projection used to compute angles in visual space. Without one the
     * store measures angles on raw normalized coordinates.
     */
    void setMapper(const CoordinateMapper* mapper) { mapper_ = mapper; }
    const CoordinateMapper* mapper() const { return mapper_; }

    const MarkupConfig& config() const { return config_; }

    // =========================================================================
    // Drawing state
    // =========================================================================

    MarkupTool tool() const { return tool_; }
    void setTool(MarkupTool tool) { tool_ = tool; }

    Color activeColor() const { return activeColor_; }
    void setActiveColor(Color color) { activeColor_ = color; }

    float lineWidth() const { return lineWidth_; }
    bool setLineWidth(float width);

    float textSize() const { return textSize_; }
    bool setTextSize(float size);

    bool hidden() const { return hidden_; }
    void setHidden(bool hidden) { hidden_ = hidden; }

    const std::optional<EntityRef>& selection() const { return selection_; }
    void setSelection(const std::optional<EntityRef>& selection) { selection_ = selection; }
    void clearSelection() { selection_.reset(); }
    bool isSelected(EntityKind kind, std::uint32_t id) const;

    // =========================================================================
    // Collections
    // =========================================================================

    const std::vector<MarkupLine>& lines() const { return lines_; }
    const std::vector<MarkupAngle>& angles() const { return angles_; }
    const std::vector<MarkupText>& texts() const { return texts_; }
    const GridSettings& grid() const { return grid_; }

    const MarkupLine* findLine(std::uint32_t id) const;
    const MarkupAngle* findAngle(std::uint32_t id) const;
    const MarkupText* findText(std::uint32_t id) const;
    bool contains(const EntityRef& ref) const;

    /** The line carrying referenceLength, if any. */
    const MarkupLine* referenceLine() const;

    // =========================================================================
    // Content mutations (snapshot-capturing)
    // =========================================================================

    // The id field of the argument is ignored; the assigned id is returned.
    std::uint32_t addLine(const MarkupLine& line);
    std::uint32_t addAngle(const MarkupAngle& angle);
    std::uint32_t addText(const MarkupText& text);

    bool removeItem(EntityKind kind, std::uint32_t id);
    void clearAll();

    // =========================================================================
    // Field updates (no snapshot, redo cleared)
    // =========================================================================

    /** @return False if the id is stale. */
    bool updateLine(std::uint32_t id, const LineUpdate& update);

    /**
     * Merge an angle update. angleDeg is recomputed from visual positions when
     * a point is part of the update, unless the caller supplies angleDeg.
     */
    bool updateAngle(std::uint32_t id, const AngleUpdate& update);
    bool updateText(std::uint32_t id, const TextUpdate& update);

    void updateGrid(const GridUpdate& update);

    /**
     * Make a line the calibration reference. Any other line loses its
     * reference length.
     */
    bool setReferenceLength(std::uint32_t lineId, float length, const std::string& unit);
    bool clearReference(std::uint32_t lineId);

    // =========================================================================
    // History
    // =========================================================================

    void snapshotForUndo();
    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }
    const HistoryManager& history() const { return history_; }

    /**
     * Replace all annotation state. Clears selection and history. Records
     * repeating an earlier id are dropped and only the first reference line
     * keeps its reference length.
     */
    void loadSnap(const MarkupSnap& snap);
    MarkupSnap snapshot() const;

    /** Angle at the vertex, measured on the visual projection of the points. */
    float visualAngleDeg(const Point2& p1, const Point2& vertex, const Point2& p2) const;

private:
    std::uint32_t allocateId();
    void restore(MarkupSnap&& snap);
    void bumpNextIdPast(std::uint32_t id);

    MarkupLine* findLineMutable(std::uint32_t id);
    MarkupAngle* findAngleMutable(std::uint32_t id);
    MarkupText* findTextMutable(std::uint32_t id);

    MarkupConfig config_;
    const CoordinateMapper* mapper_{nullptr};

    MarkupTool tool_{MarkupTool::None};
    Color activeColor_;
    float lineWidth_;
    float textSize_;
    bool hidden_{false};
    std::optional<EntityRef> selection_;

    std::vector<MarkupLine> lines_;
    std::vector<MarkupAngle> angles_;
    std::vector<MarkupText> texts_;
    GridSettings grid_;

    HistoryManager history_;
    std::uint32_t nextId_{1};
};

} // namespace markup
