#pragma once

#include "markup/entity/markup_types.h"
#include <cstddef>
#include <deque>
#include <vector>

namespace markup {

/**
 * HistoryManager: bounded undo stack plus redo stack of whole-document
 * snapshots. Pushing a new undo entry clears redo; when the undo stack
 * exceeds its depth the oldest entry is evicted.
 */
class HistoryManager {
public:
    explicit HistoryManager(std::size_t maxDepth);

    bool canUndo() const noexcept { return !undo_.empty(); }
    bool canRedo() const noexcept { return !redo_.empty(); }
    std::size_t undoDepth() const noexcept { return undo_.size(); }
    std::size_t redoDepth() const noexcept { return redo_.size(); }
    std::size_t maxDepth() const noexcept { return maxDepth_; }

    // Record the pre-mutation state of a direct edit.
    void push(MarkupSnap&& before);

    /**
     * Step back: returns the state to restore, after stashing `current`
     * for redo. Returns false when there is nothing to undo.
     */
    bool undo(MarkupSnap&& current, MarkupSnap& out);
    bool redo(MarkupSnap&& current, MarkupSnap& out);

    // Direct edits invalidate redo without adding an undo step.
    void clearRedo() { redo_.clear(); }
    void clear();

private:
    void pushBounded(std::deque<MarkupSnap>& stack, MarkupSnap&& snap);

    std::size_t maxDepth_;
    std::deque<MarkupSnap> undo_;
    std::deque<MarkupSnap> redo_;
};

} // namespace markup
