#include "markup/history/history_manager.h"
#include <utility>

namespace markup {

HistoryManager::HistoryManager(std::size_t maxDepth)
    : maxDepth_(maxDepth == 0 ? 1 : maxDepth) {}

void HistoryManager::pushBounded(std::deque<MarkupSnap>& stack, MarkupSnap&& snap) {
    stack.push_back(std::move(snap));
    while (stack.size() > maxDepth_) {
        stack.pop_front();
    }
}

void HistoryManager::push(MarkupSnap&& before) {
    pushBounded(undo_, std::move(before));
    redo_.clear();
}

bool HistoryManager::undo(MarkupSnap&& current, MarkupSnap& out) {
    if (undo_.empty()) return false;
    out = std::move(undo_.back());
    undo_.pop_back();
    pushBounded(redo_, std::move(current));
    return true;
}

bool HistoryManager::redo(MarkupSnap&& current, MarkupSnap& out) {
    if (redo_.empty()) return false;
    out = std::move(redo_.back());
    redo_.pop_back();
    pushBounded(undo_, std::move(current));
    return true;
}

void HistoryManager::clear() {
    undo_.clear();
    redo_.clear();
}

} // namespace markup
