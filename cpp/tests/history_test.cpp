#include <gtest/gtest.h>
#include "markup/history/history_manager.h"

using namespace markup;

namespace {
MarkupSnap snapWithLines(std::size_t count) {
    MarkupSnap snap;
    for (std::size_t i = 0; i < count; ++i) {
        MarkupLine line;
        line.id = static_cast<std::uint32_t>(i + 1);
        snap.lines.push_back(line);
    }
    return snap;
}
} // namespace

TEST(HistoryTest, UndoReturnsPushedState) {
    HistoryManager history(10);
    history.push(snapWithLines(0));

    MarkupSnap out;
    ASSERT_TRUE(history.undo(snapWithLines(1), out));
    EXPECT_TRUE(out.lines.empty());
    EXPECT_FALSE(history.canUndo());
    EXPECT_TRUE(history.canRedo());

    MarkupSnap redone;
    ASSERT_TRUE(history.redo(std::move(out), redone));
    EXPECT_EQ(redone.lines.size(), 1u);
    EXPECT_TRUE(history.canUndo());
}

TEST(HistoryTest, EmptyStacksRefuse) {
    HistoryManager history(10);
    MarkupSnap out = snapWithLines(3);
    EXPECT_FALSE(history.undo(snapWithLines(1), out));
    EXPECT_FALSE(history.redo(snapWithLines(1), out));
    EXPECT_EQ(out.lines.size(), 3u);
}

TEST(HistoryTest, PushClearsRedo) {
    HistoryManager history(10);
    history.push(snapWithLines(0));
    MarkupSnap out;
    ASSERT_TRUE(history.undo(snapWithLines(1), out));
    ASSERT_TRUE(history.canRedo());

    history.push(snapWithLines(0));
    EXPECT_FALSE(history.canRedo());
}

TEST(HistoryTest, DepthIsBounded) {
    HistoryManager history(3);
    for (std::size_t i = 0; i < 5; ++i) {
        history.push(snapWithLines(i));
    }
    EXPECT_EQ(history.undoDepth(), 3u);

    // Oldest entries (0 and 1 lines) were evicted.
    MarkupSnap out;
    MarkupSnap current = snapWithLines(5);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(history.undo(std::move(current), out));
        current = out;
    }
    EXPECT_EQ(out.lines.size(), 2u);
    EXPECT_FALSE(history.canUndo());
}
