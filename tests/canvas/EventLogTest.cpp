#include <gtest/gtest.h>
#include <flowcanvas/canvas/EventLog.h>

using namespace flowcanvas;

class EventLogTest : public ::testing::Test {
protected:
    static CanvasEvent addNode(const NodeId& id, Point position) {
        return makeEvent(AddNodePayload{id, NodeType::Document, position, std::nullopt}, 1000);
    }

    static CanvasEvent moveNode(const NodeId& id, Point from, Point to) {
        return makeEvent(MoveNodePayload{id, from, to, false}, 1000);
    }

    EventLog history_;
};

TEST_F(EventLogTest, StartsEmpty) {
    EXPECT_TRUE(history_.empty());
    EXPECT_EQ(history_.currentIndex(), -1);
    EXPECT_FALSE(history_.canUndo());
    EXPECT_FALSE(history_.canRedo());
    EXPECT_EQ(history_.currentState(), CanvasReducer::initialState());
}

TEST_F(EventLogTest, AppendMovesCursorToTip) {
    history_.append(addNode("n1", {0, 0}));
    history_.append(addNode("n2", {300, 0}));

    EXPECT_EQ(history_.size(), 2u);
    EXPECT_EQ(history_.currentIndex(), 1);
    EXPECT_EQ(history_.currentState().nodes.size(), 2u);
}

TEST_F(EventLogTest, UndoRedoSymmetry) {
    history_.append(addNode("n1", {0, 0}));
    history_.append(moveNode("n1", {0, 0}, {50, 50}));
    CanvasState tip = history_.currentState();

    ASSERT_TRUE(history_.undo().moved);
    EXPECT_EQ(history_.currentState().nodes.at("n1").position, (Point{0, 0}));

    ASSERT_TRUE(history_.redo().moved);
    EXPECT_EQ(history_.currentState(), tip);
}

TEST_F(EventLogTest, UndoAtStartIsNoop) {
    auto result = history_.undo();
    EXPECT_FALSE(result.moved);
    EXPECT_EQ(result.reason, "nothing to undo");
    EXPECT_EQ(history_.currentIndex(), -1);
}

TEST_F(EventLogTest, RedoAtTipIsNoop) {
    history_.append(addNode("n1", {0, 0}));
    auto result = history_.redo();
    EXPECT_FALSE(result.moved);
    EXPECT_EQ(result.reason, "nothing to redo");
    EXPECT_EQ(history_.currentIndex(), 0);
}

TEST_F(EventLogTest, UndoToEmptyYieldsInitialState) {
    history_.append(addNode("n1", {0, 0}));
    ASSERT_TRUE(history_.undo().moved);

    EXPECT_EQ(history_.currentIndex(), -1);
    EXPECT_EQ(history_.currentState(), CanvasReducer::initialState());
    EXPECT_TRUE(history_.canRedo());
}

TEST_F(EventLogTest, AppendAfterUndoTruncatesRedoTail) {
    history_.append(addNode("n1", {0, 0}));
    for (int i = 1; i <= 5; ++i) {
        history_.append(moveNode("n1", {(i - 1) * 10.0f, 0}, {i * 10.0f, 0}));
    }
    ASSERT_EQ(history_.currentIndex(), 5);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(history_.undo().moved);
    }
    EXPECT_EQ(history_.currentIndex(), 2);
    EXPECT_EQ(history_.undoneCount(), 3u);

    size_t discarded = history_.append(moveNode("n1", {20, 0}, {0, 99}));
    EXPECT_EQ(discarded, 3u);
    EXPECT_EQ(history_.size(), 4u);
    EXPECT_EQ(history_.currentIndex(), 3);
    EXPECT_FALSE(history_.canRedo());
    EXPECT_EQ(history_.currentState().nodes.at("n1").position, (Point{0, 99}));
}

TEST_F(EventLogTest, DeriveStateAtIndex) {
    history_.append(addNode("n1", {0, 0}));
    history_.append(addNode("n2", {300, 0}));
    history_.append(addNode("n3", {600, 0}));

    EXPECT_EQ(history_.deriveState(0).nodes.size(), 1u);
    EXPECT_EQ(history_.deriveState(1).nodes.size(), 2u);
    EXPECT_EQ(history_.deriveState(-1).nodes.size(), 0u);
    EXPECT_EQ(history_.deriveState(99).nodes.size(), 3u);
}

TEST_F(EventLogTest, ReplacePutsCursorAtTip) {
    history_.append(addNode("old", {0, 0}));
    history_.undo();

    history_.replace({addNode("n1", {0, 0}), addNode("n2", {10, 0})});
    EXPECT_EQ(history_.size(), 2u);
    EXPECT_EQ(history_.currentIndex(), 1);
    EXPECT_EQ(history_.currentState().findNode("old"), nullptr);
}

TEST_F(EventLogTest, ClearDropsHistory) {
    history_.append(addNode("n1", {0, 0}));
    history_.clear();

    EXPECT_TRUE(history_.empty());
    EXPECT_EQ(history_.currentIndex(), -1);
    EXPECT_FALSE(history_.canUndo());
}

TEST_F(EventLogTest, UsesConfiguredReducer) {
    ReducerOptions options;
    options.cascadeNodeDeletion = true;
    EventLog cascading{CanvasReducer(options)};

    cascading.append(addNode("n1", {0, 0}));
    cascading.append(addNode("n2", {300, 0}));
    cascading.append(makeEvent(CreateEdgePayload{
        "e1", {"n1", "right", {60, 0}}, {"n2", "left", {240, 0}}, EdgeType::Straight, {}}, 1000));
    cascading.append(makeEvent(DeleteNodePayload{"n1", {}, {}, {}}, 1000));

    EXPECT_TRUE(cascading.currentState().edges.empty());
}
