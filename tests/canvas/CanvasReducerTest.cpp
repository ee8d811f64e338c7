#include <gtest/gtest.h>
#include <flowcanvas/canvas/CanvasReducer.h>
#include <flowcanvas/common/Logger.h>

#include <limits>

using namespace flowcanvas;

namespace {

CanvasEvent addNode(const NodeId& id, Point position, NodeType type = NodeType::Document) {
    return makeEvent(AddNodePayload{id, type, position, std::nullopt}, 1000);
}

CanvasEvent moveNode(const NodeId& id, Point from, Point to, bool dragging = false) {
    return makeEvent(MoveNodePayload{id, from, to, dragging}, 1000);
}

CanvasEvent createEdge(const EdgeId& id, const ConnectionPoint& source, const ConnectionPoint& target,
                       EdgeType type = EdgeType::Bezier) {
    return makeEvent(CreateEdgePayload{id, source, target, type, {}}, 1000);
}

CanvasEvent selectNode(const std::string& id) {
    return makeEvent(SelectElementPayload{id, ElementType::Node, std::nullopt}, 1000);
}

}  // namespace

class CanvasReducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();

        state = CanvasReducer::initialState();
        ASSERT_TRUE(reducer.step(state, addNode("n1", {0, 0})).applied);
        ASSERT_TRUE(reducer.step(state, addNode("n2", {300, 0})).applied);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }

    ConnectionPoint n1Right{"n1", "right", {60, 0}};
    ConnectionPoint n2Left{"n2", "left", {240, 0}};

    CanvasReducer reducer;
    CanvasState state;
};

// ============== Initial state ==============

TEST_F(CanvasReducerTest, InitialStateIsFixed) {
    CanvasState initial = CanvasReducer::initialState();
    EXPECT_TRUE(initial.nodes.empty());
    EXPECT_TRUE(initial.edges.empty());
    EXPECT_EQ(initial.viewBox, (ViewBox{0, 0, 1200, 800}));
    EXPECT_FLOAT_EQ(initial.scale, 1.0f);
    EXPECT_FALSE(initial.selectedNodeId.has_value());
    EXPECT_FALSE(initial.selectedEdgeId.has_value());
}

// ============== Nodes ==============

TEST_F(CanvasReducerTest, AddNodeAssignsDefaultTitle) {
    EXPECT_EQ(state.nodes.at("n1").title, "Document 1");
    EXPECT_EQ(state.nodes.at("n2").title, "Document 2");

    ASSERT_TRUE(reducer.step(state, addNode("a1", {0, 200}, NodeType::Agent)).applied);
    EXPECT_EQ(state.nodes.at("a1").title, "Agent 3");
}

TEST_F(CanvasReducerTest, AddNodeKeepsExplicitTitle) {
    auto event = makeEvent(AddNodePayload{"n3", NodeType::Agent, {10, 10}, "Planner"}, 1000);
    ASSERT_TRUE(reducer.step(state, event).applied);
    EXPECT_EQ(state.nodes.at("n3").title, "Planner");
    EXPECT_EQ(state.nodes.at("n3").type, NodeType::Agent);
}

TEST_F(CanvasReducerTest, AddNodeRejectsDuplicateId) {
    CanvasState before = state;
    auto result = reducer.step(state, addNode("n1", {50, 50}));
    EXPECT_FALSE(result.applied);
    EXPECT_NE(result.reason.find("duplicate"), std::string::npos);
    EXPECT_EQ(state, before);
}

TEST_F(CanvasReducerTest, AddNodeRejectsInvalidInput) {
    CanvasState before = state;
    float nan = std::numeric_limits<float>::quiet_NaN();

    EXPECT_FALSE(reducer.step(state, addNode("", {0, 0})).applied);
    EXPECT_FALSE(reducer.step(state, addNode("n3", {nan, 0})).applied);
    EXPECT_FALSE(reducer.step(state, addNode("n3", {20000, 0})).applied);
    EXPECT_FALSE(reducer.step(state, makeEvent(
        AddNodePayload{"n3", NodeType::Document, {0, 0}, std::string(101, 'x')}, 1000)).applied);
    EXPECT_EQ(state, before);
}

TEST_F(CanvasReducerTest, MoveNodeUpdatesPosition) {
    ASSERT_TRUE(reducer.step(state, moveNode("n1", {0, 0}, {100, 50})).applied);
    EXPECT_EQ(state.nodes.at("n1").position, (Point{100, 50}));
}

TEST_F(CanvasReducerTest, MoveUnknownNodeIsRejected) {
    auto result = reducer.step(state, moveNode("ghost", {0, 0}, {1, 1}));
    EXPECT_FALSE(result.applied);
    EXPECT_NE(result.reason.find("unknown node"), std::string::npos);
}

TEST_F(CanvasReducerTest, MoveNodeCarriesAttachedEdges) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);
    ASSERT_TRUE(reducer.step(state, moveNode("n1", {0, 0}, {0, 100})).applied);

    const Edge& edge = state.edges.at("e1");
    EXPECT_EQ(edge.source.position, (Point{60, 100}));
    EXPECT_EQ(edge.target.position, (Point{240, 0}));
    EXPECT_EQ(edge.path.start, (Point{60, 100}));
    EXPECT_EQ(edge.path.end, (Point{240, 0}));
    EXPECT_EQ(edge.path.type(), EdgeType::Bezier);
}

TEST_F(CanvasReducerTest, DeleteNodeClearsSelection) {
    ASSERT_TRUE(reducer.step(state, selectNode("n1")).applied);
    ASSERT_TRUE(reducer.step(state, makeEvent(DeleteNodePayload{"n1", {}, {}, {}}, 1000)).applied);

    EXPECT_EQ(state.findNode("n1"), nullptr);
    EXPECT_FALSE(state.selectedNodeId.has_value());
}

TEST_F(CanvasReducerTest, DeleteNodeKeepsEdgesByDefault) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);
    ASSERT_TRUE(reducer.step(state, makeEvent(DeleteNodePayload{"n2", {}, {}, {}}, 1000)).applied);

    EXPECT_EQ(state.edges.size(), 1u);
    EXPECT_TRUE(connectedEdges(state).empty());
    ASSERT_EQ(danglingEdges(state).size(), 1u);
    EXPECT_EQ(danglingEdges(state)[0]->id, "e1");
}

TEST_F(CanvasReducerTest, DeleteNodeCascadesWhenConfigured) {
    ReducerOptions options;
    options.cascadeNodeDeletion = true;
    CanvasReducer cascading(options);

    ASSERT_TRUE(cascading.step(state, createEdge("e1", n1Right, n2Left)).applied);
    ASSERT_TRUE(cascading.step(state, makeEvent(
        SelectElementPayload{"e1", ElementType::Edge, std::nullopt}, 1000)).applied);
    ASSERT_TRUE(cascading.step(state, makeEvent(DeleteNodePayload{"n1", {}, {}, {}}, 1000)).applied);

    EXPECT_TRUE(state.edges.empty());
    EXPECT_FALSE(state.selectedEdgeId.has_value());
}

// ============== Selection ==============

TEST_F(CanvasReducerTest, SelectionIsExclusive) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);

    ASSERT_TRUE(reducer.step(state, selectNode("n1")).applied);
    EXPECT_EQ(state.selectedNodeId, "n1");

    ASSERT_TRUE(reducer.step(state, makeEvent(
        SelectElementPayload{"e1", ElementType::Edge, "n1"}, 1000)).applied);
    EXPECT_EQ(state.selectedEdgeId, "e1");
    EXPECT_FALSE(state.selectedNodeId.has_value());

    ASSERT_TRUE(reducer.step(state, makeEvent(
        SelectElementPayload{std::nullopt, ElementType::Node, "e1"}, 1000)).applied);
    EXPECT_FALSE(state.selectedNodeId.has_value());
    EXPECT_FALSE(state.selectedEdgeId.has_value());
}

TEST_F(CanvasReducerTest, SelectUnknownElementIsRejected) {
    EXPECT_FALSE(reducer.step(state, selectNode("ghost")).applied);
    EXPECT_FALSE(reducer.step(state, makeEvent(
        SelectElementPayload{"ghost", ElementType::Edge, std::nullopt}, 1000)).applied);
}

// ============== View ==============

TEST_F(CanvasReducerTest, PanZoomAndResetSetView) {
    ViewBox panned{50, 20, 1200, 800};
    ASSERT_TRUE(reducer.step(state, makeEvent(
        PanCanvasPayload{state.viewBox, panned, 50, 20}, 1000)).applied);
    EXPECT_EQ(state.viewBox, panned);

    ViewBox zoomed{350, 220, 600, 400};
    ASSERT_TRUE(reducer.step(state, makeEvent(
        ZoomCanvasPayload{1.0f, 2.0f, panned, zoomed, Point{650, 420}}, 1000)).applied);
    EXPECT_FLOAT_EQ(state.scale, 2.0f);
    EXPECT_EQ(state.viewBox, zoomed);

    ASSERT_TRUE(reducer.step(state, makeEvent(
        ResetViewPayload{zoomed, 2.0f, ViewBox{}, 1.0f, ResetType::Keyboard}, 1000)).applied);
    EXPECT_FLOAT_EQ(state.scale, 1.0f);
    EXPECT_EQ(state.viewBox, ViewBox{});
}

TEST_F(CanvasReducerTest, InvalidViewIsRejected) {
    CanvasState before = state;
    float inf = std::numeric_limits<float>::infinity();

    EXPECT_FALSE(reducer.step(state, makeEvent(
        PanCanvasPayload{state.viewBox, ViewBox{inf, 0, 1200, 800}, 0, 0}, 1000)).applied);
    EXPECT_FALSE(reducer.step(state, makeEvent(
        ZoomCanvasPayload{1.0f, 0.0f, state.viewBox, state.viewBox, std::nullopt}, 1000)).applied);
    EXPECT_FALSE(reducer.step(state, makeEvent(
        ResetViewPayload{state.viewBox, 1.0f, ViewBox{0, 0, 0, 800}, 1.0f, ResetType::Button}, 1000)).applied);
    EXPECT_EQ(state, before);
}

// ============== Edges ==============

TEST_F(CanvasReducerTest, CreateEdgeBuildsPath) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left, EdgeType::Orthogonal)).applied);

    const Edge& edge = state.edges.at("e1");
    EXPECT_EQ(edge.type, EdgeType::Orthogonal);
    EXPECT_EQ(edge.path.start, n1Right.position);
    EXPECT_EQ(edge.path.end, n2Left.position);
    ASSERT_NE(edge.path.waypoints(), nullptr);
    EXPECT_EQ(edge.path.waypoints()->size(), 2u);
}

TEST_F(CanvasReducerTest, CreateEdgeValidation) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);

    EXPECT_FALSE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);
    EXPECT_FALSE(reducer.step(state, createEdge("", n1Right, n2Left)).applied);
    EXPECT_FALSE(reducer.step(state, createEdge("e2", n1Right, {"ghost", "left", {0, 0}})).applied);

    auto self = reducer.step(state, createEdge("e3", n1Right, {"n1", "left", {-60, 0}}));
    EXPECT_FALSE(self.applied);
    EXPECT_EQ(self.reason, "self-connection not allowed");
}

TEST_F(CanvasReducerTest, SelfConnectionAllowedWhenConfigured) {
    ReducerOptions options;
    options.allowSelfConnection = true;
    CanvasReducer permissive(options);

    EXPECT_TRUE(permissive.step(state, createEdge("e1", n1Right, {"n1", "left", {-60, 0}})).applied);
}

TEST_F(CanvasReducerTest, DeleteEdgeClearsSelection) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);
    ASSERT_TRUE(reducer.step(state, makeEvent(
        SelectElementPayload{"e1", ElementType::Edge, std::nullopt}, 1000)).applied);
    ASSERT_TRUE(reducer.step(state, makeEvent(DeleteEdgePayload{"e1", {}, {}, {}}, 1000)).applied);

    EXPECT_TRUE(state.edges.empty());
    EXPECT_FALSE(state.selectedEdgeId.has_value());
    EXPECT_FALSE(reducer.step(state, makeEvent(DeleteEdgePayload{"e1", {}, {}, {}}, 1000)).applied);
}

TEST_F(CanvasReducerTest, UpdateEdgePathReplacesPath) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);

    auto newPath = EdgePath::orthogonal(n1Right.position, n2Left.position, {{150, 0}});
    ASSERT_TRUE(reducer.step(state, makeEvent(UpdateEdgePathPayload{
        "e1", state.edges.at("e1").path, newPath, PathUpdateReason::ManualEdit}, 1000)).applied);

    EXPECT_EQ(state.edges.at("e1").path, newPath);
}

TEST_F(CanvasReducerTest, UpdateEdgePathRejectsDetachedEndpoints) {
    ASSERT_TRUE(reducer.step(state, createEdge("e1", n1Right, n2Left)).applied);
    EdgePath original = state.edges.at("e1").path;

    auto result = reducer.step(state, makeEvent(UpdateEdgePathPayload{
        "e1", std::nullopt, EdgePath::straight({0, 0}, n2Left.position),
        PathUpdateReason::ManualEdit}, 1000));

    EXPECT_FALSE(result.applied);
    EXPECT_EQ(state.edges.at("e1").path, original);
}

// ============== Fold ==============

TEST_F(CanvasReducerTest, FoldIsDeterministic) {
    std::vector<CanvasEvent> events{
        addNode("n1", {0, 0}),
        addNode("n2", {300, 0}),
        createEdge("e1", n1Right, n2Left),
        moveNode("n2", {300, 0}, {300, 200}),
        selectNode("n2"),
    };

    EXPECT_EQ(reducer.fold(events), reducer.fold(events));
    EXPECT_EQ(reducer.fold(events, -1), CanvasReducer::initialState());
    EXPECT_EQ(reducer.fold(events, 1).nodes.size(), 2u);
    EXPECT_TRUE(reducer.fold(events, 1).edges.empty());
}

TEST_F(CanvasReducerTest, FoldSkipsMalformedEventsWithWarning) {
    std::vector<CanvasEvent> events{
        addNode("n1", {0, 0}),
        moveNode("ghost", {0, 0}, {10, 10}),
        addNode("n2", {300, 0}),
    };

    CanvasState folded = reducer.fold(events);
    EXPECT_EQ(folded.nodes.size(), 2u);

    auto warnings = Logger::getCapturedLogs("skipping malformed");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("MOVE_NODE"), std::string::npos);
    EXPECT_NE(warnings[0].find("index 1"), std::string::npos);
}

TEST_F(CanvasReducerTest, ApplyLeavesInputUntouched) {
    CanvasState before = state;
    CanvasState next = reducer.apply(state, moveNode("n1", {0, 0}, {10, 10}));

    EXPECT_EQ(state, before);
    EXPECT_EQ(next.nodes.at("n1").position, (Point{10, 10}));
}

// ============== Event metadata ==============

TEST(CanvasEventTest, PriorityClasses) {
    EXPECT_EQ(eventPriority(addNode("n1", {0, 0})), EventPriority::High);
    EXPECT_EQ(eventPriority(moveNode("n1", {0, 0}, {1, 1})), EventPriority::Medium);
    EXPECT_EQ(eventPriority(moveNode("n1", {0, 0}, {1, 1}, true)), EventPriority::Low);
    EXPECT_EQ(eventPriority(makeEvent(PanCanvasPayload{}, 0)), EventPriority::Low);
    EXPECT_EQ(eventPriority(makeEvent(ResetViewPayload{}, 0)), EventPriority::High);

    EXPECT_FALSE(shouldBatch(addNode("n1", {0, 0})));
    EXPECT_TRUE(shouldBatch(makeEvent(ZoomCanvasPayload{}, 0)));
}

TEST(CanvasEventTest, KindMatchesPayload) {
    EXPECT_EQ(addNode("n1", {0, 0}).kind(), EventKind::AddNode);
    EXPECT_EQ(makeEvent(UpdateEdgePathPayload{}, 0).kind(), EventKind::UpdateEdgePath);
    EXPECT_EQ(eventKindName(EventKind::SelectElement), "SELECT_ELEMENT");
    EXPECT_EQ(parseEventKind("CREATE_EDGE"), EventKind::CreateEdge);
    EXPECT_FALSE(parseEventKind("EXPLODE").has_value());
}
