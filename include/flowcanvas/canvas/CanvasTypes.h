#pragma once

#include "flowcanvas/core/Types.h"
#include "flowcanvas/geometry/EdgePath.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flowcanvas {

/// Canvas limits shared by the reducer, viewport math and validation
namespace limits {
constexpr float MIN_SCALE = 0.1f;
constexpr float MAX_SCALE = 5.0f;
constexpr float DEFAULT_SCALE = 1.0f;
constexpr float MAX_PAN_DISTANCE = 10000.0f;
constexpr float PAN_MARGIN = 200.0f;
constexpr float PAN_STEP = 50.0f;
constexpr float MIN_VIEWPORT_WIDTH = 100.0f;
constexpr float MIN_VIEWPORT_HEIGHT = 100.0f;
constexpr float DEFAULT_VIEWPORT_WIDTH = 1200.0f;
constexpr float DEFAULT_VIEWPORT_HEIGHT = 800.0f;
constexpr size_t MAX_TITLE_LENGTH = 100;
}  // namespace limits

/// Direction of an anchor
enum class ConnectionType {
    Input,
    Output,
    Bidirectional
};

/// Side of a node an anchor sits on
enum class AnchorSide {
    Top,
    Right,
    Bottom,
    Left,
    Center
};

/// Named connection slot on a node
struct NodeAnchor {
    AnchorId id;
    AnchorSide side = AnchorSide::Center;
    Point offset;                 ///< Offset from the node position
    bool visible = true;
    bool connectable = true;
    ConnectionType connectionType = ConnectionType::Bidirectional;
};

/// Resolved (node, anchor, world position) triple used as an edge endpoint
struct ConnectionPoint {
    NodeId nodeId;
    AnchorId anchorId;
    Point position;

    bool operator==(const ConnectionPoint& o) const {
        return nodeId == o.nodeId && anchorId == o.anchorId && position == o.position;
    }
    bool operator!=(const ConnectionPoint& o) const { return !(*this == o); }
};

struct EdgeStyle {
    std::string stroke = "#666666";
    float strokeWidth = 2.0f;
    float opacity = 1.0f;
    std::optional<std::string> dashArray;
    std::optional<std::string> markerStart;
    std::optional<std::string> markerEnd;

    bool operator==(const EdgeStyle& o) const {
        return stroke == o.stroke && strokeWidth == o.strokeWidth && opacity == o.opacity &&
               dashArray == o.dashArray && markerStart == o.markerStart && markerEnd == o.markerEnd;
    }
    bool operator!=(const EdgeStyle& o) const { return !(*this == o); }
};

struct Node {
    NodeId id;
    NodeType type = NodeType::Document;
    Point position;
    std::string title;

    bool operator==(const Node& o) const {
        return id == o.id && type == o.type && position == o.position && title == o.title;
    }
    bool operator!=(const Node& o) const { return !(*this == o); }
};

struct Edge {
    EdgeId id;
    EdgeType type = EdgeType::Bezier;
    ConnectionPoint source;
    ConnectionPoint target;
    EdgePath path;
    EdgeStyle style;

    bool operator==(const Edge& o) const {
        return id == o.id && type == o.type && source == o.source && target == o.target &&
               path == o.path && style == o.style;
    }
    bool operator!=(const Edge& o) const { return !(*this == o); }
};

/// Canvas truth derived by folding the event log
///
/// Ordered maps keep iteration, comparison and serialization deterministic.
/// At most one of selectedNodeId / selectedEdgeId is set.
struct CanvasState {
    std::map<NodeId, Node> nodes;
    std::map<EdgeId, Edge> edges;
    ViewBox viewBox{0.0f, 0.0f, limits::DEFAULT_VIEWPORT_WIDTH, limits::DEFAULT_VIEWPORT_HEIGHT};
    float scale = limits::DEFAULT_SCALE;
    std::optional<NodeId> selectedNodeId;
    std::optional<EdgeId> selectedEdgeId;

    const Node* findNode(const NodeId& id) const {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    const Edge* findEdge(const EdgeId& id) const {
        auto it = edges.find(id);
        return it != edges.end() ? &it->second : nullptr;
    }

    bool operator==(const CanvasState& o) const {
        return nodes == o.nodes && edges == o.edges && viewBox == o.viewBox &&
               scale == o.scale && selectedNodeId == o.selectedNodeId &&
               selectedEdgeId == o.selectedEdgeId;
    }
    bool operator!=(const CanvasState& o) const { return !(*this == o); }
};

// Wire names used by events, serialization and logging
std::string nodeTypeName(NodeType type);
std::optional<NodeType> parseNodeType(const std::string& name);

std::string connectionTypeName(ConnectionType type);
std::optional<ConnectionType> parseConnectionType(const std::string& name);

std::string anchorSideName(AnchorSide side);
std::optional<AnchorSide> parseAnchorSide(const std::string& name);

/// Default node title, e.g. "Document 3"
std::string defaultNodeTitle(NodeType type, size_t ordinal);

/// Check that a position is finite and inside the pannable world
bool isValidPosition(const Point& position);

/// Edges whose endpoints both refer to existing nodes
std::vector<const Edge*> connectedEdges(const CanvasState& state);

/// Edges left pointing at a deleted node
std::vector<const Edge*> danglingEdges(const CanvasState& state);

/// Edges attached to a node (as source or target)
std::vector<EdgeId> edgesAttachedTo(const CanvasState& state, const NodeId& nodeId);

}  // namespace flowcanvas
