#include "flowcanvas/canvas/CanvasTypes.h"

#include <cmath>

namespace flowcanvas {

std::string nodeTypeName(NodeType type) {
    switch (type) {
        case NodeType::Document: return "document";
        case NodeType::Agent: return "agent";
    }
    return "document";
}

std::optional<NodeType> parseNodeType(const std::string& name) {
    if (name == "document") return NodeType::Document;
    if (name == "agent") return NodeType::Agent;
    return std::nullopt;
}

std::string connectionTypeName(ConnectionType type) {
    switch (type) {
        case ConnectionType::Input: return "input";
        case ConnectionType::Output: return "output";
        case ConnectionType::Bidirectional: return "bidirectional";
    }
    return "bidirectional";
}

std::optional<ConnectionType> parseConnectionType(const std::string& name) {
    if (name == "input") return ConnectionType::Input;
    if (name == "output") return ConnectionType::Output;
    if (name == "bidirectional") return ConnectionType::Bidirectional;
    return std::nullopt;
}

std::string anchorSideName(AnchorSide side) {
    switch (side) {
        case AnchorSide::Top: return "top";
        case AnchorSide::Right: return "right";
        case AnchorSide::Bottom: return "bottom";
        case AnchorSide::Left: return "left";
        case AnchorSide::Center: return "center";
    }
    return "center";
}

std::optional<AnchorSide> parseAnchorSide(const std::string& name) {
    if (name == "top") return AnchorSide::Top;
    if (name == "right") return AnchorSide::Right;
    if (name == "bottom") return AnchorSide::Bottom;
    if (name == "left") return AnchorSide::Left;
    if (name == "center") return AnchorSide::Center;
    return std::nullopt;
}

std::string defaultNodeTitle(NodeType type, size_t ordinal) {
    std::string name = nodeTypeName(type);
    name[0] = static_cast<char>(name[0] - 'a' + 'A');
    return name + " " + std::to_string(ordinal);
}

bool isValidPosition(const Point& position) {
    return position.isFinite() &&
           std::abs(position.x) <= limits::MAX_PAN_DISTANCE &&
           std::abs(position.y) <= limits::MAX_PAN_DISTANCE;
}

std::vector<const Edge*> connectedEdges(const CanvasState& state) {
    std::vector<const Edge*> result;
    for (const auto& [id, edge] : state.edges) {
        if (state.findNode(edge.source.nodeId) && state.findNode(edge.target.nodeId)) {
            result.push_back(&edge);
        }
    }
    return result;
}

std::vector<const Edge*> danglingEdges(const CanvasState& state) {
    std::vector<const Edge*> result;
    for (const auto& [id, edge] : state.edges) {
        if (!state.findNode(edge.source.nodeId) || !state.findNode(edge.target.nodeId)) {
            result.push_back(&edge);
        }
    }
    return result;
}

std::vector<EdgeId> edgesAttachedTo(const CanvasState& state, const NodeId& nodeId) {
    std::vector<EdgeId> result;
    for (const auto& [id, edge] : state.edges) {
        if (edge.source.nodeId == nodeId || edge.target.nodeId == nodeId) {
            result.push_back(id);
        }
    }
    return result;
}

}  // namespace flowcanvas
