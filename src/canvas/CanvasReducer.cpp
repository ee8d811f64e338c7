#include "flowcanvas/canvas/CanvasReducer.h"
#include "flowcanvas/common/Logger.h"

#include <algorithm>
#include <cmath>

namespace flowcanvas {

namespace {

constexpr float kPathEndpointTolerance = 1e-3f;

bool isValidViewBox(const ViewBox& vb) {
    return std::isfinite(vb.x) && std::isfinite(vb.y) &&
           std::isfinite(vb.width) && std::isfinite(vb.height) &&
           vb.width > 0.0f && vb.height > 0.0f;
}

bool isValidScale(float scale) {
    return std::isfinite(scale) && scale > 0.0f;
}

bool isFinitePath(const EdgePath& path) {
    if (!path.start.isFinite() || !path.end.isFinite()) {
        return false;
    }
    if (const auto* cps = path.controlPoints()) {
        return cps->cp1.isFinite() && cps->cp2.isFinite();
    }
    if (const auto* waypoints = path.waypoints()) {
        for (const auto& wp : *waypoints) {
            if (!wp.isFinite()) return false;
        }
    }
    return true;
}

/// Per-kind transition rules. Each operator() validates before its first
/// write and returns an empty string on success or the rejection reason.
struct TransitionVisitor {
    CanvasState& state;
    const ReducerOptions& options;

    std::string operator()(const AddNodePayload& p) const {
        if (p.nodeId.empty()) return "missing nodeId";
        if (!isValidPosition(p.position)) return "invalid position";
        if (state.nodes.count(p.nodeId)) return "duplicate node id '" + p.nodeId + "'";
        if (p.title && p.title->size() > limits::MAX_TITLE_LENGTH) return "title too long";

        Node node;
        node.id = p.nodeId;
        node.type = p.nodeType;
        node.position = p.position;
        node.title = (p.title && !p.title->empty())
            ? *p.title
            : defaultNodeTitle(p.nodeType, state.nodes.size() + 1);
        state.nodes.emplace(node.id, std::move(node));
        return {};
    }

    std::string operator()(const MoveNodePayload& p) const {
        auto it = state.nodes.find(p.nodeId);
        if (it == state.nodes.end()) return "unknown node '" + p.nodeId + "'";
        if (!isValidPosition(p.toPosition)) return "invalid position";

        Point oldPosition = it->second.position;
        it->second.position = p.toPosition;

        // Endpoints keep their anchor offset, paths follow the endpoints
        for (auto& [id, edge] : state.edges) {
            bool touched = false;
            if (edge.source.nodeId == p.nodeId) {
                edge.source.position = p.toPosition + (edge.source.position - oldPosition);
                touched = true;
            }
            if (edge.target.nodeId == p.nodeId) {
                edge.target.position = p.toPosition + (edge.target.position - oldPosition);
                touched = true;
            }
            if (touched) {
                edge.path = geometry::rebuildPath(
                    edge.path, edge.source.position, edge.target.position, options.path);
            }
        }
        return {};
    }

    std::string operator()(const DeleteNodePayload& p) const {
        if (!state.nodes.erase(p.nodeId)) return "unknown node '" + p.nodeId + "'";

        if (state.selectedNodeId == p.nodeId) {
            state.selectedNodeId.reset();
        }
        if (options.cascadeNodeDeletion) {
            for (const auto& edgeId : edgesAttachedTo(state, p.nodeId)) {
                state.edges.erase(edgeId);
                if (state.selectedEdgeId == edgeId) {
                    state.selectedEdgeId.reset();
                }
            }
        }
        return {};
    }

    std::string operator()(const SelectElementPayload& p) const {
        if (!p.elementId) {
            state.selectedNodeId.reset();
            state.selectedEdgeId.reset();
            return {};
        }

        if (p.elementType == ElementType::Node) {
            if (!state.nodes.count(*p.elementId)) return "unknown node '" + *p.elementId + "'";
            state.selectedNodeId = *p.elementId;
            state.selectedEdgeId.reset();
        } else {
            if (!state.edges.count(*p.elementId)) return "unknown edge '" + *p.elementId + "'";
            state.selectedEdgeId = *p.elementId;
            state.selectedNodeId.reset();
        }
        return {};
    }

    std::string operator()(const PanCanvasPayload& p) const {
        if (!isValidViewBox(p.toViewBox)) return "invalid viewBox";
        state.viewBox = p.toViewBox;
        return {};
    }

    std::string operator()(const ZoomCanvasPayload& p) const {
        if (!isValidScale(p.toZoom)) return "invalid zoom";
        if (!isValidViewBox(p.toViewBox)) return "invalid viewBox";
        state.scale = p.toZoom;
        state.viewBox = p.toViewBox;
        return {};
    }

    std::string operator()(const ResetViewPayload& p) const {
        if (!isValidScale(p.toZoom)) return "invalid zoom";
        if (!isValidViewBox(p.toViewBox)) return "invalid viewBox";
        state.scale = p.toZoom;
        state.viewBox = p.toViewBox;
        return {};
    }

    std::string operator()(const CreateEdgePayload& p) const {
        if (p.edgeId.empty()) return "missing edgeId";
        if (state.edges.count(p.edgeId)) return "duplicate edge id '" + p.edgeId + "'";
        if (p.source.nodeId.empty() || p.target.nodeId.empty()) return "missing endpoint node";
        if (!state.nodes.count(p.source.nodeId)) return "unknown source node '" + p.source.nodeId + "'";
        if (!state.nodes.count(p.target.nodeId)) return "unknown target node '" + p.target.nodeId + "'";
        if (!options.allowSelfConnection && p.source.nodeId == p.target.nodeId) {
            return "self-connection not allowed";
        }
        if (!p.source.position.isFinite() || !p.target.position.isFinite()) {
            return "invalid endpoint position";
        }

        Edge edge;
        edge.id = p.edgeId;
        edge.type = p.edgeType;
        edge.source = p.source;
        edge.target = p.target;
        edge.path = geometry::buildPath(p.source.position, p.target.position, p.edgeType, options.path);
        edge.style = p.style;
        state.edges.emplace(edge.id, std::move(edge));
        return {};
    }

    std::string operator()(const DeleteEdgePayload& p) const {
        if (!state.edges.erase(p.edgeId)) return "unknown edge '" + p.edgeId + "'";
        if (state.selectedEdgeId == p.edgeId) {
            state.selectedEdgeId.reset();
        }
        return {};
    }

    std::string operator()(const UpdateEdgePathPayload& p) const {
        auto it = state.edges.find(p.edgeId);
        if (it == state.edges.end()) return "unknown edge '" + p.edgeId + "'";
        if (!isFinitePath(p.newPath)) return "invalid path";

        const Edge& edge = it->second;
        if (p.newPath.start.distanceTo(edge.source.position) > kPathEndpointTolerance ||
            p.newPath.end.distanceTo(edge.target.position) > kPathEndpointTolerance) {
            return "path endpoints do not match edge connections";
        }

        it->second.path = p.newPath;
        return {};
    }
};

}  // namespace

CanvasReducer::CanvasReducer(ReducerOptions options)
    : options_(std::move(options)) {}

CanvasState CanvasReducer::initialState() {
    return CanvasState{};
}

ApplyResult CanvasReducer::step(CanvasState& state, const CanvasEvent& event) const {
    std::string reason = std::visit(TransitionVisitor{state, options_}, event.payload);
    if (!reason.empty()) {
        return {false, std::move(reason)};
    }
    return {true, {}};
}

CanvasState CanvasReducer::apply(const CanvasState& state, const CanvasEvent& event) const {
    CanvasState next = state;
    step(next, event);
    return next;
}

CanvasState CanvasReducer::fold(const std::vector<CanvasEvent>& events, int lastIndex) const {
    CanvasState state = initialState();
    if (lastIndex < 0) {
        return state;
    }

    size_t end = std::min(events.size(), static_cast<size_t>(lastIndex) + 1);
    for (size_t i = 0; i < end; ++i) {
        auto result = step(state, events[i]);
        if (!result.applied) {
            LOG_WARN("skipping malformed {} event at index {}: {}",
                     eventKindName(events[i].kind()), i, result.reason);
        }
    }
    return state;
}

CanvasState CanvasReducer::fold(const std::vector<CanvasEvent>& events) const {
    return fold(events, static_cast<int>(events.size()) - 1);
}

}  // namespace flowcanvas
