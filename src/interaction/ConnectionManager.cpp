#include "flowcanvas/interaction/ConnectionManager.h"
#include "flowcanvas/common/Logger.h"

#include <stdexcept>

namespace flowcanvas {

ConnectionValidation validateConnection(const NodeAnchor& source, const NodeAnchor& target) {
    if (!source.connectable || !target.connectable) {
        return {false, "One or both anchor points are not connectable"};
    }
    if (source.connectionType == ConnectionType::Input &&
        target.connectionType == ConnectionType::Input) {
        return {false, "Cannot connect two input anchors"};
    }
    if (source.connectionType == ConnectionType::Output &&
        target.connectionType == ConnectionType::Output) {
        return {false, "Cannot connect two output anchors"};
    }
    return {true, {}};
}

std::optional<SnapTarget> findNearestAnchor(
    const CanvasState& state,
    const INodeAnchorRegistry& registry,
    const Point& pointer,
    float snapDistance,
    const std::optional<ConnectionPoint>& exclude) {

    std::optional<SnapTarget> best;

    for (const auto& [nodeId, node] : state.nodes) {
        for (const auto& anchor : registry.anchorsFor(node)) {
            if (!anchor.visible || !anchor.connectable) {
                continue;
            }
            if (exclude && exclude->nodeId == nodeId && exclude->anchorId == anchor.id) {
                continue;
            }

            Point position = anchorPosition(node, anchor);
            float distance = pointer.distanceTo(position);
            if (distance > snapDistance) {
                continue;
            }
            if (!best || distance < best->distance) {
                best = SnapTarget{{nodeId, anchor.id, position}, anchor, distance};
            }
        }
    }
    return best;
}

ConnectionManager::ConnectionManager(std::shared_ptr<const INodeAnchorRegistry> registry,
                                     ConnectionConfig config)
    : registry_(std::move(registry))
    , config_(std::move(config)) {
    if (!registry_) {
        throw std::invalid_argument("ConnectionManager requires an anchor registry");
    }
}

ConnectionManager::BeginResult ConnectionManager::begin(
    const CanvasState& state, const NodeId& nodeId, const AnchorId& anchorId) {

    BeginResult result;

    if (phase_ == Phase::Creating) {
        result.reason = "An edge creation session is already active";
        LOG_DEBUG("[ConnectionManager] begin rejected: session already active");
        return result;
    }

    const Node* node = state.findNode(nodeId);
    if (!node) {
        result.reason = "Unknown node '" + nodeId + "'";
        return result;
    }

    auto anchor = findAnchor(*registry_, *node, anchorId);
    if (!anchor) {
        result.reason = "Unknown anchor '" + anchorId + "' on node '" + nodeId + "'";
        return result;
    }
    if (!anchor->connectable) {
        result.reason = "Anchor '" + anchorId + "' is not connectable";
        LOG_DEBUG("[ConnectionManager] begin rejected: {}", result.reason);
        return result;
    }

    phase_ = Phase::Creating;
    source_ = ConnectionPoint{nodeId, anchorId, anchorPosition(*node, *anchor)};
    sourceAnchor_ = *anchor;
    hovered_.reset();
    hoveredAccepted_ = false;
    preview_.reset();

    LOG_DEBUG("[ConnectionManager] session started at {}.{}", nodeId, anchorId);

    result.success = true;
    result.source = *source_;
    return result;
}

ConnectionManager::UpdateResult ConnectionManager::update(const CanvasState& state, const Point& pointer) {
    UpdateResult result;
    result.endpoint = pointer;

    if (phase_ != Phase::Creating || !source_) {
        return result;
    }

    hovered_ = findNearestAnchor(state, *registry_, pointer, config_.snapDistance, source_);
    hoveredAccepted_ = hovered_ && acceptsTarget(*hovered_);
    if (hovered_) {
        result.hasValidTarget = hoveredAccepted_;
        result.target = hovered_;
        result.endpoint = hovered_->connection.position;
    }

    preview_ = geometry::buildPath(source_->position, result.endpoint,
                                   config_.defaultEdgeType, config_.preview);
    result.previewPath = *preview_;
    return result;
}

ConnectionManager::CommitResult ConnectionManager::commit(const CanvasState& state, const EdgeId& edgeId) {
    CommitResult result;

    if (phase_ != Phase::Creating || !source_) {
        result.reason = "No edge creation session is active";
        return result;
    }

    auto fail = [&](std::string reason) {
        LOG_DEBUG("[ConnectionManager] connection rejected: {}", reason);
        result.reason = std::move(reason);
        reset();
        return result;
    };

    if (!hovered_) {
        return fail("No target anchor under the pointer");
    }

    // Re-resolve both ends against the current state
    const Node* sourceNode = state.findNode(source_->nodeId);
    const Node* targetNode = state.findNode(hovered_->connection.nodeId);
    if (!sourceNode || !targetNode) {
        return fail("Endpoint node no longer exists");
    }

    auto sourceAnchor = findAnchor(*registry_, *sourceNode, source_->anchorId);
    auto targetAnchor = findAnchor(*registry_, *targetNode, hovered_->connection.anchorId);
    if (!sourceAnchor || !targetAnchor) {
        return fail("Endpoint anchor no longer exists");
    }

    auto validation = validateConnection(*sourceAnchor, *targetAnchor);
    if (!validation.valid) {
        return fail(validation.reason);
    }
    if (!config_.allowSelfConnection && sourceNode->id == targetNode->id) {
        return fail("Self-connections are not allowed");
    }

    ConnectionPoint source{sourceNode->id, sourceAnchor->id, anchorPosition(*sourceNode, *sourceAnchor)};
    ConnectionPoint target{targetNode->id, targetAnchor->id, anchorPosition(*targetNode, *targetAnchor)};

    if (!config_.allowMultipleEdges && hasEdgeBetween(state, source, target)) {
        return fail("An edge already connects these anchors");
    }

    CreateEdgePayload payload;
    payload.edgeId = edgeId;
    payload.source = source;
    payload.target = target;
    payload.edgeType = config_.defaultEdgeType;
    payload.style = config_.defaultStyle;

    LOG_DEBUG("[ConnectionManager] committed {}.{} -> {}.{}",
              source.nodeId, source.anchorId, target.nodeId, target.anchorId);

    reset();
    result.success = true;
    result.payload = std::move(payload);
    return result;
}

bool ConnectionManager::cancel() {
    if (phase_ != Phase::Creating) {
        return false;
    }
    LOG_DEBUG("[ConnectionManager] session cancelled");
    reset();
    return true;
}

bool ConnectionManager::handleCanvasClick() {
    if (phase_ != Phase::Creating || (hovered_ && hoveredAccepted_)) {
        return false;
    }
    return cancel();
}

bool ConnectionManager::handleEscape() {
    return cancel();
}

void ConnectionManager::reset() {
    phase_ = Phase::Idle;
    source_.reset();
    sourceAnchor_.reset();
    hovered_.reset();
    hoveredAccepted_ = false;
    preview_.reset();
}

bool ConnectionManager::acceptsTarget(const SnapTarget& target) const {
    if (!source_ || !sourceAnchor_) {
        return false;
    }
    if (!validateConnection(*sourceAnchor_, target.anchor).valid) {
        return false;
    }
    return config_.allowSelfConnection || target.connection.nodeId != source_->nodeId;
}

bool ConnectionManager::hasEdgeBetween(const CanvasState& state,
                                       const ConnectionPoint& source,
                                       const ConnectionPoint& target) const {
    for (const auto& [id, edge] : state.edges) {
        if (edge.source.nodeId == source.nodeId && edge.source.anchorId == source.anchorId &&
            edge.target.nodeId == target.nodeId && edge.target.anchorId == target.anchorId) {
            return true;
        }
    }
    return false;
}

}  // namespace flowcanvas
