#include "flowcanvas/interaction/AnchorRegistry.h"
#include "flowcanvas/geometry/EdgeRouting.h"

namespace flowcanvas {

std::vector<NodeAnchor> AnchorRegistry::anchorsFor(const Node& node) const {
    auto it = overrides_.find(node.id);
    if (it != overrides_.end()) {
        return it->second;
    }
    return defaultAnchors(node.type);
}

void AnchorRegistry::setAnchors(const NodeId& nodeId, std::vector<NodeAnchor> anchors) {
    overrides_[nodeId] = std::move(anchors);
}

void AnchorRegistry::clearAnchors(const NodeId& nodeId) {
    overrides_.erase(nodeId);
}

std::vector<NodeAnchor> AnchorRegistry::defaultAnchors(NodeType type) {
    Size size = geometry::nodeSize(type);
    float halfW = size.width / 2.0f;
    float halfH = size.height / 2.0f;

    auto make = [](const char* id, AnchorSide side, Point offset, ConnectionType connectionType) {
        NodeAnchor anchor;
        anchor.id = id;
        anchor.side = side;
        anchor.offset = offset;
        anchor.connectionType = connectionType;
        return anchor;
    };

    return {
        make("top", AnchorSide::Top, {0.0f, -halfH}, ConnectionType::Bidirectional),
        make("right", AnchorSide::Right, {halfW, 0.0f}, ConnectionType::Output),
        make("bottom", AnchorSide::Bottom, {0.0f, halfH}, ConnectionType::Bidirectional),
        make("left", AnchorSide::Left, {-halfW, 0.0f}, ConnectionType::Input),
    };
}

std::optional<NodeAnchor> findAnchor(const INodeAnchorRegistry& registry,
                                     const Node& node,
                                     const AnchorId& anchorId) {
    for (auto& anchor : registry.anchorsFor(node)) {
        if (anchor.id == anchorId) {
            return anchor;
        }
    }
    return std::nullopt;
}

}  // namespace flowcanvas
