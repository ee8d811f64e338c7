#pragma once

#include "flowcanvas/canvas/CanvasTypes.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace flowcanvas {

/// Source of per-node anchors
///
/// The canvas engine does not own anchor layout; hosts supply it through
/// this interface. Anchor order is significant: it is the secondary scan
/// order of the snap search.
class INodeAnchorRegistry {
public:
    virtual ~INodeAnchorRegistry() = default;

    /// Current anchors of a node
    virtual std::vector<NodeAnchor> anchorsFor(const Node& node) const = 0;
};

/// Default registry: four side anchors derived from the node type,
/// replaceable per node
///
/// Documents (120x80) get top/bottom bidirectional, right output and
/// left input anchors on their box edges. Agents (radius 35) get the same
/// set on their circumscribed box.
class AnchorRegistry : public INodeAnchorRegistry {
public:
    std::vector<NodeAnchor> anchorsFor(const Node& node) const override;

    /// Replace the anchors of one node
    void setAnchors(const NodeId& nodeId, std::vector<NodeAnchor> anchors);

    /// Revert a node to the type defaults
    void clearAnchors(const NodeId& nodeId);

    bool hasOverride(const NodeId& nodeId) const { return overrides_.count(nodeId) > 0; }

    static std::vector<NodeAnchor> defaultAnchors(NodeType type);

private:
    std::unordered_map<NodeId, std::vector<NodeAnchor>> overrides_;
};

/// Look up one anchor of a node
std::optional<NodeAnchor> findAnchor(const INodeAnchorRegistry& registry,
                                     const Node& node,
                                     const AnchorId& anchorId);

/// World position of an anchor: node position plus anchor offset
inline Point anchorPosition(const Node& node, const NodeAnchor& anchor) {
    return node.position + anchor.offset;
}

}  // namespace flowcanvas
