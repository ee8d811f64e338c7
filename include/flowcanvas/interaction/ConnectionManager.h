#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/canvas/CanvasTypes.h"
#include "flowcanvas/geometry/PathGeometry.h"
#include "flowcanvas/interaction/AnchorRegistry.h"

#include <memory>
#include <optional>
#include <string>

namespace flowcanvas {

/// Edge-creation rules and defaults
struct ConnectionConfig {
    /// Maximum pointer-to-anchor distance for snapping
    float snapDistance = 20.0f;

    bool allowSelfConnection = false;

    /// When false, a second edge between the same anchor pair is rejected
    bool allowMultipleEdges = true;

    EdgeType defaultEdgeType = EdgeType::Bezier;
    EdgeStyle defaultStyle;

    /// Parameters for the live preview path
    PathOptions preview;
};

/// Outcome of a compatibility check
struct ConnectionValidation {
    bool valid = false;
    std::string reason;
};

/// Anchor selected by the snap search
struct SnapTarget {
    ConnectionPoint connection;
    NodeAnchor anchor;
    float distance = 0.0f;
};

/// Check anchor compatibility
/// Invalid: either anchor not connectable, input to input, output to output.
ConnectionValidation validateConnection(const NodeAnchor& source, const NodeAnchor& target);

/// Nearest visible, connectable anchor within snapDistance of the pointer
///
/// Anchors are scanned by node id ascending, then in registry order. A
/// candidate replaces the current best only when strictly nearer, so at
/// equal distance the first one scanned wins.
/// @param exclude Anchor skipped by the search (the session source)
std::optional<SnapTarget> findNearestAnchor(
    const CanvasState& state,
    const INodeAnchorRegistry& registry,
    const Point& pointer,
    float snapDistance,
    const std::optional<ConnectionPoint>& exclude = std::nullopt);

/// Drag-based edge creation session
///
/// State machine: Idle -> Creating(source) -> Committed | Cancelled, both
/// of which return to Idle. Only one session may be active; a second
/// begin() is rejected. Cancellation never produces an event.
///
/// Usage:
/// @code
/// ConnectionManager manager(registry);
/// manager.begin(state, "n1", "right");
/// auto update = manager.update(state, pointerWorldPos);
/// auto commit = manager.commit(state, "e1");
/// if (commit.success) dispatchCreateEdge(*commit.payload);
/// @endcode
class ConnectionManager {
public:
    enum class Phase {
        Idle,
        Creating
    };

    /// Result of begin()
    struct BeginResult {
        bool success = false;
        std::string reason;
        ConnectionPoint source;
    };

    /// Result of update()
    struct UpdateResult {
        bool hasValidTarget = false;        ///< Snapped anchor accepts the session source
        std::optional<SnapTarget> target;   ///< Snapped anchor, if any
        Point endpoint;                     ///< Snapped anchor or raw pointer
        EdgePath previewPath;               ///< Source to endpoint
    };

    /// Result of commit()
    struct CommitResult {
        bool success = false;
        std::string reason;
        std::optional<CreateEdgePayload> payload;
    };

    explicit ConnectionManager(std::shared_ptr<const INodeAnchorRegistry> registry,
                               ConnectionConfig config = {});

    /// Start a session from a node anchor
    /// Rejected when a session is active, the node or anchor is unknown,
    /// or the anchor is not connectable.
    BeginResult begin(const CanvasState& state, const NodeId& nodeId, const AnchorId& anchorId);

    /// Pointer moved (world coordinates); recompute snap target and preview
    UpdateResult update(const CanvasState& state, const Point& pointer);

    /// Validate the hovered target and produce the CREATE_EDGE payload.
    /// An invalid or missing target cancels the session.
    CommitResult commit(const CanvasState& state, const EdgeId& edgeId);

    /// Explicit cancel
    /// @return true if a session was active
    bool cancel();

    /// Click on empty canvas: cancels unless the hovered anchor accepts the source
    /// @return true if the session was cancelled
    bool handleCanvasClick();

    /// Escape key: cancels any active session
    bool handleEscape();

    bool isCreating() const { return phase_ == Phase::Creating; }
    Phase phase() const { return phase_; }

    const std::optional<ConnectionPoint>& source() const { return source_; }
    const std::optional<SnapTarget>& hoveredTarget() const { return hovered_; }
    const std::optional<EdgePath>& previewPath() const { return preview_; }

    const ConnectionConfig& config() const { return config_; }
    void setConfig(const ConnectionConfig& config) { config_ = config; }

private:
    void reset();
    bool acceptsTarget(const SnapTarget& target) const;
    bool hasEdgeBetween(const CanvasState& state,
                        const ConnectionPoint& source,
                        const ConnectionPoint& target) const;

    std::shared_ptr<const INodeAnchorRegistry> registry_;
    ConnectionConfig config_;

    Phase phase_ = Phase::Idle;
    std::optional<ConnectionPoint> source_;
    std::optional<NodeAnchor> sourceAnchor_;
    std::optional<SnapTarget> hovered_;
    bool hoveredAccepted_ = false;
    std::optional<EdgePath> preview_;
};

}  // namespace flowcanvas
