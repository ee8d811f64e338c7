#pragma once

#include "flowcanvas/core/Types.h"
#include "flowcanvas/geometry/PathGeometry.h"

#include <vector>

namespace flowcanvas {

/// Outline used when treating a node as an obstacle
enum class NodeShape {
    Rectangle,
    Hexagon
};

/// Axis-aligned bounds of a node in world space
struct NodeBounds {
    NodeId id;
    Rect rect;
    NodeShape shape = NodeShape::Rectangle;
};

/// Padded node bounds that routing steers around
struct RoutingObstacle {
    Rect rect;
    float padding = 0.0f;
};

/// Strategy used by optimalEdgePath
enum class RoutingAlgorithm {
    Straight,
    Bezier,
    Orthogonal,
    Smart
};

/// Options for obstacle-aware routing
struct RoutingOptions {
    RoutingAlgorithm algorithm = RoutingAlgorithm::Bezier;
    bool avoidNodes = true;
    float padding = 20.0f;
    float smoothing = 0.5f;      ///< Bezier curvature
    float cornerRadius = 5.0f;
    float maxBezierOffset = constants::MAX_BEZIER_OFFSET;
};

/// Pair of paths that cross, with one crossing point
struct EdgeIntersection {
    size_t firstIndex = 0;
    size_t secondIndex = 0;
    Point point;
};

/// Node dimensions used for bounds and default anchors
namespace constants {
constexpr float DOCUMENT_WIDTH = 120.0f;
constexpr float DOCUMENT_HEIGHT = 80.0f;
constexpr float AGENT_RADIUS = 35.0f;
constexpr float ROUTING_PADDING = 20.0f;
}  // namespace constants

namespace geometry {

/// Size of a node's bounding box by type
Size nodeSize(NodeType type);

/// Bounds of a node centered on its position
/// Documents are 120x80 rectangles, agents are hexagons of radius 35.
NodeBounds createNodeBounds(const NodeId& id, NodeType type, const Point& position);

/// Inflate node bounds into routing obstacles
/// @param excludeNodes Nodes that never act as obstacles (typically the edge endpoints)
std::vector<RoutingObstacle> createRoutingObstacles(
    const std::vector<NodeBounds>& nodeBounds,
    const std::vector<NodeId>& excludeNodes = {},
    float padding = constants::ROUTING_PADDING);

bool isPointInObstacle(const Point& point, const RoutingObstacle& obstacle);

bool lineIntersectsObstacle(const Point& start, const Point& end, const RoutingObstacle& obstacle);

/// Bezier path whose control points avoid obstacles when possible
///
/// Strategies tried in order when the default curve hits an obstacle:
/// vertical shift above then below the midline, a wide arc, an S-curve.
/// Falls back to the default control points when none is clear.
EdgePath smartBezierPath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options = {});

/// Orthogonal path trying two L-shapes before detouring around the
/// largest obstacle lying between the endpoints
EdgePath smartOrthogonalPath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options = {});

/// Route according to options.algorithm
EdgePath optimalEdgePath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options = {});

/// All crossing pairs among the given paths (i < j)
std::vector<EdgeIntersection> findEdgeIntersections(const std::vector<EdgePath>& paths);

}  // namespace geometry

}  // namespace flowcanvas
