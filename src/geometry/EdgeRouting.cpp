#include "flowcanvas/geometry/EdgeRouting.h"
#include "flowcanvas/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <optional>

namespace flowcanvas::geometry {

namespace {

constexpr int kInitialObstacleSamples = 10;
constexpr int kStrategyObstacleSamples = 20;
constexpr int kIntersectionSamples = 20;
constexpr float kSmartMinDistance = 100.0f;

bool bezierHitsObstacles(
    const Point& start,
    const Point& end,
    const BezierControlPoints& cps,
    const std::vector<RoutingObstacle>& obstacles,
    int samples) {

    for (int i = 0; i <= samples; ++i) {
        float t = static_cast<float>(i) / static_cast<float>(samples);
        Point p = cubicBezierPoint(start, cps.cp1, cps.cp2, end, t);
        for (const auto& obstacle : obstacles) {
            if (isPointInObstacle(p, obstacle)) {
                return true;
            }
        }
    }
    return false;
}

bool polylineClear(const std::vector<Point>& points, const std::vector<RoutingObstacle>& obstacles) {
    for (size_t i = 1; i < points.size(); ++i) {
        for (const auto& obstacle : obstacles) {
            if (lineIntersectsObstacle(points[i - 1], points[i], obstacle)) {
                return false;
            }
        }
    }
    return true;
}

std::optional<BezierControlPoints> verticalShiftStrategy(
    const Point& start, const Point& end,
    const BezierControlPoints& base,
    const std::vector<RoutingObstacle>& obstacles,
    float padding) {

    float midY = (start.y + end.y) / 2.0f;
    float offset = std::max(100.0f, padding * 2.0f);

    for (float y : {midY - offset, midY + offset}) {
        BezierControlPoints shifted{{base.cp1.x, y}, {base.cp2.x, y}};
        if (!bezierHitsObstacles(start, end, shifted, obstacles, kStrategyObstacleSamples)) {
            return shifted;
        }
    }
    return std::nullopt;
}

BezierControlPoints wideArcStrategy(const Point& start, const Point& end, float padding) {
    float direction = end.x > start.x ? 1.0f : -1.0f;
    float arcRadius = std::max(150.0f, padding * 3.0f);

    return {
        {start.x + direction * arcRadius * 0.7f, start.y - arcRadius},
        {end.x - direction * arcRadius * 0.7f, end.y - arcRadius}
    };
}

BezierControlPoints sCurveStrategy(const Point& start, const Point& end) {
    float midX = (start.x + end.x) / 2.0f;
    float offsetY = (end.y - start.y) * 0.3f;

    return {
        {midX, start.y + offsetY},
        {midX, end.y - offsetY}
    };
}

std::optional<Point> pathIntersection(const EdgePath& a, const EdgePath& b) {
    if (a.type() == EdgeType::Straight && b.type() == EdgeType::Straight) {
        return segmentIntersection(a.start, a.end, b.start, b.end);
    }

    auto samplesA = samplePath(a, kIntersectionSamples);
    auto samplesB = samplePath(b, kIntersectionSamples);
    for (size_t i = 0; i + 1 < samplesA.size(); ++i) {
        for (size_t j = 0; j + 1 < samplesB.size(); ++j) {
            if (auto hit = segmentIntersection(samplesA[i], samplesA[i + 1],
                                               samplesB[j], samplesB[j + 1])) {
                return hit;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

Size nodeSize(NodeType type) {
    switch (type) {
        case NodeType::Document:
            return {constants::DOCUMENT_WIDTH, constants::DOCUMENT_HEIGHT};
        case NodeType::Agent:
            return {constants::AGENT_RADIUS * 2.0f, constants::AGENT_RADIUS * 2.0f};
    }
    return {constants::DOCUMENT_WIDTH, constants::DOCUMENT_HEIGHT};
}

NodeBounds createNodeBounds(const NodeId& id, NodeType type, const Point& position) {
    NodeBounds bounds;
    bounds.id = id;
    bounds.rect = Rect::centeredAt(position, nodeSize(type));
    bounds.shape = type == NodeType::Document ? NodeShape::Rectangle : NodeShape::Hexagon;
    return bounds;
}

std::vector<RoutingObstacle> createRoutingObstacles(
    const std::vector<NodeBounds>& nodeBounds,
    const std::vector<NodeId>& excludeNodes,
    float padding) {

    std::vector<RoutingObstacle> obstacles;
    obstacles.reserve(nodeBounds.size());
    for (const auto& bounds : nodeBounds) {
        if (std::find(excludeNodes.begin(), excludeNodes.end(), bounds.id) != excludeNodes.end()) {
            continue;
        }
        obstacles.push_back({bounds.rect.expanded(padding), padding});
    }
    return obstacles;
}

bool isPointInObstacle(const Point& point, const RoutingObstacle& obstacle) {
    return obstacle.rect.contains(point);
}

bool lineIntersectsObstacle(const Point& start, const Point& end, const RoutingObstacle& obstacle) {
    return segmentIntersectsRect(start, end, obstacle.rect);
}

EdgePath smartBezierPath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options) {

    BezierControlPoints cps = generateBezierControlPoints(
        start, end, options.smoothing, options.maxBezierOffset);

    if (!bezierHitsObstacles(start, end, cps, obstacles, kInitialObstacleSamples)) {
        return EdgePath::bezier(start, end, cps);
    }

    if (auto shifted = verticalShiftStrategy(start, end, cps, obstacles, options.padding)) {
        return EdgePath::bezier(start, end, *shifted);
    }

    for (const auto& candidate : {wideArcStrategy(start, end, options.padding),
                                  sCurveStrategy(start, end)}) {
        if (!bezierHitsObstacles(start, end, candidate, obstacles, kStrategyObstacleSamples)) {
            return EdgePath::bezier(start, end, candidate);
        }
    }

    LOG_DEBUG("no clear bezier route between ({}, {}) and ({}, {}), keeping default curve",
              start.x, start.y, end.x, end.y);
    return EdgePath::bezier(start, end, cps);
}

EdgePath smartOrthogonalPath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options) {

    // Horizontal then vertical
    Point corner1{end.x, start.y};
    if (polylineClear({start, corner1, end}, obstacles)) {
        return EdgePath::orthogonal(start, end, {corner1});
    }

    // Vertical then horizontal
    Point corner2{start.x, end.y};
    if (polylineClear({start, corner2, end}, obstacles)) {
        return EdgePath::orthogonal(start, end, {corner2});
    }

    float dx = end.x - start.x;
    float dy = end.y - start.y;

    // Largest obstacle whose center lies between the endpoints on some axis
    const RoutingObstacle* largest = nullptr;
    float largestArea = 0.0f;
    for (const auto& obstacle : obstacles) {
        float area = obstacle.rect.area();
        if (area <= largestArea) {
            continue;
        }
        Point c = obstacle.rect.center();
        bool between = (dx > 0 && c.x > start.x && c.x < end.x) ||
                       (dx < 0 && c.x < start.x && c.x > end.x) ||
                       (dy > 0 && c.y > start.y && c.y < end.y) ||
                       (dy < 0 && c.y < start.y && c.y > end.y);
        if (between) {
            largest = &obstacle;
            largestArea = area;
        }
    }

    if (!largest) {
        return EdgePath::orthogonal(start, end, {corner1});
    }

    const Rect& obs = largest->rect;
    if (std::abs(dx) > std::abs(dy)) {
        // Mostly horizontal: pass over or under
        bool goUp = start.y > obs.center().y;
        float routeY = goUp ? obs.top() - options.padding : obs.bottom() + options.padding;
        return EdgePath::orthogonal(start, end, {{start.x, routeY}, {end.x, routeY}});
    }

    // Mostly vertical: pass left or right
    bool goLeft = start.x > obs.center().x;
    float routeX = goLeft ? obs.left() - options.padding : obs.right() + options.padding;
    return EdgePath::orthogonal(start, end, {{routeX, start.y}, {routeX, end.y}});
}

EdgePath optimalEdgePath(
    const Point& start,
    const Point& end,
    const std::vector<RoutingObstacle>& obstacles,
    const RoutingOptions& options) {

    static const std::vector<RoutingObstacle> kNoObstacles;
    const auto& active = options.avoidNodes ? obstacles : kNoObstacles;

    switch (options.algorithm) {
        case RoutingAlgorithm::Straight:
            return EdgePath::straight(start, end);

        case RoutingAlgorithm::Orthogonal:
            return smartOrthogonalPath(start, end, active, options);

        case RoutingAlgorithm::Smart:
            if (active.empty() || start.distanceTo(end) < kSmartMinDistance) {
                return EdgePath::bezier(start, end,
                    generateBezierControlPoints(start, end, options.smoothing, options.maxBezierOffset));
            }
            return smartBezierPath(start, end, active, options);

        case RoutingAlgorithm::Bezier:
            return smartBezierPath(start, end, active, options);
    }
    return smartBezierPath(start, end, active, options);
}

std::vector<EdgeIntersection> findEdgeIntersections(const std::vector<EdgePath>& paths) {
    std::vector<EdgeIntersection> result;
    for (size_t i = 0; i < paths.size(); ++i) {
        for (size_t j = i + 1; j < paths.size(); ++j) {
            if (auto hit = pathIntersection(paths[i], paths[j])) {
                result.push_back({i, j, *hit});
            }
        }
    }
    return result;
}

}  // namespace flowcanvas::geometry
