#include "flowcanvas/geometry/PathGeometry.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace flowcanvas {

std::string edgeTypeName(EdgeType type) {
    switch (type) {
        case EdgeType::Straight: return "straight";
        case EdgeType::Bezier: return "bezier";
        case EdgeType::Orthogonal: return "orthogonal";
    }
    return "bezier";
}

std::optional<EdgeType> parseEdgeType(const std::string& name) {
    if (name == "straight") return EdgeType::Straight;
    if (name == "bezier") return EdgeType::Bezier;
    if (name == "orthogonal") return EdgeType::Orthogonal;
    return std::nullopt;
}

namespace geometry {

namespace {

/// start, waypoints..., end (default waypoints when none are stored)
std::vector<Point> orthogonalPolyline(const EdgePath& path, const OrthogonalShape& shape) {
    std::vector<Point> points;
    points.reserve(shape.waypoints.size() + 2);
    points.push_back(path.start);
    if (shape.waypoints.empty()) {
        auto defaults = generateOrthogonalWaypoints(path.start, path.end);
        points.insert(points.end(), defaults.begin(), defaults.end());
    } else {
        points.insert(points.end(), shape.waypoints.begin(), shape.waypoints.end());
    }
    points.push_back(path.end);
    return points;
}

float polylineLength(const std::vector<Point>& points) {
    float total = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        total += points[i - 1].distanceTo(points[i]);
    }
    return total;
}

Point polylinePointAtRatio(const std::vector<Point>& points, float t) {
    if (t >= 1.0f) {
        return points.back();
    }

    std::vector<float> segmentLengths;
    segmentLengths.reserve(points.size());
    float totalLength = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        float len = points[i - 1].distanceTo(points[i]);
        segmentLengths.push_back(len);
        totalLength += len;
    }

    float target = totalLength * t;
    float accumulated = 0.0f;
    for (size_t i = 0; i < segmentLengths.size(); ++i) {
        float len = segmentLengths[i];
        if (accumulated + len >= target) {
            if (len <= 0.0f) {
                return points[i];
            }
            return lerp(points[i], points[i + 1], (target - accumulated) / len);
        }
        accumulated += len;
    }

    return points.back();
}

/// Sample count proportional to path length, bounded for runaway lengths
int sampleCount(float length, float spacing, int minimum) {
    constexpr int kMaxSamples = 10000;
    if (!std::isfinite(length) || length <= 0.0f) {
        return minimum;
    }
    float steps = std::floor(length / spacing);
    return std::clamp(static_cast<int>(std::min(steps, static_cast<float>(kMaxSamples))),
                      minimum, std::max(minimum, kMaxSamples));
}

std::string fmtPoint(const Point& p) {
    return fmt::format("{},{}", p.x, p.y);
}

std::string roundedOrthogonalDrawString(const std::vector<Point>& points, float cornerRadius) {
    const Point& start = points.front();
    const Point& end = points.back();

    if (points.size() < 3) {
        return fmt::format("M {} L {}", fmtPoint(start), fmtPoint(end));
    }

    std::string out = "M " + fmtPoint(start);
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        const Point& prev = points[i - 1];
        const Point& current = points[i];
        const Point& next = points[i + 1];

        Point in = current - prev;
        Point outVec = next - current;
        float lenIn = in.length();
        float lenOut = outVec.length();

        // Degenerate corner, nothing to round
        if (lenIn == 0.0f || lenOut == 0.0f) {
            continue;
        }

        in = in / lenIn;
        outVec = outVec / lenOut;

        float radius = std::min({cornerRadius, lenIn / 2.0f, lenOut / 2.0f});
        Point arcStart = current - in * radius;
        Point arcEnd = current + outVec * radius;

        out += " L " + fmtPoint(arcStart);
        out += " Q " + fmtPoint(current) + " " + fmtPoint(arcEnd);
    }
    out += " L " + fmtPoint(end);
    return out;
}

}  // namespace

// =========================================================================
// Construction
// =========================================================================

BezierControlPoints generateBezierControlPoints(
    const Point& start,
    const Point& end,
    float curvature,
    float maxOffset) {

    float offset = std::min(start.distanceTo(end) * curvature, maxOffset);
    return {
        Point{start.x + offset, start.y},
        Point{end.x - offset, end.y}
    };
}

std::vector<Point> generateOrthogonalWaypoints(const Point& start, const Point& end) {
    float midX = (start.x + end.x) / 2.0f;
    return {
        Point{midX, start.y},
        Point{midX, end.y}
    };
}

EdgePath buildPath(
    const Point& start,
    const Point& end,
    EdgeType type,
    const PathOptions& options) {

    switch (type) {
        case EdgeType::Straight:
            return EdgePath::straight(start, end);
        case EdgeType::Bezier:
            return EdgePath::bezier(start, end,
                generateBezierControlPoints(start, end, options.curvature, options.maxBezierOffset));
        case EdgeType::Orthogonal:
            return EdgePath::orthogonal(start, end, generateOrthogonalWaypoints(start, end));
    }
    return EdgePath::straight(start, end);
}

EdgePath rebuildPath(const EdgePath& path, const Point& start, const Point& end,
                     const PathOptions& options) {
    return buildPath(start, end, path.type(), options);
}

BezierControlPoints optimalBezierControlPoints(
    const Point& start,
    const Point& end,
    const std::vector<Rect>& obstacles,
    const PathOptions& options) {

    BezierControlPoints cps = generateBezierControlPoints(
        start, end, options.curvature, options.maxBezierOffset);
    if (obstacles.empty()) {
        return cps;
    }

    Point midpoint = pointAtRatio(EdgePath::bezier(start, end, cps), 0.5f);
    bool collides = std::any_of(obstacles.begin(), obstacles.end(), [&](const Rect& obstacle) {
        return obstacle.expanded(options.obstacleMargin).contains(midpoint);
    });

    if (collides) {
        float shiftedY = (start.y + end.y) / 2.0f - options.curvature * 100.0f;
        cps.cp1.y = shiftedY;
        cps.cp2.y = shiftedY;
    }
    return cps;
}

// =========================================================================
// Rendering
// =========================================================================

std::string pathToDrawString(const EdgePath& path, float cornerRadius) {
    switch (path.type()) {
        case EdgeType::Straight:
            return fmt::format("M {} L {}", fmtPoint(path.start), fmtPoint(path.end));

        case EdgeType::Bezier: {
            const auto& cps = *path.controlPoints();
            return fmt::format("M {} C {} {} {}",
                fmtPoint(path.start), fmtPoint(cps.cp1), fmtPoint(cps.cp2), fmtPoint(path.end));
        }

        case EdgeType::Orthogonal: {
            auto points = orthogonalPolyline(path, std::get<OrthogonalShape>(path.shape));
            if (cornerRadius > 0.0f) {
                return roundedOrthogonalDrawString(points, cornerRadius);
            }
            std::string out = "M " + fmtPoint(points.front());
            for (size_t i = 1; i < points.size(); ++i) {
                out += " L " + fmtPoint(points[i]);
            }
            return out;
        }
    }
    return {};
}

// =========================================================================
// Sampling
// =========================================================================

float pathLength(const EdgePath& path) {
    switch (path.type()) {
        case EdgeType::Straight:
            return path.start.distanceTo(path.end);

        case EdgeType::Bezier: {
            const auto& cps = *path.controlPoints();
            float polygon = path.start.distanceTo(cps.cp1) +
                            cps.cp1.distanceTo(cps.cp2) +
                            cps.cp2.distanceTo(path.end);
            return polygon * 0.8f;
        }

        case EdgeType::Orthogonal:
            return polylineLength(orthogonalPolyline(path, std::get<OrthogonalShape>(path.shape)));
    }
    return path.start.distanceTo(path.end);
}

Point pointAtRatio(const EdgePath& path, float ratio) {
    float t = std::clamp(ratio, 0.0f, 1.0f);

    switch (path.type()) {
        case EdgeType::Straight:
            return lerp(path.start, path.end, t);

        case EdgeType::Bezier: {
            const auto& cps = *path.controlPoints();
            return cubicBezierPoint(path.start, cps.cp1, cps.cp2, path.end, t);
        }

        case EdgeType::Orthogonal:
            return polylinePointAtRatio(
                orthogonalPolyline(path, std::get<OrthogonalShape>(path.shape)), t);
    }
    return path.start;
}

Point pointAtDistance(const EdgePath& path, float distance) {
    float total = pathLength(path);
    if (total <= 0.0f) {
        return path.start;
    }
    return pointAtRatio(path, std::clamp(distance / total, 0.0f, 1.0f));
}

Point tangentAtRatio(const EdgePath& path, float ratio, float epsilon) {
    float t = std::clamp(ratio, 0.0f, 1.0f);

    Point p1 = pointAtRatio(path, std::max(0.0f, t - epsilon));
    Point p2 = pointAtRatio(path, std::min(1.0f, t + epsilon));

    Point delta = p2 - p1;
    float len = delta.length();
    if (len == 0.0f || !std::isfinite(len)) {
        return {1.0f, 0.0f};
    }
    return delta / len;
}

std::vector<Point> samplePath(const EdgePath& path, int samples) {
    std::vector<Point> points;
    if (samples <= 0) {
        points.push_back(path.start);
        return points;
    }
    points.reserve(static_cast<size_t>(samples) + 1);
    for (int i = 0; i <= samples; ++i) {
        points.push_back(pointAtRatio(path, static_cast<float>(i) / static_cast<float>(samples)));
    }
    return points;
}

// =========================================================================
// Hit testing
// =========================================================================

ClosestPathPoint closestPointOnPath(const EdgePath& path, const Point& point, int minSamples) {
    int steps = sampleCount(pathLength(path), 10.0f, std::max(1, minSamples));

    ClosestPathPoint best;
    best.point = path.start;
    best.ratio = 0.0f;
    best.distance = point.distanceTo(path.start);

    for (int i = 0; i <= steps; ++i) {
        float ratio = static_cast<float>(i) / static_cast<float>(steps);
        Point candidate = pointAtRatio(path, ratio);
        float distance = point.distanceTo(candidate);
        if (distance < best.distance) {
            best.point = candidate;
            best.ratio = ratio;
            best.distance = distance;
        }
    }
    return best;
}

bool isPointNearPath(const EdgePath& path, const Point& point, float tolerance) {
    int steps = sampleCount(pathLength(path), 20.0f, 10);

    for (int i = 0; i <= steps; ++i) {
        float ratio = static_cast<float>(i) / static_cast<float>(steps);
        if (point.distanceTo(pointAtRatio(path, ratio)) <= tolerance) {
            return true;
        }
    }
    return false;
}

}  // namespace geometry

}  // namespace flowcanvas
