#pragma once

#include "flowcanvas/core/GeometryUtils.h"
#include "flowcanvas/geometry/EdgePath.h"

#include <string>
#include <vector>

namespace flowcanvas {

/// Parameters for path construction and sampling
struct PathOptions {
    /// Fraction of the endpoint distance used as bezier control offset
    float curvature = constants::DEFAULT_CURVATURE;

    /// Upper bound on the bezier control offset
    float maxBezierOffset = constants::MAX_BEZIER_OFFSET;

    /// Corner radius for orthogonal draw strings (0 = sharp corners)
    float cornerRadius = 5.0f;

    /// Margin around obstacles for the bezier midpoint nudge
    float obstacleMargin = constants::OBSTACLE_MARGIN;

    /// Finite-difference step for tangent estimation
    float tangentEpsilon = constants::TANGENT_EPSILON;

    /// Minimum sample count for nearest-point queries
    int minNearestSamples = 20;
};

/// Closest sampled point on a path
struct ClosestPathPoint {
    Point point;
    float ratio = 0.0f;
    float distance = 0.0f;
};

/// Path construction, sampling and hit-testing for edge paths
///
/// Length, nearest-point and hit-test queries are sampling approximations.
/// They drive interaction only, never authoritative geometry.
namespace geometry {

// =========================================================================
// Construction
// =========================================================================

/// Default horizontal bezier control points
/// cp1 = start + (offset, 0), cp2 = end - (offset, 0),
/// offset = min(distance * curvature, maxOffset)
BezierControlPoints generateBezierControlPoints(
    const Point& start,
    const Point& end,
    float curvature = constants::DEFAULT_CURVATURE,
    float maxOffset = constants::MAX_BEZIER_OFFSET);

/// Default orthogonal waypoints {midX, start.y}, {midX, end.y}
std::vector<Point> generateOrthogonalWaypoints(const Point& start, const Point& end);

/// Build a path of the given type with default parameters
EdgePath buildPath(
    const Point& start,
    const Point& end,
    EdgeType type,
    const PathOptions& options = {});

/// Rebuild a path with new endpoints, keeping its type
EdgePath rebuildPath(const EdgePath& path, const Point& start, const Point& end,
                     const PathOptions& options = {});

/// Bezier control points nudged away from obstacles near the path midpoint
/// @param obstacles Axis-aligned obstacle rectangles
BezierControlPoints optimalBezierControlPoints(
    const Point& start,
    const Point& end,
    const std::vector<Rect>& obstacles,
    const PathOptions& options = {});

// =========================================================================
// Rendering
// =========================================================================

/// SVG-style draw string for a path
/// @param cornerRadius Rounded corner radius for orthogonal paths (<= 0 = sharp)
std::string pathToDrawString(const EdgePath& path, float cornerRadius = 0.0f);

// =========================================================================
// Sampling
// =========================================================================

/// Approximate path length
/// straight: Euclidean, bezier: 0.8 x control polygon, orthogonal: sum of segments
float pathLength(const EdgePath& path);

/// Point at ratio along the path (ratio clamped to [0, 1])
Point pointAtRatio(const EdgePath& path, float ratio);

/// Point at distance along the path (clamped to the path length)
Point pointAtDistance(const EdgePath& path, float distance);

/// Unit tangent at ratio, (1, 0) when degenerate
Point tangentAtRatio(const EdgePath& path, float ratio,
                     float epsilon = constants::TANGENT_EPSILON);

/// Uniform samples at ratios i / samples for i in [0, samples]
std::vector<Point> samplePath(const EdgePath& path, int samples);

// =========================================================================
// Hit testing
// =========================================================================

/// Closest sampled point, max(minSamples, length / 10) samples
ClosestPathPoint closestPointOnPath(const EdgePath& path, const Point& point,
                                    int minSamples = 20);

/// Check if a point lies within tolerance of the path (sampled every ~20px)
bool isPointNearPath(const EdgePath& path, const Point& point,
                     float tolerance = constants::PATH_HIT_TOLERANCE);

}  // namespace geometry

}  // namespace flowcanvas
