#pragma once

#include "Types.h"

#include <cmath>
#include <optional>

namespace flowcanvas {

/// Geometry utility functions for collision detection and spatial queries
namespace geometry {

/// Check if a line segment touches an axis-aligned rectangle
/// Endpoints inside the rectangle count as touching.
/// @param p1 Start point of segment
/// @param p2 End point of segment
/// @param rect Rectangle to test against
/// @return true if the segment intersects the rectangle
bool segmentIntersectsRect(const Point& p1, const Point& p2, const Rect& rect);

/// Intersection point of two line segments
/// @return Intersection point, or nullopt for parallel or disjoint segments
std::optional<Point> segmentIntersection(
    const Point& p1, const Point& p2,
    const Point& p3, const Point& p4);

/// Evaluate a cubic bezier in Bernstein form
/// @param t Curve parameter in [0, 1]
Point cubicBezierPoint(
    const Point& p0, const Point& p1,
    const Point& p2, const Point& p3,
    float t);

}  // namespace geometry

/// Shared geometry constants
namespace constants {

/// Floating-point comparison tolerance
constexpr float EPSILON = 1e-6f;

/// Tolerance under which two segments are treated as parallel
constexpr float PARALLEL_EPSILON = 1e-10f;

/// Default bezier curvature (fraction of endpoint distance used as offset)
constexpr float DEFAULT_CURVATURE = 0.5f;

/// Upper bound on the horizontal bezier control point offset
constexpr float MAX_BEZIER_OFFSET = 200.0f;

/// Step used for finite-difference tangent estimation
constexpr float TANGENT_EPSILON = 0.001f;

/// Margin around obstacles used by the bezier midpoint nudge
constexpr float OBSTACLE_MARGIN = 50.0f;

/// Default hit-test tolerance for edges
constexpr float PATH_HIT_TOLERANCE = 10.0f;

/// Sanitize a float coordinate, replacing NaN and infinities with a fallback
inline float finiteOr(float value, float fallback) noexcept {
    return std::isfinite(value) ? value : fallback;
}

}  // namespace constants

}  // namespace flowcanvas
