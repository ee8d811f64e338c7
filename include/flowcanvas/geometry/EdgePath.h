#pragma once

#include "flowcanvas/core/Types.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowcanvas {

/// Edge rendering style. Order matches the EdgePath::Shape alternatives.
enum class EdgeType {
    Straight,
    Bezier,
    Orthogonal
};

struct BezierControlPoints {
    Point cp1;
    Point cp2;

    bool operator==(const BezierControlPoints& o) const { return cp1 == o.cp1 && cp2 == o.cp2; }
    bool operator!=(const BezierControlPoints& o) const { return !(*this == o); }
};

struct StraightShape {
    bool operator==(const StraightShape&) const { return true; }
};

struct BezierShape {
    BezierControlPoints controlPoints;

    bool operator==(const BezierShape& o) const { return controlPoints == o.controlPoints; }
};

struct OrthogonalShape {
    std::vector<Point> waypoints;

    bool operator==(const OrthogonalShape& o) const { return waypoints == o.waypoints; }
};

/// Geometric description of an edge between two world points
///
/// The shape alternative carries only the parameters of its own
/// representation; the path is always recomputable from
/// (start, end, type, parameters).
struct EdgePath {
    using Shape = std::variant<StraightShape, BezierShape, OrthogonalShape>;

    Point start;
    Point end;
    Shape shape;

    EdgeType type() const { return static_cast<EdgeType>(shape.index()); }

    const BezierControlPoints* controlPoints() const {
        const auto* bezier = std::get_if<BezierShape>(&shape);
        return bezier ? &bezier->controlPoints : nullptr;
    }

    const std::vector<Point>* waypoints() const {
        const auto* ortho = std::get_if<OrthogonalShape>(&shape);
        return ortho ? &ortho->waypoints : nullptr;
    }

    static EdgePath straight(const Point& start, const Point& end) {
        return {start, end, StraightShape{}};
    }

    static EdgePath bezier(const Point& start, const Point& end, const BezierControlPoints& cps) {
        return {start, end, BezierShape{cps}};
    }

    static EdgePath orthogonal(const Point& start, const Point& end, std::vector<Point> waypoints) {
        return {start, end, OrthogonalShape{std::move(waypoints)}};
    }

    bool operator==(const EdgePath& o) const {
        return start == o.start && end == o.end && shape == o.shape;
    }
    bool operator!=(const EdgePath& o) const { return !(*this == o); }
};

/// Wire name of an edge type ("straight", "bezier", "orthogonal")
std::string edgeTypeName(EdgeType type);

/// Parse an edge type wire name
std::optional<EdgeType> parseEdgeType(const std::string& name);

}  // namespace flowcanvas
