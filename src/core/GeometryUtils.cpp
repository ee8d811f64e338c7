#include "flowcanvas/core/GeometryUtils.h"

#include <cmath>

namespace flowcanvas::geometry {

bool segmentIntersectsRect(const Point& p1, const Point& p2, const Rect& rect) {
    if (rect.contains(p1) || rect.contains(p2)) {
        return true;
    }

    float dx = p2.x - p1.x;
    float dy = p2.y - p1.y;

    // Parametric crossing of each rectangle side: P = p1 + t * (p2 - p1)
    auto crossesVertical = [&](float sideX) {
        if (dx == 0.0f) return false;
        float t = (sideX - p1.x) / dx;
        if (t < 0.0f || t > 1.0f) return false;
        float y = p1.y + t * dy;
        return y >= rect.top() && y <= rect.bottom();
    };
    auto crossesHorizontal = [&](float sideY) {
        if (dy == 0.0f) return false;
        float t = (sideY - p1.y) / dy;
        if (t < 0.0f || t > 1.0f) return false;
        float x = p1.x + t * dx;
        return x >= rect.left() && x <= rect.right();
    };

    return crossesVertical(rect.left()) || crossesVertical(rect.right()) ||
           crossesHorizontal(rect.top()) || crossesHorizontal(rect.bottom());
}

std::optional<Point> segmentIntersection(
    const Point& p1, const Point& p2,
    const Point& p3, const Point& p4) {

    // Solve in double to keep near-parallel cases stable
    double x1 = p1.x, y1 = p1.y;
    double x2 = p2.x, y2 = p2.y;
    double x3 = p3.x, y3 = p3.y;
    double x4 = p4.x, y4 = p4.y;

    double denom = (x1 - x2) * (y3 - y4) - (y1 - y2) * (x3 - x4);
    if (std::abs(denom) < constants::PARALLEL_EPSILON) {
        return std::nullopt;
    }

    double t = ((x1 - x3) * (y3 - y4) - (y1 - y3) * (x3 - x4)) / denom;
    double u = -((x1 - x2) * (y1 - y3) - (y1 - y2) * (x1 - x3)) / denom;

    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return std::nullopt;
    }

    return Point{static_cast<float>(x1 + t * (x2 - x1)),
                 static_cast<float>(y1 + t * (y2 - y1))};
}

Point cubicBezierPoint(
    const Point& p0, const Point& p1,
    const Point& p2, const Point& p3,
    float t) {

    float u = 1.0f - t;
    float u2 = u * u;
    float u3 = u2 * u;
    float t2 = t * t;
    float t3 = t2 * t;

    return {
        u3 * p0.x + 3 * u2 * t * p1.x + 3 * u * t2 * p2.x + t3 * p3.x,
        u3 * p0.y + 3 * u2 * t * p1.y + 3 * u * t2 * p2.y + t3 * p3.y
    };
}

}  // namespace flowcanvas::geometry
