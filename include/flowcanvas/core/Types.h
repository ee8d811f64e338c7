#pragma once

#include <cmath>
#include <string>

namespace flowcanvas {

using NodeId = std::string;
using EdgeId = std::string;
using AnchorId = std::string;

/// Kind of canvas node
enum class NodeType {
    Document,
    Agent
};

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Linear interpolation between two points, exact at t = 0 and t = 1
constexpr Point lerp(const Point& a, const Point& b, float t) {
    return {a.x * (1.0f - t) + b.x * t, a.y * (1.0f - t) + b.y * t};
}

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}

    /// Rect of the given size centered on a point
    static constexpr Rect centeredAt(const Point& c, Size size) {
        return {c.x - size.width / 2, c.y - size.height / 2, size.width, size.height};
    }

    constexpr Point position() const { return {x, y}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    Rect expanded(float padding) const {
        return {x - padding, y - padding, width + 2 * padding, height + 2 * padding};
    }

    constexpr float area() const { return width * height; }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Visible world-space rectangle mapped onto the rendering surface
struct ViewBox {
    float x = 0.0f;
    float y = 0.0f;
    float width = 1200.0f;
    float height = 800.0f;

    constexpr ViewBox() = default;
    constexpr ViewBox(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}

    constexpr Point origin() const { return {x, y}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }
    constexpr Rect toRect() const { return {x, y, width, height}; }

    constexpr bool operator==(const ViewBox& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const ViewBox& o) const { return !(*this == o); }
};

}  // namespace flowcanvas
