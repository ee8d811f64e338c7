#include "flowcanvas/viewport/ViewportTransform.h"
#include "flowcanvas/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace flowcanvas::viewport {

float clampScale(float scale, const ViewportConfig& config) {
    if (!std::isfinite(scale)) {
        return std::clamp(config.defaultScale, config.minScale, config.maxScale);
    }
    return std::max(config.minScale, std::min(config.maxScale, scale));
}

ViewBox createViewBox(float x, float y, float width, float height, const ViewportConfig& config) {
    return {
        constants::finiteOr(x, 0.0f),
        constants::finiteOr(y, 0.0f),
        std::max(config.minViewBoxWidth, constants::finiteOr(width, config.defaultViewBox.width)),
        std::max(config.minViewBoxHeight, constants::finiteOr(height, config.defaultViewBox.height))
    };
}

ViewBox clampViewBox(const ViewBox& viewBox, const ViewportConfig& config) {
    float minX = -config.panMargin;
    float minY = -config.panMargin;
    float maxX = config.maxPanDistance - viewBox.width;
    float maxY = config.maxPanDistance - viewBox.height;

    return createViewBox(
        std::max(minX, std::min(maxX, viewBox.x)),
        std::max(minY, std::min(maxY, viewBox.y)),
        viewBox.width,
        viewBox.height,
        config);
}

ViewState zoomAroundPoint(const ViewState& current, const Point& focal, float targetScale,
                          const ViewportConfig& config) {
    float newScale = clampScale(targetScale, config);
    float currentScale = current.scale > 0.0f ? current.scale : config.defaultScale;
    float factor = newScale / currentScale;

    const ViewBox& vb = current.viewBox;
    ViewBox zoomed = createViewBox(
        focal.x - (focal.x - vb.x) / factor,
        focal.y - (focal.y - vb.y) / factor,
        vb.width / factor,
        vb.height / factor,
        config);

    return {clampViewBox(zoomed, config), newScale};
}

ViewState zoomStep(const ViewState& current, bool zoomIn, const ViewportConfig& config) {
    float multiplier = zoomIn ? 1.0f + config.zoomStep : 1.0f - config.zoomStep;
    float target = clampScale(current.scale * multiplier, config);

    if (!isSignificantZoomChange(current.scale, target, config)) {
        return current;
    }
    return zoomAroundPoint(current, current.viewBox.center(), target, config);
}

float wheelZoomTarget(float currentScale, float deltaY, const ViewportConfig& config) {
    float zoomDelta = -deltaY * config.wheelSensitivity;
    return clampScale(currentScale * (1.0f + zoomDelta), config);
}

bool isSignificantZoomChange(float fromScale, float toScale, const ViewportConfig& config) {
    return std::abs(toScale - fromScale) >= config.minZoomChange;
}

Point screenToWorld(const Point& screen, const ViewBox& viewBox, const Rect& element) {
    if (element.width <= 0.0f || element.height <= 0.0f) {
        return viewBox.origin();
    }
    float scaleX = viewBox.width / element.width;
    float scaleY = viewBox.height / element.height;
    return {
        viewBox.x + (screen.x - element.x) * scaleX,
        viewBox.y + (screen.y - element.y) * scaleY
    };
}

Point worldToScreen(const Point& world, const ViewBox& viewBox, const Rect& element) {
    if (viewBox.width <= 0.0f || viewBox.height <= 0.0f) {
        return element.position();
    }
    float scaleX = element.width / viewBox.width;
    float scaleY = element.height / viewBox.height;
    return {
        element.x + (world.x - viewBox.x) * scaleX,
        element.y + (world.y - viewBox.y) * scaleY
    };
}

ViewBox panBy(const ViewBox& viewBox, float dx, float dy, const ViewportConfig& config) {
    return clampViewBox({viewBox.x + dx, viewBox.y + dy, viewBox.width, viewBox.height}, config);
}

ViewBox panByScreenDelta(const ViewBox& viewBox, float dx, float dy, const Rect& element,
                         const ViewportConfig& config) {
    if (element.width <= 0.0f || element.height <= 0.0f) {
        return viewBox;
    }
    // Dragging the content right moves the view left
    float worldDx = -dx * (viewBox.width / element.width);
    float worldDy = -dy * (viewBox.height / element.height);
    return panBy(viewBox, worldDx, worldDy, config);
}

ViewState fitToContent(const std::vector<Point>& nodePositions, const ViewState& current,
                       const ViewportConfig& config) {
    if (nodePositions.empty()) {
        return {config.defaultViewBox, config.defaultScale};
    }

    float minX = nodePositions.front().x;
    float minY = nodePositions.front().y;
    float maxX = minX;
    float maxY = minY;
    for (const auto& p : nodePositions) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    float pad = config.nodeRadius + config.fitPadding;
    minX -= pad;
    minY -= pad;
    maxX += pad;
    maxY += pad;

    float contentWidth = maxX - minX;
    float contentHeight = maxY - minY;

    float scale = std::min(current.viewBox.width / contentWidth,
                           current.viewBox.height / contentHeight);

    return {createViewBox(minX, minY, contentWidth, contentHeight, config),
            clampScale(scale, config)};
}

bool isPointVisible(const Point& point, const ViewBox& viewBox, const ViewportConfig& config) {
    float m = config.visibilityMargin;
    return point.x >= viewBox.x + m &&
           point.x <= viewBox.x + viewBox.width - m &&
           point.y >= viewBox.y + m &&
           point.y <= viewBox.y + viewBox.height - m;
}

ViewBox centerOn(const ViewBox& viewBox, const Point& point, const ViewportConfig& config) {
    return clampViewBox({point.x - viewBox.width / 2.0f,
                         point.y - viewBox.height / 2.0f,
                         viewBox.width,
                         viewBox.height},
                        config);
}

}  // namespace flowcanvas::viewport
