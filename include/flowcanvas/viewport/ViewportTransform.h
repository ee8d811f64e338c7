#pragma once

#include "flowcanvas/canvas/CanvasTypes.h"
#include "flowcanvas/core/Types.h"

#include <vector>

namespace flowcanvas {

/// Pan/zoom limits and step sizes
struct ViewportConfig {
    float minScale = limits::MIN_SCALE;
    float maxScale = limits::MAX_SCALE;
    float defaultScale = limits::DEFAULT_SCALE;

    /// Far edge of the pannable world on each axis
    float maxPanDistance = limits::MAX_PAN_DISTANCE;

    /// How far the view may move past the world origin
    float panMargin = limits::PAN_MARGIN;

    ViewBox defaultViewBox{0.0f, 0.0f, limits::DEFAULT_VIEWPORT_WIDTH, limits::DEFAULT_VIEWPORT_HEIGHT};
    float minViewBoxWidth = limits::MIN_VIEWPORT_WIDTH;
    float minViewBoxHeight = limits::MIN_VIEWPORT_HEIGHT;

    /// Relative change per zoom-in/zoom-out step
    float zoomStep = 0.1f;

    /// Zoom changes smaller than this are ignored
    float minZoomChange = 0.01f;

    /// Scale change per wheel delta unit
    float wheelSensitivity = 0.001f;

    /// Padding around content for fitToContent
    float fitPadding = 100.0f;

    /// Radius assumed around each node position for fitToContent
    float nodeRadius = 30.0f;

    /// Inset used when deciding whether a node is comfortably visible
    float visibilityMargin = 50.0f;
};

/// Camera state: viewBox plus zoom level
struct ViewState {
    ViewBox viewBox;
    float scale = limits::DEFAULT_SCALE;

    bool operator==(const ViewState& o) const { return viewBox == o.viewBox && scale == o.scale; }
    bool operator!=(const ViewState& o) const { return !(*this == o); }
};

/// Pan/zoom math and screen <-> world conversion
namespace viewport {

/// Clamp a scale to [minScale, maxScale]; non-finite input yields the default
float clampScale(float scale, const ViewportConfig& config = {});

/// Build a viewBox, replacing non-finite origins with 0 and enforcing
/// the minimum width and height
ViewBox createViewBox(float x, float y, float width, float height,
                      const ViewportConfig& config = {});

/// Clamp the origin to [-margin, maxPanDistance - size] per axis
/// (the lower bound wins when the range is empty)
ViewBox clampViewBox(const ViewBox& viewBox, const ViewportConfig& config = {});

/// Zoom keeping a world-space focal point fixed on screen
/// scaleFactor = scale' / scale; origin' = p - (p - origin) / scaleFactor;
/// size' = size / scaleFactor; the result is clamped.
ViewState zoomAroundPoint(const ViewState& current, const Point& focal, float targetScale,
                          const ViewportConfig& config = {});

/// One zoom-in or zoom-out step about the viewBox center.
/// Returns the current state unchanged when the step is below minZoomChange.
ViewState zoomStep(const ViewState& current, bool zoomIn, const ViewportConfig& config = {});

/// Target scale for a wheel delta (negative deltaY zooms in)
float wheelZoomTarget(float currentScale, float deltaY, const ViewportConfig& config = {});

/// Whether a zoom change is large enough to act on
bool isSignificantZoomChange(float fromScale, float toScale, const ViewportConfig& config = {});

/// world = viewBox.origin + (screen - element.origin) * (viewBox.size / element.size)
Point screenToWorld(const Point& screen, const ViewBox& viewBox, const Rect& element);

/// Inverse of screenToWorld
Point worldToScreen(const Point& world, const ViewBox& viewBox, const Rect& element);

/// Pan by a world-space delta, clamped
ViewBox panBy(const ViewBox& viewBox, float dx, float dy, const ViewportConfig& config = {});

/// Pan following a pointer drag of (dx, dy) screen pixels, clamped
ViewBox panByScreenDelta(const ViewBox& viewBox, float dx, float dy, const Rect& element,
                         const ViewportConfig& config = {});

/// View fitting all node positions (each padded by nodeRadius and fitPadding).
/// An empty canvas yields the default view.
ViewState fitToContent(const std::vector<Point>& nodePositions, const ViewState& current,
                       const ViewportConfig& config = {});

/// Whether a world point lies inside the viewBox inset by visibilityMargin
bool isPointVisible(const Point& point, const ViewBox& viewBox, const ViewportConfig& config = {});

/// ViewBox centered on a point, same size, clamped
ViewBox centerOn(const ViewBox& viewBox, const Point& point, const ViewportConfig& config = {});

}  // namespace viewport

}  // namespace flowcanvas
