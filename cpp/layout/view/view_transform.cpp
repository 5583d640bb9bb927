#include "layout/view/view_transform.h"

#include <algorithm>
#include <cmath>

namespace layout {

ViewTransform::ViewTransform(const ViewLimits& limits)
    : limits_(limits) {}

double ViewTransform::clampScale(double s) const noexcept {
    return std::max(limits_.minScale, std::min(s, limits_.maxScale));
}

void ViewTransform::panBy(double dx, double dy) noexcept {
    state_.offsetX += dx;
    state_.offsetY += dy;
}

void ViewTransform::setScaleAt(const Point2& screenPoint, double newScale) noexcept {
    const double oldScale = state_.scale;
    const double clamped = clampScale(newScale);
    const double ratio = clamped / oldScale;
    state_.offsetX = screenPoint.x - (screenPoint.x - state_.offsetX) * ratio;
    state_.offsetY = screenPoint.y - (screenPoint.y - state_.offsetY) * ratio;
    state_.scale = clamped;
}

void ViewTransform::zoomAt(const Point2& screenPoint, ZoomDirection direction) noexcept {
    const double next = direction == ZoomDirection::In
        ? state_.scale * limits_.zoomStep
        : state_.scale / limits_.zoomStep;
    setScaleAt(screenPoint, next);
}

void ViewTransform::toggleZoomAt(const Point2& screenPoint) noexcept {
    const bool atTarget = std::abs(state_.scale - constants::DOUBLE_CLICK_ZOOM) < constants::DOUBLE_CLICK_ZOOM_EPSILON;
    setScaleAt(screenPoint, atTarget ? 1.0 : constants::DOUBLE_CLICK_ZOOM);
}

void ViewTransform::setState(const ViewTransformState& state) noexcept {
    state_ = state;
    state_.scale = clampScale(state.scale);
}

Point2 ViewTransform::screenToWorld(const Point2& screen) const noexcept {
    return Point2{
        (screen.x - state_.offsetX) / state_.scale,
        (screen.y - state_.offsetY) / state_.scale,
    };
}

Point2 ViewTransform::worldToScreen(const Point2& world) const noexcept {
    return Point2{
        world.x * state_.scale + state_.offsetX,
        world.y * state_.scale + state_.offsetY,
    };
}

Rect2 ViewTransform::screenRectToWorld(const Rect2& screen) const noexcept {
    return normalizedRect(
        screenToWorld(Point2{screen.minX, screen.minY}),
        screenToWorld(Point2{screen.maxX, screen.maxY}));
}

} // namespace layout
