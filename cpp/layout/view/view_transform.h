#pragma once

#include "layout/core/types.h"
#include "layout/core/layout_constants.h"

namespace layout {

enum class ZoomDirection : std::uint8_t { In = 0, Out = 1 };

struct ViewLimits {
    double zoomStep = constants::ZOOM_STEP_FACTOR;
    double minScale = constants::MIN_VIEW_SCALE;
    double maxScale = constants::MAX_VIEW_SCALE;
};

struct ViewTransformState {
    double scale{1.0};
    double offsetX{0.0};
    double offsetY{0.0};
};

// Screen <-> world mapping: screen = world * scale + offset.
// Ephemeral view state; never part of project history.
class ViewTransform {
public:
    ViewTransform() = default;
    explicit ViewTransform(const ViewLimits& limits);

    void panBy(double dx, double dy) noexcept;

    // Multiplies (In) or divides (Out) the scale by the zoom step, clamps it, and
    // keeps the world point under screenPoint fixed on screen.
    void zoomAt(const Point2& screenPoint, ZoomDirection direction) noexcept;

    // Double-click zoom: 1.5, or back to 1.0 when already at 1.5.
    void toggleZoomAt(const Point2& screenPoint) noexcept;

    // Sets an absolute (clamped) scale around a fixed screen point.
    void setScaleAt(const Point2& screenPoint, double newScale) noexcept;

    void reset() noexcept { state_ = ViewTransformState{}; }
    void setState(const ViewTransformState& state) noexcept;

    Point2 screenToWorld(const Point2& screen) const noexcept;
    Point2 worldToScreen(const Point2& world) const noexcept;
    Rect2 screenRectToWorld(const Rect2& screen) const noexcept;

    const ViewTransformState& state() const noexcept { return state_; }
    double scale() const noexcept { return state_.scale; }
    const ViewLimits& limits() const noexcept { return limits_; }

private:
    double clampScale(double s) const noexcept;

    ViewLimits limits_{};
    ViewTransformState state_{};
};

} // namespace layout
