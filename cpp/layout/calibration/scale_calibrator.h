#pragma once

#include "layout/core/types.h"

#include <optional>
#include <string_view>

namespace layout {

class ViewTransform;

// Reference square shown after a successful calibration, in world units.
struct ReferenceSquare {
    double x;
    double y;
    double size;
};

// Two-click reference line followed by an operator-supplied real length.
//
//   begin() -> click(start) -> click(end) -> commit(lengthCm)
//
// A rejected commit leaves the phase open so the operator can retry. Further clicks
// while awaiting the length move the end point.
class ScaleCalibrator {
public:
    enum class Phase : std::uint8_t { Inactive = 0, AwaitingStart = 1, AwaitingEnd = 2, AwaitingLength = 3 };

    void begin() noexcept;
    void cancel() noexcept;

    Phase phase() const noexcept { return phase_; }
    bool isActive() const noexcept { return phase_ != Phase::Inactive; }

    // Records the start point, then the end point. Returns the new phase.
    Phase click(const Point2& world) noexcept;
    Phase clickAt(const Point2& screen, const ViewTransform& view) noexcept;

    // pixelLength / realLengthCm. On success the phase closes and outScale is set.
    LayoutError commit(std::optional<double> realLengthCm, double& outScale) noexcept;
    // Operator text input; anything that is not a complete number is rejected.
    LayoutError commitText(std::string_view text, double& outScale) noexcept;

    const std::optional<Point2>& start() const noexcept { return start_; }
    const std::optional<Point2>& end() const noexcept { return end_; }
    std::optional<double> pixelLength() const noexcept { return pixelLength_; }

    const std::optional<ReferenceSquare>& referenceSquare() const noexcept { return reference_; }
    void clearReferenceSquare() noexcept { reference_.reset(); }

private:
    Phase phase_{Phase::Inactive};
    std::optional<Point2> start_;
    std::optional<Point2> end_;
    std::optional<double> pixelLength_;
    std::optional<ReferenceSquare> reference_;
};

} // namespace layout
