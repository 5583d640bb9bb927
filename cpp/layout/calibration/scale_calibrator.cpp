#include "layout/calibration/scale_calibrator.h"
#include "layout/core/layout_constants.h"
#include "layout/core/logging.h"
#include "layout/core/string_utils.h"
#include "layout/view/view_transform.h"

#include <cmath>
#include <cstdlib>
#include <string>

namespace layout {

void ScaleCalibrator::begin() noexcept {
    phase_ = Phase::AwaitingStart;
    start_.reset();
    end_.reset();
    pixelLength_.reset();
    reference_.reset();
}

void ScaleCalibrator::cancel() noexcept {
    phase_ = Phase::Inactive;
    start_.reset();
    end_.reset();
    pixelLength_.reset();
}

ScaleCalibrator::Phase ScaleCalibrator::click(const Point2& world) noexcept {
    switch (phase_) {
        case Phase::Inactive:
            break;
        case Phase::AwaitingStart:
            start_ = world;
            phase_ = Phase::AwaitingEnd;
            break;
        case Phase::AwaitingEnd:
        case Phase::AwaitingLength: {
            end_ = world;
            const double dx = world.x - start_->x;
            const double dy = world.y - start_->y;
            pixelLength_ = std::sqrt(dx * dx + dy * dy);
            phase_ = Phase::AwaitingLength;
            break;
        }
    }
    return phase_;
}

ScaleCalibrator::Phase ScaleCalibrator::clickAt(const Point2& screen, const ViewTransform& view) noexcept {
    return click(view.screenToWorld(screen));
}

LayoutError ScaleCalibrator::commit(std::optional<double> realLengthCm, double& outScale) noexcept {
    if (phase_ != Phase::AwaitingLength || !pixelLength_ || !start_) {
        return LayoutError::InvalidOperation;
    }
    if (!realLengthCm || !std::isfinite(*realLengthCm) || *realLengthCm <= 0.0) {
        LAYOUT_LOG_WARN("calibration: rejected real length");
        return LayoutError::InvalidCalibrationInput;
    }
    const double scale = *pixelLength_ / *realLengthCm;
    if (!std::isfinite(scale) || scale <= 0.0) {
        // Zero-length reference line; a zero scale would break the project invariant.
        LAYOUT_LOG_WARN("calibration: degenerate reference line");
        return LayoutError::InvalidCalibrationInput;
    }

    outScale = scale;
    reference_ = ReferenceSquare{start_->x, start_->y, constants::REFERENCE_SQUARE_CM * scale};
    phase_ = Phase::Inactive;
    start_.reset();
    end_.reset();
    pixelLength_.reset();
    LAYOUT_LOG_DEBUG("calibration: scale %.6f px/cm", scale);
    return LayoutError::Ok;
}

LayoutError ScaleCalibrator::commitText(std::string_view text, double& outScale) noexcept {
    const std::string trimmed = trimCopy(text);
    if (trimmed.empty()) {
        return commit(std::nullopt, outScale);
    }
    char* endPtr = nullptr;
    const double value = std::strtod(trimmed.c_str(), &endPtr);
    if (endPtr == nullptr || *endPtr != '\0') {
        return commit(std::nullopt, outScale);
    }
    return commit(value, outScale);
}

} // namespace layout
