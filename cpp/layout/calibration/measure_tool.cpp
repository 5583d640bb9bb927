#include "layout/calibration/measure_tool.h"

#include <cmath>
#include <cstdio>

namespace layout {

std::string formatMetres(double centimetres) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.2fm", centimetres / 100.0);
    return std::string(buf);
}

void MeasureTool::begin() noexcept {
    active_ = true;
    start_.reset();
    last_.reset();
}

void MeasureTool::cancel() noexcept {
    active_ = false;
    start_.reset();
}

std::optional<MeasureLine> MeasureTool::click(const Point2& world, std::optional<double> scale) {
    if (!active_) return std::nullopt;
    if (!start_) {
        start_ = world;
        last_.reset();
        return std::nullopt;
    }

    const double dx = world.x - start_->x;
    const double dy = world.y - start_->y;
    const double pixels = std::sqrt(dx * dx + dy * dy);
    const double pxPerCm = (scale && *scale > 0.0) ? *scale : 1.0;
    const double cm = pixels / pxPerCm;

    last_ = MeasureLine{start_->x, start_->y, world.x, world.y, cm, formatMetres(cm)};
    active_ = false;
    start_.reset();
    return last_;
}

} // namespace layout
