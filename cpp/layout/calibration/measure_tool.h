#pragma once

#include "layout/core/types.h"

#include <optional>
#include <string>

namespace layout {

struct MeasureLine {
    double x1;
    double y1;
    double x2;
    double y2;
    double lengthCm;
    std::string label; // metres, two decimals, e.g. "2.35m"
};

// One-shot distance measurement: two clicks, then the tool closes.
class MeasureTool {
public:
    void begin() noexcept;
    void cancel() noexcept;
    bool isActive() const noexcept { return active_; }

    // First click stores the start point and returns nullopt. The second click returns
    // the finished line and closes the tool. A missing scale counts as 1 px/cm.
    std::optional<MeasureLine> click(const Point2& world, std::optional<double> scale);

    const std::optional<Point2>& start() const noexcept { return start_; }
    const std::optional<MeasureLine>& lastLine() const noexcept { return last_; }
    void clearLine() noexcept { last_.reset(); }

private:
    bool active_{false};
    std::optional<Point2> start_;
    std::optional<MeasureLine> last_;
};

std::string formatMetres(double centimetres);

} // namespace layout
