#include "layout/core/id_generator.h"
#include "layout/core/util.h"

#include <cmath>
#include <utility>

namespace layout {

IdGenerator::IdGenerator()
    : clock_([] { return emscripten_get_now(); }) {}

IdGenerator::IdGenerator(Clock clock)
    : clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return emscripten_get_now(); };
}

std::string IdGenerator::next(const char* prefix) {
    const double now = clock_();
    const auto stamp = static_cast<std::uint64_t>(std::llround(now < 0.0 ? 0.0 : now));
    ++counter_;
    std::string id(prefix ? prefix : "id");
    id += '_';
    id += std::to_string(stamp);
    id += '_';
    id += std::to_string(counter_);
    return id;
}

} // namespace layout
