#pragma once

#include "layout/model/project.h"

#include <cstdint>
#include <string>
#include <vector>

namespace layout {

// One row per item name among unplaced items. The first unplaced item of that name
// is kept as the representative (used to start a placement session).
struct UnplacedSummaryEntry {
    std::string name;
    FurnitureItem representative;
    std::uint32_t quantity{0};
};

// One row per item name with at least one placed item.
struct PlacedSummaryEntry {
    std::string name;
    std::uint32_t placed{0};
    std::uint32_t unplaced{0};
    std::string color;
};

std::vector<UnplacedSummaryEntry> unplacedSummary(const Project& project);
std::vector<PlacedSummaryEntry> placedSummary(const Project& project);

} // namespace layout
