#include "layout/model/furniture_summary.h"
#include "layout/core/string_utils.h"

#include <algorithm>
#include <map>

namespace layout {

std::vector<UnplacedSummaryEntry> unplacedSummary(const Project& project) {
    std::map<std::string, UnplacedSummaryEntry> byName;
    for (const auto& item : project.furniture) {
        if (item.isPlaced()) continue;
        auto it = byName.find(item.name);
        if (it == byName.end()) {
            it = byName.emplace(item.name, UnplacedSummaryEntry{item.name, item, 0}).first;
        }
        it->second.quantity += 1;
    }

    std::vector<UnplacedSummaryEntry> out;
    out.reserve(byName.size());
    for (auto& kv : byName) out.push_back(std::move(kv.second));
    std::sort(out.begin(), out.end(), [](const UnplacedSummaryEntry& a, const UnplacedSummaryEntry& b) {
        return nameLess(a.name, b.name);
    });
    return out;
}

std::vector<PlacedSummaryEntry> placedSummary(const Project& project) {
    std::map<std::string, PlacedSummaryEntry> byName;
    for (const auto& item : project.furniture) {
        auto it = byName.find(item.name);
        if (it == byName.end()) {
            it = byName.emplace(item.name, PlacedSummaryEntry{item.name, 0, 0, item.color}).first;
        }
        if (item.isPlaced()) {
            it->second.placed += 1;
        } else {
            it->second.unplaced += 1;
        }
    }

    std::vector<PlacedSummaryEntry> out;
    out.reserve(byName.size());
    for (auto& kv : byName) {
        if (kv.second.placed == 0) continue;
        out.push_back(std::move(kv.second));
    }
    std::sort(out.begin(), out.end(), [](const PlacedSummaryEntry& a, const PlacedSummaryEntry& b) {
        return nameLess(a.name, b.name);
    });
    return out;
}

} // namespace layout
