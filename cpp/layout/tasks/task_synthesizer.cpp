#include "layout/tasks/task_synthesizer.h"

#include <cmath>
#include <string>
#include <utility>

namespace layout {

namespace {

std::string describePlacement(const FurnitureItem& item) {
    const Point2 p = *item.position;
    std::string out = "Install " + item.name + " at position (";
    out += std::to_string(static_cast<long long>(std::llround(p.x)));
    out += ", ";
    out += std::to_string(static_cast<long long>(std::llround(p.y)));
    out += ")";
    if (!item.roomZone.empty()) {
        out += " in ";
        out += item.roomZone;
    }
    return out;
}

} // namespace

std::string taskIdForItem(const std::string& furnitureId) {
    return "task_" + furnitureId;
}

std::vector<InstallationTask> synthesizeTasks(const Project& project, const SynthesisOptions& options) {
    const std::optional<std::string> jobRef = options.jobRef ? options.jobRef : project.jobRef;

    std::vector<InstallationTask> tasks;
    tasks.reserve(project.furniture.size());

    std::uint32_t placedIndex = 0;
    for (const auto& item : project.furniture) {
        if (!item.isPlaced()) continue;

        InstallationTask task;
        task.id = taskIdForItem(item.id);
        task.jobRef = jobRef;
        task.title = "Install " + item.name;
        task.description = describePlacement(item);
        task.installOrder = item.installOrder.value_or(placedIndex + 1);
        task.roomZone = item.roomZone;
        task.furnitureIds.push_back(item.id);
        task.estimatedMinutes = item.estimatedMinutes.value_or(options.defaultMinutes);
        if (!tasks.empty()) {
            task.dependencies.push_back(tasks.back().id);
        }
        tasks.push_back(std::move(task));
        ++placedIndex;
    }
    return tasks;
}

} // namespace layout
