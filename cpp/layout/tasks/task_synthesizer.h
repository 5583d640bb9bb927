#pragma once

#include "layout/core/layout_constants.h"
#include "layout/model/project.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace layout {

// Derived from one placed FurnitureItem. Never edited by hand; regenerate instead.
struct InstallationTask {
    std::string id;             // "task_<furniture id>"
    std::optional<std::string> jobRef;
    std::string title;
    std::string description;
    std::uint32_t installOrder{0};
    std::string roomZone;
    std::vector<std::string> furnitureIds;
    std::uint32_t estimatedMinutes{0};
    std::vector<std::string> dependencies; // prerequisite task ids
    bool isGenerated{true};
};

struct SynthesisOptions {
    std::uint32_t defaultMinutes = constants::DEFAULT_TASK_MINUTES;
    // Stamped on every task; falls back to the project's own job reference.
    std::optional<std::string> jobRef;
};

std::string taskIdForItem(const std::string& furnitureId);

// Pure derivation over placed items in array order. Tasks form a strict linear chain:
// the first has no dependencies, every later one depends on its predecessor.
std::vector<InstallationTask> synthesizeTasks(const Project& project, const SynthesisOptions& options = {});

class TaskSynthesizer {
public:
    TaskSynthesizer() = default;
    explicit TaskSynthesizer(SynthesisOptions options) : options_(std::move(options)) {}

    std::vector<InstallationTask> synthesize(const Project& project) const {
        return synthesizeTasks(project, options_);
    }

    const SynthesisOptions& options() const noexcept { return options_; }
    void setJobRef(std::optional<std::string> jobRef) { options_.jobRef = std::move(jobRef); }

private:
    SynthesisOptions options_{};
};

} // namespace layout
