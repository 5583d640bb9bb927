#ifndef LAYOUT_PROJECT_SNAPSHOT_H
#define LAYOUT_PROJECT_SNAPSHOT_H

#include "layout/core/types.h"
#include "layout/model/project.h"
#include "layout/view/view_transform.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace layout {

// Everything a saved project file carries. PROJ and FURN are required; the view
// and selection sections are optional.
struct ProjectSnapshotData {
    std::uint32_t version{snapshotVersionFpsn};
    Project project;
    std::optional<ViewTransformState> view;
    std::vector<std::string> selection;
};

// Parses and validates an FPSN buffer. On failure `out` is left in an unspecified
// state and must not be used.
LayoutError parseProjectSnapshot(const std::uint8_t* src, std::uint32_t byteCount, ProjectSnapshotData& out);

std::vector<std::uint8_t> buildProjectSnapshotBytes(const ProjectSnapshotData& data);

} // namespace layout

#endif // LAYOUT_PROJECT_SNAPSHOT_H
