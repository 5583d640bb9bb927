// LayoutEngine load/save. Loading replaces the whole history, so every tool is closed
// and the selection starts empty (or as saved).

#include "layout/layout_engine.h"
#include "layout/core/logging.h"
#include "layout/persistence/project_snapshot.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace layout {

void LayoutEngine::loadProject(Project project) {
    // Throws before anything is touched.
    history_.reset(std::move(project));

    calibrator_.cancel();
    calibrator_.clearReferenceSquare();
    measure_.cancel();
    measure_.clearLine();
    placement_.cancel();
    selection_.clear();
    marqueeMode_ = false;
    lastError_ = LayoutError::Ok;
}

void LayoutEngine::loadSnapshot(const std::uint8_t* bytes, std::uint32_t byteCount) {
    ProjectSnapshotData data;
    const LayoutError err = parseProjectSnapshot(bytes, byteCount, data);
    if (err != LayoutError::Ok) {
        LAYOUT_LOG_WARN("snapshot: load failed (%s)", layoutErrorName(err));
        throw std::invalid_argument(std::string("invalid project snapshot: ") + layoutErrorName(err));
    }

    loadProject(std::move(data.project));
    if (data.view) {
        view_.setState(*data.view);
    } else {
        view_.reset();
    }
    if (!data.selection.empty()) {
        const LayoutError selErr = selection_.setSelection(data.selection, SelectionEngine::Mode::Replace,
                                                           history_.current());
        if (selErr != LayoutError::Ok) {
            LAYOUT_LOG_WARN("snapshot: saved selection names unknown items");
        }
    }
}

std::vector<std::uint8_t> LayoutEngine::saveSnapshot() const {
    ProjectSnapshotData data;
    data.project = history_.current();
    data.view = view_.state();
    data.selection = selection_.ids();
    return buildProjectSnapshotBytes(data);
}

} // namespace layout
