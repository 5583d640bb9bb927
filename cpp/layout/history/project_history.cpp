#include "layout/history/project_history.h"
#include "layout/core/logging.h"

#include <stdexcept>
#include <utility>

namespace layout {

namespace {

void requireValid(const Project& project) {
    const ValidationResult result = validateProject(project);
    if (!result.ok()) {
        throw std::invalid_argument("invalid project snapshot: " + result.message);
    }
}

} // namespace

ProjectHistory::ProjectHistory(Project initial) {
    requireValid(initial);
    entries_.push_back(std::move(initial));
}

void ProjectHistory::reset(Project initial) {
    requireValid(initial);
    entries_.clear();
    entries_.push_back(std::move(initial));
    cursor_ = 0;
    generation_++;
    notify(HistoryChange::Reset);
}

LayoutError ProjectHistory::commit(Project next) {
    const ValidationResult result = validateProject(next);
    if (!result.ok()) {
        LAYOUT_LOG_WARN("history: commit rejected (%s)", result.message.c_str());
        return result.error;
    }
    if (cursor_ + 1 < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1), entries_.end());
    }
    entries_.push_back(std::move(next));
    cursor_ = entries_.size() - 1;
    generation_++;
    notify(HistoryChange::Commit);
    return LayoutError::Ok;
}

LayoutError ProjectHistory::liveUpdate(Project next) {
    const ValidationResult result = validateProject(next);
    if (!result.ok()) {
        LAYOUT_LOG_WARN("history: live update rejected (%s)", result.message.c_str());
        return result.error;
    }
    entries_[cursor_] = std::move(next);
    generation_++;
    notify(HistoryChange::LiveUpdate);
    return LayoutError::Ok;
}

LayoutError ProjectHistory::undo() {
    if (!canUndo()) return LayoutError::HistoryBoundary;
    cursor_--;
    generation_++;
    notify(HistoryChange::Undo);
    return LayoutError::Ok;
}

LayoutError ProjectHistory::redo() {
    if (!canRedo()) return LayoutError::HistoryBoundary;
    cursor_++;
    generation_++;
    notify(HistoryChange::Redo);
    return LayoutError::Ok;
}

void ProjectHistory::notify(HistoryChange change) {
    if (listener_) listener_(entries_[cursor_], change);
}

} // namespace layout
