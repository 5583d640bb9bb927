#pragma once

#include "layout/core/types.h"
#include "layout/model/project.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace layout {

enum class HistoryChange : std::uint8_t {
    Commit = 0,
    LiveUpdate = 1,
    Undo = 2,
    Redo = 3,
    Reset = 4,
};

// Linear undo/redo over full project snapshots.
//
// entries_[cursor_] is the current project; cursor_ is always in [0, size - 1].
// Committing after an undo discards every entry after the cursor. There is exactly
// one listener notification per state change, delivered synchronously before the
// mutating call returns.
class ProjectHistory {
public:
    using Listener = std::function<void(const Project&, HistoryChange)>;

    // Throws std::invalid_argument if the initial snapshot is structurally invalid.
    explicit ProjectHistory(Project initial);

    void setListener(Listener listener) { listener_ = std::move(listener); }

    LayoutError commit(Project next);
    LayoutError liveUpdate(Project next);

    // HistoryBoundary at the respective end; the stored sequence is never touched.
    LayoutError undo();
    LayoutError redo();

    bool canUndo() const noexcept { return cursor_ > 0; }
    bool canRedo() const noexcept { return cursor_ + 1 < entries_.size(); }

    // Replaces the whole history with a single entry. Throws like the constructor.
    void reset(Project initial);

    const Project& current() const noexcept { return entries_[cursor_]; }
    const Project& entryAt(std::size_t index) const { return entries_.at(index); }
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t cursor() const noexcept { return cursor_; }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    void notify(HistoryChange change);

    std::vector<Project> entries_;
    std::size_t cursor_ = 0;
    std::uint32_t generation_ = 0;
    Listener listener_;
};

} // namespace layout
