#pragma once

#include "layout/core/types.h"
#include "layout/model/project.h"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace layout {

class ViewTransform;

// Grouping/stacking classification of a selection. Pure function of the furniture
// list and the selected identities.
struct SelectionInfo {
    std::size_t count{0};
    bool canGroup{false};
    bool isGroup{false};   // at least one selected item already belongs to a group
    bool canStack{false};
    bool isStack{false};   // every selected item shares one non-empty stack identity
    bool isSingleStackSelected{false}; // selection equals all members of that stack
};

SelectionInfo classifySelection(const std::vector<FurnitureItem>& furniture,
                                const std::unordered_set<std::string>& selected);

class SelectionEngine {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    // Identities absent from the project are skipped; UnknownIdentity is returned after
    // the rest of the batch has been applied.
    LayoutError setSelection(const std::vector<std::string>& ids, Mode mode, const Project& project);
    void clear();

    // Converts the screen rectangle to world space and selects every placed item whose
    // box overlaps it (open intervals). Replace mode is what the marquee gesture uses.
    const std::vector<std::string>& marqueeSelect(const Rect2& screenRect, const ViewTransform& view,
                                                   const Project& project, Mode mode = Mode::Replace);

    // Single click. Without multi, clicking a stack member selects the whole stack.
    // With multi, the item is toggled.
    LayoutError selectItem(const std::string& id, bool multi, const Project& project);

    // Drops identities no longer present (after undo, delete or reload).
    void prune(const Project& project);

    SelectionInfo info(const Project& project) const {
        return classifySelection(project.furniture, set_);
    }

    static std::vector<std::string> queryMarquee(const Rect2& worldRect, const Project& project);
    // Top-most (last in array order) placed item whose box contains the point.
    static const FurnitureItem* pickItem(const Point2& world, const Project& project);

    const std::vector<std::string>& ids() const noexcept { return ordered_; }
    const std::unordered_set<std::string>& set() const noexcept { return set_; }
    bool isSelected(const std::string& id) const { return set_.find(id) != set_.end(); }
    bool isEmpty() const noexcept { return set_.empty(); }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    void rebuildOrder(const Project& project);

    std::unordered_set<std::string> set_;
    std::vector<std::string> ordered_;
    std::uint32_t generation_ = 0;
};

} // namespace layout
