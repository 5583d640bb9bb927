#include "layout/selection/selection_engine.h"
#include "layout/core/logging.h"
#include "layout/view/view_transform.h"

#include <algorithm>

namespace layout {

SelectionInfo classifySelection(const std::vector<FurnitureItem>& furniture,
                                const std::unordered_set<std::string>& selected) {
    SelectionInfo info;
    std::vector<const FurnitureItem*> selection;
    for (const auto& item : furniture) {
        if (selected.find(item.id) != selected.end()) selection.push_back(&item);
    }
    info.count = selection.size();
    if (selection.empty()) return info;

    info.isGroup = std::any_of(selection.begin(), selection.end(),
        [](const FurnitureItem* f) { return f->groupId.has_value(); });
    info.canGroup = selection.size() > 1 && !info.isGroup;

    const std::optional<std::string>& firstStack = selection.front()->stackId;
    info.isStack = firstStack.has_value() && !firstStack->empty()
        && std::all_of(selection.begin(), selection.end(),
            [&](const FurnitureItem* f) { return f->stackId == firstStack; });

    if (info.isStack) {
        const auto members = std::count_if(furniture.begin(), furniture.end(),
            [&](const FurnitureItem& f) { return f.stackId == firstStack; });
        info.isSingleStackSelected = static_cast<std::size_t>(members) == selection.size();
    }

    info.canStack = selection.size() > 1 && !info.isStack;
    return info;
}

LayoutError SelectionEngine::setSelection(const std::vector<std::string>& ids, Mode mode, const Project& project) {
    bool changed = false;
    bool unknown = false;

    if (mode == Mode::Replace && !set_.empty()) {
        set_.clear();
        changed = true;
    }

    for (const auto& id : ids) {
        if (!findItem(project, id)) {
            LAYOUT_LOG_DEBUG("selection: unknown identity '%s'", id.c_str());
            unknown = true;
            continue;
        }
        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                if (set_.insert(id).second) changed = true;
                break;
            case Mode::Remove:
                if (set_.erase(id) > 0) changed = true;
                break;
            case Mode::Toggle:
                if (set_.erase(id) == 0) set_.insert(id);
                changed = true;
                break;
        }
    }

    if (changed) {
        rebuildOrder(project);
        generation_++;
    }
    return unknown ? LayoutError::UnknownIdentity : LayoutError::Ok;
}

void SelectionEngine::clear() {
    if (set_.empty()) return;
    set_.clear();
    ordered_.clear();
    generation_++;
}

std::vector<std::string> SelectionEngine::queryMarquee(const Rect2& worldRect, const Project& project) {
    std::vector<std::string> out;
    for (const auto& item : project.furniture) {
        if (!item.isPlaced()) continue;
        if (rectsOverlap(itemBounds(item, project.scale), worldRect)) {
            out.push_back(item.id);
        }
    }
    return out;
}

const std::vector<std::string>& SelectionEngine::marqueeSelect(const Rect2& screenRect, const ViewTransform& view,
                                                                const Project& project, Mode mode) {
    const Rect2 world = view.screenRectToWorld(screenRect);
    const std::vector<std::string> hits = queryMarquee(world, project);
    if (hits.empty()) {
        if (mode == Mode::Replace) clear();
        return ordered_;
    }
    setSelection(hits, mode, project);
    return ordered_;
}

LayoutError SelectionEngine::selectItem(const std::string& id, bool multi, const Project& project) {
    const FurnitureItem* item = findItem(project, id);
    if (!item) return LayoutError::UnknownIdentity;

    if (item->stackId && !multi) {
        std::vector<std::string> members;
        for (const auto& f : project.furniture) {
            if (f.stackId == item->stackId) members.push_back(f.id);
        }
        return setSelection(members, Mode::Replace, project);
    }
    return setSelection({id}, multi ? Mode::Toggle : Mode::Replace, project);
}

const FurnitureItem* SelectionEngine::pickItem(const Point2& world, const Project& project) {
    for (auto it = project.furniture.rbegin(); it != project.furniture.rend(); ++it) {
        if (!it->isPlaced()) continue;
        if (rectContains(itemBounds(*it, project.scale), world)) return &*it;
    }
    return nullptr;
}

void SelectionEngine::prune(const Project& project) {
    bool changed = false;
    for (auto it = set_.begin(); it != set_.end();) {
        if (!findItem(project, *it)) {
            it = set_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    if (changed) {
        rebuildOrder(project);
        generation_++;
    }
}

void SelectionEngine::rebuildOrder(const Project& project) {
    ordered_.clear();
    ordered_.reserve(set_.size());
    // Array order of the furniture list, like the draw order of the canvas.
    for (const auto& item : project.furniture) {
        if (set_.find(item.id) != set_.end()) ordered_.push_back(item.id);
    }
}

} // namespace layout
