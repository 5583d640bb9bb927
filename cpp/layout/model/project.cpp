#include "layout/model/project.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace layout {

namespace {

bool isFinitePositive(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

ValidationResult validateProject(const Project& project) {
    if (project.scale && !isFinitePositive(*project.scale)) {
        return {LayoutError::InvalidSnapshot, "project scale must be a positive number when present"};
    }
    if (project.floorPlanWidth && !isFinitePositive(*project.floorPlanWidth)) {
        return {LayoutError::InvalidSnapshot, "floor plan width must be positive when present"};
    }
    if (project.floorPlanHeight && !isFinitePositive(*project.floorPlanHeight)) {
        return {LayoutError::InvalidSnapshot, "floor plan height must be positive when present"};
    }

    std::unordered_set<std::string> seen;
    seen.reserve(project.furniture.size());
    for (const auto& item : project.furniture) {
        if (item.id.empty()) {
            return {LayoutError::InvalidSnapshot, "furniture item without identity"};
        }
        if (!seen.insert(item.id).second) {
            return {LayoutError::InvalidSnapshot, "duplicate furniture identity '" + item.id + "'"};
        }
        if (item.position && (!std::isfinite(item.position->x) || !std::isfinite(item.position->y))) {
            return {LayoutError::InvalidSnapshot, "item '" + item.id + "' has a non-finite position"};
        }
        if (!std::isfinite(item.widthCm) || !std::isfinite(item.depthCm) || item.widthCm < 0.0 || item.depthCm < 0.0) {
            return {LayoutError::InvalidSnapshot, "item '" + item.id + "' has invalid dimensions"};
        }
        if (item.installOrder && *item.installOrder == 0) {
            return {LayoutError::InvalidSnapshot, "item '" + item.id + "' install order must be positive"};
        }
        if (item.stackId && item.stackId->empty()) {
            return {LayoutError::InvalidSnapshot, "item '" + item.id + "' has an empty stack identity"};
        }
        if (item.groupId && item.groupId->empty()) {
            return {LayoutError::InvalidSnapshot, "item '" + item.id + "' has an empty group identity"};
        }
    }
    return {};
}

ItemTemplate templateFromItem(const FurnitureItem& item) {
    ItemTemplate tpl;
    tpl.name = item.name;
    tpl.productCode = item.productCode;
    tpl.widthCm = item.widthCm;
    tpl.depthCm = item.depthCm;
    tpl.roomZone = item.roomZone;
    tpl.color = item.color;
    tpl.installOrder = item.installOrder;
    tpl.lineNumber = item.lineNumber;
    tpl.estimatedMinutes = item.estimatedMinutes;
    return tpl;
}

FurnitureItem itemFromTemplate(const ItemTemplate& tpl, std::string id, const Point2& position) {
    FurnitureItem item;
    item.id = std::move(id);
    item.name = tpl.name;
    item.productCode = tpl.productCode;
    item.widthCm = tpl.widthCm;
    item.depthCm = tpl.depthCm;
    item.position = position;
    item.rotation = 0.0;
    item.roomZone = tpl.roomZone;
    item.color = tpl.color;
    item.installOrder = tpl.installOrder;
    item.lineNumber = tpl.lineNumber;
    item.estimatedMinutes = tpl.estimatedMinutes;
    return item;
}

Rect2 itemBounds(const FurnitureItem& item, std::optional<double> scale) {
    const double s = scale.value_or(0.0);
    const Point2 p = item.position.value_or(Point2{0.0, 0.0});
    return Rect2{p.x, p.y, p.x + item.widthCm * s, p.y + item.depthCm * s};
}

double itemArea(const FurnitureItem& item, std::optional<double> scale) {
    const double s = scale.value_or(0.0);
    return (item.widthCm * s) * (item.depthCm * s);
}

const FurnitureItem* findItem(const Project& project, const std::string& id) {
    const auto it = std::find_if(project.furniture.begin(), project.furniture.end(),
        [&](const FurnitureItem& f) { return f.id == id; });
    return it == project.furniture.end() ? nullptr : &*it;
}

FurnitureItem* findItem(Project& project, const std::string& id) {
    const auto it = std::find_if(project.furniture.begin(), project.furniture.end(),
        [&](const FurnitureItem& f) { return f.id == id; });
    return it == project.furniture.end() ? nullptr : &*it;
}

} // namespace layout
