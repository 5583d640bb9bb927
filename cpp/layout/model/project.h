#pragma once

#include "layout/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace layout {

// A furniture item. "Placed" means position is set; there is no partial placement.
struct FurnitureItem {
    std::string id;
    std::string name;
    std::optional<std::string> productCode;
    double widthCm{0.0};
    double depthCm{0.0};
    std::optional<Point2> position;
    double rotation{0.0}; // degrees
    std::string roomZone;
    std::string color;
    std::optional<std::uint32_t> installOrder;
    std::optional<std::string> groupId;
    std::optional<std::string> stackId;
    std::optional<std::uint32_t> lineNumber;
    std::optional<std::uint32_t> estimatedMinutes;

    bool isPlaced() const noexcept { return position.has_value(); }
};

// FurnitureItem minus identity and position; what a placement session stamps out.
struct ItemTemplate {
    std::string name;
    std::optional<std::string> productCode;
    double widthCm{0.0};
    double depthCm{0.0};
    std::string roomZone;
    std::string color;
    std::optional<std::uint32_t> installOrder;
    std::optional<std::uint32_t> lineNumber;
    std::optional<std::uint32_t> estimatedMinutes;
};

struct Project {
    std::string id;
    std::string name;
    std::string createdAt; // ISO-8601, supplied by the caller
    std::optional<std::string> jobRef;
    std::optional<std::string> floorPlanRef;
    std::optional<double> floorPlanWidth;
    std::optional<double> floorPlanHeight;
    std::vector<FurnitureItem> furniture;
    std::optional<double> scale; // pixels per centimetre
};

struct ValidationResult {
    LayoutError error{LayoutError::Ok};
    std::string message;

    bool ok() const noexcept { return error == LayoutError::Ok; }
};

// Structural checks applied to every snapshot before it enters history.
ValidationResult validateProject(const Project& project);

ItemTemplate templateFromItem(const FurnitureItem& item);
FurnitureItem itemFromTemplate(const ItemTemplate& tpl, std::string id, const Point2& position);

// World-space box of a placed item: width_cm * scale by depth_cm * scale anchored at
// its position. A missing scale counts as 0.
Rect2 itemBounds(const FurnitureItem& item, std::optional<double> scale);
double itemArea(const FurnitureItem& item, std::optional<double> scale);

const FurnitureItem* findItem(const Project& project, const std::string& id);
FurnitureItem* findItem(Project& project, const std::string& id);

// 64-bit FNV-1a digest over every persisted field.
std::uint64_t projectDigest(const Project& project);

} // namespace layout
