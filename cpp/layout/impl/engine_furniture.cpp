// LayoutEngine furniture operations and product import. Every operation builds the
// next snapshot from a copy of the current one and commits it in a single step.

#include "layout/layout_engine.h"
#include "layout/core/layout_constants.h"
#include "layout/core/logging.h"
#include "layout/core/string_utils.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace layout {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Moves the item and, when it is stacked, every other member of its stack.
void moveWithStack(Project& project, const std::string& id, const Point2& position) {
    const FurnitureItem* item = findItem(project, id);
    if (!item) return;
    const std::optional<std::string> stack = item->stackId;
    for (auto& f : project.furniture) {
        if (f.id == id || (stack && f.stackId == stack)) f.position = position;
    }
}

struct PlacedBox {
    std::string id;
    Rect2 bounds;
    double w;
    double h;
};

std::vector<PlacedBox> boxesFor(const std::vector<const FurnitureItem*>& items, std::optional<double> scale) {
    std::vector<PlacedBox> out;
    out.reserve(items.size());
    for (const FurnitureItem* item : items) {
        const Rect2 b = itemBounds(*item, scale);
        out.push_back(PlacedBox{item->id, b, b.maxX - b.minX, b.maxY - b.minY});
    }
    return out;
}

// First item with the largest footprint.
std::size_t largestIndex(const std::vector<PlacedBox>& boxes) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < boxes.size(); ++i) {
        if (boxes[i].w * boxes[i].h > boxes[best].w * boxes[best].h) best = i;
    }
    return best;
}

} // namespace

LayoutError LayoutEngine::moveItemLive(const std::string& id, const Point2& position) {
    Project next = history_.current();
    if (!findItem(next, id)) return setError(LayoutError::UnknownIdentity);
    moveWithStack(next, id, position);
    return setError(history_.liveUpdate(std::move(next)));
}

LayoutError LayoutEngine::commitItemUpdate(const std::string& id, const ItemPatch& patch) {
    Project next = history_.current();
    FurnitureItem* item = findItem(next, id);
    if (!item) return setError(LayoutError::UnknownIdentity);

    if (patch.rotation) item->rotation = *patch.rotation;
    if (patch.name) item->name = *patch.name;
    if (patch.roomZone) item->roomZone = *patch.roomZone;
    if (patch.color) item->color = *patch.color;
    if (patch.installOrder) item->installOrder = *patch.installOrder;
    if (patch.estimatedMinutes) item->estimatedMinutes = *patch.estimatedMinutes;
    if (patch.position) moveWithStack(next, id, *patch.position);

    return commitProject(std::move(next));
}

LayoutError LayoutEngine::rotateItem(const std::string& id, double degrees) {
    if (!std::isfinite(degrees)) return setError(LayoutError::InvalidOperation);
    ItemPatch patch;
    patch.rotation = degrees;
    return commitItemUpdate(id, patch);
}

LayoutError LayoutEngine::deleteItems(const std::vector<std::string>& ids) {
    const Project& current = history_.current();
    std::unordered_set<std::string> doomed;
    bool unknown = false;
    for (const auto& id : ids) {
        if (!findItem(current, id)) {
            LAYOUT_LOG_WARN("delete: unknown identity '%s'", id.c_str());
            unknown = true;
            continue;
        }
        doomed.insert(id);
    }
    if (doomed.empty()) {
        return setError(unknown ? LayoutError::UnknownIdentity : LayoutError::Ok);
    }

    Project next = current;
    next.furniture.erase(std::remove_if(next.furniture.begin(), next.furniture.end(),
        [&](const FurnitureItem& f) { return doomed.count(f.id) > 0; }), next.furniture.end());

    const LayoutError err = commitProject(std::move(next));
    if (err != LayoutError::Ok) return err;
    return setError(unknown ? LayoutError::UnknownIdentity : LayoutError::Ok);
}

LayoutError LayoutEngine::deleteSelected() {
    if (selection_.isEmpty()) return setError(LayoutError::InvalidOperation);
    const std::vector<std::string> ids = selection_.ids();
    return deleteItems(ids);
}

LayoutError LayoutEngine::groupSelected(std::string* outGroupId) {
    if (!selectionInfo().canGroup) return setError(LayoutError::InvalidOperation);

    const std::string groupId = ids_.next("group");
    Project next = history_.current();
    for (auto& f : next.furniture) {
        if (selection_.isSelected(f.id)) f.groupId = groupId;
    }
    const LayoutError err = commitProject(std::move(next));
    if (err == LayoutError::Ok && outGroupId) *outGroupId = groupId;
    return err;
}

LayoutError LayoutEngine::ungroup(const std::string& groupId) {
    Project next = history_.current();
    bool found = false;
    for (auto& f : next.furniture) {
        if (f.groupId && *f.groupId == groupId) {
            f.groupId.reset();
            found = true;
        }
    }
    if (!found) return setError(LayoutError::UnknownIdentity);
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::stackSelected(std::string* outStackId) {
    const std::vector<PlacedBox> boxes = boxesFor(selectedPlacedItems(), history_.current().scale);
    if (boxes.size() < 2) return setError(LayoutError::InvalidOperation);

    const PlacedBox& largest = boxes[largestIndex(boxes)];
    const Point2 anchor{largest.bounds.minX, largest.bounds.minY};
    const std::string stackId = ids_.next("stack");

    Project next = history_.current();
    for (const auto& box : boxes) {
        FurnitureItem* f = findItem(next, box.id);
        f->stackId = stackId;
        f->position = anchor;
    }
    const LayoutError err = commitProject(std::move(next));
    if (err == LayoutError::Ok && outStackId) *outStackId = stackId;
    return err;
}

LayoutError LayoutEngine::unstack(const std::string& stackId) {
    const Project& current = history_.current();
    std::vector<const FurnitureItem*> placed;
    bool found = false;
    for (const auto& f : current.furniture) {
        if (!f.stackId || *f.stackId != stackId) continue;
        found = true;
        if (f.isPlaced()) placed.push_back(&f);
    }
    if (!found) return setError(LayoutError::UnknownIdentity);

    std::vector<std::string> members;
    Project next = current;
    if (!placed.empty()) {
        const Rect2 first = itemBounds(*placed.front(), current.scale);
        const Point2 base = *placed.front()->position;
        const double radius = std::max(first.maxX - first.minX, first.maxY - first.minY)
            * constants::UNSTACK_RADIUS_FACTOR;
        const double angleStep = 2.0 * kPi / static_cast<double>(placed.size());
        for (std::size_t i = 0; i < placed.size(); ++i) {
            FurnitureItem* f = findItem(next, placed[i]->id);
            const double angle = static_cast<double>(i) * angleStep;
            f->position = Point2{base.x + radius * std::cos(angle), base.y + radius * std::sin(angle)};
            members.push_back(f->id);
        }
    }
    for (auto& f : next.furniture) {
        if (f.stackId && *f.stackId == stackId) f.stackId.reset();
    }

    const LayoutError err = commitProject(std::move(next));
    if (err != LayoutError::Ok) return err;
    return setError(selection_.setSelection(members, SelectionEngine::Mode::Replace, history_.current()));
}

LayoutError LayoutEngine::tidySelected(TidyDirection direction) {
    const std::vector<PlacedBox> boxes = boxesFor(selectedPlacedItems(), history_.current().scale);
    if (boxes.size() < 2) return setError(LayoutError::InvalidOperation);

    double sumX = 0.0;
    double sumY = 0.0;
    for (const auto& box : boxes) {
        sumX += box.bounds.minX + box.w / 2.0;
        sumY += box.bounds.minY + box.h / 2.0;
    }
    const double avgX = sumX / static_cast<double>(boxes.size());
    const double avgY = sumY / static_cast<double>(boxes.size());

    Project next = history_.current();
    for (const auto& box : boxes) {
        FurnitureItem* f = findItem(next, box.id);
        if (direction == TidyDirection::HorizontalCenter) {
            f->position->y = avgY - box.h / 2.0;
        } else {
            f->position->x = avgX - box.w / 2.0;
        }
    }
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::arrangeOnLargest() {
    const std::vector<PlacedBox> boxes = boxesFor(selectedPlacedItems(), history_.current().scale);
    if (boxes.size() < 2) return setError(LayoutError::InvalidOperation);

    const std::size_t li = largestIndex(boxes);
    const PlacedBox& largest = boxes[li];
    const double centerX = largest.bounds.minX + largest.w / 2.0;
    const double centerY = largest.bounds.minY + largest.h / 2.0;
    const double others = static_cast<double>(boxes.size() - 1);

    Project next = history_.current();
    if (largest.w > largest.h) {
        double total = 0.0;
        for (std::size_t i = 0; i < boxes.size(); ++i) {
            if (i != li) total += boxes[i].w;
        }
        const double spacing = (largest.w - total) / (others + 1.0);
        double x = largest.bounds.minX + spacing;
        for (std::size_t i = 0; i < boxes.size(); ++i) {
            if (i == li) continue;
            findItem(next, boxes[i].id)->position = Point2{x, centerY - boxes[i].h / 2.0};
            x += boxes[i].w + spacing;
        }
    } else {
        double total = 0.0;
        for (std::size_t i = 0; i < boxes.size(); ++i) {
            if (i != li) total += boxes[i].h;
        }
        const double spacing = (largest.h - total) / (others + 1.0);
        double y = largest.bounds.minY + spacing;
        for (std::size_t i = 0; i < boxes.size(); ++i) {
            if (i == li) continue;
            findItem(next, boxes[i].id)->position = Point2{centerX - boxes[i].w / 2.0, y};
            y += boxes[i].h + spacing;
        }
    }
    return commitProject(std::move(next));
}

// ==============================================================================
// Project properties
// ==============================================================================

LayoutError LayoutEngine::renameProject(std::string_view name) {
    const std::string trimmed = trimCopy(name);
    if (trimmed.empty()) return setError(LayoutError::InvalidOperation);
    Project next = history_.current();
    next.name = trimmed;
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::setFloorPlan(std::string ref, double width, double height) {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0 || height <= 0.0) {
        return setError(LayoutError::InvalidOperation);
    }
    // A new plan invalidates both the calibration and everything placed on the old one.
    calibrator_.cancel();
    calibrator_.clearReferenceSquare();
    placement_.cancel();

    Project next = history_.current();
    next.floorPlanRef = std::move(ref);
    next.floorPlanWidth = width;
    next.floorPlanHeight = height;
    next.furniture.clear();
    next.scale.reset();
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::setJobReference(std::optional<std::string> jobRef) {
    Project next = history_.current();
    if (jobRef) {
        std::string trimmed = trimCopy(*jobRef);
        if (trimmed.empty()) {
            next.jobRef.reset();
        } else {
            next.jobRef = std::move(trimmed);
        }
    } else {
        next.jobRef.reset();
    }
    return commitProject(std::move(next));
}

// ==============================================================================
// Import
// ==============================================================================

LayoutError LayoutEngine::importProducts(const std::vector<ImportRecord>& records, ImportReport* outReport) {
    if (!history_.current().scale) return setError(LayoutError::ScaleRequired);

    ImportReport report = validateProductRecords(records);
    if (report.accepted.empty()) {
        if (outReport) *outReport = std::move(report);
        return setError(LayoutError::InvalidImportRecord);
    }

    Project next = history_.current();
    std::vector<FurnitureItem> items = expandProducts(report.accepted, next, ids_);
    LAYOUT_LOG_DEBUG("import: %zu items from %zu records (%zu rejected)",
                     items.size(), records.size(), report.rejected.size());
    next.furniture.insert(next.furniture.end(),
                          std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    if (outReport) *outReport = std::move(report);
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::importProductCsv(std::string_view text, ImportReport* outReport) {
    if (!history_.current().scale) return setError(LayoutError::ScaleRequired);

    std::vector<ImportRecord> records;
    std::string reason;
    const LayoutError err = parseProductCsv(text, records, &reason);
    if (err != LayoutError::Ok) {
        LAYOUT_LOG_WARN("import: %s", reason.c_str());
        if (outReport) {
            *outReport = ImportReport{};
            outReport->rejected.push_back(ImportIssue{0, reason});
        }
        return setError(err);
    }
    return importProducts(records, outReport);
}

} // namespace layout
