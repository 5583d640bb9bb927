// LayoutEngine construction, the commit pipeline, modes and selection.

#include "layout/layout_engine.h"
#include "layout/core/logging.h"
#include "layout/interaction/interaction_controller.h"

#include <utility>

namespace layout {

LayoutEngine::LayoutEngine(Project initial, LayoutConfig config)
    : config_(std::move(config)),
      ids_(config_.clock),
      history_(std::move(initial)),
      view_(config_.view),
      placement_(history_, ids_),
      synthesizer_(config_.synthesis),
      interaction_(std::make_unique<InteractionController>(*this)) {
    history_.setListener([this](const Project& project, HistoryChange change) {
        onHistoryChanged(project, change);
    });
    tasks_ = synthesizer_.synthesize(history_.current());
}

LayoutEngine::~LayoutEngine() = default;

void LayoutEngine::onHistoryChanged(const Project& project, HistoryChange change) {
    // Tasks first: nobody may see the new project next to the old task list.
    tasks_ = synthesizer_.synthesize(project);
    selection_.prune(project);
    LAYOUT_LOG_DEBUG("pipeline: change=%u tasks=%zu", static_cast<unsigned>(change), tasks_.size());

    if (onProjectChange_) onProjectChange_(project);
    if (onTasksGenerated_) onTasksGenerated_(tasks_);
}

LayoutError LayoutEngine::commitProject(Project next) {
    return setError(history_.commit(std::move(next)));
}

LayoutError LayoutEngine::undo() {
    return setError(history_.undo());
}

LayoutError LayoutEngine::redo() {
    return setError(history_.redo());
}

// ==============================================================================
// Modes
// ==============================================================================

InteractionMode LayoutEngine::mode() const noexcept {
    if (calibrator_.isActive()) return InteractionMode::Scaling;
    if (measure_.isActive()) return InteractionMode::Measuring;
    if (placement_.isActive()) return InteractionMode::Placing;
    if (marqueeMode_) return InteractionMode::MarqueeSelecting;
    return InteractionMode::Idle;
}

void LayoutEngine::beginCalibration() {
    measure_.cancel();
    placement_.cancel();
    marqueeMode_ = false;
    calibrator_.begin();
}

LayoutError LayoutEngine::commitCalibration(std::optional<double> realLengthCm) {
    double scale = 0.0;
    const LayoutError err = calibrator_.commit(realLengthCm, scale);
    if (err != LayoutError::Ok) return setError(err);

    Project next = history_.current();
    next.scale = scale;
    return commitProject(std::move(next));
}

LayoutError LayoutEngine::commitCalibrationText(std::string_view text) {
    double scale = 0.0;
    const LayoutError err = calibrator_.commitText(text, scale);
    if (err != LayoutError::Ok) return setError(err);

    Project next = history_.current();
    next.scale = scale;
    return commitProject(std::move(next));
}

void LayoutEngine::beginMeasure() {
    calibrator_.cancel();
    placement_.cancel();
    marqueeMode_ = false;
    measure_.begin();
}

LayoutError LayoutEngine::startPlacement(const ItemTemplate& itemTemplate, std::uint32_t quantity) {
    return beginPlacement(itemTemplate, quantity, PlacementSource::Template);
}

LayoutError LayoutEngine::startPlacementByName(const std::string& name, std::uint32_t quantity) {
    const FurnitureItem* first = nullptr;
    std::uint32_t available = 0;
    for (const auto& item : history_.current().furniture) {
        if (item.isPlaced() || item.name != name) continue;
        if (!first) first = &item;
        ++available;
    }
    if (!first) {
        LAYOUT_LOG_DEBUG("placement: no unplaced item named '%s'", name.c_str());
        return setError(LayoutError::UnknownIdentity);
    }
    if (quantity > available) {
        LAYOUT_LOG_DEBUG("placement: '%s' has %u unplaced, %u requested", name.c_str(), available, quantity);
        return setError(LayoutError::InvalidOperation);
    }
    return beginPlacement(templateFromItem(*first), quantity, PlacementSource::Unplaced);
}

LayoutError LayoutEngine::beginPlacement(const ItemTemplate& itemTemplate, std::uint32_t quantity,
                                         PlacementSource source) {
    const LayoutError err = placement_.start(itemTemplate, quantity, source);
    if (err == LayoutError::Ok) {
        calibrator_.cancel();
        measure_.cancel();
        marqueeMode_ = false;
    }
    return setError(err);
}

LayoutError LayoutEngine::placeAt(const Point2& world, std::string* outId) {
    return setError(placement_.placeAt(world, outId));
}

void LayoutEngine::setMarqueeMode(bool enabled) {
    if (enabled) {
        calibrator_.cancel();
        measure_.cancel();
        placement_.cancel();
    }
    marqueeMode_ = enabled;
}

void LayoutEngine::cancelAll() {
    placement_.cancel();
    calibrator_.cancel();
    measure_.cancel();
    measure_.clearLine();
    selection_.clear();
    marqueeMode_ = false;
}

// ==============================================================================
// Selection
// ==============================================================================

LayoutError LayoutEngine::setSelection(const std::vector<std::string>& ids, SelectionEngine::Mode mode) {
    return setError(selection_.setSelection(ids, mode, history_.current()));
}

LayoutError LayoutEngine::selectItem(const std::string& id, bool multi) {
    return setError(selection_.selectItem(id, multi, history_.current()));
}

const std::vector<std::string>& LayoutEngine::marqueeSelect(const Rect2& screenRect) {
    marqueeMode_ = false;
    lastError_ = LayoutError::Ok;
    return selection_.marqueeSelect(screenRect, view_, history_.current(), SelectionEngine::Mode::Replace);
}

std::vector<const FurnitureItem*> LayoutEngine::selectedPlacedItems() const {
    std::vector<const FurnitureItem*> out;
    for (const auto& item : history_.current().furniture) {
        if (item.isPlaced() && selection_.isSelected(item.id)) out.push_back(&item);
    }
    return out;
}

} // namespace layout
