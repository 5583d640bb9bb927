#pragma once

#include "layout/core/id_generator.h"
#include "layout/core/layout_constants.h"
#include "layout/core/types.h"

#include "layout/calibration/measure_tool.h"
#include "layout/calibration/scale_calibrator.h"
#include "layout/history/project_history.h"
#include "layout/import/product_import.h"
#include "layout/interaction/interaction_types.h"
#include "layout/interaction/pointer_capture.h"
#include "layout/model/furniture_summary.h"
#include "layout/model/project.h"
#include "layout/placement/placement_session.h"
#include "layout/selection/selection_engine.h"
#include "layout/tasks/task_synthesizer.h"
#include "layout/view/view_transform.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace layout {

class InteractionController;

struct LayoutConfig {
    ViewLimits view{};
    SynthesisOptions synthesis{};
    double dragThresholdPx = constants::DRAG_THRESHOLD_PX;
    // Time source for generated identities; empty means wall clock.
    IdGenerator::Clock clock;
};

// Partial update of one item. Unset fields are left alone.
struct ItemPatch {
    std::optional<Point2> position;
    std::optional<double> rotation;
    std::optional<std::string> name;
    std::optional<std::string> roomZone;
    std::optional<std::string> color;
    std::optional<std::uint32_t> installOrder;
    std::optional<std::uint32_t> estimatedMinutes;
};

enum class TidyDirection : std::uint8_t {
    HorizontalCenter = 0, // align centres on one horizontal line
    VerticalCenter = 1,   // align centres on one vertical line
};

// Facade owning the project history and every interaction component.
//
// Every history change runs the same synchronous pipeline before the mutating call
// returns: tasks are re-synthesized, the selection is pruned, then onProjectChange
// and onTasksGenerated fire in that order. Callbacks must not mutate the engine.
class LayoutEngine {
    friend class InteractionController;
public:
    using ProjectChangeCallback = std::function<void(const Project&)>;
    using TasksCallback = std::function<void(const std::vector<InstallationTask>&)>;

    // Throws std::invalid_argument if the project is structurally invalid.
    explicit LayoutEngine(Project initial, LayoutConfig config = {});
    ~LayoutEngine();

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    void setProjectChangeCallback(ProjectChangeCallback cb) { onProjectChange_ = std::move(cb); }
    void setTasksCallback(TasksCallback cb) { onTasksGenerated_ = std::move(cb); }
    void setPointerCaptureHook(PointerCapture::Hook hook);

    // ==============================================================================
    // Project & history
    // ==============================================================================
    const Project& project() const noexcept { return history_.current(); }
    const std::vector<InstallationTask>& tasks() const noexcept { return tasks_; }
    const ProjectHistory& history() const noexcept { return history_; }
    std::uint64_t digest() const { return projectDigest(history_.current()); }

    LayoutError undo();
    LayoutError redo();
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }

    // Status of the last operation driven through this facade.
    LayoutError lastError() const noexcept { return lastError_; }

    // Replace the whole history. Both throw std::invalid_argument on bad input and
    // leave the engine untouched in that case.
    void loadProject(Project project);
    void loadSnapshot(const std::uint8_t* bytes, std::uint32_t byteCount);
    std::vector<std::uint8_t> saveSnapshot() const;

    // ==============================================================================
    // View
    // ==============================================================================
    ViewTransform& view() noexcept { return view_; }
    const ViewTransform& view() const noexcept { return view_; }

    // ==============================================================================
    // Modes
    // ==============================================================================
    InteractionMode mode() const noexcept;

    void beginCalibration();
    void cancelCalibration() noexcept { calibrator_.cancel(); }
    LayoutError commitCalibration(std::optional<double> realLengthCm);
    LayoutError commitCalibrationText(std::string_view text);
    const ScaleCalibrator& calibrator() const noexcept { return calibrator_; }

    void beginMeasure();
    void cancelMeasure() noexcept { measure_.cancel(); }
    const MeasureTool& measureTool() const noexcept { return measure_; }

    LayoutError startPlacement(const ItemTemplate& itemTemplate, std::uint32_t quantity);
    // Places unplaced items with that name one click at a time. quantity may not exceed
    // the number of unplaced items of that name.
    LayoutError startPlacementByName(const std::string& name, std::uint32_t quantity);
    LayoutError placeAt(const Point2& world, std::string* outId = nullptr);
    void cancelPlacement() noexcept { placement_.cancel(); }
    const PlacementSession& placement() const noexcept { return placement_; }

    void setMarqueeMode(bool enabled);
    void toggleMarqueeMode() { setMarqueeMode(!marqueeMode_); }

    // Escape: closes every tool, clears the selection and leaves marquee mode.
    void cancelAll();

    // ==============================================================================
    // Selection
    // ==============================================================================
    LayoutError setSelection(const std::vector<std::string>& ids,
                             SelectionEngine::Mode mode = SelectionEngine::Mode::Replace);
    LayoutError selectItem(const std::string& id, bool multi);
    void clearSelection() { selection_.clear(); }
    // Always replaces the selection; leaves marquee mode.
    const std::vector<std::string>& marqueeSelect(const Rect2& screenRect);
    const std::vector<std::string>& selection() const noexcept { return selection_.ids(); }
    SelectionInfo selectionInfo() const { return selection_.info(history_.current()); }
    const SelectionEngine& selectionEngine() const noexcept { return selection_; }

    // ==============================================================================
    // Furniture operations
    // ==============================================================================
    LayoutError moveItemLive(const std::string& id, const Point2& position);
    LayoutError commitItemUpdate(const std::string& id, const ItemPatch& patch);
    LayoutError rotateItem(const std::string& id, double degrees);
    LayoutError deleteItems(const std::vector<std::string>& ids);
    LayoutError deleteSelected();
    LayoutError groupSelected(std::string* outGroupId = nullptr);
    LayoutError ungroup(const std::string& groupId);
    LayoutError stackSelected(std::string* outStackId = nullptr);
    LayoutError unstack(const std::string& stackId);
    LayoutError tidySelected(TidyDirection direction);
    LayoutError arrangeOnLargest();

    LayoutError renameProject(std::string_view name);
    LayoutError setFloorPlan(std::string ref, double width, double height);
    LayoutError setJobReference(std::optional<std::string> jobRef);

    // ==============================================================================
    // Import
    // ==============================================================================
    // Requires a calibrated scale. Valid records are committed in one step; rejected
    // ones are listed in outReport. InvalidImportRecord when nothing was accepted.
    LayoutError importProducts(const std::vector<ImportRecord>& records, ImportReport* outReport = nullptr);
    LayoutError importProductCsv(std::string_view text, ImportReport* outReport = nullptr);

    // ==============================================================================
    // Derived views
    // ==============================================================================
    std::vector<UnplacedSummaryEntry> unplacedItems() const { return unplacedSummary(history_.current()); }
    std::vector<PlacedSummaryEntry> placedItems() const { return placedSummary(history_.current()); }

    // ==============================================================================
    // Input events
    // ==============================================================================
    void pointerDown(const Point2& screen, std::uint32_t modifiers);
    void pointerMove(const Point2& screen, std::uint32_t modifiers);
    void pointerUp(const Point2& screen, std::uint32_t modifiers);
    void click(const Point2& screen, std::uint32_t modifiers);
    void doubleClick(const Point2& screen);
    void wheel(const Point2& screen, double deltaY);
    void keyDown(InputKey key);
    void keyUp(InputKey key);
    void blur();

    bool isPointerCaptured() const noexcept;
    DragKind dragKind() const noexcept;
    std::optional<Rect2> marqueeRect() const;

private:
    void onHistoryChanged(const Project& project, HistoryChange change);
    LayoutError commitProject(Project next);
    LayoutError beginPlacement(const ItemTemplate& itemTemplate, std::uint32_t quantity, PlacementSource source);
    LayoutError setError(LayoutError error) noexcept {
        lastError_ = error;
        return error;
    }
    // Placed, selected items in furniture order.
    std::vector<const FurnitureItem*> selectedPlacedItems() const;

    LayoutConfig config_;
    IdGenerator ids_;
    ProjectHistory history_;
    ViewTransform view_;
    ScaleCalibrator calibrator_;
    MeasureTool measure_;
    SelectionEngine selection_;
    PlacementSession placement_;
    TaskSynthesizer synthesizer_;
    std::vector<InstallationTask> tasks_;
    ProjectChangeCallback onProjectChange_;
    TasksCallback onTasksGenerated_;
    bool marqueeMode_ = false;
    LayoutError lastError_ = LayoutError::Ok;
    std::unique_ptr<InteractionController> interaction_;
};

} // namespace layout
