#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "layout/layout_engine.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using layout::LayoutEngine;
using layout::LayoutError;
using layout::Point2;

struct PlaceResult {
    LayoutError error;
    std::string id;
};

std::shared_ptr<LayoutEngine> createEngine(std::string id, std::string name, std::string createdAt) {
    layout::Project project;
    project.id = std::move(id);
    project.name = std::move(name);
    project.createdAt = std::move(createdAt);
    return std::make_shared<LayoutEngine>(std::move(project));
}

std::vector<std::string> toStringVector(const emscripten::val& array) {
    return emscripten::vecFromJSArray<std::string>(array);
}

// Snapshot bytes cross the boundary through WASM memory, like any other buffer.
std::uintptr_t allocBytes(std::uint32_t byteCount) {
    return reinterpret_cast<std::uintptr_t>(std::malloc(byteCount));
}

void freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

} // namespace

EMSCRIPTEN_BINDINGS(layout_engine_module) {
    using namespace layout;

    emscripten::enum_<LayoutError>("LayoutError")
        .value("Ok", LayoutError::Ok)
        .value("InvalidCalibrationInput", LayoutError::InvalidCalibrationInput)
        .value("PlacementSessionInactive", LayoutError::PlacementSessionInactive)
        .value("HistoryBoundary", LayoutError::HistoryBoundary)
        .value("UnknownIdentity", LayoutError::UnknownIdentity)
        .value("InvalidSnapshot", LayoutError::InvalidSnapshot)
        .value("InvalidOperation", LayoutError::InvalidOperation)
        .value("ScaleRequired", LayoutError::ScaleRequired)
        .value("InvalidImportRecord", LayoutError::InvalidImportRecord)
        .value("BufferTruncated", LayoutError::BufferTruncated)
        .value("InvalidMagic", LayoutError::InvalidMagic)
        .value("UnsupportedVersion", LayoutError::UnsupportedVersion)
        .value("InvalidPayloadSize", LayoutError::InvalidPayloadSize);

    emscripten::enum_<InteractionMode>("InteractionMode")
        .value("Idle", InteractionMode::Idle)
        .value("Scaling", InteractionMode::Scaling)
        .value("Measuring", InteractionMode::Measuring)
        .value("Placing", InteractionMode::Placing)
        .value("MarqueeSelecting", InteractionMode::MarqueeSelecting);

    emscripten::enum_<InputKey>("InputKey")
        .value("Escape", InputKey::Escape)
        .value("Space", InputKey::Space)
        .value("Other", InputKey::Other);

    emscripten::enum_<TidyDirection>("TidyDirection")
        .value("HorizontalCenter", TidyDirection::HorizontalCenter)
        .value("VerticalCenter", TidyDirection::VerticalCenter);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<Rect2>("Rect2")
        .field("minX", &Rect2::minX)
        .field("minY", &Rect2::minY)
        .field("maxX", &Rect2::maxX)
        .field("maxY", &Rect2::maxY);

    emscripten::value_object<ViewTransformState>("ViewTransformState")
        .field("scale", &ViewTransformState::scale)
        .field("offsetX", &ViewTransformState::offsetX)
        .field("offsetY", &ViewTransformState::offsetY);

    emscripten::value_object<SelectionInfo>("SelectionInfo")
        .field("count", &SelectionInfo::count)
        .field("canGroup", &SelectionInfo::canGroup)
        .field("isGroup", &SelectionInfo::isGroup)
        .field("canStack", &SelectionInfo::canStack)
        .field("isStack", &SelectionInfo::isStack)
        .field("isSingleStackSelected", &SelectionInfo::isSingleStackSelected);

    emscripten::value_object<PlaceResult>("PlaceResult")
        .field("error", &PlaceResult::error)
        .field("id", &PlaceResult::id);

    emscripten::register_vector<std::string>("VectorString");
    emscripten::register_vector<std::uint8_t>("VectorUInt8");

    emscripten::function("allocBytes", &allocBytes);
    emscripten::function("freeBytes", &freeBytes);

    emscripten::class_<LayoutEngine>("LayoutEngine")
        .smart_ptr<std::shared_ptr<LayoutEngine>>("LayoutEngineHandle")
        .constructor(&createEngine)
        // The project callback only reports identity and size; the frontend pulls a
        // snapshot when it needs the full document.
        .function("setProjectChangeCallback", emscripten::optional_override([](LayoutEngine& self, emscripten::val cb) {
            self.setProjectChangeCallback([cb](const Project& project) {
                cb(emscripten::val(project.id), emscripten::val(project.furniture.size()));
            });
        }))
        .function("setTasksCallback", emscripten::optional_override([](LayoutEngine& self, emscripten::val cb) {
            self.setTasksCallback([cb](const std::vector<InstallationTask>& tasks) {
                emscripten::val out = emscripten::val::array();
                for (const auto& task : tasks) {
                    emscripten::val t = emscripten::val::object();
                    t.set("id", task.id);
                    t.set("title", task.title);
                    t.set("description", task.description);
                    t.set("installOrder", task.installOrder);
                    t.set("roomZone", task.roomZone);
                    t.set("estimatedMinutes", task.estimatedMinutes);
                    t.set("dependencies", emscripten::val::array(task.dependencies.begin(), task.dependencies.end()));
                    t.set("furnitureIds", emscripten::val::array(task.furnitureIds.begin(), task.furnitureIds.end()));
                    out.call<void>("push", t);
                }
                cb(out);
            });
        }))
        .function("setPointerCaptureHook", emscripten::optional_override([](LayoutEngine& self, emscripten::val cb) {
            self.setPointerCaptureHook([cb](bool captured) { cb(captured); });
        }))
        // History
        .function("undo", &LayoutEngine::undo)
        .function("redo", &LayoutEngine::redo)
        .function("canUndo", emscripten::optional_override([](const LayoutEngine& self) { return self.canUndo(); }))
        .function("canRedo", emscripten::optional_override([](const LayoutEngine& self) { return self.canRedo(); }))
        .function("getLastError", emscripten::optional_override([](const LayoutEngine& self) { return self.lastError(); }))
        .function("loadSnapshotFromPtr", emscripten::optional_override([](LayoutEngine& self, std::uintptr_t ptr, std::uint32_t byteCount) {
            try {
                self.loadSnapshot(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
            } catch (const std::invalid_argument&) {
                return LayoutError::InvalidSnapshot;
            }
            return LayoutError::Ok;
        }))
        .function("saveSnapshot", &LayoutEngine::saveSnapshot)
        // View
        .function("getViewState", emscripten::optional_override([](const LayoutEngine& self) {
            return self.view().state();
        }))
        .function("setViewState", emscripten::optional_override([](LayoutEngine& self, const ViewTransformState& s) {
            self.view().setState(s);
        }))
        .function("screenToWorld", emscripten::optional_override([](const LayoutEngine& self, const Point2& p) {
            return self.view().screenToWorld(p);
        }))
        .function("worldToScreen", emscripten::optional_override([](const LayoutEngine& self, const Point2& p) {
            return self.view().worldToScreen(p);
        }))
        // Modes
        .function("getMode", emscripten::optional_override([](const LayoutEngine& self) { return self.mode(); }))
        .function("beginCalibration", &LayoutEngine::beginCalibration)
        .function("cancelCalibration", emscripten::optional_override([](LayoutEngine& self) { self.cancelCalibration(); }))
        .function("commitCalibrationText", emscripten::optional_override([](LayoutEngine& self, const std::string& text) {
            return self.commitCalibrationText(text);
        }))
        .function("beginMeasure", &LayoutEngine::beginMeasure)
        .function("cancelMeasure", emscripten::optional_override([](LayoutEngine& self) { self.cancelMeasure(); }))
        .function("startPlacementByName", &LayoutEngine::startPlacementByName)
        .function("cancelPlacement", emscripten::optional_override([](LayoutEngine& self) { self.cancelPlacement(); }))
        .function("placeAt", emscripten::optional_override([](LayoutEngine& self, const Point2& world) {
            PlaceResult r{LayoutError::Ok, {}};
            r.error = self.placeAt(world, &r.id);
            return r;
        }))
        .function("toggleMarqueeMode", &LayoutEngine::toggleMarqueeMode)
        .function("cancelAll", &LayoutEngine::cancelAll)
        // Selection
        .function("setSelection", emscripten::optional_override([](LayoutEngine& self, emscripten::val ids) {
            return self.setSelection(toStringVector(ids));
        }))
        .function("selectItem", &LayoutEngine::selectItem)
        .function("clearSelection", &LayoutEngine::clearSelection)
        .function("getSelection", emscripten::optional_override([](const LayoutEngine& self) {
            return self.selection();
        }))
        .function("getSelectionInfo", &LayoutEngine::selectionInfo)
        // Furniture
        .function("moveItemLive", &LayoutEngine::moveItemLive)
        .function("rotateItem", &LayoutEngine::rotateItem)
        .function("deleteItems", emscripten::optional_override([](LayoutEngine& self, emscripten::val ids) {
            return self.deleteItems(toStringVector(ids));
        }))
        .function("deleteSelected", &LayoutEngine::deleteSelected)
        .function("groupSelected", emscripten::optional_override([](LayoutEngine& self) {
            return self.groupSelected();
        }))
        .function("ungroup", &LayoutEngine::ungroup)
        .function("stackSelected", emscripten::optional_override([](LayoutEngine& self) {
            return self.stackSelected();
        }))
        .function("unstack", &LayoutEngine::unstack)
        .function("tidySelected", &LayoutEngine::tidySelected)
        .function("arrangeOnLargest", &LayoutEngine::arrangeOnLargest)
        .function("renameProject", emscripten::optional_override([](LayoutEngine& self, const std::string& name) {
            return self.renameProject(name);
        }))
        .function("setFloorPlan", &LayoutEngine::setFloorPlan)
        .function("importProductCsv", emscripten::optional_override([](LayoutEngine& self, const std::string& text) {
            return self.importProductCsv(text);
        }))
        // Input
        .function("pointerDown", &LayoutEngine::pointerDown)
        .function("pointerMove", &LayoutEngine::pointerMove)
        .function("pointerUp", &LayoutEngine::pointerUp)
        .function("click", &LayoutEngine::click)
        .function("doubleClick", &LayoutEngine::doubleClick)
        .function("wheel", &LayoutEngine::wheel)
        .function("keyDown", &LayoutEngine::keyDown)
        .function("keyUp", &LayoutEngine::keyUp)
        .function("blur", &LayoutEngine::blur)
        .function("isPointerCaptured", emscripten::optional_override([](const LayoutEngine& self) { return self.isPointerCaptured(); }));
}
#endif
