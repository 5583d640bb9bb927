#include "layout/interaction/interaction_controller.h"
#include "layout/core/logging.h"
#include "layout/layout_engine.h"

#include <cmath>
#include <string>
#include <vector>

namespace layout {

namespace {
    constexpr std::uint32_t kMultiSelectMask =
        static_cast<std::uint32_t>(PointerModifier::Shift)
        | static_cast<std::uint32_t>(PointerModifier::Ctrl)
        | static_cast<std::uint32_t>(PointerModifier::Meta);
}

InteractionController::InteractionController(LayoutEngine& engine)
    : engine_(engine) {}

void InteractionController::beginDrag(DragKind kind, const Point2& screen) {
    drag_ = DragState{};
    drag_.kind = kind;
    drag_.startScreen = screen;
    drag_.lastScreen = screen;
    capture_ = PointerCapture(captureHook_);
}

void InteractionController::endDrag() {
    capture_.release();
    drag_ = DragState{};
}

bool InteractionController::pastThreshold(const Point2& screen) const {
    const double dx = screen.x - drag_.startScreen.x;
    const double dy = screen.y - drag_.startScreen.y;
    return std::hypot(dx, dy) > engine_.config_.dragThresholdPx;
}

std::optional<Rect2> InteractionController::marqueeRect() const {
    if (drag_.kind != DragKind::Marquee) return std::nullopt;
    return normalizedRect(drag_.startScreen, drag_.lastScreen);
}

void InteractionController::pointerDown(const Point2& screen, std::uint32_t /*modifiers*/) {
    if (drag_.kind != DragKind::None) endDrag();
    suppressClick_ = false;

    if (spaceHeld_) {
        beginDrag(DragKind::Pan, screen);
        return;
    }

    switch (engine_.mode()) {
        case InteractionMode::MarqueeSelecting:
            beginDrag(DragKind::Marquee, screen);
            break;
        case InteractionMode::Idle: {
            const Point2 world = engine_.view_.screenToWorld(screen);
            const FurnitureItem* hit = SelectionEngine::pickItem(world, engine_.project());
            if (hit) {
                beginDrag(DragKind::PendingItem, screen);
                drag_.itemId = hit->id;
                drag_.itemStart = *hit->position;
                drag_.startWorld = world;
            } else {
                beginDrag(DragKind::Pan, screen);
            }
            break;
        }
        case InteractionMode::Scaling:
        case InteractionMode::Measuring:
        case InteractionMode::Placing:
            // These tools are driven by clicks.
            break;
    }
}

void InteractionController::pointerMove(const Point2& screen, std::uint32_t /*modifiers*/) {
    const auto itemTarget = [&]() {
        const Point2 world = engine_.view_.screenToWorld(screen);
        return Point2{drag_.itemStart.x + (world.x - drag_.startWorld.x),
                      drag_.itemStart.y + (world.y - drag_.startWorld.y)};
    };

    switch (drag_.kind) {
        case DragKind::None:
            return;
        case DragKind::PendingItem: {
            if (!pastThreshold(screen)) return;
            drag_.moved = true;
            // The first real move is the undo step; later moves only refine it.
            ItemPatch patch;
            patch.position = itemTarget();
            if (engine_.commitItemUpdate(drag_.itemId, patch) != LayoutError::Ok) {
                LAYOUT_LOG_WARN("drag: item '%s' could not be moved", drag_.itemId.c_str());
                endDrag();
                return;
            }
            drag_.kind = DragKind::MovingItem;
            break;
        }
        case DragKind::MovingItem:
            if (engine_.moveItemLive(drag_.itemId, itemTarget()) != LayoutError::Ok) {
                endDrag();
                return;
            }
            break;
        case DragKind::Pan:
            engine_.view_.panBy(screen.x - drag_.lastScreen.x, screen.y - drag_.lastScreen.y);
            if (pastThreshold(screen)) drag_.moved = true;
            break;
        case DragKind::Marquee:
            if (pastThreshold(screen)) drag_.moved = true;
            break;
    }
    drag_.lastScreen = screen;
}

void InteractionController::pointerUp(const Point2& screen, std::uint32_t modifiers) {
    if (drag_.kind == DragKind::None) return;

    if (drag_.kind == DragKind::MovingItem
        && (screen.x != drag_.lastScreen.x || screen.y != drag_.lastScreen.y)) {
        pointerMove(screen, modifiers);
    }
    if (drag_.kind == DragKind::Pan && (screen.x != drag_.lastScreen.x || screen.y != drag_.lastScreen.y)) {
        pointerMove(screen, modifiers);
    }
    if (drag_.kind == DragKind::Marquee) {
        drag_.lastScreen = screen;
        if (pastThreshold(screen)) drag_.moved = true;
        if (drag_.moved) {
            const std::vector<std::string>& ids = engine_.marqueeSelect(normalizedRect(drag_.startScreen, screen));
            LAYOUT_LOG_DEBUG("marquee: %zu selected", ids.size());
        }
    }

    suppressClick_ = drag_.moved;
    endDrag();
}

void InteractionController::click(const Point2& screen, std::uint32_t modifiers) {
    if (suppressClick_) {
        // The click that ends a drag is not a click.
        suppressClick_ = false;
        return;
    }

    const Point2 world = engine_.view_.screenToWorld(screen);
    switch (engine_.mode()) {
        case InteractionMode::Scaling:
            engine_.calibrator_.click(world);
            break;
        case InteractionMode::Measuring:
            if (auto line = engine_.measure_.click(world, engine_.project().scale)) {
                LAYOUT_LOG_DEBUG("measure: %s", line->label.c_str());
            }
            break;
        case InteractionMode::Placing: {
            const LayoutError err = engine_.placeAt(world);
            if (err != LayoutError::Ok) {
                LAYOUT_LOG_WARN("placement: click rejected (%s)", layoutErrorName(err));
            }
            break;
        }
        case InteractionMode::MarqueeSelecting:
            break;
        case InteractionMode::Idle: {
            const bool multi = (modifiers & kMultiSelectMask) != 0;
            const FurnitureItem* hit = SelectionEngine::pickItem(world, engine_.project());
            if (hit) {
                const std::string id = hit->id;
                if (engine_.selectItem(id, multi) != LayoutError::Ok) {
                    LAYOUT_LOG_DEBUG("select: '%s' rejected", id.c_str());
                }
            } else if (!multi) {
                engine_.clearSelection();
            }
            break;
        }
    }
}

void InteractionController::doubleClick(const Point2& screen) {
    if (engine_.mode() == InteractionMode::Idle) {
        const Point2 world = engine_.view_.screenToWorld(screen);
        const FurnitureItem* hit = SelectionEngine::pickItem(world, engine_.project());
        if (hit && hit->stackId) {
            const std::string stackId = *hit->stackId;
            if (engine_.unstack(stackId) != LayoutError::Ok) {
                LAYOUT_LOG_WARN("unstack: '%s' failed", stackId.c_str());
            }
            return;
        }
    }
    engine_.view_.toggleZoomAt(screen);
}

void InteractionController::wheel(const Point2& screen, double deltaY) {
    if (deltaY < 0.0) {
        engine_.view_.zoomAt(screen, ZoomDirection::In);
    } else if (deltaY > 0.0) {
        engine_.view_.zoomAt(screen, ZoomDirection::Out);
    }
}

void InteractionController::keyDown(InputKey key) {
    switch (key) {
        case InputKey::Escape:
            // Marquee drags are abandoned; item drags keep what they already did.
            if (drag_.kind == DragKind::Marquee) endDrag();
            engine_.cancelAll();
            break;
        case InputKey::Space:
            spaceHeld_ = true;
            break;
        case InputKey::Other:
            break;
    }
}

void InteractionController::keyUp(InputKey key) {
    if (key == InputKey::Space) spaceHeld_ = false;
}

void InteractionController::blur() {
    spaceHeld_ = false;
    suppressClick_ = false;
    endDrag();
}

} // namespace layout
