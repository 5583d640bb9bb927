#pragma once

#include "layout/core/types.h"
#include "layout/interaction/interaction_types.h"
#include "layout/interaction/pointer_capture.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace layout {

class LayoutEngine;

// Routes raw input events to the component the current mode owns.
//
// Clicks go to the calibrator, the measure tool or the placement session. Drags move
// items, pan the view, or draw the marquee, and hold a PointerCapture for their
// whole lifetime. Item drags commit once when the threshold is crossed and
// live-update afterwards, so the whole drag is a single undo step.
class InteractionController {
public:
    explicit InteractionController(LayoutEngine& engine);

    void setCaptureHook(PointerCapture::Hook hook) { captureHook_ = std::move(hook); }

    void pointerDown(const Point2& screen, std::uint32_t modifiers);
    void pointerMove(const Point2& screen, std::uint32_t modifiers);
    void pointerUp(const Point2& screen, std::uint32_t modifiers);
    void click(const Point2& screen, std::uint32_t modifiers);
    void doubleClick(const Point2& screen);
    void wheel(const Point2& screen, double deltaY);
    void keyDown(InputKey key);
    void keyUp(InputKey key);
    // Focus loss: releases any capture, keeping whatever state the drag reached.
    void blur();

    DragKind dragKind() const noexcept { return drag_.kind; }
    bool isCaptured() const noexcept { return capture_.active(); }
    bool isSpaceHeld() const noexcept { return spaceHeld_; }
    // Current marquee rectangle in screen space while a marquee drag is running.
    std::optional<Rect2> marqueeRect() const;

private:
    struct DragState {
        DragKind kind = DragKind::None;
        Point2 startScreen{};
        Point2 lastScreen{};
        Point2 startWorld{};
        Point2 itemStart{};
        std::string itemId;
        bool moved = false;
    };

    void beginDrag(DragKind kind, const Point2& screen);
    void endDrag();
    bool pastThreshold(const Point2& screen) const;

    LayoutEngine& engine_;
    PointerCapture::Hook captureHook_;
    PointerCapture capture_;
    DragState drag_;
    bool spaceHeld_ = false;
    bool suppressClick_ = false;
};

} // namespace layout
