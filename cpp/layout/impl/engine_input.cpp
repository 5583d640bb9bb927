// LayoutEngine input events, forwarded to the interaction controller.

#include "layout/layout_engine.h"
#include "layout/interaction/interaction_controller.h"

#include <utility>

namespace layout {

void LayoutEngine::setPointerCaptureHook(PointerCapture::Hook hook) {
    interaction_->setCaptureHook(std::move(hook));
}

void LayoutEngine::pointerDown(const Point2& screen, std::uint32_t modifiers) {
    interaction_->pointerDown(screen, modifiers);
}

void LayoutEngine::pointerMove(const Point2& screen, std::uint32_t modifiers) {
    interaction_->pointerMove(screen, modifiers);
}

void LayoutEngine::pointerUp(const Point2& screen, std::uint32_t modifiers) {
    interaction_->pointerUp(screen, modifiers);
}

void LayoutEngine::click(const Point2& screen, std::uint32_t modifiers) {
    interaction_->click(screen, modifiers);
}

void LayoutEngine::doubleClick(const Point2& screen) {
    interaction_->doubleClick(screen);
}

void LayoutEngine::wheel(const Point2& screen, double deltaY) {
    interaction_->wheel(screen, deltaY);
}

void LayoutEngine::keyDown(InputKey key) {
    interaction_->keyDown(key);
}

void LayoutEngine::keyUp(InputKey key) {
    interaction_->keyUp(key);
}

void LayoutEngine::blur() {
    interaction_->blur();
}

bool LayoutEngine::isPointerCaptured() const noexcept {
    return interaction_->isCaptured();
}

DragKind LayoutEngine::dragKind() const noexcept {
    return interaction_->dragKind();
}

std::optional<Rect2> LayoutEngine::marqueeRect() const {
    return interaction_->marqueeRect();
}

} // namespace layout
