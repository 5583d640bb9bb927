#pragma once

#include <cstdint>

namespace layout {

// Derived from which tool is open; at most one is open at a time.
enum class InteractionMode : std::uint8_t {
    Idle = 0,
    Scaling = 1,
    Measuring = 2,
    Placing = 3,
    MarqueeSelecting = 4,
};

enum class PointerModifier : std::uint32_t {
    Shift = 1 << 0,
    Ctrl = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3,
};

enum class InputKey : std::uint8_t {
    Escape = 0,
    Space = 1,
    Other = 255,
};

enum class DragKind : std::uint8_t {
    None = 0,
    PendingItem = 1, // pointer is down on an item, threshold not crossed yet
    MovingItem = 2,
    Pan = 3,
    Marquee = 4,
};

inline bool hasModifier(std::uint32_t modifiers, PointerModifier m) {
    return (modifiers & static_cast<std::uint32_t>(m)) != 0;
}

} // namespace layout
