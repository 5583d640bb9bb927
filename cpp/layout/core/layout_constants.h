#pragma once

#include <cstdint>

/**
 * @file layout_constants.h
 * @brief Default values for view, interaction and task derivation.
 *
 * LayoutConfig copies these at construction; change a default here, override it
 * per engine through LayoutConfig.
 */

namespace layout::constants {

// =============================================================================
// View transform
// =============================================================================

/// Multiplier applied per wheel step
constexpr double ZOOM_STEP_FACTOR = 1.1;

/// Allowed range of the view scale factor
constexpr double MIN_VIEW_SCALE = 0.1;
constexpr double MAX_VIEW_SCALE = 10.0;

/// Double-click zoom target; a second double-click returns to 1.0
constexpr double DOUBLE_CLICK_ZOOM = 1.5;
constexpr double DOUBLE_CLICK_ZOOM_EPSILON = 0.01;

// =============================================================================
// Interaction
// =============================================================================

/// Minimum pointer travel (screen pixels) before a press on an item becomes a drag
constexpr double DRAG_THRESHOLD_PX = 3.0;

// =============================================================================
// Calibration / measuring
// =============================================================================

/// Side of the reference square shown after calibration (centimetres)
constexpr double REFERENCE_SQUARE_CM = 100.0;

// =============================================================================
// Furniture operations
// =============================================================================

/// Unstack spreads members on a circle of radius factor * max(w, h)
constexpr double UNSTACK_RADIUS_FACTOR = 0.75;

// =============================================================================
// Product import
// =============================================================================

/// Largest quantity a single import record may expand into
constexpr std::uint32_t MAX_IMPORT_QUANTITY = 10000;

// =============================================================================
// Task derivation
// =============================================================================

constexpr std::uint32_t DEFAULT_TASK_MINUTES = 30;

} // namespace layout::constants
