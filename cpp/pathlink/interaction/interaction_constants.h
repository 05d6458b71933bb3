#pragma once

/**
 * @file interaction_constants.h
 * @brief Default values for the path interaction rules.
 *
 * The presentation shell mirrors STROKE_WIDTH_PX and the palette when it
 * paints. Everything else can be overridden at runtime through
 * InteractionOptions.
 */

namespace interaction_constants {

// =============================================================================
// Stroke Filtering
// =============================================================================

/// Moves closer than this to the last recorded point are dropped (pointer jitter)
constexpr float MIN_POINT_SPACING = 5.0f;

/// Trailing points of the in-progress path exempt from the self-crossing test
constexpr unsigned SELF_INTERSECTION_WINDOW = 10;

// =============================================================================
// Completion
// =============================================================================

/// Delay between the winning commit and the win notification (milliseconds)
constexpr double WIN_NOTIFY_DELAY_MS = 300.0;

// =============================================================================
// Visual Rendering
// =============================================================================

/// Stroke width used by the shell when painting paths (in pixels)
constexpr float STROKE_WIDTH_PX = 8.0f;

/// Category palette (RGB 0..1): A #f43f5e, B #3b82f6, C #22c55e
namespace Palette {
    constexpr float A[3] = {0xf4 / 255.0f, 0x3f / 255.0f, 0x5e / 255.0f};
    constexpr float B[3] = {0x3b / 255.0f, 0x82 / 255.0f, 0xf6 / 255.0f};
    constexpr float C[3] = {0x22 / 255.0f, 0xc5 / 255.0f, 0x5e / 255.0f};
}

} // namespace interaction_constants
