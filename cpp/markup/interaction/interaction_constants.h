#pragma once

/**
 * @file interaction_constants.h
 * @brief Constants for hit-testing, snapping and overlay geometry.
 *
 * All distances are surface pixels unless noted otherwise.
 * The host overlay renderer mirrors these values.
 */

namespace interaction_constants {

// =============================================================================
// Hit-test Tolerances
// =============================================================================

/// Maximum distance from a segment / box for a body hit
constexpr float HIT_THRESHOLD_PX = 12.0f;

/// Radius of endpoint and resize handles
constexpr float HANDLE_RADIUS_PX = 6.0f;

/// Two pending clicks closer than this are treated as the same point
constexpr float SAME_POINT_EPSILON_PX = 0.5f;

// =============================================================================
// Snapping
// =============================================================================

/// Direction snap increment for line / angle placement (radians, 45°)
constexpr float SNAP_ANGLE_STEP_RAD = 0.785398163f;  // π/4

// =============================================================================
// Text Layout Estimates
// =============================================================================

/// Average glyph advance as a fraction of font size (no shaped font)
constexpr float TEXT_WIDTH_FACTOR = 0.55f;

/// Line box height as a fraction of font size
constexpr float TEXT_LINE_HEIGHT_FACTOR = 1.2f;

/// Hit box extends below the baseline by this much
constexpr float TEXT_DESCENT_PX = 4.0f;

/// Minimum rendered width of a single-line text box
constexpr float TEXT_MIN_WIDTH_PX = 30.0f;

/// Minimum wrap-box width (normalized)
constexpr float TEXT_MIN_BOX_WIDTH = 0.04f;

// =============================================================================
// Overlay Geometry
// =============================================================================

/// Minimum grid spacing
constexpr float GRID_MIN_SPACING_PX = 10.0f;

/// Radius of the arc drawn at an angle vertex
constexpr float ANGLE_ARC_RADIUS_PX = 22.0f;

/// Distance of the angle label from the vertex, along the bisector
constexpr float ANGLE_LABEL_DISTANCE_PX = 42.0f;

// =============================================================================
// Magnifier
// =============================================================================

constexpr float MAGNIFIER_VIEW_SIZE_PX = 120.0f;
constexpr float MAGNIFIER_ZOOM = 3.0f;
constexpr float MAGNIFIER_SOURCE_RADIUS_PX = 35.0f;

} // namespace interaction_constants
