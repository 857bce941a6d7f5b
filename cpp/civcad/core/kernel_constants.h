#pragma once

#include <cstddef>

/**
 * @file kernel_constants.h
 * @brief Tolerances and fixed sizes used across the drafting kernel.
 *
 * Lengths are in project units (default meters), angles in radians.
 */

namespace civcad {
namespace kernel_constants {

// =============================================================================
// Numeric tolerances
// =============================================================================

/// Below this |determinant| two lines are treated as parallel, three points as collinear
constexpr double DETERMINANT_EPSILON = 1e-4;

/// Line/circle roots closer than this (in line parameter space) are reported once
constexpr double ROOT_MERGE_EPSILON = 1e-4;

// =============================================================================
// Editing
// =============================================================================

/// Each end of an extend target is lengthened by this much before intersecting
constexpr double EXTEND_LENGTH = 1000.0;

/// Undo stack capacity; the oldest command is evicted past this
constexpr std::size_t HISTORY_CAPACITY = 100;

// =============================================================================
// Queries
// =============================================================================

constexpr double DEFAULT_PICK_TOLERANCE = 5.0;

/// Cell edge of the uniform grid behind EntityIndex
constexpr double SPATIAL_CELL_SIZE = 50.0;

// =============================================================================
// Geometry approximation
// =============================================================================

constexpr int DEFAULT_SPLINE_SEGMENTS = 20;
constexpr int HATCH_CIRCLE_SEGMENTS = 32;

/// Text extents are estimated as glyphCount * fontSize * factor wide
constexpr double TEXT_WIDTH_FACTOR = 0.6;
constexpr double DEFAULT_FONT_SIZE = 12.0;
constexpr std::size_t EMPTY_TEXT_GLYPHS = 10;

// =============================================================================
// Exchange format
// =============================================================================

constexpr double EXCHANGE_DEFAULT_TEXT_HEIGHT = 2.5;
constexpr double EXCHANGE_EXTENT = 10000.0;

} // namespace kernel_constants
} // namespace civcad
