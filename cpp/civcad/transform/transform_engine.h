#pragma once

#include "civcad/entity/entity_types.h"
#include <optional>

namespace civcad {

// All transforms return a new entity with the same id; the input is never modified.

Entity translateEntity(const Entity& entity, double dx, double dy);

// Counter-clockwise rotation in radians. A rectangle becomes a closed polyline
// unless the angle is zero.
Entity rotateEntity(const Entity& entity, double angle, const Point2& center);

// Uniform scale about center.
Entity scaleEntity(const Entity& entity, double factor, const Point2& center);

// Reflection across the infinite line through a and b.
Entity mirrorEntity(const Entity& entity, const Point2& a, const Point2& b);

/**
 * Parallel copy at a signed distance. Lines shift along the left normal of
 * start->end; circles and arcs change radius and reject non-positive results;
 * polylines move each vertex along the averaged normal of its adjacent edges.
 * Returns nullopt for every other kind and for degenerate input.
 */
std::optional<Entity> offsetEntity(const Entity& entity, double distance);

/**
 * Cuts `target` where it crosses `cuttingEdge` (both lines, segment-bounded) and
 * keeps the part between the intersection and the target end nearer `pick`.
 */
std::optional<Entity> trimLine(const Entity& target, const Entity& cuttingEdge, const Point2& pick);

/**
 * Runs from the end of `target` nearer `pick` to where the target's line meets
 * the infinite extension of `boundary`. The meeting point must fall within the
 * target lengthened by EXTEND_LENGTH at each end.
 */
std::optional<Entity> extendLine(const Entity& target, const Entity& boundary, const Point2& pick);

} // namespace civcad
