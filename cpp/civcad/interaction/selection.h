#pragma once

#include "civcad/core/kernel_constants.h"
#include "civcad/entity/entity_types.h"
#include <optional>
#include <vector>

namespace civcad {

/**
 * Hit test in two stages: the entity bounds grown by `tolerance` must contain
 * the point, then a per-kind test runs. Lines, polylines (closing edge
 * included), rectangles and splines use edge distance; circles and arcs use
 * radial distance (arcs also require the angle to fall in their span); text,
 * dimensions, hatches, block instances, ellipses and points use their bounds.
 */
bool isPointNearEntity(const Entity& entity, const Point2& point,
                       double tolerance = kernel_constants::DEFAULT_PICK_TOLERANCE);

// Ids of entities whose bounds lie entirely inside box, in list order.
std::vector<EntityId> selectEntitiesInBox(const EntityList& entities, const AABB& box);

// Ids of visible entities hit at point, topmost (last in list) first.
std::vector<EntityId> pickEntities(const EntityList& entities, const Point2& point,
                                   double tolerance = kernel_constants::DEFAULT_PICK_TOLERANCE);

std::optional<EntityId> pickEntity(const EntityList& entities, const Point2& point,
                                   double tolerance = kernel_constants::DEFAULT_PICK_TOLERANCE);

} // namespace civcad
