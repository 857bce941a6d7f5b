#pragma once

#include "civcad/entity/entity_types.h"
#include "civcad/interaction/snap_types.h"

#include <optional>
#include <vector>

namespace civcad {

// Endpoint, midpoint, center and quadrant candidates of every visible entity,
// gated by the matching settings flags. Block instances contribute the points of
// their materialized entities.
std::vector<SnapPoint> collectSnapPoints(const EntityList& entities, const SnapSettings& settings);

// Pairwise segment/segment and segment/circle intersections within maxDistance
// of cursor. Segments come from lines and the edges of polylines and rectangles.
std::vector<SnapPoint> collectIntersectionSnapPoints(const EntityList& entities, const Point2& cursor,
                                                     double maxDistance);

// Foot of the perpendicular from cursor onto a line or the nearest polyline edge.
std::optional<SnapPoint> perpendicularSnapPoint(const Entity& entity, const Point2& cursor);

// Tangent points on a circle seen from `from`; empty when `from` is not outside it.
std::vector<SnapPoint> tangentSnapPoints(const Entity& entity, const Point2& from);
std::vector<SnapPoint> tangentSnapPoints(const Point2& center, double radius, const Point2& from);

// Closest point on a line, circle or polyline.
std::optional<SnapPoint> nearestSnapPoint(const Entity& entity, const Point2& cursor);

// Closest candidate strictly closer than maxDistance.
std::optional<SnapPoint> findNearestSnapPoint(const Point2& point, const std::vector<SnapPoint>& candidates,
                                              double maxDistance);

// Rounds each coordinate to the nearest multiple of spacing; non-positive spacing is a no-op.
Point2 snapToGrid(const Point2& point, double spacing);

/**
 * Full snap query: every enabled object snap competes, the nearest within
 * snapDistance wins, otherwise the grid point when grid snap is on.
 */
std::optional<SnapPoint> solveSnap(const EntityList& entities, const Point2& cursor,
                                   const SnapSettings& settings, const GridSettings& grid = GridSettings{});

} // namespace civcad
