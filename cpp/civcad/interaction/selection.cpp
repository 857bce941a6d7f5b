#include "civcad/interaction/selection.h"
#include "civcad/core/util.h"
#include "civcad/entity/entity_bounds.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <cmath>

namespace civcad {

namespace {

bool nearPath(const std::vector<Point2>& points, bool closed, const Point2& p, double tol) {
    if (points.empty()) return false;
    if (points.size() == 1) return distance(p, points.front()) <= tol;

    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        if (distanceToSegment(p, points[i], points[i + 1]) <= tol) return true;
    }
    if (closed && points.size() > 2) {
        return distanceToSegment(p, points.back(), points.front()) <= tol;
    }
    return false;
}

bool nearArc(const ArcGeom& arc, const Point2& p, double tol) {
    const double radial = distance(p, arc.center);
    if (std::fabs(radial - arc.radius) > tol) return false;

    const double raw = arc.endAngle - arc.startAngle;
    double sweep = normalizeAngle(raw);
    if (sweep == 0.0 && raw != 0.0) return true; // full turn

    // Allow the tolerance to spill past the ends, measured along the arc.
    const double slack = arc.radius > 0.0 ? tol / arc.radius : kPi;
    const double rel = normalizeAngle(angleBetweenPoints(arc.center, p) - arc.startAngle);
    return rel <= sweep + slack || rel >= 2.0 * kPi - slack;
}

} // namespace

bool isPointNearEntity(const Entity& entity, const Point2& point, double tolerance) {
    const AABB bounds = computeEntityBounds(entity);
    if (!boxContainsPoint(expandBounds(bounds, tolerance), point)) return false;

    switch (entity.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(entity.geometry);
            return distanceToSegment(point, g.start, g.end) <= tolerance;
        }
        case EntityKind::Polyline: {
            const auto& g = std::get<PolylineGeom>(entity.geometry);
            return nearPath(g.points, g.closed, point, tolerance);
        }
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(entity.geometry);
            return std::fabs(distance(point, g.center) - g.radius) <= tolerance;
        }
        case EntityKind::Arc:
            return nearArc(std::get<ArcGeom>(entity.geometry), point, tolerance);
        case EntityKind::Rectangle:
            return nearPath(rectangleCorners(std::get<RectangleGeom>(entity.geometry)), true, point, tolerance);
        case EntityKind::Spline: {
            const auto& g = std::get<SplineGeom>(entity.geometry);
            return nearPath(interpolateSpline(g), g.closed, point, tolerance);
        }
        case EntityKind::Text:
        case EntityKind::Dimension:
        case EntityKind::Hatch:
        case EntityKind::BlockInstance:
        case EntityKind::Ellipse:
        case EntityKind::Point:
            return boxContainsPoint(bounds, point);
    }
    return false;
}

std::vector<EntityId> selectEntitiesInBox(const EntityList& entities, const AABB& box) {
    std::vector<EntityId> out;
    for (const Entity& e : entities) {
        if (boxContainsBox(box, computeEntityBounds(e))) out.push_back(e.id);
    }
    return out;
}

std::vector<EntityId> pickEntities(const EntityList& entities, const Point2& point, double tolerance) {
    std::vector<EntityId> out;
    for (auto it = entities.rbegin(); it != entities.rend(); ++it) {
        if (!it->visible) continue;
        if (isPointNearEntity(*it, point, tolerance)) out.push_back(it->id);
    }
    return out;
}

std::optional<EntityId> pickEntity(const EntityList& entities, const Point2& point, double tolerance) {
    for (auto it = entities.rbegin(); it != entities.rend(); ++it) {
        if (it->visible && isPointNearEntity(*it, point, tolerance)) return it->id;
    }
    return std::nullopt;
}

} // namespace civcad
