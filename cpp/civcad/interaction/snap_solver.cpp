#include "civcad/interaction/snap_solver.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <cmath>
#include <limits>

namespace civcad {

namespace {

struct Segment {
    Point2 start;
    Point2 end;
};

struct Circle {
    Point2 center;
    double radius;
};

inline void push(std::vector<SnapPoint>& out, const Point2& p, SnapKind kind, EntityId id) {
    out.push_back(SnapPoint{p, kind, id});
}

void addPathPoints(std::vector<SnapPoint>& out, const std::vector<Point2>& points, bool closed,
                   const SnapSettings& settings, EntityId id) {
    if (settings.endpoint) {
        for (const Point2& p : points) push(out, p, SnapKind::Endpoint, id);
    }
    if (settings.midpoint && points.size() > 1) {
        for (std::size_t i = 0; i + 1 < points.size(); ++i) {
            push(out, midpoint(points[i], points[i + 1]), SnapKind::Midpoint, id);
        }
        if (closed && points.size() > 2) {
            push(out, midpoint(points.back(), points.front()), SnapKind::Midpoint, id);
        }
    }
}

void addEntitySnapPoints(std::vector<SnapPoint>& out, const Entity& e, const SnapSettings& settings, EntityId id) {
    switch (e.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(e.geometry);
            if (settings.endpoint) {
                push(out, g.start, SnapKind::Endpoint, id);
                push(out, g.end, SnapKind::Endpoint, id);
            }
            if (settings.midpoint) push(out, midpoint(g.start, g.end), SnapKind::Midpoint, id);
            break;
        }
        case EntityKind::Polyline: {
            const auto& g = std::get<PolylineGeom>(e.geometry);
            addPathPoints(out, g.points, g.closed, settings, id);
            break;
        }
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(e.geometry);
            if (settings.center) push(out, g.center, SnapKind::Center, id);
            if (settings.endpoint) {
                push(out, Point2{g.center.x + g.radius, g.center.y}, SnapKind::Quadrant, id);
                push(out, Point2{g.center.x - g.radius, g.center.y}, SnapKind::Quadrant, id);
                push(out, Point2{g.center.x, g.center.y + g.radius}, SnapKind::Quadrant, id);
                push(out, Point2{g.center.x, g.center.y - g.radius}, SnapKind::Quadrant, id);
            }
            break;
        }
        case EntityKind::Arc: {
            const auto& g = std::get<ArcGeom>(e.geometry);
            if (settings.center) push(out, g.center, SnapKind::Center, id);
            if (settings.endpoint) {
                push(out, polarToCartesian(g.center, g.radius, g.startAngle), SnapKind::Endpoint, id);
                push(out, polarToCartesian(g.center, g.radius, g.endAngle), SnapKind::Endpoint, id);
            }
            break;
        }
        case EntityKind::Rectangle: {
            const auto& g = std::get<RectangleGeom>(e.geometry);
            addPathPoints(out, rectangleCorners(g), true, settings, id);
            if (settings.center) {
                push(out, Point2{g.topLeft.x + g.width / 2.0, g.topLeft.y + g.height / 2.0}, SnapKind::Center, id);
            }
            break;
        }
        case EntityKind::Ellipse: {
            const auto& g = std::get<EllipseGeom>(e.geometry);
            if (settings.center) push(out, g.center, SnapKind::Center, id);
            break;
        }
        case EntityKind::Point: {
            const auto& g = std::get<PointGeom>(e.geometry);
            if (settings.endpoint) push(out, g.position, SnapKind::Endpoint, id);
            break;
        }
        case EntityKind::Spline: {
            const auto& g = std::get<SplineGeom>(e.geometry);
            if (settings.endpoint && !g.controlPoints.empty() && !g.closed) {
                push(out, g.controlPoints.front(), SnapKind::Endpoint, id);
                push(out, g.controlPoints.back(), SnapKind::Endpoint, id);
            }
            break;
        }
        case EntityKind::BlockInstance: {
            const auto& g = std::get<BlockInstanceGeom>(e.geometry);
            for (const Entity& sub : g.entities) {
                if (sub.visible) addEntitySnapPoints(out, sub, settings, id);
            }
            break;
        }
        case EntityKind::Text:
        case EntityKind::Dimension:
        case EntityKind::Hatch:
            break;
    }
}

void collectEdges(const std::vector<Point2>& points, bool closed, std::vector<Segment>& out) {
    for (std::size_t i = 0; i + 1 < points.size(); ++i) out.push_back(Segment{points[i], points[i + 1]});
    if (closed && points.size() > 2) out.push_back(Segment{points.back(), points.front()});
}

// Edges of lines, polylines (closing edge included) and rectangles.
std::vector<Segment> entityEdges(const Entity& e) {
    std::vector<Segment> out;
    switch (e.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(e.geometry);
            out.push_back(Segment{g.start, g.end});
            break;
        }
        case EntityKind::Polyline: {
            const auto& g = std::get<PolylineGeom>(e.geometry);
            collectEdges(g.points, g.closed, out);
            break;
        }
        case EntityKind::Rectangle:
            collectEdges(rectangleCorners(std::get<RectangleGeom>(e.geometry)), true, out);
            break;
        default:
            break;
    }
    return out;
}

} // namespace

const char* snapKindName(SnapKind kind) {
    switch (kind) {
        case SnapKind::None: return "none";
        case SnapKind::Endpoint: return "endpoint";
        case SnapKind::Midpoint: return "midpoint";
        case SnapKind::Center: return "center";
        case SnapKind::Quadrant: return "quadrant";
        case SnapKind::Intersection: return "intersection";
        case SnapKind::Perpendicular: return "perpendicular";
        case SnapKind::Tangent: return "tangent";
        case SnapKind::Nearest: return "nearest";
        case SnapKind::Grid: return "grid";
    }
    return "none";
}

std::vector<SnapPoint> collectSnapPoints(const EntityList& entities, const SnapSettings& settings) {
    std::vector<SnapPoint> out;
    for (const Entity& e : entities) {
        if (!e.visible) continue;
        addEntitySnapPoints(out, e, settings, e.id);
    }
    return out;
}

std::vector<SnapPoint> collectIntersectionSnapPoints(const EntityList& entities, const Point2& cursor,
                                                     double maxDistance) {
    std::vector<Segment> segments;
    std::vector<Circle> circles;
    for (const Entity& e : entities) {
        if (!e.visible) continue;
        if (const CircleGeom* c = e.as<CircleGeom>()) {
            circles.push_back(Circle{c->center, c->radius});
            continue;
        }
        const std::vector<Segment> edges = entityEdges(e);
        segments.insert(segments.end(), edges.begin(), edges.end());
    }

    std::vector<SnapPoint> out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        for (std::size_t j = i + 1; j < segments.size(); ++j) {
            const auto hit = segmentIntersection(segments[i].start, segments[i].end,
                                                 segments[j].start, segments[j].end);
            if (hit && distance(*hit, cursor) <= maxDistance) {
                push(out, *hit, SnapKind::Intersection, kNoId);
            }
        }
    }

    for (const Segment& s : segments) {
        for (const Circle& c : circles) {
            for (const Point2& hit : lineCircleIntersection(s.start, s.end, c.center, c.radius)) {
                if (distance(hit, cursor) <= maxDistance) push(out, hit, SnapKind::Intersection, kNoId);
            }
        }
    }
    return out;
}

std::optional<SnapPoint> perpendicularSnapPoint(const Entity& entity, const Point2& cursor) {
    if (entity.kind() != EntityKind::Line && entity.kind() != EntityKind::Polyline) return std::nullopt;

    // Closed polylines include their closing edge, as in hit testing and nearest snaps.
    std::optional<Point2> best;
    double bestDist = std::numeric_limits<double>::infinity();
    for (const Segment& s : entityEdges(entity)) {
        const auto foot = perpendicularFoot(cursor, s.start, s.end);
        if (!foot) continue;
        const double d = distance(*foot, cursor);
        if (d < bestDist) {
            bestDist = d;
            best = foot;
        }
    }
    if (!best) return std::nullopt;
    return SnapPoint{*best, SnapKind::Perpendicular, entity.id};
}

std::vector<SnapPoint> tangentSnapPoints(const Point2& center, double radius, const Point2& from) {
    const double dx = from.x - center.x;
    const double dy = from.y - center.y;
    const double d = std::sqrt(dx * dx + dy * dy);
    if (d <= radius) return {};

    const double a = std::acos(radius / d);
    const double b = std::atan2(dy, dx);
    return {
        SnapPoint{polarToCartesian(center, radius, b + a), SnapKind::Tangent, kNoId},
        SnapPoint{polarToCartesian(center, radius, b - a), SnapKind::Tangent, kNoId},
    };
}

std::vector<SnapPoint> tangentSnapPoints(const Entity& entity, const Point2& from) {
    const CircleGeom* c = entity.as<CircleGeom>();
    if (!c) return {};
    std::vector<SnapPoint> out = tangentSnapPoints(c->center, c->radius, from);
    for (SnapPoint& sp : out) sp.sourceId = entity.id;
    return out;
}

std::optional<SnapPoint> nearestSnapPoint(const Entity& entity, const Point2& cursor) {
    switch (entity.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(entity.geometry);
            return SnapPoint{nearestPointOnSegment(cursor, g.start, g.end), SnapKind::Nearest, entity.id};
        }
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(entity.geometry);
            const double angle = angleBetweenPoints(g.center, cursor);
            return SnapPoint{polarToCartesian(g.center, g.radius, angle), SnapKind::Nearest, entity.id};
        }
        case EntityKind::Polyline: {
            std::optional<Point2> best;
            double bestDist = std::numeric_limits<double>::infinity();
            for (const Segment& s : entityEdges(entity)) {
                const Point2 p = nearestPointOnSegment(cursor, s.start, s.end);
                const double d = distance(p, cursor);
                if (d < bestDist) {
                    bestDist = d;
                    best = p;
                }
            }
            if (!best) return std::nullopt;
            return SnapPoint{*best, SnapKind::Nearest, entity.id};
        }
        default:
            return std::nullopt;
    }
}

std::optional<SnapPoint> findNearestSnapPoint(const Point2& point, const std::vector<SnapPoint>& candidates,
                                              double maxDistance) {
    std::optional<SnapPoint> nearest;
    double minDist = maxDistance;
    for (const SnapPoint& sp : candidates) {
        const double d = distance(point, sp.point);
        if (d < minDist) {
            minDist = d;
            nearest = sp;
        }
    }
    return nearest;
}

Point2 snapToGrid(const Point2& point, double spacing) {
    if (!(spacing > 0.0)) return point;
    return Point2{std::round(point.x / spacing) * spacing, std::round(point.y / spacing) * spacing};
}

std::optional<SnapPoint> solveSnap(const EntityList& entities, const Point2& cursor,
                                   const SnapSettings& settings, const GridSettings& grid) {
    if (!settings.enabled) return std::nullopt;

    std::vector<SnapPoint> candidates = collectSnapPoints(entities, settings);
    if (settings.intersection) {
        const auto hits = collectIntersectionSnapPoints(entities, cursor, settings.snapDistance);
        candidates.insert(candidates.end(), hits.begin(), hits.end());
    }
    for (const Entity& e : entities) {
        if (!e.visible) continue;
        if (settings.perpendicular) {
            if (auto sp = perpendicularSnapPoint(e, cursor)) candidates.push_back(*sp);
        }
        if (settings.nearest) {
            if (auto sp = nearestSnapPoint(e, cursor)) candidates.push_back(*sp);
        }
        if (settings.tangent) {
            const auto tangents = tangentSnapPoints(e, cursor);
            candidates.insert(candidates.end(), tangents.begin(), tangents.end());
        }
    }

    if (auto best = findNearestSnapPoint(cursor, candidates, settings.snapDistance)) return best;

    if (settings.gridSnap && grid.spacing > 0.0) {
        return SnapPoint{snapToGrid(cursor, grid.spacing), SnapKind::Grid, kNoId};
    }
    return std::nullopt;
}

} // namespace civcad
