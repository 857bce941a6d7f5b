#include "civcad/transform/transform_engine.h"
#include "civcad/block/block_library.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/core/util.h"
#include "civcad/entity/dimension_factory.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <cmath>
#include <utility>

namespace civcad {

namespace {

template <typename Fn>
void mapPoints(std::vector<Point2>& points, Fn&& fn) {
    for (Point2& p : points) p = fn(p);
}

// Applies fn to every stored point of a dimension.
template <typename Fn>
void mapDimensionPoints(DimensionGeom& g, Fn&& fn) {
    g.start = fn(g.start);
    g.end = fn(g.end);
    g.dimLineStart = fn(g.dimLineStart);
    g.dimLineEnd = fn(g.dimLineEnd);
    g.textPosition = fn(g.textPosition);
    if (g.center) g.center = fn(*g.center);
    mapPoints(g.areaPoints, fn);
}

Entity promoteRectangle(const Entity& source, std::vector<Point2> corners) {
    Entity out = source;
    PolylineGeom poly;
    poly.points = std::move(corners);
    poly.closed = true;
    out.geometry = std::move(poly);
    return out;
}

Point2 scaleAbout(const Point2& p, const Point2& center, double factor) {
    return Point2{center.x + (p.x - center.x) * factor, center.y + (p.y - center.y) * factor};
}

// Left normal of a->b; nullopt for zero length.
std::optional<Point2> unitNormal(const Point2& a, const Point2& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len = std::sqrt(dx * dx + dy * dy);
    if (len == 0.0) return std::nullopt;
    return Point2{-dy / len, dx / len};
}

Point2 nearerEnd(const LineGeom& line, const Point2& pick) {
    return distance(pick, line.start) <= distance(pick, line.end) ? line.start : line.end;
}

} // namespace

// =============================================================================
// Translate
// =============================================================================

Entity translateEntity(const Entity& entity, double dx, double dy) {
    Entity out = entity;
    const auto shift = [dx, dy](const Point2& p) { return Point2{p.x + dx, p.y + dy}; };

    switch (out.kind()) {
        case EntityKind::Line: {
            auto& g = std::get<LineGeom>(out.geometry);
            g.start = shift(g.start);
            g.end = shift(g.end);
            break;
        }
        case EntityKind::Polyline:
            mapPoints(std::get<PolylineGeom>(out.geometry).points, shift);
            break;
        case EntityKind::Circle: {
            auto& g = std::get<CircleGeom>(out.geometry);
            g.center = shift(g.center);
            break;
        }
        case EntityKind::Arc: {
            auto& g = std::get<ArcGeom>(out.geometry);
            g.center = shift(g.center);
            break;
        }
        case EntityKind::Rectangle: {
            auto& g = std::get<RectangleGeom>(out.geometry);
            g.topLeft = shift(g.topLeft);
            break;
        }
        case EntityKind::Text: {
            auto& g = std::get<TextGeom>(out.geometry);
            g.position = shift(g.position);
            break;
        }
        case EntityKind::Dimension:
            mapDimensionPoints(std::get<DimensionGeom>(out.geometry), shift);
            break;
        case EntityKind::Hatch:
            mapPoints(std::get<HatchGeom>(out.geometry).boundary, shift);
            break;
        case EntityKind::BlockInstance: {
            auto& g = std::get<BlockInstanceGeom>(out.geometry);
            g.position = shift(g.position);
            rematerialize(g);
            break;
        }
        case EntityKind::Point: {
            auto& g = std::get<PointGeom>(out.geometry);
            g.position = shift(g.position);
            break;
        }
        case EntityKind::Ellipse: {
            auto& g = std::get<EllipseGeom>(out.geometry);
            g.center = shift(g.center);
            break;
        }
        case EntityKind::Spline:
            mapPoints(std::get<SplineGeom>(out.geometry).controlPoints, shift);
            break;
    }
    return out;
}

// =============================================================================
// Rotate
// =============================================================================

Entity rotateEntity(const Entity& entity, double angle, const Point2& center) {
    Entity out = entity;
    const auto rot = [&center, angle](const Point2& p) { return rotatePoint(p, center, angle); };

    switch (out.kind()) {
        case EntityKind::Line: {
            auto& g = std::get<LineGeom>(out.geometry);
            g.start = rot(g.start);
            g.end = rot(g.end);
            break;
        }
        case EntityKind::Polyline:
            mapPoints(std::get<PolylineGeom>(out.geometry).points, rot);
            break;
        case EntityKind::Circle: {
            auto& g = std::get<CircleGeom>(out.geometry);
            g.center = rot(g.center);
            break;
        }
        case EntityKind::Arc: {
            auto& g = std::get<ArcGeom>(out.geometry);
            g.center = rot(g.center);
            g.startAngle += angle;
            g.endAngle += angle;
            break;
        }
        case EntityKind::Rectangle: {
            if (angle == 0.0) break;
            std::vector<Point2> corners = rectangleCorners(std::get<RectangleGeom>(entity.geometry));
            mapPoints(corners, rot);
            return promoteRectangle(entity, std::move(corners));
        }
        case EntityKind::Text: {
            auto& g = std::get<TextGeom>(out.geometry);
            g.position = rot(g.position);
            g.rotation += angle;
            break;
        }
        case EntityKind::Dimension: {
            auto& g = std::get<DimensionGeom>(out.geometry);
            mapDimensionPoints(g, rot);
            g.textRotation += angle;
            g.startAngle += angle;
            g.endAngle += angle;
            break;
        }
        case EntityKind::Hatch: {
            auto& g = std::get<HatchGeom>(out.geometry);
            mapPoints(g.boundary, rot);
            g.rotation += angle;
            break;
        }
        case EntityKind::BlockInstance: {
            auto& g = std::get<BlockInstanceGeom>(out.geometry);
            g.position = rot(g.position);
            g.rotation += angle;
            rematerialize(g);
            break;
        }
        case EntityKind::Point: {
            auto& g = std::get<PointGeom>(out.geometry);
            g.position = rot(g.position);
            break;
        }
        case EntityKind::Ellipse: {
            auto& g = std::get<EllipseGeom>(out.geometry);
            g.center = rot(g.center);
            g.rotation += angle;
            break;
        }
        case EntityKind::Spline:
            mapPoints(std::get<SplineGeom>(out.geometry).controlPoints, rot);
            break;
    }
    return out;
}

// =============================================================================
// Scale
// =============================================================================

Entity scaleEntity(const Entity& entity, double factor, const Point2& center) {
    Entity out = entity;
    const auto sc = [&center, factor](const Point2& p) { return scaleAbout(p, center, factor); };
    const double magnitude = std::fabs(factor);
    // A negative factor is a point reflection, i.e. a half turn about the center.
    const double halfTurn = factor < 0.0 ? kPi : 0.0;

    switch (out.kind()) {
        case EntityKind::Line: {
            auto& g = std::get<LineGeom>(out.geometry);
            g.start = sc(g.start);
            g.end = sc(g.end);
            break;
        }
        case EntityKind::Polyline:
            mapPoints(std::get<PolylineGeom>(out.geometry).points, sc);
            break;
        case EntityKind::Circle: {
            auto& g = std::get<CircleGeom>(out.geometry);
            g.center = sc(g.center);
            g.radius *= magnitude;
            break;
        }
        case EntityKind::Arc: {
            auto& g = std::get<ArcGeom>(out.geometry);
            g.center = sc(g.center);
            g.radius *= magnitude;
            g.startAngle += halfTurn;
            g.endAngle += halfTurn;
            break;
        }
        case EntityKind::Rectangle: {
            auto& g = std::get<RectangleGeom>(out.geometry);
            g.topLeft = sc(g.topLeft);
            g.width *= factor;
            g.height *= factor;
            g.cornerRadius *= magnitude;
            break;
        }
        case EntityKind::Text: {
            auto& g = std::get<TextGeom>(out.geometry);
            g.position = sc(g.position);
            g.fontSize *= magnitude;
            g.rotation += halfTurn;
            break;
        }
        case EntityKind::Dimension: {
            auto& g = std::get<DimensionGeom>(out.geometry);
            mapDimensionPoints(g, sc);
            g.radius *= magnitude;
            g.textRotation += halfTurn;
            g.startAngle += halfTurn;
            g.endAngle += halfTurn;
            if (g.kind == DimensionKind::Area) {
                g.measuredValue *= factor * factor;
            } else if (g.kind != DimensionKind::Angular) {
                g.measuredValue *= magnitude;
            }
            g.displayText = dimensionDisplayText(g.kind, g.measuredValue, g.style);
            break;
        }
        case EntityKind::Hatch: {
            auto& g = std::get<HatchGeom>(out.geometry);
            mapPoints(g.boundary, sc);
            g.scale *= magnitude;
            g.rotation += halfTurn;
            break;
        }
        case EntityKind::BlockInstance: {
            auto& g = std::get<BlockInstanceGeom>(out.geometry);
            g.position = sc(g.position);
            g.scale *= factor;
            rematerialize(g);
            break;
        }
        case EntityKind::Point: {
            auto& g = std::get<PointGeom>(out.geometry);
            g.position = sc(g.position);
            g.size *= magnitude;
            break;
        }
        case EntityKind::Ellipse: {
            auto& g = std::get<EllipseGeom>(out.geometry);
            g.center = sc(g.center);
            g.radiusX *= magnitude;
            g.radiusY *= magnitude;
            break;
        }
        case EntityKind::Spline:
            mapPoints(std::get<SplineGeom>(out.geometry).controlPoints, sc);
            break;
    }
    return out;
}

// =============================================================================
// Mirror
// =============================================================================

Entity mirrorEntity(const Entity& entity, const Point2& a, const Point2& b) {
    if (a == b) return entity;

    Entity out = entity;
    const auto ref = [&a, &b](const Point2& p) { return reflectPoint(p, a, b); };
    const double axis = angleBetweenPoints(a, b);
    const auto reflectAngle = [axis](double angle) { return 2.0 * axis - angle; };

    switch (out.kind()) {
        case EntityKind::Line: {
            auto& g = std::get<LineGeom>(out.geometry);
            g.start = ref(g.start);
            g.end = ref(g.end);
            break;
        }
        case EntityKind::Polyline:
            mapPoints(std::get<PolylineGeom>(out.geometry).points, ref);
            break;
        case EntityKind::Circle: {
            auto& g = std::get<CircleGeom>(out.geometry);
            g.center = ref(g.center);
            break;
        }
        case EntityKind::Arc: {
            // Reflection reverses orientation, so the endpoints swap roles.
            auto& g = std::get<ArcGeom>(out.geometry);
            g.center = ref(g.center);
            const double start = reflectAngle(g.endAngle);
            const double end = reflectAngle(g.startAngle);
            g.startAngle = start;
            g.endAngle = end;
            break;
        }
        case EntityKind::Rectangle: {
            std::vector<Point2> corners = rectangleCorners(std::get<RectangleGeom>(entity.geometry));
            mapPoints(corners, ref);
            if (a.x != b.x && a.y != b.y) {
                return promoteRectangle(entity, std::move(corners));
            }
            const AABB box = boundsFromPoints(corners);
            auto& g = std::get<RectangleGeom>(out.geometry);
            g.topLeft = Point2{box.minX, box.minY};
            g.width = boundsWidth(box);
            g.height = boundsHeight(box);
            break;
        }
        case EntityKind::Text: {
            auto& g = std::get<TextGeom>(out.geometry);
            g.position = ref(g.position);
            g.rotation = reflectAngle(g.rotation);
            break;
        }
        case EntityKind::Dimension: {
            auto& g = std::get<DimensionGeom>(out.geometry);
            mapDimensionPoints(g, ref);
            g.textRotation = reflectAngle(g.textRotation);
            const double start = reflectAngle(g.endAngle);
            const double end = reflectAngle(g.startAngle);
            g.startAngle = start;
            g.endAngle = end;
            break;
        }
        case EntityKind::Hatch: {
            auto& g = std::get<HatchGeom>(out.geometry);
            mapPoints(g.boundary, ref);
            g.rotation = reflectAngle(g.rotation);
            break;
        }
        case EntityKind::BlockInstance: {
            // Instances carry no handedness; the insertion point and angle are reflected.
            auto& g = std::get<BlockInstanceGeom>(out.geometry);
            g.position = ref(g.position);
            g.rotation = reflectAngle(g.rotation);
            rematerialize(g);
            break;
        }
        case EntityKind::Point: {
            auto& g = std::get<PointGeom>(out.geometry);
            g.position = ref(g.position);
            break;
        }
        case EntityKind::Ellipse: {
            auto& g = std::get<EllipseGeom>(out.geometry);
            g.center = ref(g.center);
            g.rotation = reflectAngle(g.rotation);
            break;
        }
        case EntityKind::Spline:
            mapPoints(std::get<SplineGeom>(out.geometry).controlPoints, ref);
            break;
    }
    return out;
}

// =============================================================================
// Offset
// =============================================================================

std::optional<Entity> offsetEntity(const Entity& entity, double dist) {
    Entity out = entity;

    switch (entity.kind()) {
        case EntityKind::Line: {
            auto& g = std::get<LineGeom>(out.geometry);
            const auto n = unitNormal(g.start, g.end);
            if (!n) return std::nullopt;
            const Point2 shift = scalePoint(*n, dist);
            g.start = addPoints(g.start, shift);
            g.end = addPoints(g.end, shift);
            return out;
        }
        case EntityKind::Circle: {
            auto& g = std::get<CircleGeom>(out.geometry);
            const double radius = g.radius + dist;
            if (radius <= 0.0) return std::nullopt;
            g.radius = radius;
            return out;
        }
        case EntityKind::Arc: {
            auto& g = std::get<ArcGeom>(out.geometry);
            const double radius = g.radius + dist;
            if (radius <= 0.0) return std::nullopt;
            g.radius = radius;
            return out;
        }
        case EntityKind::Polyline: {
            const auto& src = std::get<PolylineGeom>(entity.geometry);
            const std::size_t n = src.points.size();
            if (n < 2) return std::nullopt;

            auto& g = std::get<PolylineGeom>(out.geometry);
            for (std::size_t i = 0; i < n; ++i) {
                Point2 sum{};
                int count = 0;
                const bool hasPrev = i > 0 || src.closed;
                const bool hasNext = i + 1 < n || src.closed;
                if (hasPrev) {
                    if (auto nrm = unitNormal(src.points[(i + n - 1) % n], src.points[i])) {
                        sum = addPoints(sum, *nrm);
                        ++count;
                    }
                }
                if (hasNext) {
                    if (auto nrm = unitNormal(src.points[i], src.points[(i + 1) % n])) {
                        sum = addPoints(sum, *nrm);
                        ++count;
                    }
                }
                if (count == 0) continue;

                const double len = std::sqrt(sum.x * sum.x + sum.y * sum.y);
                if (len == 0.0) continue;
                g.points[i] = addPoints(src.points[i], scalePoint(sum, dist / len));
            }
            return out;
        }
        default:
            return std::nullopt;
    }
}

// =============================================================================
// Trim / extend
// =============================================================================

std::optional<Entity> trimLine(const Entity& target, const Entity& cuttingEdge, const Point2& pick) {
    const LineGeom* line = target.as<LineGeom>();
    const LineGeom* edge = cuttingEdge.as<LineGeom>();
    if (!line || !edge) return std::nullopt;

    const auto hit = segmentIntersection(line->start, line->end, edge->start, edge->end);
    if (!hit) return std::nullopt;

    Entity out = target;
    out.geometry = LineGeom{nearerEnd(*line, pick), *hit};
    return out;
}

std::optional<Entity> extendLine(const Entity& target, const Entity& boundary, const Point2& pick) {
    const LineGeom* line = target.as<LineGeom>();
    const LineGeom* edge = boundary.as<LineGeom>();
    if (!line || !edge) return std::nullopt;

    const double dx = line->end.x - line->start.x;
    const double dy = line->end.y - line->start.y;
    const double len = std::sqrt(dx * dx + dy * dy);
    if (len == 0.0) return std::nullopt;

    const double ext = kernel_constants::EXTEND_LENGTH;
    const Point2 dir{dx / len, dy / len};
    const Point2 lengthenedStart = addPoints(line->start, scalePoint(dir, -ext));
    const Point2 lengthenedEnd = addPoints(line->end, scalePoint(dir, ext));

    // Unbounded: the lengthened copy only fixes the direction of the infinite line.
    const auto hit = lineIntersection(lengthenedStart, lengthenedEnd, edge->start, edge->end);
    if (!hit) return std::nullopt;

    Entity out = target;
    out.geometry = LineGeom{nearerEnd(*line, pick), *hit};
    return out;
}

} // namespace civcad
