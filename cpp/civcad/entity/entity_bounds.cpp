#include "civcad/entity/entity_bounds.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/core/string_utils.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <algorithm>
#include <cmath>

namespace civcad {

namespace {

AABB circleBounds(const Point2& c, double r) {
    return AABB{c.x - r, c.y - r, c.x + r, c.y + r};
}

AABB twoPointBounds(const Point2& a, const Point2& b) {
    return AABB{std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
}

AABB dimensionBounds(const DimensionGeom& dim) {
    if (dim.kind == DimensionKind::Area) return boundsFromPoints(dim.areaPoints);
    return twoPointBounds(dim.start, dim.end);
}

AABB blockInstanceBounds(const BlockInstanceGeom& block) {
    if (block.entities.empty()) {
        return AABB{block.position.x, block.position.y, block.position.x, block.position.y};
    }
    AABB box = computeEntityBounds(block.entities.front());
    for (std::size_t i = 1; i < block.entities.size(); ++i) {
        box = mergeBounds(box, computeEntityBounds(block.entities[i]));
    }
    return box;
}

} // namespace

AABB computeTextBounds(const TextGeom& text) {
    std::size_t glyphs = utf8Length(text.content);
    if (glyphs == 0) glyphs = kernel_constants::EMPTY_TEXT_GLYPHS;
    const double fontSize = text.fontSize > 0.0 ? text.fontSize : kernel_constants::DEFAULT_FONT_SIZE;
    const double width = static_cast<double>(glyphs) * fontSize * kernel_constants::TEXT_WIDTH_FACTOR;
    return AABB{text.position.x, text.position.y, text.position.x + width, text.position.y + fontSize};
}

AABB computeEllipseBounds(const EllipseGeom& ellipse) {
    const double c = std::cos(ellipse.rotation);
    const double s = std::sin(ellipse.rotation);
    const double ex = std::sqrt(ellipse.radiusX * ellipse.radiusX * c * c + ellipse.radiusY * ellipse.radiusY * s * s);
    const double ey = std::sqrt(ellipse.radiusX * ellipse.radiusX * s * s + ellipse.radiusY * ellipse.radiusY * c * c);
    return AABB{ellipse.center.x - ex, ellipse.center.y - ey, ellipse.center.x + ex, ellipse.center.y + ey};
}

AABB computeEntityBounds(const Entity& entity) {
    switch (entity.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(entity.geometry);
            return twoPointBounds(g.start, g.end);
        }
        case EntityKind::Polyline:
            return boundsFromPoints(std::get<PolylineGeom>(entity.geometry).points);
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(entity.geometry);
            return circleBounds(g.center, g.radius);
        }
        case EntityKind::Arc: {
            const auto& g = std::get<ArcGeom>(entity.geometry);
            return circleBounds(g.center, g.radius);
        }
        case EntityKind::Rectangle: {
            const auto& g = std::get<RectangleGeom>(entity.geometry);
            return twoPointBounds(g.topLeft, Point2{g.topLeft.x + g.width, g.topLeft.y + g.height});
        }
        case EntityKind::Text:
            return computeTextBounds(std::get<TextGeom>(entity.geometry));
        case EntityKind::Dimension:
            return dimensionBounds(std::get<DimensionGeom>(entity.geometry));
        case EntityKind::Hatch:
            return boundsFromPoints(std::get<HatchGeom>(entity.geometry).boundary);
        case EntityKind::BlockInstance:
            return blockInstanceBounds(std::get<BlockInstanceGeom>(entity.geometry));
        case EntityKind::Point: {
            const auto& g = std::get<PointGeom>(entity.geometry);
            const double half = g.size / 2.0;
            return AABB{g.position.x - half, g.position.y - half, g.position.x + half, g.position.y + half};
        }
        case EntityKind::Ellipse:
            return computeEllipseBounds(std::get<EllipseGeom>(entity.geometry));
        case EntityKind::Spline:
            return boundsFromPoints(interpolateSpline(std::get<SplineGeom>(entity.geometry)));
    }
    return AABB{0.0, 0.0, 0.0, 0.0};
}

} // namespace civcad
