#include "civcad/entity/entity_factory.h"
#include "civcad/core/util.h"
#include "civcad/geometry/geometry.h"

#include <cmath>
#include <utility>

namespace civcad {

Entity createEntity(IdSource& ids, EntityGeometry geometry, LayerId layerId, const EntityStyle& style) {
    Entity e;
    e.id = ids.next();
    e.layerId = layerId;
    e.style = style;
    e.geometry = std::move(geometry);
    return e;
}

Entity createLine(IdSource& ids, const Point2& start, const Point2& end,
                  LayerId layerId, const EntityStyle& style) {
    return createEntity(ids, LineGeom{start, end}, layerId, style);
}

Entity createPolyline(IdSource& ids, std::vector<Point2> points, bool closed,
                      LayerId layerId, const EntityStyle& style) {
    PolylineGeom geom;
    geom.points = std::move(points);
    geom.closed = closed;
    return createEntity(ids, std::move(geom), layerId, style);
}

Entity createCircle(IdSource& ids, const Point2& center, double radius,
                    LayerId layerId, const EntityStyle& style) {
    return createEntity(ids, CircleGeom{center, radius}, layerId, style);
}

Entity createArc(IdSource& ids, const Point2& center, double radius,
                 double startAngleDeg, double endAngleDeg,
                 LayerId layerId, const EntityStyle& style) {
    ArcGeom geom;
    geom.center = center;
    geom.radius = radius;
    geom.startAngle = degreesToRadians(startAngleDeg);
    geom.endAngle = degreesToRadians(endAngleDeg);
    return createEntity(ids, geom, layerId, style);
}

Entity createArcFrom3Points(IdSource& ids, const Point2& p1, const Point2& p2, const Point2& p3,
                            LayerId layerId, const EntityStyle& style) {
    const double ax = p1.x, ay = p1.y;
    const double bx = p2.x, by = p2.y;
    const double cx = p3.x, cy = p3.y;

    const double d = 2.0 * (ax * (by - cy) + bx * (cy - ay) + cx * (ay - by));
    if (std::fabs(d) < kernel_constants::DETERMINANT_EPSILON) {
        return createLine(ids, p1, p3, layerId, style);
    }

    const double aSq = ax * ax + ay * ay;
    const double bSq = bx * bx + by * by;
    const double cSq = cx * cx + cy * cy;
    const Point2 center{
        (aSq * (by - cy) + bSq * (cy - ay) + cSq * (ay - by)) / d,
        (aSq * (cx - bx) + bSq * (ax - cx) + cSq * (bx - ax)) / d,
    };

    ArcGeom geom;
    geom.center = center;
    geom.radius = distance(p1, center);
    geom.startAngle = std::atan2(ay - center.y, ax - center.x);
    geom.endAngle = std::atan2(cy - center.y, cx - center.x);
    return createEntity(ids, geom, layerId, style);
}

Entity createRectangle(IdSource& ids, const Point2& topLeft, double width, double height,
                       LayerId layerId, const EntityStyle& style) {
    RectangleGeom geom;
    geom.topLeft = topLeft;
    geom.width = width;
    geom.height = height;
    return createEntity(ids, geom, layerId, style);
}

Entity createText(IdSource& ids, const Point2& position, std::string content, double fontSize,
                  LayerId layerId, const EntityStyle& style) {
    TextGeom geom;
    geom.position = position;
    geom.content = std::move(content);
    geom.fontSize = fontSize;
    return createEntity(ids, std::move(geom), layerId, style);
}

Entity createEllipse(IdSource& ids, const Point2& center, double radiusX, double radiusY,
                     double rotationDeg, LayerId layerId, const EntityStyle& style) {
    EllipseGeom geom;
    geom.center = center;
    geom.radiusX = radiusX;
    geom.radiusY = radiusY;
    geom.rotation = degreesToRadians(rotationDeg);
    return createEntity(ids, geom, layerId, style);
}

Entity createPoint(IdSource& ids, const Point2& position, PointMarker marker, double size,
                   LayerId layerId, const EntityStyle& style) {
    return createEntity(ids, PointGeom{position, marker, size}, layerId, style);
}

Entity createSpline(IdSource& ids, std::vector<Point2> controlPoints, bool closed, double tension,
                    LayerId layerId, const EntityStyle& style) {
    SplineGeom geom;
    geom.controlPoints = std::move(controlPoints);
    geom.closed = closed;
    geom.tension = tension;
    return createEntity(ids, std::move(geom), layerId, style);
}

std::vector<Point2> interpolateSpline(const SplineGeom& spline, int segments) {
    const std::vector<Point2>& pts = spline.controlPoints;
    const std::size_t n = pts.size();
    if (n < 2 || segments <= 0) return pts;

    const double tension = spline.tension;
    const std::size_t spans = spline.closed ? n : n - 1;
    std::vector<Point2> out;
    out.reserve(spans * static_cast<std::size_t>(segments) + 1);

    for (std::size_t i = 0; i < spans; ++i) {
        const Point2& p0 = pts[(i + n - 1) % n];
        const Point2& p1 = pts[i];
        const Point2& p2 = pts[(i + 1) % n];
        const Point2& p3 = pts[(i + 2) % n];

        for (int step = 0; step < segments; ++step) {
            const double s = static_cast<double>(step) / segments;
            const double s2 = s * s;
            const double s3 = s2 * s;

            const double h1 = 2.0 * s3 - 3.0 * s2 + 1.0;
            const double h2 = s3 - 2.0 * s2 + s;
            const double h3 = -2.0 * s3 + 3.0 * s2;
            const double h4 = s3 - s2;

            out.push_back(Point2{
                h1 * p1.x + h2 * tension * (p2.x - p0.x) + h3 * p2.x + h4 * tension * (p3.x - p1.x),
                h1 * p1.y + h2 * tension * (p2.y - p0.y) + h3 * p2.y + h4 * tension * (p3.y - p1.y),
            });
        }
    }

    if (!spline.closed) out.push_back(pts.back());
    return out;
}

std::vector<Point2> rectangleCorners(const RectangleGeom& rect) {
    const Point2& tl = rect.topLeft;
    return {
        tl,
        Point2{tl.x + rect.width, tl.y},
        Point2{tl.x + rect.width, tl.y + rect.height},
        Point2{tl.x, tl.y + rect.height},
    };
}

} // namespace civcad
