#include "civcad/entity/dimension_factory.h"
#include "civcad/core/util.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace civcad {

namespace {

EntityStyle dimensionEntityStyle(const DimensionStyle& style) {
    EntityStyle s;
    s.stroke = StrokeColor::explicitColor(style.lineColor);
    return s;
}

Entity makeDimension(IdSource& ids, DimensionGeom geom) {
    const EntityStyle style = dimensionEntityStyle(geom.style);
    return createEntity(ids, std::move(geom), kDimensionsLayerId, style);
}

double sweepOf(double startAngle, double endAngle) {
    double sweep = endAngle - startAngle;
    if (sweep < 0.0) sweep += 2.0 * kPi;
    return sweep;
}

} // namespace

std::string formatFixed(double value, int precision) {
    if (precision < 0) precision = 0;
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

std::string formatDimension(double value, const DimensionStyle& style) {
    std::string out = formatFixed(value, style.precision);
    if (style.showUnits) out += " " + style.units;
    return out;
}

std::string formatArea(double value, const DimensionStyle& style) {
    std::string out = formatFixed(value, style.precision);
    if (style.showUnits) out += " " + style.units + "\xC2\xB2";
    return out;
}

std::string formatCoordinates(const Point2& p, int precision) {
    return "(" + formatFixed(p.x, precision) + ", " + formatFixed(p.y, precision) + ")";
}

std::string dimensionDisplayText(DimensionKind kind, double value, const DimensionStyle& style) {
    switch (kind) {
        case DimensionKind::Linear:
        case DimensionKind::Aligned:
        case DimensionKind::Horizontal:
        case DimensionKind::Vertical:
            return formatDimension(value, style);
        case DimensionKind::Radius:
            return "R" + formatDimension(value, style);
        case DimensionKind::Diameter:
            return "\xE2\x8C\x80" + formatDimension(value, style);
        case DimensionKind::Angular:
            return formatFixed(value, style.precision) + "\xC2\xB0";
        case DimensionKind::ArcLength:
            return "\xE2\x8C\x92" + formatDimension(value, style);
        case DimensionKind::Area:
            return formatArea(value, style);
    }
    return formatDimension(value, style);
}

Entity createLinearDimension(IdSource& ids, const Point2& start, const Point2& end,
                             double offset, const DimensionStyle& style) {
    const double angle = angleBetweenPoints(start, end);
    const double perp = angle + kPi / 2.0;
    const Point2 shift{std::cos(perp) * offset, std::sin(perp) * offset};

    DimensionGeom geom;
    geom.kind = DimensionKind::Linear;
    geom.start = start;
    geom.end = end;
    geom.dimLineStart = addPoints(start, shift);
    geom.dimLineEnd = addPoints(end, shift);
    geom.textPosition = midpoint(geom.dimLineStart, geom.dimLineEnd);
    geom.textRotation = angle;
    geom.measuredValue = distance(start, end);
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createAlignedDimension(IdSource& ids, const Point2& start, const Point2& end,
                              double offset, const DimensionStyle& style) {
    Entity e = createLinearDimension(ids, start, end, offset, style);
    std::get<DimensionGeom>(e.geometry).kind = DimensionKind::Aligned;
    return e;
}

Entity createHorizontalDimension(IdSource& ids, const Point2& start, const Point2& end,
                                 double yOffset, const DimensionStyle& style) {
    const double dimY = std::min(start.y, end.y) - std::fabs(yOffset);

    DimensionGeom geom;
    geom.kind = DimensionKind::Horizontal;
    geom.start = start;
    geom.end = end;
    geom.dimLineStart = Point2{start.x, dimY};
    geom.dimLineEnd = Point2{end.x, dimY};
    geom.textPosition = midpoint(geom.dimLineStart, geom.dimLineEnd);
    geom.textRotation = 0.0;
    geom.measuredValue = std::fabs(end.x - start.x);
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createVerticalDimension(IdSource& ids, const Point2& start, const Point2& end,
                               double xOffset, const DimensionStyle& style) {
    const double dimX = std::min(start.x, end.x) - std::fabs(xOffset);

    DimensionGeom geom;
    geom.kind = DimensionKind::Vertical;
    geom.start = start;
    geom.end = end;
    geom.dimLineStart = Point2{dimX, start.y};
    geom.dimLineEnd = Point2{dimX, end.y};
    geom.textPosition = midpoint(geom.dimLineStart, geom.dimLineEnd);
    geom.textRotation = -kPi / 2.0;
    geom.measuredValue = std::fabs(end.y - start.y);
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createRadiusDimension(IdSource& ids, const Point2& center, double radius,
                             double angle, const DimensionStyle& style) {
    DimensionGeom geom;
    geom.kind = DimensionKind::Radius;
    geom.center = center;
    geom.radius = radius;
    geom.startAngle = angle;
    geom.endAngle = angle;
    geom.start = center;
    geom.end = polarToCartesian(center, radius, angle);
    geom.dimLineStart = geom.start;
    geom.dimLineEnd = geom.end;
    geom.textPosition = polarToCartesian(center, radius * 0.6, angle);
    geom.textRotation = angle;
    geom.measuredValue = radius;
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, radius, style);
    return makeDimension(ids, std::move(geom));
}

Entity createDiameterDimension(IdSource& ids, const Point2& center, double radius,
                               double angle, const DimensionStyle& style) {
    DimensionGeom geom;
    geom.kind = DimensionKind::Diameter;
    geom.center = center;
    geom.radius = radius;
    geom.startAngle = angle;
    geom.endAngle = angle;
    geom.start = polarToCartesian(center, -radius, angle);
    geom.end = polarToCartesian(center, radius, angle);
    geom.dimLineStart = geom.start;
    geom.dimLineEnd = geom.end;
    geom.textPosition = center;
    geom.textRotation = angle;
    geom.measuredValue = radius * 2.0;
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createAngularDimension(IdSource& ids, const Point2& center, double startAngle, double endAngle,
                              double radius, const DimensionStyle& style) {
    const double sweep = sweepOf(startAngle, endAngle);
    const double midAngle = startAngle + sweep / 2.0;

    DimensionGeom geom;
    geom.kind = DimensionKind::Angular;
    geom.center = center;
    geom.radius = radius;
    geom.startAngle = startAngle;
    geom.endAngle = endAngle;
    geom.start = polarToCartesian(center, radius, startAngle);
    geom.end = polarToCartesian(center, radius, endAngle);
    geom.dimLineStart = geom.start;
    geom.dimLineEnd = geom.end;
    geom.textPosition = polarToCartesian(center, radius * 1.2, midAngle);
    geom.textRotation = midAngle;
    geom.measuredValue = radiansToDegrees(sweep);
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createArcLengthDimension(IdSource& ids, const Point2& center, double radius,
                                double startAngle, double endAngle, double offset,
                                const DimensionStyle& style) {
    const double sweep = sweepOf(startAngle, endAngle);
    const double midAngle = startAngle + sweep / 2.0;
    const double dimRadius = radius + offset;

    DimensionGeom geom;
    geom.kind = DimensionKind::ArcLength;
    geom.center = center;
    geom.radius = dimRadius;
    geom.startAngle = startAngle;
    geom.endAngle = endAngle;
    geom.start = polarToCartesian(center, radius, startAngle);
    geom.end = polarToCartesian(center, radius, endAngle);
    geom.dimLineStart = polarToCartesian(center, dimRadius, startAngle);
    geom.dimLineEnd = polarToCartesian(center, dimRadius, endAngle);
    geom.textPosition = polarToCartesian(center, dimRadius, midAngle);
    geom.textRotation = midAngle + kPi / 2.0;
    geom.measuredValue = radius * sweep;
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

Entity createAreaDimension(IdSource& ids, const std::vector<Point2>& points, const DimensionStyle& style) {
    Point2 sum{};
    for (const Point2& p : points) sum = addPoints(sum, p);
    const Point2 centroid = points.empty() ? sum : scalePoint(sum, 1.0 / static_cast<double>(points.size()));

    DimensionGeom geom;
    geom.kind = DimensionKind::Area;
    geom.areaPoints = points;
    if (!points.empty()) {
        geom.start = points.front();
        geom.end = points.back();
    }
    geom.textPosition = centroid;
    geom.textRotation = 0.0;
    geom.measuredValue = polygonArea(points);
    geom.style = style;
    geom.displayText = dimensionDisplayText(geom.kind, geom.measuredValue, style);
    return makeDimension(ids, std::move(geom));
}

DistanceMeasurement measureDistance(const Point2& a, const Point2& b) {
    const double angle = angleBetweenPoints(a, b);
    return DistanceMeasurement{distance(a, b), b.x - a.x, b.y - a.y, angle, radiansToDegrees(angle)};
}

AngleMeasurement measureAngle(const Point2& a, const Point2& vertex, const Point2& b) {
    const double sweep = sweepOf(angleBetweenPoints(vertex, a), angleBetweenPoints(vertex, b));
    return AngleMeasurement{sweep, radiansToDegrees(sweep)};
}

PolygonMeasurement measurePolygon(const std::vector<Point2>& points) {
    Point2 sum{};
    for (const Point2& p : points) sum = addPoints(sum, p);
    const Point2 centroid = points.empty() ? sum : scalePoint(sum, 1.0 / static_cast<double>(points.size()));
    return PolygonMeasurement{polygonArea(points), polygonPerimeter(points), centroid, points.size()};
}

CircleMeasurement measureCircle(double radius) {
    return CircleMeasurement{radius, radius * 2.0, 2.0 * kPi * radius, kPi * radius * radius};
}

ArcMeasurement measureArc(double radius, double startAngle, double endAngle) {
    const double sweep = sweepOf(startAngle, endAngle);
    return ArcMeasurement{radius, sweep, radiansToDegrees(sweep), radius * sweep,
                          2.0 * radius * std::sin(sweep / 2.0)};
}

RectangleMeasurement measureRectangle(double width, double height) {
    return RectangleMeasurement{width, height, width * height, 2.0 * (width + height),
                                std::sqrt(width * width + height * height)};
}

} // namespace civcad
