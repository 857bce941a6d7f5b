#pragma once

#include "civcad/core/id_source.h"
#include "civcad/entity/entity_types.h"
#include <string>
#include <vector>

namespace civcad {

// Dimension factories place their output on the Dimensions layer with the
// style's line color as an explicit stroke.

// Dimension line offset along the +90 degree normal of start->end.
Entity createLinearDimension(IdSource& ids, const Point2& start, const Point2& end,
                             double offset = 10.0, const DimensionStyle& style = DimensionStyle{});
Entity createAlignedDimension(IdSource& ids, const Point2& start, const Point2& end,
                              double offset = 10.0, const DimensionStyle& style = DimensionStyle{});
// Dimension line at min(y) - |yOffset|.
Entity createHorizontalDimension(IdSource& ids, const Point2& start, const Point2& end,
                                 double yOffset = 10.0, const DimensionStyle& style = DimensionStyle{});
// Dimension line at min(x) - |xOffset|.
Entity createVerticalDimension(IdSource& ids, const Point2& start, const Point2& end,
                               double xOffset = 10.0, const DimensionStyle& style = DimensionStyle{});
Entity createRadiusDimension(IdSource& ids, const Point2& center, double radius,
                             double angle = 0.0, const DimensionStyle& style = DimensionStyle{});
Entity createDiameterDimension(IdSource& ids, const Point2& center, double radius,
                               double angle = 0.0, const DimensionStyle& style = DimensionStyle{});
Entity createAngularDimension(IdSource& ids, const Point2& center, double startAngle, double endAngle,
                              double radius = 20.0, const DimensionStyle& style = DimensionStyle{});
Entity createArcLengthDimension(IdSource& ids, const Point2& center, double radius,
                                double startAngle, double endAngle, double offset = 5.0,
                                const DimensionStyle& style = DimensionStyle{});
Entity createAreaDimension(IdSource& ids, const std::vector<Point2>& points,
                           const DimensionStyle& style = DimensionStyle{});

// =============================================================================
// Formatting
// =============================================================================

std::string formatFixed(double value, int precision);
std::string formatDimension(double value, const DimensionStyle& style = DimensionStyle{});
std::string formatArea(double value, const DimensionStyle& style = DimensionStyle{});
std::string formatCoordinates(const Point2& p, int precision = 2);

// Display text for a measured value of the given kind (prefix and unit included).
std::string dimensionDisplayText(DimensionKind kind, double value, const DimensionStyle& style);

// =============================================================================
// Measurements (no entity produced)
// =============================================================================

struct DistanceMeasurement {
    double distance;
    double deltaX;
    double deltaY;
    double angle;
    double angleDegrees;
};

struct AngleMeasurement {
    double radians;
    double degrees;
};

struct PolygonMeasurement {
    double area;
    double perimeter;
    Point2 centroid;
    std::size_t vertexCount;
};

struct CircleMeasurement {
    double radius;
    double diameter;
    double circumference;
    double area;
};

struct ArcMeasurement {
    double radius;
    double angle;
    double angleDegrees;
    double arcLength;
    double chordLength;
};

struct RectangleMeasurement {
    double width;
    double height;
    double area;
    double perimeter;
    double diagonal;
};

DistanceMeasurement measureDistance(const Point2& a, const Point2& b);
// Counter-clockwise angle at vertex from the ray vertex->a to vertex->b.
AngleMeasurement measureAngle(const Point2& a, const Point2& vertex, const Point2& b);
PolygonMeasurement measurePolygon(const std::vector<Point2>& points);
CircleMeasurement measureCircle(double radius);
ArcMeasurement measureArc(double radius, double startAngle, double endAngle);
RectangleMeasurement measureRectangle(double width, double height);

} // namespace civcad
