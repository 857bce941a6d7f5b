#pragma once

#include "civcad/core/id_source.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/entity/entity_types.h"
#include <string>
#include <vector>

namespace civcad {

// Every factory mints a fresh id from `ids`; layer and style default to the
// default layer and EntityStyle{}.

Entity createEntity(IdSource& ids, EntityGeometry geometry,
                    LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createLine(IdSource& ids, const Point2& start, const Point2& end,
                  LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createPolyline(IdSource& ids, std::vector<Point2> points, bool closed = false,
                      LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createCircle(IdSource& ids, const Point2& center, double radius,
                    LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

// Angles in degrees; stored in radians.
Entity createArc(IdSource& ids, const Point2& center, double radius,
                 double startAngleDeg, double endAngleDeg,
                 LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

/**
 * Arc through three points via the circumscribed circle. The arc runs from p1
 * to p3. When the points are collinear (|det| < DETERMINANT_EPSILON) the result
 * is a line from p1 to p3 instead.
 */
Entity createArcFrom3Points(IdSource& ids, const Point2& p1, const Point2& p2, const Point2& p3,
                            LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createRectangle(IdSource& ids, const Point2& topLeft, double width, double height,
                       LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createText(IdSource& ids, const Point2& position, std::string content,
                  double fontSize = kernel_constants::DEFAULT_FONT_SIZE,
                  LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

// Rotation in degrees; stored in radians.
Entity createEllipse(IdSource& ids, const Point2& center, double radiusX, double radiusY,
                     double rotationDeg = 0.0,
                     LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createPoint(IdSource& ids, const Point2& position, PointMarker marker = PointMarker::Cross,
                   double size = 1.0,
                   LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

Entity createSpline(IdSource& ids, std::vector<Point2> controlPoints, bool closed = false,
                    double tension = 0.5,
                    LayerId layerId = kDefaultLayerId, const EntityStyle& style = EntityStyle{});

/**
 * Catmull-Rom expansion of a spline's control polygon. Each segment i uses
 * neighbours i-1, i, i+1, i+2 (indices wrap). Open splines emit n-1 segments and
 * end on the last control point; closed ones emit n. The spline is not modified.
 */
std::vector<Point2> interpolateSpline(const SplineGeom& spline,
                                      int segments = kernel_constants::DEFAULT_SPLINE_SEGMENTS);

// Corner order: topLeft, +x, +x+y, +y.
std::vector<Point2> rectangleCorners(const RectangleGeom& rect);

} // namespace civcad
