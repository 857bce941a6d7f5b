#pragma once

#include "civcad/core/types.h"
#include <optional>
#include <vector>

namespace civcad {

// =============================================================================
// Points and vectors
// =============================================================================

double distance(const Point2& a, const Point2& b);
double distance3D(const Point3& a, const Point3& b);
Point2 midpoint(const Point2& a, const Point2& b);
Point2 addPoints(const Point2& a, const Point2& b);
Point2 subtractPoints(const Point2& a, const Point2& b);
Point2 scalePoint(const Point2& p, double factor);

// Counter-clockwise rotation of p about center.
Point2 rotatePoint(const Point2& p, const Point2& center, double angle);

// Reflection of p across the infinite line through a and b. A zero-length
// axis leaves p unchanged.
Point2 reflectPoint(const Point2& p, const Point2& a, const Point2& b);

// Maps into [0, 2*pi).
double normalizeAngle(double angle);
double angleBetweenPoints(const Point2& from, const Point2& to);
Point2 polarToCartesian(const Point2& center, double radius, double angle);

// =============================================================================
// Segments, lines, circles
// =============================================================================

double distanceToSegment(const Point2& p, const Point2& a, const Point2& b);

/** Clamped projection onto segment ab; a zero-length segment yields a. */
Point2 nearestPointOnSegment(const Point2& p, const Point2& a, const Point2& b);

/** Projection onto segment ab, or nullopt when it falls outside [0,1] or ab has no length. */
std::optional<Point2> perpendicularFoot(const Point2& p, const Point2& a, const Point2& b);

/**
 * Intersection of segments p1p2 and p3p4 by Cramer's rule.
 * Returns nullopt when |det| < DETERMINANT_EPSILON or either parameter leaves [0,1].
 */
std::optional<Point2> segmentIntersection(const Point2& p1, const Point2& p2,
                                          const Point2& p3, const Point2& p4);

/** Same formula as segmentIntersection with no parameter clamp. */
std::optional<Point2> lineIntersection(const Point2& p1, const Point2& p2,
                                       const Point2& p3, const Point2& p4);

/**
 * Points where segment ab crosses the circle. Roots are taken in line-parameter
 * space, kept only inside [0,1]; a second root within ROOT_MERGE_EPSILON of the
 * first is dropped.
 */
std::vector<Point2> lineCircleIntersection(const Point2& a, const Point2& b,
                                           const Point2& center, double radius);

std::vector<Point2> circleCircleIntersection(const Point2& c1, double r1,
                                             const Point2& c2, double r2);

double arcLength(double radius, double startAngle, double endAngle);

// =============================================================================
// Polygons
// =============================================================================

double polygonArea(const std::vector<Point2>& points);
double polygonPerimeter(const std::vector<Point2>& points);
Point2 polygonCentroid(const std::vector<Point2>& points);
bool isPointInPolygon(const Point2& p, const std::vector<Point2>& polygon);
std::vector<Point2> regularPolygonVertices(const Point2& center, double radius, int sides, double rotation = 0.0);

// =============================================================================
// Bounding boxes
// =============================================================================

AABB boundsFromPoints(const std::vector<Point2>& points);
AABB expandBounds(const AABB& box, double margin);
AABB mergeBounds(const AABB& a, const AABB& b);
bool boxContainsPoint(const AABB& box, const Point2& p);
bool boxContainsBox(const AABB& outer, const AABB& inner);
bool boxesOverlap(const AABB& a, const AABB& b);
Point2 boundsCenter(const AABB& box);
double boundsWidth(const AABB& box);
double boundsHeight(const AABB& box);

// =============================================================================
// Units
// =============================================================================

enum class LengthUnit : std::uint8_t {
    Millimeter,
    Meter,
    Kilometer,
    Inch,
    Foot,
};

double millimetersPerUnit(LengthUnit unit);
double convertUnits(double value, LengthUnit from, LengthUnit to);
const char* lengthUnitSymbol(LengthUnit unit);

} // namespace civcad
