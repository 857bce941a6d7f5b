#include "civcad/geometry/geometry.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace civcad {

namespace {

using kernel_constants::DETERMINANT_EPSILON;
using kernel_constants::ROOT_MERGE_EPSILON;

double crossDeterminant(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4) {
    return (p1.x - p2.x) * (p3.y - p4.y) - (p1.y - p2.y) * (p3.x - p4.x);
}

} // namespace

double distance(const Point2& a, const Point2& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

double distance3D(const Point3& a, const Point3& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double dz = b.z - a.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

Point2 midpoint(const Point2& a, const Point2& b) {
    return Point2{(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}

Point2 addPoints(const Point2& a, const Point2& b) { return Point2{a.x + b.x, a.y + b.y}; }
Point2 subtractPoints(const Point2& a, const Point2& b) { return Point2{a.x - b.x, a.y - b.y}; }
Point2 scalePoint(const Point2& p, double factor) { return Point2{p.x * factor, p.y * factor}; }

Point2 rotatePoint(const Point2& p, const Point2& center, double angle) {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    const double dx = p.x - center.x;
    const double dy = p.y - center.y;
    return Point2{center.x + dx * c - dy * s, center.y + dx * s + dy * c};
}

Point2 reflectPoint(const Point2& p, const Point2& a, const Point2& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double lenSq = dx * dx + dy * dy;
    if (lenSq == 0.0) return p;
    const double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
    const double fx = a.x + t * dx;
    const double fy = a.y + t * dy;
    return Point2{2.0 * fx - p.x, 2.0 * fy - p.y};
}

double normalizeAngle(double angle) {
    const double twoPi = 2.0 * kPi;
    double a = std::fmod(angle, twoPi);
    if (a < 0.0) a += twoPi;
    return a;
}

double angleBetweenPoints(const Point2& from, const Point2& to) {
    return std::atan2(to.y - from.y, to.x - from.x);
}

Point2 polarToCartesian(const Point2& center, double radius, double angle) {
    return Point2{center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
}

double distanceToSegment(const Point2& p, const Point2& a, const Point2& b) {
    return distance(p, nearestPointOnSegment(p, a, b));
}

Point2 nearestPointOnSegment(const Point2& p, const Point2& a, const Point2& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double lenSq = dx * dx + dy * dy;
    if (lenSq == 0.0) return a;
    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
    t = std::max(0.0, std::min(1.0, t));
    return Point2{a.x + t * dx, a.y + t * dy};
}

std::optional<Point2> perpendicularFoot(const Point2& p, const Point2& a, const Point2& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double lenSq = dx * dx + dy * dy;
    if (lenSq == 0.0) return std::nullopt;
    const double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
    if (t < 0.0 || t > 1.0) return std::nullopt;
    return Point2{a.x + t * dx, a.y + t * dy};
}

std::optional<Point2> segmentIntersection(const Point2& p1, const Point2& p2,
                                          const Point2& p3, const Point2& p4) {
    const double d = crossDeterminant(p1, p2, p3, p4);
    if (std::fabs(d) < DETERMINANT_EPSILON) return std::nullopt;

    const double t = ((p1.x - p3.x) * (p3.y - p4.y) - (p1.y - p3.y) * (p3.x - p4.x)) / d;
    const double u = -((p1.x - p2.x) * (p1.y - p3.y) - (p1.y - p2.y) * (p1.x - p3.x)) / d;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) return std::nullopt;

    return Point2{p1.x + t * (p2.x - p1.x), p1.y + t * (p2.y - p1.y)};
}

std::optional<Point2> lineIntersection(const Point2& p1, const Point2& p2,
                                       const Point2& p3, const Point2& p4) {
    const double d = crossDeterminant(p1, p2, p3, p4);
    if (std::fabs(d) < DETERMINANT_EPSILON) return std::nullopt;

    const double t = ((p1.x - p3.x) * (p3.y - p4.y) - (p1.y - p3.y) * (p3.x - p4.x)) / d;
    return Point2{p1.x + t * (p2.x - p1.x), p1.y + t * (p2.y - p1.y)};
}

std::vector<Point2> lineCircleIntersection(const Point2& a, const Point2& b,
                                           const Point2& center, double radius) {
    std::vector<Point2> out;
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double fx = a.x - center.x;
    const double fy = a.y - center.y;

    const double qa = dx * dx + dy * dy;
    if (qa == 0.0) return out;
    const double qb = 2.0 * (fx * dx + fy * dy);
    const double qc = fx * fx + fy * fy - radius * radius;
    const double disc = qb * qb - 4.0 * qa * qc;
    if (disc < 0.0) return out;

    const double root = std::sqrt(disc);
    const double t1 = (-qb - root) / (2.0 * qa);
    const double t2 = (-qb + root) / (2.0 * qa);

    if (t1 >= 0.0 && t1 <= 1.0) {
        out.push_back(Point2{a.x + t1 * dx, a.y + t1 * dy});
    }
    if (t2 >= 0.0 && t2 <= 1.0 && std::fabs(t2 - t1) > ROOT_MERGE_EPSILON) {
        out.push_back(Point2{a.x + t2 * dx, a.y + t2 * dy});
    }
    return out;
}

std::vector<Point2> circleCircleIntersection(const Point2& c1, double r1,
                                             const Point2& c2, double r2) {
    std::vector<Point2> out;
    const double d = distance(c1, c2);
    if (d == 0.0 || d > r1 + r2 || d < std::fabs(r1 - r2)) return out;

    const double a = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
    const double hSq = r1 * r1 - a * a;
    const double h = hSq > 0.0 ? std::sqrt(hSq) : 0.0;
    const double px = c1.x + a * (c2.x - c1.x) / d;
    const double py = c1.y + a * (c2.y - c1.y) / d;

    out.push_back(Point2{px + h * (c2.y - c1.y) / d, py - h * (c2.x - c1.x) / d});
    if (h > 0.0) {
        out.push_back(Point2{px - h * (c2.y - c1.y) / d, py + h * (c2.x - c1.x) / d});
    }
    return out;
}

double arcLength(double radius, double startAngle, double endAngle) {
    double sweep = endAngle - startAngle;
    if (sweep < 0.0) sweep += 2.0 * kPi;
    return radius * sweep;
}

double polygonArea(const std::vector<Point2>& points) {
    const std::size_t n = points.size();
    double area = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        area += points[i].x * points[j].y;
        area -= points[j].x * points[i].y;
    }
    return std::fabs(area / 2.0);
}

double polygonPerimeter(const std::vector<Point2>& points) {
    const std::size_t n = points.size();
    double perimeter = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        perimeter += distance(points[i], points[(i + 1) % n]);
    }
    return perimeter;
}

Point2 polygonCentroid(const std::vector<Point2>& points) {
    const std::size_t n = points.size();
    double cx = 0.0;
    double cy = 0.0;
    double area = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        const double cross = points[i].x * points[j].y - points[j].x * points[i].y;
        area += cross;
        cx += (points[i].x + points[j].x) * cross;
        cy += (points[i].y + points[j].y) * cross;
    }
    area /= 2.0;
    if (area == 0.0) {
        // Degenerate polygon: fall back to the vertex average.
        Point2 sum{};
        for (const Point2& p : points) sum = addPoints(sum, p);
        return n == 0 ? sum : scalePoint(sum, 1.0 / static_cast<double>(n));
    }
    return Point2{cx / (6.0 * area), cy / (6.0 * area)};
}

bool isPointInPolygon(const Point2& p, const std::vector<Point2>& polygon) {
    bool inside = false;
    const std::size_t n = polygon.size();
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& pi = polygon[i];
        const Point2& pj = polygon[j];
        if (((pi.y > p.y) != (pj.y > p.y)) &&
            (p.x < (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x)) {
            inside = !inside;
        }
    }
    return inside;
}

std::vector<Point2> regularPolygonVertices(const Point2& center, double radius, int sides, double rotation) {
    std::vector<Point2> out;
    if (sides < 3) return out;
    out.reserve(static_cast<std::size_t>(sides));
    for (int i = 0; i < sides; ++i) {
        const double angle = rotation + (2.0 * kPi * i) / sides;
        out.push_back(polarToCartesian(center, radius, angle));
    }
    return out;
}

AABB boundsFromPoints(const std::vector<Point2>& points) {
    if (points.empty()) return AABB{0.0, 0.0, 0.0, 0.0};
    AABB box{std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity(),
             -std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};
    for (const Point2& p : points) {
        box.minX = std::min(box.minX, p.x);
        box.minY = std::min(box.minY, p.y);
        box.maxX = std::max(box.maxX, p.x);
        box.maxY = std::max(box.maxY, p.y);
    }
    return box;
}

AABB expandBounds(const AABB& box, double margin) {
    return AABB{box.minX - margin, box.minY - margin, box.maxX + margin, box.maxY + margin};
}

AABB mergeBounds(const AABB& a, const AABB& b) {
    return AABB{std::min(a.minX, b.minX), std::min(a.minY, b.minY),
                std::max(a.maxX, b.maxX), std::max(a.maxY, b.maxY)};
}

bool boxContainsPoint(const AABB& box, const Point2& p) {
    return p.x >= box.minX && p.x <= box.maxX && p.y >= box.minY && p.y <= box.maxY;
}

bool boxContainsBox(const AABB& outer, const AABB& inner) {
    return inner.minX >= outer.minX && inner.maxX <= outer.maxX &&
           inner.minY >= outer.minY && inner.maxY <= outer.maxY;
}

bool boxesOverlap(const AABB& a, const AABB& b) {
    return a.minX <= b.maxX && a.maxX >= b.minX && a.minY <= b.maxY && a.maxY >= b.minY;
}

Point2 boundsCenter(const AABB& box) {
    return Point2{(box.minX + box.maxX) / 2.0, (box.minY + box.maxY) / 2.0};
}

double boundsWidth(const AABB& box) { return box.maxX - box.minX; }
double boundsHeight(const AABB& box) { return box.maxY - box.minY; }

double millimetersPerUnit(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::Millimeter: return 1.0;
        case LengthUnit::Meter: return 1000.0;
        case LengthUnit::Kilometer: return 1000000.0;
        case LengthUnit::Inch: return 25.4;
        case LengthUnit::Foot: return 304.8;
    }
    return 1.0;
}

double convertUnits(double value, LengthUnit from, LengthUnit to) {
    return value * millimetersPerUnit(from) / millimetersPerUnit(to);
}

const char* lengthUnitSymbol(LengthUnit unit) {
    switch (unit) {
        case LengthUnit::Millimeter: return "mm";
        case LengthUnit::Meter: return "m";
        case LengthUnit::Kilometer: return "km";
        case LengthUnit::Inch: return "in";
        case LengthUnit::Foot: return "ft";
    }
    return "m";
}

} // namespace civcad
