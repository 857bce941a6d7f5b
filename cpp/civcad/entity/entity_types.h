#pragma once

#include "civcad/core/types.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace civcad {

struct BlockDefinition;
struct Entity;

// =============================================================================
// Style
// =============================================================================

enum class ColorSource : std::uint8_t {
    Explicit = 0,
    ByLayer = 1,
    ByBlock = 2,
};

struct StrokeColor {
    ColorSource source = ColorSource::Explicit;
    Rgb rgb = 0x000000;

    static StrokeColor explicitColor(Rgb rgb) { return StrokeColor{ColorSource::Explicit, rgb}; }
    static StrokeColor byLayer() { return StrokeColor{ColorSource::ByLayer, 0}; }
    static StrokeColor byBlock() { return StrokeColor{ColorSource::ByBlock, 0}; }
};

bool operator==(const StrokeColor& a, const StrokeColor& b);
inline bool operator!=(const StrokeColor& a, const StrokeColor& b) { return !(a == b); }

enum class LineType : std::uint8_t {
    Continuous = 0,
    Dashed,
    Dotted,
    DashDot,
    DashDotDot,
    Center,
    Hidden,
    Phantom,
    ByLayer,
};

const char* lineTypeName(LineType type);
std::optional<LineType> parseLineType(const std::string& name);

struct EntityStyle {
    StrokeColor stroke;
    std::optional<double> strokeWidth = 1.0; // empty: by layer
    std::optional<Rgb> fill;
    double opacity = 1.0;
    LineType lineType = LineType::Continuous;
};

bool operator==(const EntityStyle& a, const EntityStyle& b);
inline bool operator!=(const EntityStyle& a, const EntityStyle& b) { return !(a == b); }

// =============================================================================
// Per-kind geometry
// =============================================================================

struct LineGeom {
    Point2 start;
    Point2 end;
};

struct PolylineGeom {
    std::vector<Point2> points;
    bool closed = false;
};

struct CircleGeom {
    Point2 center;
    double radius = 0.0;
};

// Counter-clockwise from startAngle to endAngle, radians.
struct ArcGeom {
    Point2 center;
    double radius = 0.0;
    double startAngle = 0.0;
    double endAngle = 0.0;
};

// topLeft is the minimum corner; width and height extend along +x and +y.
struct RectangleGeom {
    Point2 topLeft;
    double width = 0.0;
    double height = 0.0;
    double cornerRadius = 0.0;
};

enum class TextAlign : std::uint8_t { Left = 0, Center = 1, Right = 2 };

struct TextGeom {
    Point2 position;
    std::string content;
    double fontSize = 12.0;
    std::string fontFamily = "Arial";
    TextAlign alignment = TextAlign::Left;
    double rotation = 0.0;
};

enum class DimensionKind : std::uint8_t {
    Linear = 0,
    Aligned,
    Horizontal,
    Vertical,
    Radius,
    Diameter,
    Angular,
    ArcLength,
    Area,
};

struct DimensionStyle {
    double textHeight = 2.5;
    double arrowSize = 2.0;
    double extensionLineOffset = 1.0;
    double extensionLineExtension = 1.5;
    double dimensionLineGap = 0.5;
    Rgb textColor = 0x000000;
    Rgb lineColor = 0x000000;
    int precision = 2;
    std::string units = "m";
    bool showUnits = true;
};

bool operator==(const DimensionStyle& a, const DimensionStyle& b);

struct DimensionGeom {
    DimensionKind kind = DimensionKind::Linear;
    Point2 start;            // first measured point (center for radius)
    Point2 end;              // second measured point
    Point2 dimLineStart;
    Point2 dimLineEnd;
    Point2 textPosition;
    double textRotation = 0.0;
    double measuredValue = 0.0;
    std::string displayText;
    std::optional<Point2> center; // radius, diameter, angular, arc length
    double radius = 0.0;
    double startAngle = 0.0;
    double endAngle = 0.0;
    std::vector<Point2> areaPoints;
    DimensionStyle style;
};

struct HatchGeom {
    std::vector<Point2> boundary;
    std::optional<EntityId> boundaryRef; // legacy hatches may carry only this
    std::string patternName = "diagonal45";
    double scale = 1.0;
    double rotation = 0.0;
};

// Materialized entities are a projection of (definition, position, scale, rotation)
// and are regenerated whenever one of those changes.
struct BlockInstanceGeom {
    BlockId blockId = kNoId;
    std::string blockName;
    std::shared_ptr<const BlockDefinition> definition;
    Point2 position;
    double scale = 1.0;
    double rotation = 0.0;
    std::vector<Entity> entities;
};

enum class PointMarker : std::uint8_t { Cross = 0, Circle, Dot, Square };

struct PointGeom {
    Point2 position;
    PointMarker marker = PointMarker::Cross;
    double size = 1.0;
};

struct EllipseGeom {
    Point2 center;
    double radiusX = 0.0;
    double radiusY = 0.0;
    double rotation = 0.0;
};

struct SplineGeom {
    std::vector<Point2> controlPoints;
    bool closed = false;
    double tension = 0.5;
};

// =============================================================================
// Entity
// =============================================================================

// Alternative order matches EntityKind.
using EntityGeometry = std::variant<
    LineGeom,
    PolylineGeom,
    CircleGeom,
    ArcGeom,
    RectangleGeom,
    TextGeom,
    DimensionGeom,
    HatchGeom,
    BlockInstanceGeom,
    PointGeom,
    EllipseGeom,
    SplineGeom>;

enum class EntityKind : std::uint8_t {
    Line = 0,
    Polyline,
    Circle,
    Arc,
    Rectangle,
    Text,
    Dimension,
    Hatch,
    BlockInstance,
    Point,
    Ellipse,
    Spline,
};

const char* entityKindName(EntityKind kind);

struct Entity {
    EntityId id = kNoId;
    LayerId layerId = kDefaultLayerId;
    bool visible = true;
    bool locked = false;
    EntityStyle style;
    std::map<std::string, std::string> metadata; // opaque to the kernel
    EntityGeometry geometry;

    EntityKind kind() const noexcept { return static_cast<EntityKind>(geometry.index()); }

    template <typename T>
    const T* as() const noexcept { return std::get_if<T>(&geometry); }

    template <typename T>
    T* as() noexcept { return std::get_if<T>(&geometry); }
};

using EntityList = std::vector<Entity>;

bool operator==(const LineGeom& a, const LineGeom& b);
bool operator==(const PolylineGeom& a, const PolylineGeom& b);
bool operator==(const CircleGeom& a, const CircleGeom& b);
bool operator==(const ArcGeom& a, const ArcGeom& b);
bool operator==(const RectangleGeom& a, const RectangleGeom& b);
bool operator==(const TextGeom& a, const TextGeom& b);
bool operator==(const DimensionGeom& a, const DimensionGeom& b);
bool operator==(const HatchGeom& a, const HatchGeom& b);
bool operator==(const BlockInstanceGeom& a, const BlockInstanceGeom& b);
bool operator==(const PointGeom& a, const PointGeom& b);
bool operator==(const EllipseGeom& a, const EllipseGeom& b);
bool operator==(const SplineGeom& a, const SplineGeom& b);
bool operator==(const Entity& a, const Entity& b);
inline bool operator!=(const Entity& a, const Entity& b) { return !(a == b); }

// Linear search by id; nullptr when absent.
const Entity* findEntity(const EntityList& entities, EntityId id);

} // namespace civcad
