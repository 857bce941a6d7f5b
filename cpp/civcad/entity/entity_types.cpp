#include "civcad/entity/entity_types.h"
#include "civcad/core/string_utils.h"

#include <algorithm>

namespace civcad {

bool operator==(const StrokeColor& a, const StrokeColor& b) {
    if (a.source != b.source) return false;
    return a.source != ColorSource::Explicit || a.rgb == b.rgb;
}

bool operator==(const EntityStyle& a, const EntityStyle& b) {
    return a.stroke == b.stroke && a.strokeWidth == b.strokeWidth && a.fill == b.fill &&
           a.opacity == b.opacity && a.lineType == b.lineType;
}

bool operator==(const DimensionStyle& a, const DimensionStyle& b) {
    return a.textHeight == b.textHeight && a.arrowSize == b.arrowSize &&
           a.extensionLineOffset == b.extensionLineOffset &&
           a.extensionLineExtension == b.extensionLineExtension &&
           a.dimensionLineGap == b.dimensionLineGap && a.textColor == b.textColor &&
           a.lineColor == b.lineColor && a.precision == b.precision && a.units == b.units &&
           a.showUnits == b.showUnits;
}

bool operator==(const LineGeom& a, const LineGeom& b) {
    return a.start == b.start && a.end == b.end;
}

bool operator==(const PolylineGeom& a, const PolylineGeom& b) {
    return a.closed == b.closed && a.points == b.points;
}

bool operator==(const CircleGeom& a, const CircleGeom& b) {
    return a.center == b.center && a.radius == b.radius;
}

bool operator==(const ArcGeom& a, const ArcGeom& b) {
    return a.center == b.center && a.radius == b.radius && a.startAngle == b.startAngle &&
           a.endAngle == b.endAngle;
}

bool operator==(const RectangleGeom& a, const RectangleGeom& b) {
    return a.topLeft == b.topLeft && a.width == b.width && a.height == b.height &&
           a.cornerRadius == b.cornerRadius;
}

bool operator==(const TextGeom& a, const TextGeom& b) {
    return a.position == b.position && a.content == b.content && a.fontSize == b.fontSize &&
           a.fontFamily == b.fontFamily && a.alignment == b.alignment && a.rotation == b.rotation;
}

bool operator==(const DimensionGeom& a, const DimensionGeom& b) {
    return a.kind == b.kind && a.start == b.start && a.end == b.end &&
           a.dimLineStart == b.dimLineStart && a.dimLineEnd == b.dimLineEnd &&
           a.textPosition == b.textPosition && a.textRotation == b.textRotation &&
           a.measuredValue == b.measuredValue && a.displayText == b.displayText &&
           a.center == b.center && a.radius == b.radius && a.startAngle == b.startAngle &&
           a.endAngle == b.endAngle && a.areaPoints == b.areaPoints && a.style == b.style;
}

bool operator==(const HatchGeom& a, const HatchGeom& b) {
    return a.boundary == b.boundary && a.boundaryRef == b.boundaryRef &&
           a.patternName == b.patternName && a.scale == b.scale && a.rotation == b.rotation;
}

bool operator==(const BlockInstanceGeom& a, const BlockInstanceGeom& b) {
    // Definitions are shared, so identity is the right comparison.
    return a.blockId == b.blockId && a.blockName == b.blockName && a.definition == b.definition &&
           a.position == b.position && a.scale == b.scale && a.rotation == b.rotation &&
           a.entities == b.entities;
}

bool operator==(const PointGeom& a, const PointGeom& b) {
    return a.position == b.position && a.marker == b.marker && a.size == b.size;
}

bool operator==(const EllipseGeom& a, const EllipseGeom& b) {
    return a.center == b.center && a.radiusX == b.radiusX && a.radiusY == b.radiusY &&
           a.rotation == b.rotation;
}

bool operator==(const SplineGeom& a, const SplineGeom& b) {
    return a.controlPoints == b.controlPoints && a.closed == b.closed && a.tension == b.tension;
}

bool operator==(const Entity& a, const Entity& b) {
    return a.id == b.id && a.layerId == b.layerId && a.visible == b.visible &&
           a.locked == b.locked && a.style == b.style && a.metadata == b.metadata &&
           a.geometry == b.geometry;
}

const char* entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Line: return "line";
        case EntityKind::Polyline: return "polyline";
        case EntityKind::Circle: return "circle";
        case EntityKind::Arc: return "arc";
        case EntityKind::Rectangle: return "rectangle";
        case EntityKind::Text: return "text";
        case EntityKind::Dimension: return "dimension";
        case EntityKind::Hatch: return "hatch";
        case EntityKind::BlockInstance: return "block";
        case EntityKind::Point: return "point";
        case EntityKind::Ellipse: return "ellipse";
        case EntityKind::Spline: return "spline";
    }
    return "unknown";
}

const char* lineTypeName(LineType type) {
    switch (type) {
        case LineType::Continuous: return "continuous";
        case LineType::Dashed: return "dashed";
        case LineType::Dotted: return "dotted";
        case LineType::DashDot: return "dashdot";
        case LineType::DashDotDot: return "dashdotdot";
        case LineType::Center: return "center";
        case LineType::Hidden: return "hidden";
        case LineType::Phantom: return "phantom";
        case LineType::ByLayer: return "bylayer";
    }
    return "continuous";
}

std::optional<LineType> parseLineType(const std::string& name) {
    const std::string lower = toLowerAscii(name);
    if (lower == "continuous" || lower == "solid") return LineType::Continuous;
    if (lower == "dashed") return LineType::Dashed;
    if (lower == "dotted") return LineType::Dotted;
    if (lower == "dashdot") return LineType::DashDot;
    if (lower == "dashdotdot") return LineType::DashDotDot;
    if (lower == "center") return LineType::Center;
    if (lower == "hidden") return LineType::Hidden;
    if (lower == "phantom") return LineType::Phantom;
    if (lower == "bylayer") return LineType::ByLayer;
    return std::nullopt;
}

const Entity* findEntity(const EntityList& entities, EntityId id) {
    const auto it = std::find_if(entities.begin(), entities.end(),
                                 [id](const Entity& e) { return e.id == id; });
    return it == entities.end() ? nullptr : &*it;
}

} // namespace civcad
