#include "civcad/exchange/dxf_writer.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/core/logging.h"
#include "civcad/core/string_utils.h"
#include "civcad/core/util.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/exchange/aci_palette.h"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace civcad {

namespace {

constexpr int kAciByBlock = 0;
constexpr int kAciByLayer = 256;
constexpr int kAciWhite = 7;

template <typename T>
void writePair(std::ostream& out, int code, const T& value) {
    out << code << '\n' << value << '\n';
}

void writePoint(std::ostream& out, int baseCode, const Point2& p) {
    writePair(out, baseCode, p.x);
    writePair(out, baseCode + 10, p.y);
    writePair(out, baseCode + 20, "0.0");
}

int entityAci(const Entity& entity) {
    switch (entity.style.stroke.source) {
        case ColorSource::ByLayer: return kAciByLayer;
        case ColorSource::ByBlock: return kAciByBlock;
        case ColorSource::Explicit: break;
    }
    return colorToAci(entity.style.stroke.rgb);
}

std::string layerName(const LayerList& layers, LayerId id) {
    const Layer* layer = findLayer(layers, id);
    return layer ? layer->name : std::string("0");
}

void beginRecord(std::ostream& out, const char* type, const std::string& layer, int aci) {
    writePair(out, 0, type);
    writePair(out, 8, layer);
    writePair(out, 62, aci);
}

void writeLwPolyline(std::ostream& out, const std::string& layer, int aci,
                     const std::vector<Point2>& points, bool closed) {
    beginRecord(out, "LWPOLYLINE", layer, aci);
    writePair(out, 90, points.size());
    writePair(out, 70, closed ? 1 : 0);
    for (const Point2& p : points) {
        writePair(out, 10, p.x);
        writePair(out, 20, p.y);
    }
}

// =============================================================================
// Sections
// =============================================================================

void writeHeader(std::ostream& out) {
    const double extent = kernel_constants::EXCHANGE_EXTENT;
    writePair(out, 0, "SECTION");
    writePair(out, 2, "HEADER");
    writePair(out, 9, "$ACADVER");
    writePair(out, 1, "AC1015");
    writePair(out, 9, "$INSBASE");
    writePoint(out, 10, {0.0, 0.0});
    writePair(out, 9, "$EXTMIN");
    writePoint(out, 10, {-extent, -extent});
    writePair(out, 9, "$EXTMAX");
    writePoint(out, 10, {extent, extent});
    writePair(out, 9, "$LIMMIN");
    writePair(out, 10, 0.0);
    writePair(out, 20, 0.0);
    writePair(out, 9, "$LIMMAX");
    writePair(out, 10, extent);
    writePair(out, 20, extent);
    writePair(out, 9, "$LUNITS");
    writePair(out, 70, 2);
    writePair(out, 9, "$LUPREC");
    writePair(out, 70, 4);
    writePair(out, 9, "$AUNITS");
    writePair(out, 70, 0);
    writePair(out, 9, "$AUPREC");
    writePair(out, 70, 2);
    writePair(out, 0, "ENDSEC");
}

void writeLineType(std::ostream& out, const char* name, const char* description,
                   const std::vector<double>& pattern) {
    writePair(out, 0, "LTYPE");
    writePair(out, 2, name);
    writePair(out, 70, 0);
    writePair(out, 3, description);
    writePair(out, 72, 65);
    writePair(out, 73, pattern.size());
    double total = 0.0;
    for (double d : pattern) total += std::abs(d);
    writePair(out, 40, total);
    for (double d : pattern) writePair(out, 49, d);
}

void writeLayerEntry(std::ostream& out, const Layer& layer) {
    // Layer colors must be 1..255 so the sign can carry visibility; black becomes white.
    int aci = colorToAci(layer.color);
    if (aci == kAciByBlock) aci = kAciWhite;
    const LineType type = layer.lineType == LineType::ByLayer ? LineType::Continuous : layer.lineType;
    writePair(out, 0, "LAYER");
    writePair(out, 2, layer.name);
    writePair(out, 70, layer.locked() ? 4 : 0);
    writePair(out, 62, layer.visible() ? aci : -aci);
    writePair(out, 6, toUpperAscii(lineTypeName(type)));
}

void writeTables(std::ostream& out, const ProjectDocument& project) {
    writePair(out, 0, "SECTION");
    writePair(out, 2, "TABLES");

    writePair(out, 0, "TABLE");
    writePair(out, 2, "LTYPE");
    writePair(out, 70, 8);
    writeLineType(out, "CONTINUOUS", "Solid line", {});
    writeLineType(out, "DASHED", "Dashed line", {5.0, -3.0});
    writeLineType(out, "DOTTED", "Dotted line", {0.5, -2.0});
    writeLineType(out, "DASHDOT", "Dash dot line", {5.0, -2.0, 0.5, -2.0});
    writeLineType(out, "DASHDOTDOT", "Dash dot dot line", {5.0, -2.0, 0.5, -2.0, 0.5, -2.0});
    writeLineType(out, "CENTER", "Center line", {12.5, -2.5, 2.5, -2.5});
    writeLineType(out, "HIDDEN", "Hidden line", {2.5, -1.25});
    writeLineType(out, "PHANTOM", "Phantom line", {12.5, -2.5, 2.5, -2.5, 2.5, -2.5});
    writePair(out, 0, "ENDTAB");

    writePair(out, 0, "TABLE");
    writePair(out, 2, "LAYER");
    writePair(out, 70, project.layers.size());
    for (const Layer& layer : project.layers) writeLayerEntry(out, layer);
    writePair(out, 0, "ENDTAB");

    writePair(out, 0, "TABLE");
    writePair(out, 2, "STYLE");
    writePair(out, 70, 1);
    writePair(out, 0, "STYLE");
    writePair(out, 2, "STANDARD");
    writePair(out, 70, 0);
    writePair(out, 40, 0.0);
    writePair(out, 41, 1.0);
    writePair(out, 50, 0.0);
    writePair(out, 71, 0);
    writePair(out, 42, kernel_constants::EXCHANGE_DEFAULT_TEXT_HEIGHT);
    writePair(out, 3, "txt");
    writePair(out, 4, "");
    writePair(out, 0, "ENDTAB");

    writePair(out, 0, "ENDSEC");
}

// =============================================================================
// Entity records
// =============================================================================

void writeDimension(std::ostream& out, const DimensionGeom& dim, const std::string& layer, int aci) {
    const int type = dxfDimensionType(dim.kind);
    beginRecord(out, "DIMENSION", layer, aci);
    writePair(out, 2, "*D0");
    writePoint(out, 10, dim.textPosition);
    writePoint(out, 11, dim.textPosition);
    writePair(out, 70, type);
    writePair(out, 1, dim.displayText.empty() ? std::string("<>") : dim.displayText);
    if (dim.textRotation != 0.0) writePair(out, 53, radiansToDegrees(dim.textRotation));
    writePoint(out, 13, dim.start);
    writePoint(out, 14, dim.end);
    writePair(out, 3, "STANDARD");
    if (type >= 2 && dim.center) writePoint(out, 15, *dim.center);
}

void writeEllipse(std::ostream& out, const EllipseGeom& e, const std::string& layer, int aci) {
    // The major axis is written relative to the center; ratio is minor / major.
    double major = e.radiusX;
    double minor = e.radiusY;
    double angle = e.rotation;
    if (e.radiusY > e.radiusX) {
        major = e.radiusY;
        minor = e.radiusX;
        angle += kPi / 2.0;
    }
    beginRecord(out, "ELLIPSE", layer, aci);
    writePoint(out, 10, e.center);
    writePoint(out, 11, {major * std::cos(angle), major * std::sin(angle)});
    writePair(out, 40, major > 0.0 ? minor / major : 1.0);
    writePair(out, 41, 0.0);
    writePair(out, 42, 2.0 * kPi);
}

void writeSpline(std::ostream& out, const SplineGeom& s, const std::string& layer, int aci) {
    beginRecord(out, "SPLINE", layer, aci);
    writePair(out, 70, (s.closed ? 1 : 0) | 8);
    writePair(out, 71, 3);
    writePair(out, 73, s.controlPoints.size());
    for (const Point2& p : s.controlPoints) writePoint(out, 10, p);
}

// Returns false when nothing was written.
bool writeEntity(std::ostream& out, const Entity& entity, const LayerList& layers) {
    const std::string layer = layerName(layers, entity.layerId);
    const int aci = entityAci(entity);

    switch (entity.kind()) {
        case EntityKind::Line: {
            const auto& g = std::get<LineGeom>(entity.geometry);
            beginRecord(out, "LINE", layer, aci);
            writePoint(out, 10, g.start);
            writePoint(out, 11, g.end);
            return true;
        }
        case EntityKind::Polyline: {
            const auto& g = std::get<PolylineGeom>(entity.geometry);
            writeLwPolyline(out, layer, aci, g.points, g.closed);
            return true;
        }
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(entity.geometry);
            beginRecord(out, "CIRCLE", layer, aci);
            writePoint(out, 10, g.center);
            writePair(out, 40, g.radius);
            return true;
        }
        case EntityKind::Arc: {
            const auto& g = std::get<ArcGeom>(entity.geometry);
            beginRecord(out, "ARC", layer, aci);
            writePoint(out, 10, g.center);
            writePair(out, 40, g.radius);
            writePair(out, 50, radiansToDegrees(g.startAngle));
            writePair(out, 51, radiansToDegrees(g.endAngle));
            return true;
        }
        case EntityKind::Rectangle: {
            const auto& g = std::get<RectangleGeom>(entity.geometry);
            writeLwPolyline(out, layer, aci, rectangleCorners(g), true);
            return true;
        }
        case EntityKind::Text: {
            const auto& g = std::get<TextGeom>(entity.geometry);
            beginRecord(out, "TEXT", layer, aci);
            writePoint(out, 10, g.position);
            writePair(out, 40, g.fontSize > 0.0 ? g.fontSize : kernel_constants::EXCHANGE_DEFAULT_TEXT_HEIGHT);
            writePair(out, 1, g.content);
            writePair(out, 50, radiansToDegrees(g.rotation));
            writePair(out, 7, "STANDARD");
            return true;
        }
        case EntityKind::Dimension:
            writeDimension(out, std::get<DimensionGeom>(entity.geometry), layer, aci);
            return true;
        case EntityKind::Hatch: {
            const auto& g = std::get<HatchGeom>(entity.geometry);
            if (g.boundary.size() < 2) {
                CIVCAD_LOG_WARN("dxf: hatch %u has no boundary points, skipped", entity.id);
                return false;
            }
            writeLwPolyline(out, layer, aci, g.boundary, true);
            return true;
        }
        case EntityKind::BlockInstance: {
            const auto& g = std::get<BlockInstanceGeom>(entity.geometry);
            writePair(out, 0, "INSERT");
            writePair(out, 8, layer);
            writePair(out, 2, g.blockName);
            writePoint(out, 10, g.position);
            writePair(out, 41, g.scale);
            writePair(out, 42, g.scale);
            writePair(out, 43, g.scale);
            writePair(out, 50, radiansToDegrees(g.rotation));
            return true;
        }
        case EntityKind::Point: {
            const auto& g = std::get<PointGeom>(entity.geometry);
            beginRecord(out, "POINT", layer, aci);
            writePoint(out, 10, g.position);
            return true;
        }
        case EntityKind::Ellipse:
            writeEllipse(out, std::get<EllipseGeom>(entity.geometry), layer, aci);
            return true;
        case EntityKind::Spline:
            writeSpline(out, std::get<SplineGeom>(entity.geometry), layer, aci);
            return true;
    }
    return false;
}

void writeBlockHeader(std::ostream& out, const std::string& name, const Point2& base) {
    writePair(out, 0, "BLOCK");
    writePair(out, 8, "0");
    writePair(out, 2, name);
    writePair(out, 70, 0);
    writePoint(out, 10, base);
    writePair(out, 3, name);
}

void writeBlockEnd(std::ostream& out) {
    writePair(out, 0, "ENDBLK");
    writePair(out, 8, "0");
}

void writeBlocks(std::ostream& out, const ProjectDocument& project) {
    writePair(out, 0, "SECTION");
    writePair(out, 2, "BLOCKS");

    writeBlockHeader(out, "*MODEL_SPACE", {0.0, 0.0});
    writeBlockEnd(out);
    writeBlockHeader(out, "*PAPER_SPACE", {0.0, 0.0});
    writeBlockEnd(out);

    for (const BlockDefinitionPtr& def : project.blocks.definitions()) {
        writeBlockHeader(out, def->name, def->basePoint);
        for (const Entity& e : def->entities) writeEntity(out, e, project.layers);
        writeBlockEnd(out);
    }

    writePair(out, 0, "ENDSEC");
}

void writeEntities(std::ostream& out, const ProjectDocument& project) {
    writePair(out, 0, "SECTION");
    writePair(out, 2, "ENTITIES");

    std::size_t written = 0;
    for (const Entity& e : project.entities) {
        if (!e.visible) continue;
        if (writeEntity(out, e, project.layers)) ++written;
    }
    CIVCAD_LOG_DEBUG("dxf: wrote %zu of %zu entities", written, project.entities.size());

    writePair(out, 0, "ENDSEC");
}

} // namespace

int dxfDimensionType(DimensionKind kind) {
    switch (kind) {
        case DimensionKind::Aligned: return 1;
        case DimensionKind::Angular: return 2;
        case DimensionKind::Diameter: return 3;
        case DimensionKind::Radius: return 4;
        case DimensionKind::Linear:
        case DimensionKind::Horizontal:
        case DimensionKind::Vertical:
        case DimensionKind::ArcLength:
        case DimensionKind::Area:
            break;
    }
    return 0;
}

void writeDxf(std::ostream& out, const ProjectDocument& project) {
    const auto oldPrecision = out.precision(15);
    writeHeader(out);
    writeTables(out, project);
    writeBlocks(out, project);
    writeEntities(out, project);
    writePair(out, 0, "EOF");
    out.precision(oldPrecision);
}

std::string exportDxf(const ProjectDocument& project) {
    std::ostringstream out;
    writeDxf(out, project);
    return out.str();
}

} // namespace civcad
