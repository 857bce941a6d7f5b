#include "civcad/entity/hatch_factory.h"
#include "civcad/core/errors.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"

#include <string>
#include <utility>

namespace civcad {

const std::vector<HatchPattern>& hatchPatterns() {
    static const std::vector<HatchPattern> kPatterns = {
        {"solid", "Solid", HatchPatternType::Solid, 0.0, 0.0, 0.0, "Solid fill"},
        {"horizontal", "Horizontal Lines", HatchPatternType::Lines, 0.0, 0.0, 5.0, "Horizontal parallel lines"},
        {"vertical", "Vertical Lines", HatchPatternType::Lines, 90.0, 0.0, 5.0, "Vertical parallel lines"},
        {"diagonal45", "Diagonal 45\xC2\xB0", HatchPatternType::Lines, 45.0, 0.0, 5.0, "Diagonal lines at 45 degrees"},
        {"diagonal135", "Diagonal 135\xC2\xB0", HatchPatternType::Lines, 135.0, 0.0, 5.0, "Diagonal lines at 135 degrees"},
        {"crosshatch", "Crosshatch", HatchPatternType::Crosshatch, 0.0, 90.0, 5.0, "Perpendicular crosshatch pattern"},
        {"diagonalCross", "Diagonal Cross", HatchPatternType::Crosshatch, 45.0, 135.0, 5.0, "Diagonal crosshatch pattern"},
        {"concrete", "Concrete", HatchPatternType::Dots, 0.0, 0.0, 8.0, "Concrete/aggregate pattern"},
        {"brick", "Brick", HatchPatternType::Brick, 0.0, 0.0, 10.0, "Brick/masonry pattern"},
        {"stone", "Stone", HatchPatternType::RandomLines, 0.0, 0.0, 0.0, "Random stone pattern"},
        {"earth", "Earth/Soil", HatchPatternType::Dots, 0.0, 0.0, 4.0, "Earth/soil section pattern"},
        {"gravel", "Gravel", HatchPatternType::Circles, 0.0, 0.0, 6.0, "Gravel pattern"},
        {"sand", "Sand", HatchPatternType::Dots, 0.0, 0.0, 2.0, "Sand pattern"},
        {"water", "Water", HatchPatternType::Waves, 0.0, 0.0, 8.0, "Water pattern"},
        {"grass", "Grass", HatchPatternType::Grass, 0.0, 0.0, 10.0, "Grass/vegetation pattern"},
        {"insulation", "Insulation", HatchPatternType::Zigzag, 0.0, 0.0, 10.0, "Insulation pattern"},
        {"steel", "Steel", HatchPatternType::Lines, 45.0, 0.0, 2.0, "Steel section pattern"},
        {"wood", "Wood", HatchPatternType::WoodGrain, 0.0, 0.0, 3.0, "Wood grain pattern"},
    };
    return kPatterns;
}

const HatchPattern* findHatchPattern(const std::string& id) {
    for (const HatchPattern& p : hatchPatterns()) {
        if (id == p.id) return &p;
    }
    return nullptr;
}

const HatchPattern& resolveHatchPattern(const std::string& id) {
    if (const HatchPattern* p = findHatchPattern(id)) return *p;
    return *findHatchPattern("diagonal45");
}

std::vector<std::string> listHatchPatterns() {
    std::vector<std::string> out;
    out.reserve(hatchPatterns().size());
    for (const HatchPattern& p : hatchPatterns()) out.emplace_back(p.id);
    return out;
}

Entity createHatch(IdSource& ids, std::vector<Point2> boundary, const std::string& patternName,
                   const HatchOptions& options) {
    HatchGeom geom;
    geom.boundary = std::move(boundary);
    geom.patternName = patternName;
    geom.scale = options.scale;
    geom.rotation = options.rotation;

    EntityStyle style;
    style.stroke = StrokeColor::explicitColor(options.color);
    style.fill = options.fill;
    style.opacity = options.opacity;
    return createEntity(ids, std::move(geom), options.layerId, style);
}

Entity createHatchFromEntity(IdSource& ids, const Entity& source, const std::string& patternName,
                             const HatchOptions& options) {
    std::vector<Point2> boundary;
    switch (source.kind()) {
        case EntityKind::Rectangle:
            boundary = rectangleCorners(std::get<RectangleGeom>(source.geometry));
            break;
        case EntityKind::Polyline: {
            const auto& g = std::get<PolylineGeom>(source.geometry);
            if (!g.closed) {
                throw KernelException(KernelError::InvalidHatchSource,
                                      "polyline must be closed for hatching");
            }
            boundary = g.points;
            break;
        }
        case EntityKind::Circle: {
            const auto& g = std::get<CircleGeom>(source.geometry);
            boundary = regularPolygonVertices(g.center, g.radius, kernel_constants::HATCH_CIRCLE_SEGMENTS);
            break;
        }
        default:
            throw KernelException(KernelError::InvalidHatchSource,
                                  std::string("cannot hatch entity of kind ") + entityKindName(source.kind()));
    }

    Entity hatch = createHatch(ids, std::move(boundary), patternName, options);
    std::get<HatchGeom>(hatch.geometry).boundaryRef = source.id;
    return hatch;
}

} // namespace civcad
