#pragma once

#include "civcad/core/id_source.h"
#include "civcad/entity/entity_types.h"
#include <optional>
#include <string>
#include <vector>

namespace civcad {

enum class HatchPatternType : std::uint8_t {
    Solid = 0,
    Lines,
    Crosshatch,
    Dots,
    Circles,
    Brick,
    Waves,
    Grass,
    Zigzag,
    WoodGrain,
    RandomLines,
};

struct HatchPattern {
    const char* id;
    const char* name;
    HatchPatternType type;
    double angle;   // degrees; first family for crosshatch
    double angle2;  // crosshatch second family
    double spacing;
    const char* description;
};

// Static table in declaration order.
const std::vector<HatchPattern>& hatchPatterns();

// nullptr when the name is not in the table.
const HatchPattern* findHatchPattern(const std::string& id);

// Unknown names fall back to diagonal45.
const HatchPattern& resolveHatchPattern(const std::string& id);

std::vector<std::string> listHatchPatterns();

struct HatchOptions {
    LayerId layerId = kDefaultLayerId;
    Rgb color = 0x000000;
    std::optional<Rgb> fill;
    double opacity = 1.0;
    double scale = 1.0;
    double rotation = 0.0;
};

Entity createHatch(IdSource& ids, std::vector<Point2> boundary,
                   const std::string& patternName = "diagonal45",
                   const HatchOptions& options = HatchOptions{});

/**
 * Hatch bounded by an existing entity: rectangle corners, the points of a closed
 * polyline, or a regular 32-gon inscribed in a circle. The hatch records the
 * source id in boundaryRef.
 * @throws KernelException(InvalidHatchSource) for open polylines and other kinds.
 */
Entity createHatchFromEntity(IdSource& ids, const Entity& source,
                             const std::string& patternName = "diagonal45",
                             const HatchOptions& options = HatchOptions{});

} // namespace civcad
