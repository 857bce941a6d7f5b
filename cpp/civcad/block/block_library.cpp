#include "civcad/block/block_library.h"
#include "civcad/core/errors.h"
#include "civcad/core/util.h"
#include "civcad/geometry/geometry.h"
#include "civcad/transform/transform_engine.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace civcad {

namespace {

// Definition parts carry no id; createBlockDefinition assigns them.
Entity part(EntityGeometry geometry, const EntityStyle& style = EntityStyle{}) {
    Entity e;
    e.geometry = std::move(geometry);
    e.style = style;
    return e;
}

EntityStyle widthStyle(double width) {
    EntityStyle s;
    s.strokeWidth = width;
    return s;
}

EntityStyle colorStyle(Rgb color) {
    EntityStyle s;
    s.stroke = StrokeColor::explicitColor(color);
    return s;
}

TextGeom label(const Point2& position, std::string content, double fontSize, TextAlign align) {
    TextGeom t;
    t.position = position;
    t.content = std::move(content);
    t.fontSize = fontSize;
    t.alignment = align;
    return t;
}

RectangleGeom rect(double x, double y, double width, double height) {
    RectangleGeom r;
    r.topLeft = Point2{x, y};
    r.width = width;
    r.height = height;
    return r;
}

} // namespace

// =============================================================================
// Definitions and instances
// =============================================================================

BlockDefinitionPtr createBlockDefinition(IdSource& ids, std::string name, const EntityList& entities,
                                         const Point2& basePoint) {
    auto def = std::make_shared<BlockDefinition>();
    def->id = ids.next();
    def->name = std::move(name);
    def->basePoint = basePoint;
    def->entities.reserve(entities.size());
    for (const Entity& e : entities) {
        Entity copy = e;
        copy.id = ids.next();
        def->entities.push_back(std::move(copy));
    }
    return def;
}

Point2 transformBlockPoint(const Point2& p, const Point2& basePoint, const Point2& position,
                           double scale, double rotation) {
    Point2 local = scalePoint(subtractPoints(p, basePoint), scale);
    local = rotatePoint(local, Point2{}, rotation);
    return addPoints(local, position);
}

EntityList materializeBlock(const BlockDefinition& definition, const Point2& position,
                            double scale, double rotation) {
    const Point2 origin{};
    EntityList out;
    out.reserve(definition.entities.size());
    for (const Entity& source : definition.entities) {
        Entity e = translateEntity(source, -definition.basePoint.x, -definition.basePoint.y);
        e = scaleEntity(e, scale, origin);
        if (rotation != 0.0) e = rotateEntity(e, rotation, origin);
        e = translateEntity(e, position.x, position.y);
        out.push_back(std::move(e));
    }
    return out;
}

Entity insertBlock(IdSource& ids, const BlockDefinitionPtr& definition, const Point2& position,
                   double scale, double rotation, LayerId layerId) {
    if (!definition) {
        throw KernelException(KernelError::UnknownBlock, "insertBlock: null block definition");
    }

    BlockInstanceGeom geom;
    geom.blockId = definition->id;
    geom.blockName = definition->name;
    geom.definition = definition;
    geom.position = position;
    geom.scale = scale;
    geom.rotation = rotation;
    geom.entities = materializeBlock(*definition, position, scale, rotation);

    Entity e;
    e.id = ids.next();
    e.layerId = layerId;
    e.geometry = std::move(geom);
    return e;
}

void rematerialize(BlockInstanceGeom& instance) {
    if (!instance.definition) {
        instance.entities.clear();
        return;
    }
    instance.entities = materializeBlock(*instance.definition, instance.position, instance.scale, instance.rotation);
}

Entity setInsertion(const Entity& instance, const Point2& position, double scale, double rotation) {
    Entity out = instance;
    BlockInstanceGeom* geom = out.as<BlockInstanceGeom>();
    if (!geom) return out;
    geom->position = position;
    geom->scale = scale;
    geom->rotation = rotation;
    rematerialize(*geom);
    return out;
}

// =============================================================================
// Library
// =============================================================================

BlockDefinitionPtr BlockLibrary::registerDefinition(BlockDefinitionPtr definition) {
    if (!definition) return definition;
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const BlockDefinitionPtr& d) { return d->name == definition->name; });
    if (it != definitions_.end()) {
        *it = definition;
    } else {
        definitions_.push_back(definition);
    }
    return definition;
}

bool BlockLibrary::remove(const std::string& name) {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const BlockDefinitionPtr& d) { return d->name == name; });
    if (it == definitions_.end()) return false;
    definitions_.erase(it);
    return true;
}

const BlockDefinition* BlockLibrary::find(const std::string& name) const {
    return findShared(name).get();
}

const BlockDefinition* BlockLibrary::findById(BlockId id) const {
    for (const auto& d : definitions_) {
        if (d->id == id) return d.get();
    }
    return nullptr;
}

BlockDefinitionPtr BlockLibrary::findShared(const std::string& name) const {
    for (const auto& d : definitions_) {
        if (d->name == name) return d;
    }
    return nullptr;
}

BlockDefinitionPtr BlockLibrary::get(const std::string& name) const {
    BlockDefinitionPtr def = findShared(name);
    if (!def) {
        throw KernelException(KernelError::UnknownBlock, "unknown block: " + name);
    }
    return def;
}

std::vector<std::string> BlockLibrary::names() const {
    std::vector<std::string> out;
    out.reserve(definitions_.size());
    for (const auto& d : definitions_) out.push_back(d->name);
    return out;
}

// =============================================================================
// Standard civil engineering symbols
// =============================================================================

BlockDefinitionPtr createNorthArrow(IdSource& ids, double size) {
    EntityStyle filled;
    filled.fill = 0x000000;
    const EntityList parts = {
        part(PolylineGeom{{
            {0.0, size},
            {-size * 0.3, -size * 0.3},
            {0.0, 0.0},
            {size * 0.3, -size * 0.3},
            {0.0, size},
        }, true}, filled),
        part(label(Point2{0.0, size * 1.3}, "N", size * 0.4, TextAlign::Center)),
    };
    return createBlockDefinition(ids, "North Arrow", parts);
}

BlockDefinitionPtr createSectionMarker(IdSource& ids, const std::string& labelText, double size) {
    const EntityList parts = {
        part(CircleGeom{Point2{}, size}),
        part(LineGeom{Point2{-size, 0.0}, Point2{size, 0.0}}),
        part(label(Point2{0.0, size * 0.3}, labelText, size * 0.8, TextAlign::Center)),
    };
    return createBlockDefinition(ids, "Section " + labelText, parts);
}

BlockDefinitionPtr createLevelMarker(IdSource& ids, const std::string& elevation, double size) {
    const EntityList parts = {
        part(PolylineGeom{{
            {-size, 0.0},
            {0.0, size},
            {size, 0.0},
            {0.0, -size},
            {-size, 0.0},
        }, true}),
        part(label(Point2{size * 1.5, 0.0}, elevation, size * 0.6, TextAlign::Left)),
    };
    return createBlockDefinition(ids, "Level " + elevation, parts);
}

BlockDefinitionPtr createDoorSymbol(IdSource& ids, double width, double openingAngleDeg) {
    const double angle = degreesToRadians(openingAngleDeg);
    EntityStyle dashed;
    dashed.lineType = LineType::Dashed;
    const EntityList parts = {
        part(LineGeom{Point2{}, Point2{width, 0.0}}, widthStyle(2.0)),
        part(ArcGeom{Point2{}, width, 0.0, angle}, dashed),
        part(LineGeom{Point2{}, Point2{width * std::cos(angle), width * std::sin(angle)}}, widthStyle(2.0)),
    };
    return createBlockDefinition(ids, "Door", parts);
}

BlockDefinitionPtr createWindowSymbol(IdSource& ids, double width, double wallThickness) {
    const double half = wallThickness / 2.0;
    const EntityList parts = {
        part(LineGeom{Point2{0.0, -half}, Point2{0.0, half}}),
        part(LineGeom{Point2{width, -half}, Point2{width, half}}),
        part(LineGeom{Point2{}, Point2{width, 0.0}}, widthStyle(2.0)),
        part(LineGeom{Point2{width * 0.25, -half * 0.5}, Point2{width * 0.25, half * 0.5}}),
        part(LineGeom{Point2{width * 0.75, -half * 0.5}, Point2{width * 0.75, half * 0.5}}),
    };
    return createBlockDefinition(ids, "Window", parts);
}

BlockDefinitionPtr createColumnSymbol(IdSource& ids, double width, double depth) {
    const double hw = width / 2.0;
    const double hd = depth / 2.0;
    const EntityList parts = {
        part(rect(-hw, -hd, width, depth), widthStyle(2.0)),
        part(LineGeom{Point2{-hw, -hd}, Point2{hw, hd}}),
        part(LineGeom{Point2{hw, -hd}, Point2{-hw, hd}}),
    };
    return createBlockDefinition(ids, "Column", parts);
}

BlockDefinitionPtr createToiletSymbol(IdSource& ids) {
    const EntityList parts = {
        part(ArcGeom{Point2{0.0, 150.0}, 200.0, kPi, 0.0}),
        part(LineGeom{Point2{-200.0, 150.0}, Point2{-200.0, 0.0}}),
        part(LineGeom{Point2{200.0, 150.0}, Point2{200.0, 0.0}}),
        part(rect(-180.0, -150.0, 360.0, 150.0)),
    };
    return createBlockDefinition(ids, "Toilet", parts);
}

BlockDefinitionPtr createSinkSymbol(IdSource& ids) {
    const EntityList parts = {
        part(rect(-250.0, -200.0, 500.0, 400.0)),
        part(CircleGeom{Point2{}, 30.0}),
    };
    return createBlockDefinition(ids, "Sink", parts);
}

BlockDefinitionPtr createTreeSymbol(IdSource& ids, double radius) {
    // Eight-point star alternating full and 0.7 radius.
    std::vector<Point2> crown;
    for (int i = 0; i < 8; ++i) {
        const double angle = i * kPi / 4.0;
        const double r = (i % 2 == 0) ? radius : radius * 0.7;
        crown.push_back(Point2{r * std::cos(angle), r * std::sin(angle)});
    }
    const EntityList parts = {
        part(PolylineGeom{std::move(crown), true}, colorStyle(0x228B22)),
        part(CircleGeom{Point2{}, radius * 0.2}, colorStyle(0x8B4513)),
    };
    return createBlockDefinition(ids, "Tree", parts);
}

BlockDefinitionPtr createManholeSymbol(IdSource& ids, double diameter) {
    const double r = diameter / 2.0;
    const EntityList parts = {
        part(CircleGeom{Point2{}, r}, widthStyle(2.0)),
        part(CircleGeom{Point2{}, r * 0.7}),
        part(LineGeom{Point2{-r * 0.5, -r * 0.5}, Point2{r * 0.5, r * 0.5}}),
        part(LineGeom{Point2{r * 0.5, -r * 0.5}, Point2{-r * 0.5, r * 0.5}}),
    };
    return createBlockDefinition(ids, "Manhole", parts);
}

BlockDefinitionPtr createBenchmarkSymbol(IdSource& ids, double size) {
    const EntityList parts = {
        part(PolylineGeom{{
            {0.0, size},
            {-size, -size},
            {size, -size},
            {0.0, size},
        }, true}),
        part(CircleGeom{Point2{0.0, -size * 0.3}, size * 0.3}),
    };
    return createBlockDefinition(ids, "Benchmark", parts);
}

BlockDefinitionPtr createTraditionalHausSymbol(IdSource& ids, double width, double depth) {
    EntityStyle post;
    post.fill = 0x8B4513;
    const EntityList parts = {
        part(rect(0.0, 0.0, width, depth), widthStyle(2.0)),
        part(CircleGeom{Point2{500.0, 500.0}, 100.0}, post),
        part(CircleGeom{Point2{width - 500.0, 500.0}, 100.0}, post),
        part(CircleGeom{Point2{500.0, depth - 500.0}, 100.0}, post),
        part(CircleGeom{Point2{width - 500.0, depth - 500.0}, 100.0}, post),
        part(CircleGeom{Point2{width / 2.0, depth / 2.0}, 150.0}, post),
    };
    return createBlockDefinition(ids, "Traditional Haus", parts);
}

BlockDefinitionPtr createWaterTankSymbol(IdSource& ids, double diameter) {
    const double r = diameter / 2.0;
    EntityStyle shell = colorStyle(0x00BFFF);
    shell.strokeWidth = 2.0;
    const EntityList parts = {
        part(CircleGeom{Point2{}, r}, shell),
        part(label(Point2{}, "WT", r * 0.5, TextAlign::Center)),
    };
    return createBlockDefinition(ids, "Water Tank", parts);
}

BlockDefinitionPtr createSepticTankSymbol(IdSource& ids, double width, double depth) {
    const EntityList parts = {
        part(rect(-width / 2.0, -depth / 2.0, width, depth), widthStyle(2.0)),
        part(LineGeom{Point2{-width / 2.0, 0.0}, Point2{width / 2.0, 0.0}}),
        part(label(Point2{0.0, -depth * 0.25}, "ST", depth * 0.2, TextAlign::Center)),
    };
    return createBlockDefinition(ids, "Septic Tank", parts);
}

namespace {

using StandardBlockCreator = BlockDefinitionPtr (*)(IdSource&);

struct StandardBlockEntry {
    const char* key;
    StandardBlockCreator create;
};

const StandardBlockEntry kStandardBlocks[] = {
    {"north-arrow", [](IdSource& ids) { return createNorthArrow(ids); }},
    {"section-marker", [](IdSource& ids) { return createSectionMarker(ids); }},
    {"level-marker", [](IdSource& ids) { return createLevelMarker(ids); }},
    {"door", [](IdSource& ids) { return createDoorSymbol(ids); }},
    {"window", [](IdSource& ids) { return createWindowSymbol(ids); }},
    {"column", [](IdSource& ids) { return createColumnSymbol(ids); }},
    {"toilet", [](IdSource& ids) { return createToiletSymbol(ids); }},
    {"sink", [](IdSource& ids) { return createSinkSymbol(ids); }},
    {"tree", [](IdSource& ids) { return createTreeSymbol(ids); }},
    {"manhole", [](IdSource& ids) { return createManholeSymbol(ids); }},
    {"benchmark", [](IdSource& ids) { return createBenchmarkSymbol(ids); }},
    {"traditional-haus", [](IdSource& ids) { return createTraditionalHausSymbol(ids); }},
    {"water-tank", [](IdSource& ids) { return createWaterTankSymbol(ids); }},
    {"septic-tank", [](IdSource& ids) { return createSepticTankSymbol(ids); }},
};

} // namespace

BlockDefinitionPtr createStandardBlock(IdSource& ids, const std::string& key) {
    for (const StandardBlockEntry& entry : kStandardBlocks) {
        if (key == entry.key) return entry.create(ids);
    }
    throw KernelException(KernelError::UnknownBlock, "unknown block: " + key);
}

std::vector<std::string> listStandardBlocks() {
    std::vector<std::string> out;
    for (const StandardBlockEntry& entry : kStandardBlocks) out.emplace_back(entry.key);
    return out;
}

} // namespace civcad
