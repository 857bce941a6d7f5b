#pragma once

#include "civcad/block/block_library.h"
#include "civcad/core/id_source.h"
#include "civcad/core/types.h"
#include "civcad/entity/entity_types.h"
#include "civcad/geometry/geometry.h"
#include "civcad/interaction/snap_types.h"
#include "civcad/layer/layer.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace civcad {

struct UnitSettings {
    LengthUnit length = LengthUnit::Meter;
    std::string area = "sqm";
    std::string angle = "degrees";
    int precision = 3;
};

struct Viewport {
    std::uint32_t id = kNoId;
    std::string name;
    double zoom = 1.0;
    Point2 pan{};
    double rotation = 0.0;
    AABB bounds{-10000.0, -10000.0, 10000.0, 10000.0};
    bool active = false;
};

struct ProjectDocument {
    std::uint32_t id = kNoId;
    std::string name;
    LayerList layers;
    EntityList entities;
    BlockLibrary blocks;
    std::vector<Viewport> viewports;
    UnitSettings units;
    GridSettings grid;
    SnapSettings snap;
    std::map<std::string, std::string> metadata;
    double createdAtMs = 0.0;
    double modifiedAtMs = 0.0;
};

// Default layers plus one active "Main" viewport.
ProjectDocument createProject(IdSource& ids, std::string name);

Viewport createViewport(IdSource& ids, std::string name);

// nullptr when the project has no active viewport.
const Viewport* activeViewport(const ProjectDocument& project);

// Canvas coordinates put the viewport origin at the canvas center.
Point2 screenToWorld(const Point2& screen, const Viewport& viewport, double canvasWidth, double canvasHeight);
Point2 worldToScreen(const Point2& world, const Viewport& viewport, double canvasWidth, double canvasHeight);

} // namespace civcad
