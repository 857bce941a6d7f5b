#pragma once

#include "civcad/entity/entity_types.h"
#include "civcad/layer/layer.h"
#include <optional>
#include <vector>

namespace civcad {

// Color context of the block instance that encloses an entity.
struct BlockContext {
    std::optional<Rgb> color;
    LayerId layerId = kDefaultLayerId;
};

struct RenderStyle {
    Rgb stroke = 0x000000;
    double strokeWidth = 1.0;
    LineType lineType = LineType::Continuous;
    std::optional<Rgb> fill;
    double opacity = 1.0;
    std::vector<double> dashPattern; // empty: solid
};

// Explicit wins. ByBlock takes the context color, then the context layer's
// color; without a context it behaves like ByLayer.
Rgb resolveEntityColor(const Entity& entity, const LayerList& layers, const BlockContext* block = nullptr);
Rgb resolveLayerColor(const LayerList& layers, LayerId id);
double resolveEntityLineWeight(const Entity& entity, const LayerList& layers);
LineType resolveEntityLineType(const Entity& entity, const LayerList& layers);

bool isEntityVisible(const Entity& entity, const LayerList& layers);
bool isEntitySelectable(const Entity& entity, const LayerList& layers);

RenderStyle entityRenderStyle(const Entity& entity, const LayerList& layers, const BlockContext* block = nullptr,
                              double dashScale = 1.0);

// Dash lengths alternate on/off, multiplied by scale.
std::vector<double> lineDashPattern(LineType type, double scale = 1.0);

EntityList entitiesOnLayer(const EntityList& entities, LayerId layerId);
EntityList moveEntitiesToLayer(const EntityList& entities, LayerId layerId);

Entity setEntityColorByLayer(const Entity& entity);
Entity setEntityColorByBlock(const Entity& entity);
Entity setEntityExplicitColor(const Entity& entity, Rgb color);

// Stable ascending by layer order; unknown layers count as order 0.
EntityList sortEntitiesByLayerOrder(const EntityList& entities, const LayerList& layers);

} // namespace civcad
