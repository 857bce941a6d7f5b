#include "civcad/layer/layer_resolution.h"

#include <algorithm>
#include <iterator>

namespace civcad {

Rgb resolveLayerColor(const LayerList& layers, LayerId id) {
    return resolveLayer(layers, id).color;
}

Rgb resolveEntityColor(const Entity& entity, const LayerList& layers, const BlockContext* block) {
    const StrokeColor& stroke = entity.style.stroke;
    switch (stroke.source) {
        case ColorSource::Explicit:
            return stroke.rgb;
        case ColorSource::ByBlock:
            if (block) {
                if (block->color) return *block->color;
                return resolveLayerColor(layers, block->layerId);
            }
            break;
        case ColorSource::ByLayer:
            break;
    }
    return resolveLayerColor(layers, entity.layerId);
}

double resolveEntityLineWeight(const Entity& entity, const LayerList& layers) {
    if (entity.style.strokeWidth) return *entity.style.strokeWidth;
    return resolveLayer(layers, entity.layerId).lineWeight;
}

LineType resolveEntityLineType(const Entity& entity, const LayerList& layers) {
    if (entity.style.lineType != LineType::ByLayer) return entity.style.lineType;
    const LineType layerType = resolveLayer(layers, entity.layerId).lineType;
    return layerType == LineType::ByLayer ? LineType::Continuous : layerType;
}

bool isEntityVisible(const Entity& entity, const LayerList& layers) {
    if (!entity.visible) return false;
    const Layer& layer = resolveLayer(layers, entity.layerId);
    return layer.visible() && !layer.frozen();
}

bool isEntitySelectable(const Entity& entity, const LayerList& layers) {
    if (!isEntityVisible(entity, layers) || entity.locked) return false;
    return !resolveLayer(layers, entity.layerId).locked();
}

RenderStyle entityRenderStyle(const Entity& entity, const LayerList& layers, const BlockContext* block,
                              double dashScale) {
    RenderStyle style;
    style.stroke = resolveEntityColor(entity, layers, block);
    style.strokeWidth = resolveEntityLineWeight(entity, layers);
    style.lineType = resolveEntityLineType(entity, layers);
    style.fill = entity.style.fill;
    style.opacity = entity.style.opacity;
    style.dashPattern = lineDashPattern(style.lineType, dashScale);
    return style;
}

std::vector<double> lineDashPattern(LineType type, double scale) {
    std::vector<double> pattern;
    switch (type) {
        case LineType::Dashed: pattern = {8, 4}; break;
        case LineType::Dotted: pattern = {2, 4}; break;
        case LineType::DashDot: pattern = {8, 3, 2, 3}; break;
        case LineType::DashDotDot: pattern = {8, 3, 2, 3, 2, 3}; break;
        case LineType::Center: pattern = {12, 3, 4, 3}; break;
        case LineType::Hidden: pattern = {4, 4}; break;
        case LineType::Phantom: pattern = {12, 3, 2, 3, 2, 3}; break;
        case LineType::Continuous:
        case LineType::ByLayer:
            break;
    }
    for (double& d : pattern) d *= scale;
    return pattern;
}

EntityList entitiesOnLayer(const EntityList& entities, LayerId layerId) {
    EntityList out;
    std::copy_if(entities.begin(), entities.end(), std::back_inserter(out),
                 [layerId](const Entity& e) { return e.layerId == layerId; });
    return out;
}

EntityList moveEntitiesToLayer(const EntityList& entities, LayerId layerId) {
    EntityList out = entities;
    for (Entity& e : out) e.layerId = layerId;
    return out;
}

Entity setEntityColorByLayer(const Entity& entity) {
    Entity out = entity;
    out.style.stroke = StrokeColor::byLayer();
    return out;
}

Entity setEntityColorByBlock(const Entity& entity) {
    Entity out = entity;
    out.style.stroke = StrokeColor::byBlock();
    return out;
}

Entity setEntityExplicitColor(const Entity& entity, Rgb color) {
    Entity out = entity;
    out.style.stroke = StrokeColor::explicitColor(color);
    return out;
}

EntityList sortEntitiesByLayerOrder(const EntityList& entities, const LayerList& layers) {
    const auto orderOf = [&layers](const Entity& e) -> std::uint32_t {
        const Layer* layer = findLayer(layers, e.layerId);
        return layer ? layer->order : 0u;
    };
    EntityList out = entities;
    std::stable_sort(out.begin(), out.end(),
                     [&orderOf](const Entity& a, const Entity& b) { return orderOf(a) < orderOf(b); });
    return out;
}

} // namespace civcad
