#include "civcad/layer/layer.h"

#include <utility>

namespace civcad {

namespace {

Layer makeLayer(LayerId id, const char* name, Rgb color, LineType lineType, double weight, std::uint32_t order) {
    Layer l;
    l.id = id;
    l.name = name;
    l.color = color;
    l.lineType = lineType;
    l.lineWeight = weight;
    l.order = order;
    return l;
}

} // namespace

bool operator==(const Layer& a, const Layer& b) {
    return a.id == b.id && a.name == b.name && a.color == b.color && a.lineType == b.lineType &&
           a.lineWeight == b.lineWeight && a.order == b.order && a.flags == b.flags;
}

LayerList defaultLayers() {
    return {
        makeLayer(1, "0", 0x000000, LineType::Continuous, 1.0, 0),
        makeLayer(2, "Construction", 0x808080, LineType::Dashed, 0.5, 1),
        makeLayer(kDimensionsLayerId, "Dimensions", 0x0000FF, LineType::Continuous, 0.5, 2),
        makeLayer(4, "Text", 0x000000, LineType::Continuous, 1.0, 3),
        makeLayer(5, "Structural", 0xFF0000, LineType::Continuous, 2.0, 4),
        makeLayer(6, "Foundation", 0x8B4513, LineType::Continuous, 2.0, 5),
        makeLayer(7, "Drainage", 0x00BFFF, LineType::Continuous, 1.5, 6),
        makeLayer(8, "Electrical", 0xFFD700, LineType::Continuous, 1.0, 7),
        makeLayer(9, "Plumbing", 0x00FF00, LineType::Continuous, 1.0, 8),
        makeLayer(10, "Site", 0x228B22, LineType::Continuous, 1.0, 9),
    };
}

Layer createLayer(IdSource& ids, std::string name, Rgb color, std::uint32_t order) {
    Layer l;
    l.id = ids.next();
    l.name = std::move(name);
    l.color = color;
    l.order = order;
    return l;
}

const Layer* findLayer(const LayerList& layers, LayerId id) {
    for (const Layer& l : layers) {
        if (l.id == id) return &l;
    }
    return nullptr;
}

const Layer* findLayerByName(const LayerList& layers, const std::string& name) {
    for (const Layer& l : layers) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

const Layer& resolveLayer(const LayerList& layers, LayerId id) {
    if (const Layer* l = findLayer(layers, id)) return *l;
    if (const Layer* l = findLayer(layers, kDefaultLayerId)) return *l;
    static const Layer kFallback = makeLayer(kDefaultLayerId, "0", 0x000000, LineType::Continuous, 1.0, 0);
    return kFallback;
}

bool setLayerFlags(LayerList& layers, LayerId id, std::uint32_t mask, std::uint32_t value) {
    for (Layer& l : layers) {
        if (l.id == id) {
            l.setFlags(mask, value);
            return true;
        }
    }
    return false;
}

} // namespace civcad
