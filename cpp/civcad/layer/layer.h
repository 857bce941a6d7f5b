#pragma once

#include "civcad/core/id_source.h"
#include "civcad/core/types.h"
#include "civcad/entity/entity_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace civcad {

enum class LayerFlags : std::uint32_t {
    Visible = 1 << 0,
    Locked = 1 << 1,
    Frozen = 1 << 2,
};

struct Layer {
    static constexpr std::uint32_t kDefaultFlags = static_cast<std::uint32_t>(LayerFlags::Visible);

    LayerId id = kNoId;
    std::string name;
    Rgb color = 0x000000;
    LineType lineType = LineType::Continuous;
    double lineWeight = 1.0;
    std::uint32_t order = 0; // paint and export order
    std::uint32_t flags = kDefaultFlags;

    bool hasFlag(LayerFlags f) const noexcept { return (flags & static_cast<std::uint32_t>(f)) != 0; }
    bool visible() const noexcept { return hasFlag(LayerFlags::Visible); }
    bool locked() const noexcept { return hasFlag(LayerFlags::Locked); }
    bool frozen() const noexcept { return hasFlag(LayerFlags::Frozen); }

    void setFlags(std::uint32_t mask, std::uint32_t value) { flags = (flags & ~mask) | (value & mask); }
    void setFlag(LayerFlags f, bool on) {
        const auto bit = static_cast<std::uint32_t>(f);
        setFlags(bit, on ? bit : 0u);
    }
};

bool operator==(const Layer& a, const Layer& b);

using LayerList = std::vector<Layer>;

// "0", Construction, Dimensions, Text, Structural, Foundation, Drainage,
// Electrical, Plumbing, Site with ids 1..10 and orders 0..9.
LayerList defaultLayers();

Layer createLayer(IdSource& ids, std::string name, Rgb color = 0x000000, std::uint32_t order = 0);

// nullptr when absent.
const Layer* findLayer(const LayerList& layers, LayerId id);
const Layer* findLayerByName(const LayerList& layers, const std::string& name);

// Falls back to the default layer, then to a built-in copy of layer "0".
const Layer& resolveLayer(const LayerList& layers, LayerId id);

// Masked flag update; false when the layer does not exist.
bool setLayerFlags(LayerList& layers, LayerId id, std::uint32_t mask, std::uint32_t value);

} // namespace civcad
