#pragma once

#include "civcad/core/types.h"
#include "civcad/entity/entity_types.h"
#include <string>

namespace civcad {

// Named group of entities inserted relative to basePoint. Sub-entity ids are
// independent of the top-level entity list.
struct BlockDefinition {
    BlockId id = kNoId;
    std::string name;
    Point2 basePoint;
    EntityList entities;
};

inline bool operator==(const BlockDefinition& a, const BlockDefinition& b) {
    return a.id == b.id && a.name == b.name && a.basePoint == b.basePoint && a.entities == b.entities;
}

} // namespace civcad
