#pragma once

#include "civcad/block/block_library.h"
#include "civcad/core/id_source.h"
#include "civcad/entity/entity_types.h"
#include "civcad/layer/layer.h"
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace civcad {

struct DxfImportResult {
    EntityList entities;
    std::size_t skippedRecords = 0;
    std::vector<std::string> skippedTypes; // first-seen order, no duplicates
};

/**
 * Forward-only import of the ENTITIES section.
 *
 * Reads LINE, LWPOLYLINE, POLYLINE (with VERTEX/SEQEND), CIRCLE, ARC, TEXT,
 * MTEXT, INSERT, POINT, ELLIPSE and SPLINE records; any other record type is
 * counted in the result and dropped. Layer names resolve against `layers`,
 * falling back to the default layer. INSERT records pick up their definition
 * from `blocks` when a block with that name is registered.
 */
DxfImportResult importDxf(std::istream& in, IdSource& ids, const LayerList& layers = {},
                          const BlockLibrary* blocks = nullptr);
DxfImportResult importDxf(const std::string& content, IdSource& ids, const LayerList& layers = {},
                          const BlockLibrary* blocks = nullptr);

} // namespace civcad
