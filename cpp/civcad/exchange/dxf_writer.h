#pragma once

#include "civcad/document/project.h"
#include <ostream>
#include <string>

namespace civcad {

// Writes HEADER, TABLES, BLOCKS and ENTITIES sections followed by EOF.
// Only entities with their own visible flag set are written; hatches that
// carry no boundary points are skipped.
void writeDxf(std::ostream& out, const ProjectDocument& project);

std::string exportDxf(const ProjectDocument& project);

// Numeric type code of a DIMENSION record: 0 linear, 1 aligned, 2 angular,
// 3 diameter, 4 radius. Horizontal, vertical, arc length and area write 0.
int dxfDimensionType(DimensionKind kind);

} // namespace civcad
