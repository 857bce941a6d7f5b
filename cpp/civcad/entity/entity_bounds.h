#pragma once

#include "civcad/entity/entity_types.h"

namespace civcad {

// Axis-aligned bounds per kind. Arcs report the full circle; text is estimated
// from glyph count and font size; empty point sets give the zero box.
AABB computeEntityBounds(const Entity& entity);

AABB computeTextBounds(const TextGeom& text);
AABB computeEllipseBounds(const EllipseGeom& ellipse);

} // namespace civcad
