#pragma once

#include "civcad/core/types.h"

namespace civcad {

// Coarse channel-threshold buckets onto the first ten indexed colors.
// Lossy: colors outside the buckets map to 7 (or 8 for light greys).
int colorToAci(Rgb color);

// Fixed table for indices 0..9; any other index decodes as black.
Rgb aciToColor(int aci);

} // namespace civcad
