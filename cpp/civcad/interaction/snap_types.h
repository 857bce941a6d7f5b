#pragma once

#include "civcad/core/types.h"
#include <cstdint>

namespace civcad {

enum class SnapKind : std::uint16_t {
    None = 0,
    Endpoint = 1,
    Midpoint = 2,
    Center = 3,
    Quadrant = 4,
    Intersection = 5,
    Perpendicular = 6,
    Tangent = 7,
    Nearest = 8,
    Grid = 9,
};

const char* snapKindName(SnapKind kind);

struct SnapPoint {
    Point2 point{};
    SnapKind kind{SnapKind::None};
    EntityId sourceId{kNoId};
};

struct SnapSettings {
    bool enabled{true};
    bool gridSnap{true};
    bool endpoint{true};
    bool midpoint{true};
    bool center{true};
    bool intersection{true};
    bool perpendicular{true};
    bool tangent{false};
    bool nearest{false};
    double snapDistance{10.0};
};

struct GridSettings {
    bool visible{true};
    double spacing{10.0};
    int majorLineEvery{10};
    Rgb color{0xE0E0E0};
    Rgb majorColor{0xC0C0C0};
    double opacity{0.5};
};

} // namespace civcad
