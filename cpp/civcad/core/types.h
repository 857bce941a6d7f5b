#ifndef CIVCAD_CORE_TYPES_H
#define CIVCAD_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight value types shared by every kernel module.

namespace civcad {

using EntityId = std::uint32_t;
using LayerId = std::uint32_t;
using BlockId = std::uint32_t;

// Packed 0xRRGGBB.
using Rgb = std::uint32_t;

static constexpr EntityId kNoId = 0;
static constexpr LayerId kDefaultLayerId = 1;
static constexpr LayerId kDimensionsLayerId = 3;

struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct AABB {
    double minX, minY, maxX, maxY;
};

inline bool operator==(const AABB& a, const AABB& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

inline constexpr std::uint8_t rgbRed(Rgb c) { return static_cast<std::uint8_t>((c >> 16) & 0xFF); }
inline constexpr std::uint8_t rgbGreen(Rgb c) { return static_cast<std::uint8_t>((c >> 8) & 0xFF); }
inline constexpr std::uint8_t rgbBlue(Rgb c) { return static_cast<std::uint8_t>(c & 0xFF); }
inline constexpr Rgb makeRgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return (static_cast<Rgb>(r) << 16) | (static_cast<Rgb>(g) << 8) | static_cast<Rgb>(b);
}

} // namespace civcad

#endif // CIVCAD_CORE_TYPES_H
