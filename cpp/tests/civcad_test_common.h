#pragma once

#include <gtest/gtest.h>
#include "civcad/core/id_source.h"
#include "civcad/core/types.h"
#include "civcad/entity/entity_types.h"
#include <cmath>
#include <variant>

namespace civcad_test {
inline constexpr double kEps = 1e-9;
inline constexpr double kLooseEps = 1e-6;

inline void expectPointNear(const civcad::Point2& actual, const civcad::Point2& expected, double tol = kEps) {
    EXPECT_NEAR(actual.x, expected.x, tol);
    EXPECT_NEAR(actual.y, expected.y, tol);
}

inline void expectBoxNear(const civcad::AABB& actual, const civcad::AABB& expected, double tol = kEps) {
    EXPECT_NEAR(actual.minX, expected.minX, tol);
    EXPECT_NEAR(actual.minY, expected.minY, tol);
    EXPECT_NEAR(actual.maxX, expected.maxX, tol);
    EXPECT_NEAR(actual.maxY, expected.maxY, tol);
}

// Throws std::bad_variant_access (a test failure) when the kind is wrong.
template <typename T>
const T& geomOf(const civcad::Entity& e) {
    return std::get<T>(e.geometry);
}

inline civcad::Entity hiddenCopy(civcad::Entity e) {
    e.visible = false;
    return e;
}
} // namespace civcad_test
