#ifndef CIVCAD_CORE_UTIL_H
#define CIVCAD_CORE_UTIL_H

#include <chrono>
#include <cmath>

namespace civcad {

static constexpr double kPi = 3.14159265358979323846;

// Wall-clock milliseconds since the epoch; used for command timestamps only.
inline double nowMilliseconds() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(system_clock::now().time_since_epoch()).count();
}

inline constexpr double degreesToRadians(double degrees) noexcept { return degrees * kPi / 180.0; }
inline constexpr double radiansToDegrees(double radians) noexcept { return radians * 180.0 / kPi; }

inline bool nearlyEqual(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

} // namespace civcad

#endif // CIVCAD_CORE_UTIL_H
