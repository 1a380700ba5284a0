/**
 * @file vector.cpp
 * @brief Vector math implementation
 */

#include "geoclamp/core/types.h"
#include <cmath>
#include <algorithm>

namespace geoclamp {

bool equals_epsilon(Real a, Real b, Real relative_eps, Real absolute_eps) noexcept {
    Real diff = std::abs(a - b);
    return diff <= absolute_eps ||
           diff <= relative_eps * std::max(std::abs(a), std::abs(b));
}

// ============================================================================
// Vec3 Member Function Implementations
// ============================================================================

bool Vec3::equals_epsilon(const Vec3& other, Real relative_eps,
                          Real absolute_eps) const noexcept {
    return geoclamp::equals_epsilon(x, other.x, relative_eps, absolute_eps) &&
           geoclamp::equals_epsilon(y, other.y, relative_eps, absolute_eps) &&
           geoclamp::equals_epsilon(z, other.z, relative_eps, absolute_eps);
}

Real Vec3::length() const noexcept {
    return std::sqrt(x*x + y*y + z*z);
}

Vec3 Vec3::normalized() const noexcept {
    Real len = length();
    if (len > 1e-10) {
        return {x / len, y / len, z / len};
    }
    return *this;
}

} // namespace geoclamp
