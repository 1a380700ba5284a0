#pragma once
/**
 * @file types.h
 * @brief Core type definitions for GeoClamp
 *
 * Fundamental numeric types, the Vec3 point/vector structure and the
 * tolerance helpers used when comparing world-space positions.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace geoclamp {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type
 *
 * Double precision is required for geocentric coordinates; single precision
 * loses centimetres at Earth radius.
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Tolerances
// ============================================================================

namespace epsilon {

constexpr Real E7  = 1e-7;
constexpr Real E10 = 1e-10;
constexpr Real E12 = 1e-12;

} // namespace epsilon

/**
 * @brief Compare two scalars within an absolute or relative tolerance
 *
 * True when |a - b| <= absolute_eps, or when the difference is within
 * relative_eps of the larger magnitude.
 */
bool equals_epsilon(Real a, Real b, Real relative_eps, Real absolute_eps) noexcept;

// ============================================================================
// Math Structures
// ============================================================================

/**
 * @brief 3D vector (ECEF position, surface normal, offset)
 */
struct Vec3 {
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Vec3() noexcept = default;
    constexpr Vec3(Real x_, Real y_, Real z_) noexcept : x(x_), y(y_), z(z_) {}

    // Basic operations
    constexpr Vec3 operator+(const Vec3& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr Vec3 operator-(const Vec3& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr Vec3 operator*(Real scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }
    constexpr Vec3 operator/(Real scalar) const noexcept {
        return {x / scalar, y / scalar, z / scalar};
    }
    constexpr Vec3 operator-() const noexcept {
        return {-x, -y, -z};
    }
    friend constexpr Vec3 operator*(Real scalar, const Vec3& v) noexcept {
        return {v.x * scalar, v.y * scalar, v.z * scalar};
    }

    // Component-wise multiply
    constexpr Vec3 multiply_components(const Vec3& other) const noexcept {
        return {x * other.x, y * other.y, z * other.z};
    }

    constexpr Real dot(const Vec3& other) const noexcept {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Real length_squared() const noexcept {
        return x*x + y*y + z*z;
    }

    // Exact equality
    constexpr bool operator==(const Vec3& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
    constexpr bool operator!=(const Vec3& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Component-wise comparison within a tolerance
     *
     * @param other Vector to compare against
     * @param relative_eps Relative tolerance
     * @param absolute_eps Absolute tolerance (defaults to relative_eps)
     */
    bool equals_epsilon(const Vec3& other, Real relative_eps,
                        Real absolute_eps) const noexcept;
    bool equals_epsilon(const Vec3& other, Real eps) const noexcept {
        return equals_epsilon(other, eps, eps);
    }

    // Defined in vector.cpp
    Real length() const noexcept;
    Vec3 normalized() const noexcept;

    constexpr bool is_zero() const noexcept {
        return x == 0.0 && y == 0.0 && z == 0.0;
    }

    static constexpr Vec3 Zero() noexcept { return {0.0, 0.0, 0.0}; }
    static constexpr Vec3 UnitX() noexcept { return {1.0, 0.0, 0.0}; }
    static constexpr Vec3 UnitY() noexcept { return {0.0, 1.0, 0.0}; }
    static constexpr Vec3 UnitZ() noexcept { return {0.0, 0.0, 1.0}; }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// Pi
constexpr Real PI = 3.14159265358979323846;

/// Degrees to radians conversion
constexpr Real DEG_TO_RAD = PI / 180.0;

/// Radians to degrees conversion
constexpr Real RAD_TO_DEG = 180.0 / PI;

/// Feet to meters conversion
constexpr Real FT_TO_M = 0.3048;

/// Seconds in a day
constexpr Real SECONDS_PER_DAY = 86400.0;

} // namespace constants

} // namespace geoclamp
