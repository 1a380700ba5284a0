/**
 * @file coordinates.cpp
 * @brief Ellipsoid and geodetic conversion implementations
 */

#include "geoclamp/core/coordinates.h"
#include <cmath>

namespace geoclamp {

// ============================================================================
// GeodeticPosition Implementation
// ============================================================================

GeodeticPosition GeodeticPosition::from_degrees(Real lat_deg, Real lon_deg, Real height_m) noexcept {
    return {
        lat_deg * constants::DEG_TO_RAD,
        lon_deg * constants::DEG_TO_RAD,
        height_m
    };
}

void GeodeticPosition::to_degrees(Real& lat_deg, Real& lon_deg, Real& height_m) const noexcept {
    lat_deg = latitude * constants::RAD_TO_DEG;
    lon_deg = longitude * constants::RAD_TO_DEG;
    height_m = height;
}

bool GeodeticPosition::equals_epsilon(const GeodeticPosition& other, Real eps) const noexcept {
    return std::abs(latitude - other.latitude) <= eps &&
           std::abs(longitude - other.longitude) <= eps &&
           std::abs(height - other.height) <= eps;
}

// ============================================================================
// Ellipsoid Conversions
// ============================================================================

Real Ellipsoid::radius_of_curvature_n(Real lat) const noexcept {
    Real sin_lat = std::sin(lat);
    return a_ / std::sqrt(1.0 - eccentricity_squared() * sin_lat * sin_lat);
}

Vec3 Ellipsoid::geodetic_to_cartesian(const GeodeticPosition& lla) const noexcept {
    Real sin_lat = std::sin(lla.latitude);
    Real cos_lat = std::cos(lla.latitude);
    Real sin_lon = std::sin(lla.longitude);
    Real cos_lon = std::cos(lla.longitude);

    Real N = radius_of_curvature_n(lla.latitude);
    Real e2 = eccentricity_squared();

    Real x = (N + lla.height) * cos_lat * cos_lon;
    Real y = (N + lla.height) * cos_lat * sin_lon;
    Real z = (N * (1.0 - e2) + lla.height) * sin_lat;

    return {x, y, z};
}

GeodeticPosition Ellipsoid::cartesian_to_geodetic(const Vec3& ecef) const noexcept {
    // Bowring's iterative method
    const Real e2 = eccentricity_squared();
    const Real ep2 = second_eccentricity_squared();

    Real x = ecef.x;
    Real y = ecef.y;
    Real z = ecef.z;

    Real lon = std::atan2(y, x);

    // Distance from Z-axis
    Real p = std::sqrt(x * x + y * y);

    // Pole case
    if (p < 1e-10) {
        Real lat = (z >= 0.0) ? constants::PI / 2.0 : -constants::PI / 2.0;
        Real h = std::abs(z) - b_;
        return {lat, lon, h};
    }

    Real theta = std::atan2(z * a_, p * b_);
    Real sin_theta = std::sin(theta);
    Real cos_theta = std::cos(theta);

    Real lat = std::atan2(
        z + ep2 * b_ * sin_theta * sin_theta * sin_theta,
        p - e2 * a_ * cos_theta * cos_theta * cos_theta
    );

    // Usually converges in 2-3 iterations
    for (int i = 0; i < 5; ++i) {
        Real sin_lat = std::sin(lat);
        Real N = a_ / std::sqrt(1.0 - e2 * sin_lat * sin_lat);

        Real lat_new = std::atan2(z + e2 * N * sin_lat, p);

        if (std::abs(lat_new - lat) < 1e-12) {
            lat = lat_new;
            break;
        }
        lat = lat_new;
    }

    Real sin_lat = std::sin(lat);
    Real cos_lat = std::cos(lat);
    Real N = radius_of_curvature_n(lat);
    Real h;

    if (std::abs(cos_lat) > 1e-10) {
        h = p / cos_lat - N;
    } else {
        h = std::abs(z) / std::abs(sin_lat) - N * (1.0 - e2);
    }

    return {lat, lon, h};
}

// ============================================================================
// Surface Normal
// ============================================================================

Vec3 Ellipsoid::geodetic_surface_normal(const Vec3& ecef) const noexcept {
    if (ecef.is_zero()) {
        return Vec3::Zero();
    }
    // Gradient of x²/a² + y²/a² + z²/b²
    Vec3 gradient{
        ecef.x / (a_ * a_),
        ecef.y / (a_ * a_),
        ecef.z / (b_ * b_)
    };
    return gradient.normalized();
}

Vec3 Ellipsoid::geodetic_surface_normal(const GeodeticPosition& lla) const noexcept {
    Real cos_lat = std::cos(lla.latitude);
    return Vec3{
        cos_lat * std::cos(lla.longitude),
        cos_lat * std::sin(lla.longitude),
        std::sin(lla.latitude)
    }.normalized();
}

Vec3 Ellipsoid::scale_to_geodetic_surface(const Vec3& ecef) const noexcept {
    GeodeticPosition lla = cartesian_to_geodetic(ecef);
    lla.height = 0.0;
    return geodetic_to_cartesian(lla);
}

// ============================================================================
// Math Utilities
// ============================================================================

namespace math {

Real normalize_angle(Real angle) noexcept {
    while (angle > constants::PI) {
        angle -= 2.0 * constants::PI;
    }
    while (angle < -constants::PI) {
        angle += 2.0 * constants::PI;
    }
    return angle;
}

} // namespace math

} // namespace geoclamp
