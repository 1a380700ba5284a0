#pragma once
/**
 * @file coordinates.h
 * @brief Ellipsoid and geodetic coordinate utilities
 *
 * Provides conversions between ECEF (Earth-Centered, Earth-Fixed) cartesian
 * positions and geodetic latitude/longitude/height on a reference ellipsoid,
 * plus the geodetic surface normal used to direct terrain offsets.
 *
 * All angles are in radians unless otherwise specified.
 */

#include "geoclamp/core/types.h"

namespace geoclamp {

// ============================================================================
// WGS84 Ellipsoid Parameters
// ============================================================================

namespace wgs84 {
    /// Semi-major axis (equatorial radius) in meters
    constexpr Real a = 6378137.0;

    /// Semi-minor axis (polar radius) in meters
    constexpr Real b = 6356752.314245;
}

// ============================================================================
// Geodetic Position (Latitude, Longitude, Height)
// ============================================================================

/**
 * @brief Geodetic position relative to a reference ellipsoid
 */
struct GeodeticPosition {
    Real latitude{0.0};   ///< Geodetic latitude (radians, -PI/2 to PI/2)
    Real longitude{0.0};  ///< Longitude (radians, -PI to PI)
    Real height{0.0};     ///< Height above the ellipsoid (meters)

    constexpr GeodeticPosition() noexcept = default;
    constexpr GeodeticPosition(Real lat, Real lon, Real h) noexcept
        : latitude(lat), longitude(lon), height(h) {}

    /// Create from degrees
    static GeodeticPosition from_degrees(Real lat_deg, Real lon_deg, Real height_m) noexcept;

    /// Convert to degrees
    void to_degrees(Real& lat_deg, Real& lon_deg, Real& height_m) const noexcept;

    /// Compare latitude, longitude and height within a tolerance
    bool equals_epsilon(const GeodeticPosition& other, Real eps) const noexcept;

    constexpr bool operator==(const GeodeticPosition& other) const noexcept {
        return latitude == other.latitude && longitude == other.longitude &&
               height == other.height;
    }
    constexpr bool operator!=(const GeodeticPosition& other) const noexcept {
        return !(*this == other);
    }
};

// ============================================================================
// Ellipsoid
// ============================================================================

/**
 * @brief Oblate reference ellipsoid of revolution
 *
 * Value type; copies are cheap. The default-constructed ellipsoid is WGS84.
 */
class Ellipsoid {
public:
    constexpr Ellipsoid() noexcept
        : a_(wgs84::a), b_(wgs84::b) {}

    /**
     * @param semi_major_axis Equatorial radius (meters, > 0)
     * @param semi_minor_axis Polar radius (meters, > 0)
     */
    constexpr Ellipsoid(Real semi_major_axis, Real semi_minor_axis) noexcept
        : a_(semi_major_axis), b_(semi_minor_axis) {}

    static constexpr Ellipsoid wgs84() noexcept { return Ellipsoid{}; }

    /// Sphere of the given radius
    static constexpr Ellipsoid sphere(Real radius) noexcept {
        return Ellipsoid{radius, radius};
    }

    constexpr Real semi_major_axis() const noexcept { return a_; }
    constexpr Real semi_minor_axis() const noexcept { return b_; }

    /// First eccentricity squared
    constexpr Real eccentricity_squared() const noexcept {
        return (a_ * a_ - b_ * b_) / (a_ * a_);
    }

    /// Second eccentricity squared
    constexpr Real second_eccentricity_squared() const noexcept {
        return (a_ * a_ - b_ * b_) / (b_ * b_);
    }

    /**
     * @brief Convert geodetic coordinates to ECEF
     */
    Vec3 geodetic_to_cartesian(const GeodeticPosition& lla) const noexcept;

    /**
     * @brief Convert ECEF coordinates to geodetic
     *
     * Uses Bowring's iterative method. Positions on the polar axis are
     * handled explicitly.
     */
    GeodeticPosition cartesian_to_geodetic(const Vec3& ecef) const noexcept;

    /**
     * @brief Unit normal to the ellipsoid surface at a cartesian position
     *
     * Returns the zero vector for the origin.
     */
    Vec3 geodetic_surface_normal(const Vec3& ecef) const noexcept;

    /**
     * @brief Unit normal to the ellipsoid surface at a geodetic position
     */
    Vec3 geodetic_surface_normal(const GeodeticPosition& lla) const noexcept;

    /**
     * @brief Project a position along its surface normal onto the surface
     */
    Vec3 scale_to_geodetic_surface(const Vec3& ecef) const noexcept;

    /**
     * @brief Radius of curvature in the prime vertical at a latitude
     */
    Real radius_of_curvature_n(Real lat) const noexcept;

    constexpr bool operator==(const Ellipsoid& other) const noexcept {
        return a_ == other.a_ && b_ == other.b_;
    }
    constexpr bool operator!=(const Ellipsoid& other) const noexcept {
        return !(*this == other);
    }

private:
    Real a_;
    Real b_;
};

// ============================================================================
// Math Utilities
// ============================================================================

namespace math {

/**
 * @brief Normalize angle to range [-PI, PI]
 */
Real normalize_angle(Real angle) noexcept;

constexpr Real deg_to_rad(Real deg) noexcept {
    return deg * constants::DEG_TO_RAD;
}

constexpr Real rad_to_deg(Real rad) noexcept {
    return rad * constants::RAD_TO_DEG;
}

} // namespace math

} // namespace geoclamp
