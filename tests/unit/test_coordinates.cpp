/**
 * @file test_coordinates.cpp
 * @brief Unit tests for ellipsoid and geodetic conversions
 */

#include <gtest/gtest.h>
#include "geoclamp/core/coordinates.h"
#include <cmath>

using namespace geoclamp;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

bool nearly_equal_vec(const Vec3& a, const Vec3& b, Real eps = 1e-6) {
    return std::abs(a.x - b.x) < eps &&
           std::abs(a.y - b.y) < eps &&
           std::abs(a.z - b.z) < eps;
}

} // anonymous namespace

// ============================================================================
// Geodetic Position Tests
// ============================================================================

class GeodeticPositionTest : public ::testing::Test {
protected:
    static constexpr Real EPSILON = 1e-10;
};

TEST_F(GeodeticPositionTest, DefaultConstruction) {
    GeodeticPosition lla;
    EXPECT_DOUBLE_EQ(lla.latitude, 0.0);
    EXPECT_DOUBLE_EQ(lla.longitude, 0.0);
    EXPECT_DOUBLE_EQ(lla.height, 0.0);
}

TEST_F(GeodeticPositionTest, FromDegrees) {
    GeodeticPosition lla = GeodeticPosition::from_degrees(45.0, -122.0, 100.0);

    EXPECT_NEAR(lla.latitude, 45.0 * constants::DEG_TO_RAD, EPSILON);
    EXPECT_NEAR(lla.longitude, -122.0 * constants::DEG_TO_RAD, EPSILON);
    EXPECT_DOUBLE_EQ(lla.height, 100.0);
}

TEST_F(GeodeticPositionTest, ToDegrees) {
    GeodeticPosition lla{45.0 * constants::DEG_TO_RAD, -122.0 * constants::DEG_TO_RAD, 100.0};

    Real lat_deg, lon_deg, h;
    lla.to_degrees(lat_deg, lon_deg, h);

    EXPECT_NEAR(lat_deg, 45.0, EPSILON);
    EXPECT_NEAR(lon_deg, -122.0, EPSILON);
    EXPECT_DOUBLE_EQ(h, 100.0);
}

TEST_F(GeodeticPositionTest, EqualsEpsilon) {
    GeodeticPosition a{0.5, 0.25, 10.0};
    GeodeticPosition b{0.5 + 1e-12, 0.25, 10.0};

    EXPECT_TRUE(a.equals_epsilon(b, 1e-10));
    EXPECT_FALSE(a.equals_epsilon(b, 0.0));
    EXPECT_NE(a, b);
    EXPECT_EQ(a, a);
}

// ============================================================================
// Cartesian <-> Geodetic Conversion Tests
// ============================================================================

class EllipsoidConversionTest : public ::testing::Test {
protected:
    static constexpr Real POS_EPSILON = 0.1;    // 10 cm position accuracy
    static constexpr Real ANGLE_EPSILON = 1e-8;

    Ellipsoid earth = Ellipsoid::wgs84();
};

TEST_F(EllipsoidConversionTest, DefaultIsWGS84) {
    Ellipsoid e;
    EXPECT_DOUBLE_EQ(e.semi_major_axis(), wgs84::a);
    EXPECT_DOUBLE_EQ(e.semi_minor_axis(), wgs84::b);
    EXPECT_NEAR(e.eccentricity_squared(), 0.00669437999014, 1e-12);
    EXPECT_EQ(e, Ellipsoid::wgs84());
    EXPECT_NE(e, Ellipsoid::sphere(6371000.0));
}

TEST_F(EllipsoidConversionTest, EquatorPrimeMeridian) {
    GeodeticPosition lla{0.0, 0.0, 0.0};
    Vec3 ecef = earth.geodetic_to_cartesian(lla);

    EXPECT_NEAR(ecef.x, wgs84::a, POS_EPSILON);
    EXPECT_NEAR(ecef.y, 0.0, POS_EPSILON);
    EXPECT_NEAR(ecef.z, 0.0, POS_EPSILON);

    GeodeticPosition lla_back = earth.cartesian_to_geodetic(ecef);
    EXPECT_NEAR(lla_back.latitude, lla.latitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.longitude, lla.longitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.height, lla.height, POS_EPSILON);
}

TEST_F(EllipsoidConversionTest, NorthPole) {
    GeodeticPosition lla{constants::PI / 2.0, 0.0, 0.0};
    Vec3 ecef = earth.geodetic_to_cartesian(lla);

    EXPECT_NEAR(ecef.x, 0.0, POS_EPSILON);
    EXPECT_NEAR(ecef.y, 0.0, POS_EPSILON);
    EXPECT_NEAR(ecef.z, wgs84::b, POS_EPSILON);

    GeodeticPosition lla_back = earth.cartesian_to_geodetic(ecef);
    EXPECT_NEAR(lla_back.latitude, lla.latitude, ANGLE_EPSILON);
    // Longitude is undefined at the pole
    EXPECT_NEAR(lla_back.height, lla.height, POS_EPSILON);
}

TEST_F(EllipsoidConversionTest, ExactlyOnPolarAxis) {
    GeodeticPosition lla = earth.cartesian_to_geodetic(Vec3{0.0, 0.0, -(wgs84::b + 250.0)});

    EXPECT_NEAR(lla.latitude, -constants::PI / 2.0, ANGLE_EPSILON);
    EXPECT_NEAR(lla.height, 250.0, POS_EPSILON);
}

TEST_F(EllipsoidConversionTest, WithHeight) {
    GeodeticPosition lla = GeodeticPosition::from_degrees(47.6062, -122.3321, 10000.0);
    Vec3 ecef = earth.geodetic_to_cartesian(lla);

    GeodeticPosition lla_back = earth.cartesian_to_geodetic(ecef);
    EXPECT_NEAR(lla_back.latitude, lla.latitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.longitude, lla.longitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.height, lla.height, POS_EPSILON);
}

TEST_F(EllipsoidConversionTest, NegativeHeight) {
    // Dead Sea shore
    GeodeticPosition lla = GeodeticPosition::from_degrees(31.5, 35.5, -430.0);
    Vec3 ecef = earth.geodetic_to_cartesian(lla);

    GeodeticPosition lla_back = earth.cartesian_to_geodetic(ecef);
    EXPECT_NEAR(lla_back.latitude, lla.latitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.longitude, lla.longitude, ANGLE_EPSILON);
    EXPECT_NEAR(lla_back.height, lla.height, 1.0);
}

TEST_F(EllipsoidConversionTest, SphereUsesRadius) {
    Ellipsoid sphere = Ellipsoid::sphere(1000.0);
    Vec3 ecef = sphere.geodetic_to_cartesian(GeodeticPosition::from_degrees(0.0, 90.0, 50.0));

    EXPECT_NEAR(ecef.x, 0.0, 1e-9);
    EXPECT_NEAR(ecef.y, 1050.0, 1e-9);
    EXPECT_NEAR(ecef.z, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(sphere.eccentricity_squared(), 0.0);
}

// ============================================================================
// Surface Normal Tests
// ============================================================================

TEST_F(EllipsoidConversionTest, SurfaceNormalOnEquator) {
    Vec3 normal = earth.geodetic_surface_normal(Vec3{wgs84::a, 0.0, 0.0});
    EXPECT_TRUE(nearly_equal_vec(normal, Vec3::UnitX(), 1e-15));
}

TEST_F(EllipsoidConversionTest, SurfaceNormalIsUnitLength) {
    Vec3 ecef = earth.geodetic_to_cartesian(GeodeticPosition::from_degrees(-33.9, 151.2, 120.0));
    EXPECT_NEAR(earth.geodetic_surface_normal(ecef).length(), 1.0, 1e-14);
}

TEST_F(EllipsoidConversionTest, SurfaceNormalMatchesGeodeticLatitude) {
    // The ellipsoid normal points along the geodetic (not geocentric) vertical
    GeodeticPosition lla = GeodeticPosition::from_degrees(45.0, 10.0, 0.0);
    Vec3 ecef = earth.geodetic_to_cartesian(lla);

    Vec3 from_cartesian = earth.geodetic_surface_normal(ecef);
    Vec3 from_geodetic = earth.geodetic_surface_normal(lla);

    EXPECT_TRUE(nearly_equal_vec(from_cartesian, from_geodetic, 1e-12));
    EXPECT_NEAR(std::asin(from_cartesian.z), lla.latitude, 1e-12);
}

TEST_F(EllipsoidConversionTest, SurfaceNormalAtOriginIsZero) {
    EXPECT_TRUE(earth.geodetic_surface_normal(Vec3::Zero()).is_zero());
}

TEST_F(EllipsoidConversionTest, ScaleToGeodeticSurface) {
    GeodeticPosition lla = GeodeticPosition::from_degrees(60.0, 25.0, 3000.0);
    Vec3 surface = earth.scale_to_geodetic_surface(earth.geodetic_to_cartesian(lla));

    GeodeticPosition back = earth.cartesian_to_geodetic(surface);
    EXPECT_NEAR(back.latitude, lla.latitude, ANGLE_EPSILON);
    EXPECT_NEAR(back.longitude, lla.longitude, ANGLE_EPSILON);
    EXPECT_NEAR(back.height, 0.0, 1e-6);
}

// ============================================================================
// Math Utility Tests
// ============================================================================

TEST(MathUtilityTest, NormalizeAngle) {
    EXPECT_NEAR(math::normalize_angle(3.0 * constants::PI), constants::PI, 1e-12);
    EXPECT_NEAR(math::normalize_angle(-1.5 * constants::PI), 0.5 * constants::PI, 1e-12);
    EXPECT_NEAR(math::rad_to_deg(math::deg_to_rad(123.0)), 123.0, 1e-12);
}
