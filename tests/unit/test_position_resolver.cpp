/**
 * @file test_position_resolver.cpp
 * @brief Unit tests for position resolvers
 */

#include <gtest/gtest.h>
#include "geoclamp/datasources/position_resolver.h"
#include <stdexcept>

using namespace geoclamp;
using namespace geoclamp::datasources;

namespace {

const JulianDate kTime(2451545, 0.0);

} // anonymous namespace

TEST(PositionResolverTest, FunctionResolver) {
    int calls = 0;
    auto resolver = FunctionPositionResolver::create([&calls](const JulianDate& t) {
        ++calls;
        return std::optional<Vec3>(Vec3{t.seconds_of_day, 0.0, 0.0});
    });

    auto p = resolver->resolve_position(JulianDate(2451545, 25.0));
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 25.0);
    EXPECT_EQ(calls, 1);
}

TEST(PositionResolverTest, FunctionResolverRequiresFunction) {
    EXPECT_THROW(FunctionPositionResolver(FunctionPositionResolver::Function{}),
                 std::invalid_argument);
}

TEST(PositionResolverTest, PropertyResolverFollowsProperty) {
    auto position = ConstantProperty<Vec3>::create(Vec3{1.0, 2.0, 3.0});
    PropertyPositionResolver resolver(position);

    EXPECT_EQ(resolver.resolve_position(kTime), Vec3(1.0, 2.0, 3.0));

    position->set_value(std::nullopt);
    EXPECT_FALSE(resolver.resolve_position(kTime).has_value());
}

TEST(PositionResolverTest, PropertyResolverRequiresProperty) {
    EXPECT_THROW(PropertyPositionResolver(nullptr), std::invalid_argument);
}

TEST(PositionResolverTest, CentroidOfPositions) {
    auto positions = ConstantProperty<std::vector<Vec3>>::create(std::vector<Vec3>{
        {0.0, 0.0, 0.0}, {2.0, 0.0, 0.0}, {2.0, 4.0, 0.0}, {0.0, 4.0, 8.0}});
    CentroidPositionResolver resolver(positions);

    auto centroid = resolver.resolve_position(kTime);
    ASSERT_TRUE(centroid.has_value());
    EXPECT_DOUBLE_EQ(centroid->x, 1.0);
    EXPECT_DOUBLE_EQ(centroid->y, 2.0);
    EXPECT_DOUBLE_EQ(centroid->z, 2.0);
}

TEST(PositionResolverTest, CentroidOfNothingIsUndefined) {
    auto positions = ConstantProperty<std::vector<Vec3>>::create(std::vector<Vec3>{});
    CentroidPositionResolver resolver(positions);

    EXPECT_FALSE(resolver.resolve_position(kTime).has_value());

    positions->set_value(std::nullopt);
    EXPECT_FALSE(resolver.resolve_position(kTime).has_value());
}

TEST(PositionResolverTest, CentroidResolverRequiresProperty) {
    EXPECT_THROW(CentroidPositionResolver(nullptr), std::invalid_argument);
}
