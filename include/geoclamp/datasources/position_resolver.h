#pragma once
/**
 * @file position_resolver.h
 * @brief Sources of the world-space point at which terrain is sampled
 */

#include "geoclamp/core/types.h"
#include "geoclamp/datasources/property.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace geoclamp::datasources {

/**
 * @brief Maps a time to the ECEF position used for the terrain height check
 */
class PositionResolver {
public:
    virtual ~PositionResolver() = default;

    /**
     * @return ECEF position, or nullopt when no position is defined at time
     */
    virtual std::optional<Vec3> resolve_position(const JulianDate& time) = 0;
};

/**
 * @brief Resolver backed by a caller-supplied function
 */
class FunctionPositionResolver : public PositionResolver {
public:
    using Function = std::function<std::optional<Vec3>(const JulianDate&)>;

    explicit FunctionPositionResolver(Function function);

    static std::shared_ptr<PositionResolver> create(Function function);

    std::optional<Vec3> resolve_position(const JulianDate& time) override;

private:
    Function function_;
};

/**
 * @brief Resolver that reads an entity position property
 */
class PropertyPositionResolver : public PositionResolver {
public:
    explicit PropertyPositionResolver(std::shared_ptr<Property<Vec3>> position);

    std::optional<Vec3> resolve_position(const JulianDate& time) override;

private:
    std::shared_ptr<Property<Vec3>> position_;
};

/**
 * @brief Resolver returning the centroid of a set of positions
 *
 * Used for area graphics (polygons, ellipses, corridors) whose offset is
 * sampled once at the middle of the shape.
 */
class CentroidPositionResolver : public PositionResolver {
public:
    explicit CentroidPositionResolver(std::shared_ptr<Property<std::vector<Vec3>>> positions);

    std::optional<Vec3> resolve_position(const JulianDate& time) override;

private:
    std::shared_ptr<Property<std::vector<Vec3>>> positions_;
};

} // namespace geoclamp::datasources
