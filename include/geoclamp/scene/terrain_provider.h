#pragma once
/**
 * @file terrain_provider.h
 * @brief Terrain height data sources
 */

#include "geoclamp/core/types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoclamp::scene {

/// Finest level of detail a globe will address
constexpr int MAX_TERRAIN_LEVEL = 30;

/**
 * @brief Multi-resolution terrain height source
 *
 * Level 0 is the coarsest detail. Sampling at a higher level never returns
 * less accurate heights than a lower level.
 */
class TerrainProvider {
public:
    virtual ~TerrainProvider() = default;

    /**
     * @brief Display name for diagnostics
     */
    virtual std::string name() const = 0;

    /**
     * @brief Finest available level of detail
     */
    virtual int max_level() const = 0;

    /**
     * @brief Height above the ellipsoid at a level of detail
     * @param lat Latitude (rad)
     * @param lon Longitude (rad)
     * @param level Level of detail in [0, max_level()]
     * @return Height in meters, or nullopt outside the covered area
     */
    virtual std::optional<Real> sample_height(Real lat, Real lon, int level) const = 0;
};

/**
 * @brief Smooth ellipsoid with zero height everywhere
 */
class EllipsoidTerrainProvider : public TerrainProvider {
public:
    std::string name() const override { return "ellipsoid"; }
    int max_level() const override { return 0; }
    std::optional<Real> sample_height(Real lat, Real lon, int level) const override;
};

/**
 * @brief Geographic bounds (radians)
 */
struct GeographicBounds {
    Real min_lat{0.0};
    Real max_lat{0.0};
    Real min_lon{0.0};
    Real max_lon{0.0};

    bool contains(Real lat, Real lon) const noexcept {
        return lat >= min_lat && lat <= max_lat && lon >= min_lon && lon <= max_lon;
    }
};

/**
 * @brief Regular latitude/longitude elevation grid with bilinear interpolation
 *
 * Row 0 lies on min_lat, column 0 on min_lon. Coarser levels sample every
 * 2^(max_level - level)-th grid post.
 */
class HeightmapTerrainProvider : public TerrainProvider {
public:
    /**
     * @param bounds Area covered by the grid
     * @param rows Number of grid rows (>= 2)
     * @param cols Number of grid columns (>= 2)
     * @param heights Row-major heights, rows * cols values
     * @param max_level Finest level of detail in [0, MAX_TERRAIN_LEVEL]
     * @throws std::invalid_argument on inconsistent dimensions
     */
    HeightmapTerrainProvider(std::string name, const GeographicBounds& bounds,
                             int rows, int cols, std::vector<float> heights,
                             int max_level);

    /**
     * @brief Build a grid by sampling a height function at every post
     */
    static std::shared_ptr<HeightmapTerrainProvider> from_function(
        std::string name, const GeographicBounds& bounds, int rows, int cols,
        int max_level, const std::function<Real(Real lat, Real lon)>& height_at);

    std::string name() const override { return name_; }
    int max_level() const override { return max_level_; }
    std::optional<Real> sample_height(Real lat, Real lon, int level) const override;

    const GeographicBounds& bounds() const { return bounds_; }

private:
    Real post(int row, int col) const;

    std::string name_;
    GeographicBounds bounds_;
    int rows_;
    int cols_;
    std::vector<float> heights_;
    int max_level_;
};

} // namespace geoclamp::scene
