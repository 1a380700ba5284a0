/**
 * @file terrain_provider.cpp
 * @brief Terrain provider implementations
 */

#include "geoclamp/scene/terrain_provider.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace geoclamp::scene {

// ============================================================================
// EllipsoidTerrainProvider
// ============================================================================

std::optional<Real> EllipsoidTerrainProvider::sample_height(
    [[maybe_unused]] Real lat, [[maybe_unused]] Real lon, [[maybe_unused]] int level) const
{
    return 0.0;
}

// ============================================================================
// HeightmapTerrainProvider
// ============================================================================

HeightmapTerrainProvider::HeightmapTerrainProvider(std::string name,
                                                   const GeographicBounds& bounds,
                                                   int rows, int cols,
                                                   std::vector<float> heights,
                                                   int max_level)
    : name_(std::move(name))
    , bounds_(bounds)
    , rows_(rows)
    , cols_(cols)
    , heights_(std::move(heights))
    , max_level_(max_level)
{
    if (rows_ < 2 || cols_ < 2) {
        throw std::invalid_argument("HeightmapTerrainProvider: grid must be at least 2x2");
    }
    if (heights_.size() != static_cast<SizeT>(rows_) * static_cast<SizeT>(cols_)) {
        throw std::invalid_argument("HeightmapTerrainProvider: height count does not match grid");
    }
    if (max_level_ < 0 || max_level_ > MAX_TERRAIN_LEVEL) {
        throw std::invalid_argument("HeightmapTerrainProvider: max_level must be in [0, " +
                                    std::to_string(MAX_TERRAIN_LEVEL) + "]");
    }
    if (!(bounds_.max_lat > bounds_.min_lat) || !(bounds_.max_lon > bounds_.min_lon)) {
        throw std::invalid_argument("HeightmapTerrainProvider: empty bounds");
    }
}

std::shared_ptr<HeightmapTerrainProvider> HeightmapTerrainProvider::from_function(
    std::string name, const GeographicBounds& bounds, int rows, int cols,
    int max_level, const std::function<Real(Real lat, Real lon)>& height_at)
{
    std::vector<float> heights;
    if (rows > 0 && cols > 0) {
        heights.reserve(static_cast<SizeT>(rows) * static_cast<SizeT>(cols));
    }

    const Real dlat = rows > 1 ? (bounds.max_lat - bounds.min_lat) / (rows - 1) : 0.0;
    const Real dlon = cols > 1 ? (bounds.max_lon - bounds.min_lon) / (cols - 1) : 0.0;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            heights.push_back(static_cast<float>(
                height_at(bounds.min_lat + r * dlat, bounds.min_lon + c * dlon)));
        }
    }

    return std::make_shared<HeightmapTerrainProvider>(
        std::move(name), bounds, rows, cols, std::move(heights), max_level);
}

Real HeightmapTerrainProvider::post(int row, int col) const
{
    row = std::clamp(row, 0, rows_ - 1);
    col = std::clamp(col, 0, cols_ - 1);
    return static_cast<Real>(heights_[static_cast<SizeT>(row) * cols_ + col]);
}

std::optional<Real> HeightmapTerrainProvider::sample_height(Real lat, Real lon, int level) const
{
    if (!bounds_.contains(lat, lon)) {
        return std::nullopt;
    }

    level = std::clamp(level, 0, max_level_);
    const int stride = 1 << (max_level_ - level);

    // Fractional grid coordinates
    Real py = (lat - bounds_.min_lat) / (bounds_.max_lat - bounds_.min_lat) * (rows_ - 1);
    Real px = (lon - bounds_.min_lon) / (bounds_.max_lon - bounds_.min_lon) * (cols_ - 1);

    // Snap to the coarse lattice for this level
    int y0 = static_cast<int>(std::floor(py / stride)) * stride;
    int x0 = static_cast<int>(std::floor(px / stride)) * stride;
    int y1 = y0 + stride;
    int x1 = x0 + stride;

    Real fy = (py - y0) / stride;
    Real fx = (px - x0) / stride;

    Real v00 = post(y0, x0);
    Real v10 = post(y0, x1);
    Real v01 = post(y1, x0);
    Real v11 = post(y1, x1);

    // Bilinear interpolation
    Real v0 = v00 * (1.0 - fx) + v10 * fx;
    Real v1 = v01 * (1.0 - fx) + v11 * fx;
    return v0 * (1.0 - fy) + v1 * fy;
}

} // namespace geoclamp::scene
