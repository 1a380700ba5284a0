#pragma once
/**
 * @file terrain_globe.h
 * @brief Reference globe with streamed, tiled terrain detail
 */

#include "geoclamp/scene/globe.h"
#include "geoclamp/scene/terrain_provider.h"
#include <memory>

namespace geoclamp::scene {

/**
 * @brief Tile paging configuration
 */
struct TerrainGlobeOptions {
    int max_tile_loads_per_update{4};     ///< Tiles made resident per update()
    Real level_zero_tile_degrees{10.0};   ///< Edge length of a level 0 tile (deg)
};

/**
 * @brief Globe whose terrain detail becomes resident tile by tile
 *
 * Terrain is tiled in a geographic quadtree. Nothing is resident initially;
 * update() loads the next level of detail for every registered refinement
 * request (bounded by max_tile_loads_per_update) and then delivers refined
 * heights to the callbacks whose coverage improved. get_height() only answers
 * from resident tiles.
 *
 * Not thread-safe: all calls, and every callback, happen on the caller's thread.
 */
class TerrainGlobe : public Globe {
public:
    /**
     * @throws std::invalid_argument if provider is null or options are invalid
     */
    explicit TerrainGlobe(std::shared_ptr<TerrainProvider> provider,
                          const Ellipsoid& ellipsoid = Ellipsoid::wgs84(),
                          const TerrainGlobeOptions& options = {});
    ~TerrainGlobe() override;

    // Non-copyable
    TerrainGlobe(const TerrainGlobe&) = delete;
    TerrainGlobe& operator=(const TerrainGlobe&) = delete;

    // ========================================================================
    // Globe
    // ========================================================================

    const Ellipsoid& ellipsoid() const override;

    std::optional<Real> get_height(const GeodeticPosition& position) const override;

    HeightUpdateHandle update_height(const GeodeticPosition& position,
                                     HeightUpdateCallback callback) override;

    events::Event<>& terrain_provider_changed() override;

    // ========================================================================
    // Terrain Provider
    // ========================================================================

    TerrainProvider& terrain_provider() const;

    /**
     * @brief Replace the terrain source
     *
     * Drops every resident tile, keeps registered requests (they will be
     * refined again from the new source) and raises terrain_provider_changed().
     *
     * @throws std::invalid_argument if provider is null
     */
    void set_terrain_provider(std::shared_ptr<TerrainProvider> provider);

    // ========================================================================
    // Paging
    // ========================================================================

    /**
     * @brief Load tiles and deliver refined heights (call each frame)
     * @return Number of tiles made resident
     */
    SizeT update();

    /**
     * @brief Immediately make tiles covering a position resident
     * @param position Geodetic position (height ignored)
     * @param level Finest level to load, clamped to the provider's max level
     */
    void preload(const GeodeticPosition& position, int level);

    /**
     * @brief Finest resident level covering a position, or -1
     */
    int resident_level_at(const GeodeticPosition& position) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    SizeT resident_tile_count() const;

    /**
     * @brief Number of registered (not cancelled) refinement requests
     */
    SizeT pending_request_count() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace geoclamp::scene
