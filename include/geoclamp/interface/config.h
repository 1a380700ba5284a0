#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "geoclamp/core/coordinates.h"
#include "geoclamp/core/logger.h"
#include "geoclamp/scene/scene.h"
#include "geoclamp/scene/terrain_globe.h"
#include <string>

namespace geoclamp::config {

/**
 * @brief Terrain clamping configuration loaded from XML
 *
 * @code{.xml}
 * <geoclamp_config>
 *   <offset><position_epsilon>1e-10</position_epsilon></offset>
 *   <ellipsoid>
 *     <semi_major_axis unit="m">6378137.0</semi_major_axis>
 *     <semi_minor_axis unit="m">6356752.314245</semi_minor_axis>
 *   </ellipsoid>
 *   <terrain>
 *     <max_tile_loads_per_update>4</max_tile_loads_per_update>
 *     <tile_size unit="deg">10</tile_size>
 *   </terrain>
 *   <scene><mode>3D</mode><morph_duration unit="s">2.0</morph_duration></scene>
 *   <logging><level>warning</level></logging>
 * </geoclamp_config>
 * @endcode
 */
struct ClampConfig {
    // Offset evaluation
    Real position_epsilon{epsilon::E10};

    // Reference ellipsoid
    Real semi_major_axis{wgs84::a};
    Real semi_minor_axis{wgs84::b};

    // Terrain paging
    int max_tile_loads_per_update{4};
    Real level_zero_tile_degrees{10.0};

    // Scene
    scene::SceneMode initial_mode{scene::SceneMode::Scene3D};
    Real morph_duration{2.0};

    // Logging
    core::LogLevel log_level{core::LogLevel::Warning};

    /**
     * @brief Load configuration from an XML file
     * @throws std::runtime_error on parse errors or invalid values
     */
    static ClampConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML string
     * @throws std::runtime_error on parse errors or invalid values
     */
    static ClampConfig parse(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static ClampConfig defaults();

    /**
     * @brief Save configuration to an XML file
     */
    bool save(const std::string& path) const;

    Ellipsoid ellipsoid() const { return Ellipsoid{semi_major_axis, semi_minor_axis}; }

    scene::SceneOptions scene_options() const;

    scene::TerrainGlobeOptions terrain_options() const;

    /**
     * @brief Apply log_level to the process logger
     */
    void apply_logging() const;
};

} // namespace geoclamp::config
