#pragma once
/**
 * @file geoclamp.h
 * @brief Main include file for GeoClamp
 *
 * GeoClamp - terrain-relative offsets for ground-clamped graphics.
 *
 * Include this single header to access all public GeoClamp APIs.
 */

#include "geoclamp/core/types.h"
#include "geoclamp/core/coordinates.h"
#include "geoclamp/core/time.h"
#include "geoclamp/core/logger.h"

#include "geoclamp/events/event.h"

#include "geoclamp/scene/height_reference.h"
#include "geoclamp/scene/globe.h"
#include "geoclamp/scene/terrain_provider.h"
#include "geoclamp/scene/terrain_globe.h"
#include "geoclamp/scene/scene.h"

#include "geoclamp/datasources/property.h"
#include "geoclamp/datasources/height_source.h"
#include "geoclamp/datasources/position_resolver.h"
#include "geoclamp/datasources/terrain_offset_property.h"

#include "geoclamp/interface/config.h"

/**
 * @namespace geoclamp
 * @brief Root namespace for all GeoClamp components
 */
namespace geoclamp {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace geoclamp
