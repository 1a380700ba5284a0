#pragma once
/**
 * @file height_reference.h
 * @brief Policy for positioning an entity relative to terrain
 */

#include "geoclamp/core/types.h"
#include <optional>
#include <string>

namespace geoclamp::scene {

enum class HeightReference : UInt8 {
    None,              ///< Position is absolute
    ClampToGround,     ///< Position is clamped to the terrain
    RelativeToGround   ///< Height is above the terrain
};

/**
 * @brief Name as written in configuration files ("NONE", "CLAMP_TO_GROUND", ...)
 */
const char* height_reference_name(HeightReference reference);

/**
 * @brief Parse a height reference name, case-insensitive
 */
std::optional<HeightReference> parse_height_reference(const std::string& name);

} // namespace geoclamp::scene
