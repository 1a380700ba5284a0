/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads and writes ClampConfig documents using pugixml. Lengths, angles and
 * durations may carry a unit attribute and are converted to SI.
 */

#include "geoclamp/interface/config.h"
#include <pugixml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace geoclamp::config {

namespace {

// ============================================================================
// Unit Conversion Helpers
// ============================================================================

/**
 * @brief Physical dimension a configured value is expected to have
 */
enum class UnitKind { Length, Angle, Duration };

const char* unit_kind_name(UnitKind kind) {
    switch (kind) {
        case UnitKind::Length: return "a length";
        case UnitKind::Angle: return "an angle";
        case UnitKind::Duration: return "a duration";
    }
    return "a value";
}

// Scale to meters, degrees or seconds; nullopt if the unit is not of this kind
std::optional<Real> unit_scale(const std::string& unit, UnitKind kind) {
    switch (kind) {
        case UnitKind::Length:
            if (unit == "km") return 1000.0;
            if (unit == "ft") return constants::FT_TO_M;
            if (unit == "m") return 1.0;
            break;
        case UnitKind::Angle:
            // Tile sizes are expressed in degrees
            if (unit == "rad") return constants::RAD_TO_DEG;
            if (unit == "deg") return 1.0;
            break;
        case UnitKind::Duration:
            if (unit == "ms") return 1.0 / 1000.0;
            if (unit == "min") return 60.0;
            if (unit == "s") return 1.0;
            break;
    }
    return std::nullopt;
}

Real convert_to_si(Real value, const std::string& unit, UnitKind kind) {
    if (auto scale = unit_scale(unit, kind)) {
        return value * *scale;
    }
    for (UnitKind other : {UnitKind::Length, UnitKind::Angle, UnitKind::Duration}) {
        if (other != kind && unit_scale(unit, other)) {
            throw std::runtime_error("Unit '" + unit + "' is not valid for " +
                                     unit_kind_name(kind) + " in config");
        }
    }
    throw std::runtime_error("Unknown unit in config: " + unit);
}

Real parse_value_with_unit(const pugi::xml_node& node, Real default_value, UnitKind kind) {
    if (!node) {
        return default_value;
    }
    Real value = node.text().as_double(default_value);
    std::string unit = node.attribute("unit").as_string("");
    return unit.empty() ? value : convert_to_si(value, unit, kind);
}

scene::SceneMode parse_scene_mode(const std::string& mode) {
    if (mode == "3D" || mode == "SCENE3D") return scene::SceneMode::Scene3D;
    if (mode == "2D" || mode == "SCENE2D") return scene::SceneMode::Scene2D;
    if (mode == "COLUMBUS_VIEW" || mode == "2.5D") return scene::SceneMode::ColumbusView;
    throw std::runtime_error("Invalid scene mode in config: " + mode);
}

void validate(const ClampConfig& config) {
    if (config.position_epsilon < 0.0) {
        throw std::runtime_error("Invalid config: position_epsilon must be >= 0");
    }
    if (!(config.semi_major_axis > 0.0) || !(config.semi_minor_axis > 0.0)) {
        throw std::runtime_error("Invalid config: ellipsoid axes must be > 0");
    }
    if (config.max_tile_loads_per_update < 1) {
        throw std::runtime_error("Invalid config: max_tile_loads_per_update must be >= 1");
    }
    if (!(config.level_zero_tile_degrees > 0.0)) {
        throw std::runtime_error("Invalid config: tile_size must be > 0");
    }
    if (config.morph_duration < 0.0) {
        throw std::runtime_error("Invalid config: morph_duration must be >= 0");
    }
}

ClampConfig from_document(const pugi::xml_document& doc) {
    ClampConfig config = ClampConfig::defaults();

    auto root = doc.child("geoclamp_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid geoclamp config XML: no root element");
    }

    if (auto offset = root.child("offset")) {
        config.position_epsilon = offset.child("position_epsilon").text().as_double(
            config.position_epsilon);
    }

    if (auto ellipsoid = root.child("ellipsoid")) {
        config.semi_major_axis = parse_value_with_unit(
            ellipsoid.child("semi_major_axis"), config.semi_major_axis, UnitKind::Length);
        config.semi_minor_axis = parse_value_with_unit(
            ellipsoid.child("semi_minor_axis"), config.semi_minor_axis, UnitKind::Length);
    }

    if (auto terrain = root.child("terrain")) {
        config.max_tile_loads_per_update = terrain.child("max_tile_loads_per_update").text().as_int(
            config.max_tile_loads_per_update);
        config.level_zero_tile_degrees = parse_value_with_unit(
            terrain.child("tile_size"), config.level_zero_tile_degrees, UnitKind::Angle);
    }

    if (auto scene = root.child("scene")) {
        if (auto mode = scene.child("mode")) {
            config.initial_mode = parse_scene_mode(mode.text().as_string());
        }
        config.morph_duration = parse_value_with_unit(
            scene.child("morph_duration"), config.morph_duration, UnitKind::Duration);
    }

    if (auto logging = root.child("logging")) {
        config.log_level = core::parse_log_level(
            logging.child("level").text().as_string(""), config.log_level);
    }

    validate(config);
    return config;
}

} // anonymous namespace

// ============================================================================
// ClampConfig Implementation
// ============================================================================

ClampConfig ClampConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }

    return from_document(doc);
}

ClampConfig ClampConfig::parse(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }

    return from_document(doc);
}

ClampConfig ClampConfig::defaults() {
    return ClampConfig{};
}

bool ClampConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("geoclamp_config");

    auto offset = root.append_child("offset");
    offset.append_child("position_epsilon").text().set(position_epsilon);

    auto ellipsoid = root.append_child("ellipsoid");
    auto major = ellipsoid.append_child("semi_major_axis");
    major.append_attribute("unit") = "m";
    major.text().set(semi_major_axis);
    auto minor = ellipsoid.append_child("semi_minor_axis");
    minor.append_attribute("unit") = "m";
    minor.text().set(semi_minor_axis);

    auto terrain = root.append_child("terrain");
    terrain.append_child("max_tile_loads_per_update").text().set(max_tile_loads_per_update);
    auto tile_size = terrain.append_child("tile_size");
    tile_size.append_attribute("unit") = "deg";
    tile_size.text().set(level_zero_tile_degrees);

    auto scene = root.append_child("scene");
    scene.append_child("mode").text().set(scene::scene_mode_name(initial_mode));
    auto morph = scene.append_child("morph_duration");
    morph.append_attribute("unit") = "s";
    morph.text().set(morph_duration);

    const char* level_str = "warning";
    switch (log_level) {
        case core::LogLevel::Debug:   level_str = "debug"; break;
        case core::LogLevel::Info:    level_str = "info"; break;
        case core::LogLevel::Warning: level_str = "warning"; break;
        case core::LogLevel::Error:   level_str = "error"; break;
        case core::LogLevel::Off:     level_str = "off"; break;
    }
    root.append_child("logging").append_child("level").text().set(level_str);

    return doc.save_file(path.c_str());
}

scene::SceneOptions ClampConfig::scene_options() const {
    scene::SceneOptions options;
    options.ellipsoid = ellipsoid();
    options.mode = initial_mode;
    options.morph_duration = morph_duration;
    return options;
}

scene::TerrainGlobeOptions ClampConfig::terrain_options() const {
    scene::TerrainGlobeOptions options;
    options.max_tile_loads_per_update = max_tile_loads_per_update;
    options.level_zero_tile_degrees = level_zero_tile_degrees;
    return options;
}

void ClampConfig::apply_logging() const {
    core::Logger::instance().set_level(log_level);
}

} // namespace geoclamp::config
