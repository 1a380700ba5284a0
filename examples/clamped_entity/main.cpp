/**
 * @file main.cpp
 * @brief Ground-relative entity example
 *
 * Drives an entity across a synthetic ridge while terrain streams in, and
 * prints the offset that lifts it from the ellipsoid to the terrain.
 *
 * Usage: clamped_entity [config.xml]
 */

#include "geoclamp/geoclamp.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>

using namespace geoclamp;

int main(int argc, char** argv) {
    std::cout << "GeoClamp Clamped Entity Example\n";
    std::cout << "Version: " << GetVersionString() << "\n\n";

    config::ClampConfig cfg = config::ClampConfig::defaults();
    if (argc > 1) {
        try {
            cfg = config::ClampConfig::load(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what() << "\n";
            return 1;
        }
    }
    cfg.apply_logging();

    // A ridge running north-south through 10E, 45N
    scene::GeographicBounds bounds{
        math::deg_to_rad(44.0), math::deg_to_rad(46.0),
        math::deg_to_rad(9.0), math::deg_to_rad(11.0)
    };
    auto ridge = scene::HeightmapTerrainProvider::from_function(
        "ridge", bounds, 257, 257, 5,
        [](Real lat, Real lon) {
            Real d = (lon - math::deg_to_rad(10.0)) / math::deg_to_rad(0.3);
            return 1500.0 * std::exp(-d * d) + 100.0 * std::sin(lat * 200.0);
        });

    scene::Scene view(cfg.scene_options());
    auto globe = std::make_shared<scene::TerrainGlobe>(ridge, cfg.ellipsoid(), cfg.terrain_options());
    view.set_globe(globe);

    const Ellipsoid ellipsoid = cfg.ellipsoid();
    const core::JulianDate start = core::JulianDate::from_calendar(2026, 10, 19, 12, 0, 0.0);

    auto position = datasources::FunctionPositionResolver::create(
        [&](const core::JulianDate& time) -> std::optional<Vec3> {
            Real t = start.seconds_until(time);
            Real lon = 9.5 + std::min(t, 60.0) / 60.0;  // one degree per minute, then park
            return ellipsoid.geodetic_to_cartesian(GeodeticPosition::from_degrees(45.0, lon, 0.0));
        });

    datasources::TerrainOffsetProperty offset(
        view,
        datasources::HeightSource::constant(scene::HeightReference::RelativeToGround),
        datasources::HeightSource::constant(scene::HeightReference::None),
        position,
        cfg.position_epsilon);

    int refinements = 0;
    events::ScopedListener changed(offset.definition_changed(), [&] { ++refinements; });

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Time(s)  Lon(deg)  Height(m)  Offset(m)  Tiles\n";
    std::cout << "-------  --------  ---------  ---------  -----\n";

    const Real dt = 1.0;
    for (int step = 0; step <= 90; ++step) {
        core::JulianDate now = start.add_seconds(step * dt);

        Vec3 value;
        offset.get_value(now, value);
        globe->update();
        view.tick(dt);

        if (step == 70) {
            view.morph_to(scene::SceneMode::ColumbusView);
        }

        if (step % 10 == 0) {
            Real lat, lon, h;
            offset.cached_geodetic_position().to_degrees(lat, lon, h);
            std::cout << std::setw(7) << step * dt << "  "
                      << std::setw(8) << lon << "  "
                      << std::setw(9) << offset.terrain_height() << "  "
                      << std::setw(9) << value.length() << "  "
                      << std::setw(5) << globe->resident_tile_count() << "\n";
        }
    }

    std::cout << "\nHeight changes observed: " << refinements << "\n";
    std::cout << "Final scene mode: " << scene::scene_mode_name(view.mode()) << "\n";

    offset.destroy();
    return 0;
}
