#pragma once
/**
 * @file terrain_offset_property.h
 * @brief Offset lifting ground-relative graphics onto the terrain
 */

#include "geoclamp/core/coordinates.h"
#include "geoclamp/datasources/height_source.h"
#include "geoclamp/datasources/position_resolver.h"
#include "geoclamp/datasources/property.h"
#include "geoclamp/scene/scene.h"
#include <memory>

namespace geoclamp::datasources {

/**
 * @brief Vertical offset from the ellipsoid surface to the terrain
 *
 * Evaluates to surface_normal(position) * terrain_height, where position
 * comes from the PositionResolver and terrain_height from the scene's globe.
 * The value is zero when neither height source requires terrain
 * (base reference None and extruded reference not RelativeToGround), when no
 * position is defined, or when no globe is attached.
 *
 * The terrain height is resolved only when the evaluated position moves by
 * more than position_epsilon, or when the scene reports a terrain provider
 * change or a completed morph. Each resolution takes the best height already
 * resident on the globe immediately and registers one asynchronous
 * refinement request, replacing the previous one. definition_changed() is
 * raised whenever the terrain height changes.
 *
 * The scene must outlive the property. Single-threaded.
 */
class TerrainOffsetProperty : public Property<Vec3> {
public:
    /**
     * @param scene Scene providing the globe and invalidation notifications
     * @param height Base height configuration
     * @param extruded_height Extruded height configuration
     * @param position_resolver Position at which terrain is sampled
     * @param position_epsilon Per-component distance (m) below which a new
     *        position is treated as unchanged
     * @throws std::invalid_argument if any source is null or the epsilon
     *         is negative
     */
    TerrainOffsetProperty(scene::Scene& scene,
                          std::shared_ptr<HeightSource> height,
                          std::shared_ptr<HeightSource> extruded_height,
                          std::shared_ptr<PositionResolver> position_resolver,
                          Real position_epsilon = epsilon::E10);
    ~TerrainOffsetProperty() override;

    // Non-copyable, non-movable: registered callbacks refer to this instance
    TerrainOffsetProperty(const TerrainOffsetProperty&) = delete;
    TerrainOffsetProperty& operator=(const TerrainOffsetProperty&) = delete;

    // ========================================================================
    // Property
    // ========================================================================

    /**
     * @brief Offset at time; always engaged
     * @throws std::logic_error after destroy()
     */
    std::optional<Vec3> get_value(const JulianDate& time) override;

    /**
     * @brief Offset at time, written into a caller-owned buffer
     * @return result
     * @throws std::logic_error after destroy()
     */
    Vec3& get_value(const JulianDate& time, Vec3& result);

    bool is_constant() const override { return false; }

    events::Event<>& definition_changed() override { return definition_changed_; }

    /**
     * @brief Same instance, or same scene and equal cached positions
     */
    bool equals(const Property<Vec3>& other) const override;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Release scene subscriptions and the pending height request
     *
     * Safe to call more than once.
     */
    void destroy();

    bool is_destroyed() const { return destroyed_; }

    // ========================================================================
    // Cached State
    // ========================================================================

    /// Last resolved (or best-effort) terrain height, 0 until resolved
    Real terrain_height() const { return terrain_height_; }

    /// Last evaluated position; zero before the first evaluation
    const Vec3& cached_position() const { return position_; }

    /// Geodetic coordinate of the last resolution
    const GeodeticPosition& cached_geodetic_position() const { return geodetic_position_; }

    /// Surface normal at cached_position()
    const Vec3& cached_normal() const { return normal_; }

    /// True while a refinement request is registered with the globe
    bool has_pending_update() const { return pending_update_.active(); }

    Real position_epsilon() const { return position_epsilon_; }

private:
    /**
     * @brief Resolve the terrain height at the cached position
     */
    void update_clamping();

    void on_height_refined(UInt64 generation, const GeodeticPosition& requested,
                           const Ellipsoid& ellipsoid, const Vec3& clamped_position);

    void set_terrain_height(Real height);

    scene::Scene& scene_;
    std::shared_ptr<HeightSource> height_;
    std::shared_ptr<HeightSource> extruded_height_;
    std::shared_ptr<PositionResolver> position_resolver_;
    Real position_epsilon_;

    Vec3 position_{};
    GeodeticPosition geodetic_position_{};
    Vec3 normal_{};
    bool has_position_{false};

    Real terrain_height_{0.0};
    events::Event<> definition_changed_;

    scene::HeightUpdateHandle pending_update_;
    UInt64 request_generation_{0};

    events::ScopedListener terrain_provider_listener_;
    events::ScopedListener morph_listener_;
    bool destroyed_{false};
};

} // namespace geoclamp::datasources
