/**
 * @file terrain_offset_property.cpp
 * @brief Terrain offset property implementation
 */

#include "geoclamp/datasources/terrain_offset_property.h"
#include "geoclamp/core/logger.h"
#include <stdexcept>

namespace geoclamp::datasources {

using scene::HeightReference;
using scene::SceneMode;

TerrainOffsetProperty::TerrainOffsetProperty(scene::Scene& scene,
                                             std::shared_ptr<HeightSource> height,
                                             std::shared_ptr<HeightSource> extruded_height,
                                             std::shared_ptr<PositionResolver> position_resolver,
                                             Real position_epsilon)
    : scene_(scene)
    , height_(std::move(height))
    , extruded_height_(std::move(extruded_height))
    , position_resolver_(std::move(position_resolver))
    , position_epsilon_(position_epsilon)
{
    if (!height_) {
        throw std::invalid_argument("TerrainOffsetProperty: height source is required");
    }
    if (!extruded_height_) {
        throw std::invalid_argument("TerrainOffsetProperty: extruded height source is required");
    }
    if (!position_resolver_) {
        throw std::invalid_argument("TerrainOffsetProperty: position resolver is required");
    }
    if (!(position_epsilon_ >= 0.0)) {
        throw std::invalid_argument("TerrainOffsetProperty: position epsilon must be >= 0");
    }

    terrain_provider_listener_ = events::ScopedListener(
        scene_.terrain_provider_changed(),
        [this] { update_clamping(); });
    morph_listener_ = events::ScopedListener(
        scene_.morph_complete(),
        [this](SceneMode, SceneMode) { update_clamping(); });
}

TerrainOffsetProperty::~TerrainOffsetProperty()
{
    destroy();
}

// ============================================================================
// Evaluation
// ============================================================================

std::optional<Vec3> TerrainOffsetProperty::get_value(const JulianDate& time)
{
    Vec3 result;
    get_value(time, result);
    return result;
}

Vec3& TerrainOffsetProperty::get_value(const JulianDate& time, Vec3& result)
{
    if (destroyed_) {
        throw std::logic_error("TerrainOffsetProperty: evaluated after destroy()");
    }

    HeightReference height_reference = height_->height_reference_at(time);
    HeightReference extruded_reference = extruded_height_->height_reference_at(time);
    if (height_reference == HeightReference::None &&
        extruded_reference != HeightReference::RelativeToGround) {
        result = Vec3::Zero();
        return result;
    }

    std::optional<Vec3> position = position_resolver_->resolve_position(time);
    if (!position || position->is_zero()) {
        result = Vec3::Zero();
        return result;
    }

    if (has_position_ && position->equals_epsilon(position_, 0.0, position_epsilon_)) {
        result = normal_ * terrain_height_;
        return result;
    }

    position_ = *position;
    has_position_ = true;
    // Normal first: definition_changed listeners may re-enter get_value()
    normal_ = scene_.ellipsoid().geodetic_surface_normal(position_);

    update_clamping();

    result = normal_ * terrain_height_;
    return result;
}

// ============================================================================
// Clamping
// ============================================================================

void TerrainOffsetProperty::update_clamping()
{
    scene::Globe* globe = scene_.globe();
    if (globe == nullptr) {
        pending_update_.cancel();
        set_terrain_height(0.0);
        return;
    }
    if (!has_position_) {
        return;
    }

    pending_update_.cancel();

    const Ellipsoid& ellipsoid = globe->ellipsoid();
    geodetic_position_ = ellipsoid.cartesian_to_geodetic(position_);
    normal_ = ellipsoid.geodetic_surface_normal(position_);

    const UInt64 generation = ++request_generation_;
    const GeodeticPosition requested = geodetic_position_;
    const Ellipsoid request_ellipsoid = ellipsoid;

    GEOCLAMP_LOG_DEBUG("Terrain height request #", generation, " at lat ",
                       math::rad_to_deg(requested.latitude), " lon ",
                       math::rad_to_deg(requested.longitude));

    pending_update_ = globe->update_height(
        requested,
        [this, generation, requested, request_ellipsoid](const Vec3& clamped_position) {
            on_height_refined(generation, requested, request_ellipsoid, clamped_position);
        });

    std::optional<Real> height = globe->get_height(geodetic_position_);
    set_terrain_height(height ? *height : 0.0);
}

void TerrainOffsetProperty::on_height_refined(UInt64 generation,
                                              const GeodeticPosition& requested,
                                              const Ellipsoid& ellipsoid,
                                              const Vec3& clamped_position)
{
    if (destroyed_ || generation != request_generation_ ||
        requested != geodetic_position_) {
        GEOCLAMP_LOG_DEBUG("Discarding stale terrain height for request #", generation,
                           " (current #", request_generation_, ")");
        return;
    }

    set_terrain_height(ellipsoid.cartesian_to_geodetic(clamped_position).height);
}

void TerrainOffsetProperty::set_terrain_height(Real height)
{
    if (height == terrain_height_) {
        return;
    }
    terrain_height_ = height;
    definition_changed_.raise();
}

// ============================================================================
// Equality & Lifecycle
// ============================================================================

bool TerrainOffsetProperty::equals(const Property<Vec3>& other) const
{
    if (this == &other) {
        return true;
    }
    auto* offset = dynamic_cast<const TerrainOffsetProperty*>(&other);
    return offset != nullptr &&
           &scene_ == &offset->scene_ &&
           position_ == offset->position_;
}

void TerrainOffsetProperty::destroy()
{
    if (destroyed_) {
        return;
    }

    terrain_provider_listener_.release();
    morph_listener_.release();
    pending_update_.cancel();
    destroyed_ = true;
}

} // namespace geoclamp::datasources
