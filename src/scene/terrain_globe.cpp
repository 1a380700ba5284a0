/**
 * @file terrain_globe.cpp
 * @brief Tiled terrain globe implementation
 */

#include "geoclamp/scene/terrain_globe.h"
#include "geoclamp/core/logger.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

namespace geoclamp::scene {

namespace {

/**
 * @brief Quadtree tile address
 */
struct TileKey {
    int level{0};
    Int64 x{0};
    Int64 y{0};

    bool operator<(const TileKey& other) const {
        if (level != other.level) return level < other.level;
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

} // anonymous namespace

// ============================================================================
// TerrainGlobe Implementation
// ============================================================================

struct TerrainGlobe::Impl {
    using RequestId = UInt64;

    struct Request {
        GeodeticPosition position;
        HeightUpdateCallback callback;
        int delivered_level{-1};
    };

    Ellipsoid ellipsoid;
    std::shared_ptr<TerrainProvider> provider;
    TerrainGlobeOptions options;

    std::set<TileKey> resident;
    std::map<RequestId, Request> requests;
    RequestId next_request_id{1};

    events::Event<> terrain_provider_changed;

    int max_level() const
    {
        return std::min(provider->max_level(), MAX_TERRAIN_LEVEL);
    }

    TileKey tile_for(Real lat, Real lon, int level) const
    {
        level = std::clamp(level, 0, MAX_TERRAIN_LEVEL);
        Real size = options.level_zero_tile_degrees * constants::DEG_TO_RAD /
                    static_cast<Real>(Int64{1} << level);
        return TileKey{
            level,
            static_cast<Int64>(std::floor((lon + constants::PI) / size)),
            static_cast<Int64>(std::floor((lat + constants::PI / 2.0) / size))
        };
    }

    int best_resident_level(Real lat, Real lon) const
    {
        for (int level = max_level(); level >= 0; --level) {
            if (resident.count(tile_for(lat, lon, level)) != 0) {
                return level;
            }
        }
        return -1;
    }
};

TerrainGlobe::TerrainGlobe(std::shared_ptr<TerrainProvider> provider,
                           const Ellipsoid& ellipsoid,
                           const TerrainGlobeOptions& options)
    : impl_(std::make_shared<Impl>())
{
    if (!provider) {
        throw std::invalid_argument("TerrainGlobe: terrain provider is required");
    }
    if (options.max_tile_loads_per_update < 1) {
        throw std::invalid_argument("TerrainGlobe: max_tile_loads_per_update must be >= 1");
    }
    if (!(options.level_zero_tile_degrees > 0.0)) {
        throw std::invalid_argument("TerrainGlobe: level_zero_tile_degrees must be > 0");
    }

    impl_->ellipsoid = ellipsoid;
    impl_->provider = std::move(provider);
    impl_->options = options;
}

TerrainGlobe::~TerrainGlobe() = default;

const Ellipsoid& TerrainGlobe::ellipsoid() const
{
    return impl_->ellipsoid;
}

std::optional<Real> TerrainGlobe::get_height(const GeodeticPosition& position) const
{
    int level = impl_->best_resident_level(position.latitude, position.longitude);
    if (level < 0) {
        return std::nullopt;
    }
    return impl_->provider->sample_height(position.latitude, position.longitude, level);
}

HeightUpdateHandle TerrainGlobe::update_height(const GeodeticPosition& position,
                                               HeightUpdateCallback callback)
{
    if (!callback) {
        return HeightUpdateHandle{};
    }

    Impl::RequestId id = impl_->next_request_id++;
    impl_->requests.emplace(id, Impl::Request{position, std::move(callback), -1});

    std::weak_ptr<Impl> weak = impl_;
    return HeightUpdateHandle([weak, id] {
        if (auto impl = weak.lock()) {
            impl->requests.erase(id);
        }
    });
}

events::Event<>& TerrainGlobe::terrain_provider_changed()
{
    return impl_->terrain_provider_changed;
}

TerrainProvider& TerrainGlobe::terrain_provider() const
{
    return *impl_->provider;
}

void TerrainGlobe::set_terrain_provider(std::shared_ptr<TerrainProvider> provider)
{
    if (!provider) {
        throw std::invalid_argument("TerrainGlobe: terrain provider is required");
    }
    if (provider == impl_->provider) {
        return;
    }

    GEOCLAMP_LOG_INFO("Terrain provider changed: ", impl_->provider->name(),
                      " -> ", provider->name(), " (dropping ",
                      impl_->resident.size(), " resident tiles)");

    impl_->provider = std::move(provider);
    impl_->resident.clear();
    for (auto& [id, request] : impl_->requests) {
        request.delivered_level = -1;
    }

    impl_->terrain_provider_changed.raise();
}

SizeT TerrainGlobe::update()
{
    // Callbacks may release the last owner of this globe
    std::shared_ptr<Impl> impl = impl_;
    const int max_level = impl->max_level();

    // Next level of detail wanted by each request, in registration order
    std::vector<TileKey> wanted;
    std::set<TileKey> seen;
    for (const auto& [id, request] : impl->requests) {
        const Real lat = request.position.latitude;
        const Real lon = request.position.longitude;
        int best = impl->best_resident_level(lat, lon);
        if (best >= max_level) {
            continue;
        }
        TileKey key = impl->tile_for(lat, lon, best + 1);
        if (seen.insert(key).second) {
            wanted.push_back(key);
        }
    }

    SizeT loaded = 0;
    for (const auto& key : wanted) {
        if (loaded >= static_cast<SizeT>(impl->options.max_tile_loads_per_update)) {
            break;
        }
        impl->resident.insert(key);
        ++loaded;
        GEOCLAMP_LOG_DEBUG("Loaded terrain tile L", key.level, " (", key.x, ", ", key.y, ")");
    }

    // Callbacks may cancel or register requests, so walk a snapshot of ids
    std::vector<Impl::RequestId> ids;
    ids.reserve(impl->requests.size());
    for (const auto& [id, request] : impl->requests) {
        ids.push_back(id);
    }

    for (Impl::RequestId id : ids) {
        auto it = impl->requests.find(id);
        if (it == impl->requests.end()) {
            continue;
        }
        Impl::Request& request = it->second;
        const Real lat = request.position.latitude;
        const Real lon = request.position.longitude;

        int best = impl->best_resident_level(lat, lon);
        if (best <= request.delivered_level) {
            continue;
        }
        request.delivered_level = best;

        std::optional<Real> height = impl->provider->sample_height(lat, lon, best);
        if (!height) {
            continue;
        }

        Vec3 clamped = impl->ellipsoid.geodetic_to_cartesian(
            GeodeticPosition{lat, lon, *height});
        HeightUpdateCallback callback = request.callback;
        callback(clamped);
    }

    return loaded;
}

void TerrainGlobe::preload(const GeodeticPosition& position, int level)
{
    level = std::min(level, impl_->max_level());
    for (int l = 0; l <= level; ++l) {
        impl_->resident.insert(impl_->tile_for(position.latitude, position.longitude, l));
    }
}

int TerrainGlobe::resident_level_at(const GeodeticPosition& position) const
{
    return impl_->best_resident_level(position.latitude, position.longitude);
}

SizeT TerrainGlobe::resident_tile_count() const
{
    return impl_->resident.size();
}

SizeT TerrainGlobe::pending_request_count() const
{
    return impl_->requests.size();
}

} // namespace geoclamp::scene
