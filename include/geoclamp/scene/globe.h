#pragma once
/**
 * @file globe.h
 * @brief Terrain height services offered by a globe
 */

#include "geoclamp/core/coordinates.h"
#include "geoclamp/events/event.h"
#include <functional>
#include <optional>

namespace geoclamp::scene {

/**
 * @brief Receives the terrain-clamped ECEF position of a refined sample
 */
using HeightUpdateCallback = std::function<void(const Vec3& clamped_position)>;

// ============================================================================
// Height Update Handle
// ============================================================================

/**
 * @brief Ownership of one registered height refinement request
 *
 * Move-only. cancel() is idempotent and guarantees the callback is not
 * invoked afterwards. Destroying the handle cancels the request.
 */
class HeightUpdateHandle {
public:
    using Canceller = std::function<void()>;

    HeightUpdateHandle() = default;
    explicit HeightUpdateHandle(Canceller canceller);
    ~HeightUpdateHandle();

    HeightUpdateHandle(const HeightUpdateHandle&) = delete;
    HeightUpdateHandle& operator=(const HeightUpdateHandle&) = delete;

    HeightUpdateHandle(HeightUpdateHandle&& other) noexcept;
    HeightUpdateHandle& operator=(HeightUpdateHandle&& other) noexcept;

    /**
     * @brief Cancel the request if still registered
     */
    void cancel();

    /**
     * @brief True until cancel() is called
     */
    bool active() const { return static_cast<bool>(canceller_); }

private:
    Canceller canceller_;
};

// ============================================================================
// Globe Interface
// ============================================================================

/**
 * @brief Terrain collaborator attached to a Scene
 */
class Globe {
public:
    virtual ~Globe() = default;

    /**
     * @brief Reference ellipsoid of the terrain
     */
    virtual const Ellipsoid& ellipsoid() const = 0;

    /**
     * @brief Best-effort height from terrain detail already resident
     * @return Height above the ellipsoid, or nullopt if nothing is loaded
     */
    virtual std::optional<Real> get_height(const GeodeticPosition& position) const = 0;

    /**
     * @brief Register for refined heights at a position
     *
     * The callback runs on the caller's thread each time more detailed
     * terrain covering the position becomes available, until the returned
     * handle is cancelled.
     */
    virtual HeightUpdateHandle update_height(const GeodeticPosition& position,
                                             HeightUpdateCallback callback) = 0;

    /**
     * @brief Raised when the terrain data source is replaced
     */
    virtual events::Event<>& terrain_provider_changed() = 0;
};

} // namespace geoclamp::scene
