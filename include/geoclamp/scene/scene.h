#pragma once
/**
 * @file scene.h
 * @brief View state observed by ground-relative properties
 */

#include "geoclamp/core/coordinates.h"
#include "geoclamp/events/event.h"
#include "geoclamp/scene/globe.h"
#include <memory>

namespace geoclamp::scene {

/**
 * @brief Projection in which the scene is displayed
 */
enum class SceneMode : UInt8 {
    Scene3D,       ///< Globe
    Scene2D,       ///< Flat map, top-down
    ColumbusView,  ///< Flat map, perspective
    Morphing       ///< Transition between modes in progress
};

const char* scene_mode_name(SceneMode mode);

/**
 * @brief Scene construction options
 */
struct SceneOptions {
    Ellipsoid ellipsoid{};                 ///< Used while no globe is attached
    SceneMode mode{SceneMode::Scene3D};    ///< Initial mode (not Morphing)
    Real morph_duration{2.0};              ///< Default morph duration (s)
};

/**
 * @brief Scene owning the globe slot, the display mode and view notifications
 *
 * Usage:
 * @code
 * Scene scene;
 * scene.set_globe(std::make_shared<TerrainGlobe>(provider));
 * scene.morph_to(SceneMode::Scene2D);
 * scene.tick(dt);   // raises morph_complete() once the duration elapses
 * @endcode
 */
class Scene {
public:
    using MorphEvent = events::Event<SceneMode, SceneMode>;

    /**
     * @throws std::invalid_argument if options.mode is Morphing or the
     *         morph duration is negative
     */
    explicit Scene(const SceneOptions& options = {});
    ~Scene();

    // Non-copyable
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // ========================================================================
    // Globe
    // ========================================================================

    /**
     * @brief Attached globe, or nullptr
     */
    Globe* globe() const { return globe_.get(); }

    /**
     * @brief Attach, replace or (with nullptr) detach the globe
     *
     * Raises terrain_provider_changed() when the globe actually changes.
     */
    void set_globe(std::shared_ptr<Globe> globe);

    /**
     * @brief Globe ellipsoid, or the scene ellipsoid when no globe is attached
     */
    const Ellipsoid& ellipsoid() const;

    // ========================================================================
    // Mode & Morphing
    // ========================================================================

    SceneMode mode() const { return mode_; }

    bool is_morphing() const { return mode_ == SceneMode::Morphing; }

    /**
     * @brief Start a transition using the default duration
     */
    void morph_to(SceneMode target);

    /**
     * @brief Start a transition to a display mode
     *
     * A morph already in progress is completed first. Morphing to the
     * current mode does nothing. A duration <= 0 completes immediately.
     *
     * @throws std::invalid_argument if target is Morphing
     */
    void morph_to(SceneMode target, Real duration_seconds);

    /**
     * @brief Finish the current morph and raise morph_complete()
     */
    void complete_morph();

    /**
     * @brief Advance morph progress by dt seconds
     */
    void tick(Real dt);

    /**
     * @brief Morph progress in [0, 1]; 1 when not morphing
     */
    Real morph_progress() const;

    // ========================================================================
    // Notifications
    // ========================================================================

    /**
     * @brief Raised when the terrain source (or the globe itself) changes
     */
    events::Event<>& terrain_provider_changed() { return terrain_provider_changed_; }

    /**
     * @brief Raised with (previous mode, target mode) when a morph starts
     */
    MorphEvent& morph_start() { return morph_start_; }

    /**
     * @brief Raised with (previous mode, new mode) when a morph completes
     */
    MorphEvent& morph_complete() { return morph_complete_; }

private:
    Ellipsoid ellipsoid_;
    Real default_morph_duration_;

    std::shared_ptr<Globe> globe_;
    events::ScopedListener globe_listener_;

    SceneMode mode_;
    SceneMode morph_from_{SceneMode::Scene3D};
    SceneMode morph_target_{SceneMode::Scene3D};
    Real morph_duration_{0.0};
    Real morph_elapsed_{0.0};

    events::Event<> terrain_provider_changed_;
    MorphEvent morph_start_;
    MorphEvent morph_complete_;
};

} // namespace geoclamp::scene
