/**
 * @file scene.cpp
 * @brief Scene implementation
 */

#include "geoclamp/scene/scene.h"
#include "geoclamp/core/logger.h"
#include <algorithm>
#include <stdexcept>

namespace geoclamp::scene {

const char* scene_mode_name(SceneMode mode)
{
    switch (mode) {
        case SceneMode::Scene3D:      return "3D";
        case SceneMode::Scene2D:      return "2D";
        case SceneMode::ColumbusView: return "COLUMBUS_VIEW";
        case SceneMode::Morphing:     return "MORPHING";
    }
    return "UNKNOWN";
}

Scene::Scene(const SceneOptions& options)
    : ellipsoid_(options.ellipsoid)
    , default_morph_duration_(options.morph_duration)
    , mode_(options.mode)
{
    if (options.mode == SceneMode::Morphing) {
        throw std::invalid_argument("Scene: initial mode cannot be Morphing");
    }
    if (options.morph_duration < 0.0) {
        throw std::invalid_argument("Scene: morph duration must be >= 0");
    }
}

Scene::~Scene() = default;

// ============================================================================
// Globe
// ============================================================================

void Scene::set_globe(std::shared_ptr<Globe> globe)
{
    if (globe == globe_) {
        return;
    }

    globe_listener_.release();
    globe_ = std::move(globe);
    if (globe_) {
        globe_listener_ = events::ScopedListener(
            globe_->terrain_provider_changed(),
            [this] { terrain_provider_changed_.raise(); });
    }

    GEOCLAMP_LOG_INFO("Scene globe ", globe_ ? "attached" : "detached");
    terrain_provider_changed_.raise();
}

const Ellipsoid& Scene::ellipsoid() const
{
    return globe_ ? globe_->ellipsoid() : ellipsoid_;
}

// ============================================================================
// Mode & Morphing
// ============================================================================

void Scene::morph_to(SceneMode target)
{
    morph_to(target, default_morph_duration_);
}

void Scene::morph_to(SceneMode target, Real duration_seconds)
{
    if (target == SceneMode::Morphing) {
        throw std::invalid_argument("Scene: cannot morph to Morphing");
    }

    if (is_morphing()) {
        complete_morph();
    }
    if (target == mode_) {
        return;
    }

    morph_from_ = mode_;
    morph_target_ = target;
    morph_duration_ = std::max(duration_seconds, 0.0);
    morph_elapsed_ = 0.0;
    mode_ = SceneMode::Morphing;

    GEOCLAMP_LOG_DEBUG("Scene morph ", scene_mode_name(morph_from_), " -> ",
                       scene_mode_name(morph_target_), " over ", morph_duration_, " s");
    morph_start_.raise(morph_from_, morph_target_);

    if (morph_duration_ <= 0.0) {
        complete_morph();
    }
}

void Scene::complete_morph()
{
    if (!is_morphing()) {
        return;
    }

    mode_ = morph_target_;
    morph_elapsed_ = morph_duration_;
    morph_complete_.raise(morph_from_, mode_);
}

void Scene::tick(Real dt)
{
    if (!is_morphing()) {
        return;
    }

    morph_elapsed_ += dt;
    if (morph_elapsed_ >= morph_duration_) {
        complete_morph();
    }
}

Real Scene::morph_progress() const
{
    if (!is_morphing() || morph_duration_ <= 0.0) {
        return 1.0;
    }
    return std::clamp(morph_elapsed_ / morph_duration_, 0.0, 1.0);
}

} // namespace geoclamp::scene
