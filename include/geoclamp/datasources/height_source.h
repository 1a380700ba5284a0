#pragma once
/**
 * @file height_source.h
 * @brief Height configuration of an entity's graphics
 */

#include "geoclamp/datasources/property.h"
#include "geoclamp/scene/height_reference.h"
#include <memory>

namespace geoclamp::datasources {

using scene::HeightReference;

/**
 * @brief Reactive height-reference configuration
 *
 * Owned by the entity graphics that configure it. An unset height reference
 * property evaluates to HeightReference::None. definition_changed() is raised
 * when the property is replaced or when the current property changes.
 */
class HeightSource {
public:
    HeightSource() = default;
    explicit HeightSource(std::shared_ptr<Property<HeightReference>> height_reference);
    ~HeightSource() = default;

    HeightSource(const HeightSource&) = delete;
    HeightSource& operator=(const HeightSource&) = delete;

    /**
     * @brief Convenience: constant height reference
     */
    static std::shared_ptr<HeightSource> constant(HeightReference reference);

    Property<HeightReference>* height_reference() const { return height_reference_.get(); }

    void set_height_reference(std::shared_ptr<Property<HeightReference>> height_reference);

    /**
     * @brief Height reference at a time, None if unset or undefined
     */
    HeightReference height_reference_at(const JulianDate& time) const;

    events::Event<>& definition_changed() { return definition_changed_; }

private:
    std::shared_ptr<Property<HeightReference>> height_reference_;
    events::ScopedListener height_reference_listener_;
    events::Event<> definition_changed_;
};

} // namespace geoclamp::datasources
