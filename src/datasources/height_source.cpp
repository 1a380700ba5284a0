/**
 * @file height_source.cpp
 * @brief Height source implementation
 */

#include "geoclamp/datasources/height_source.h"

namespace geoclamp::datasources {

HeightSource::HeightSource(std::shared_ptr<Property<HeightReference>> height_reference)
{
    set_height_reference(std::move(height_reference));
}

std::shared_ptr<HeightSource> HeightSource::constant(HeightReference reference)
{
    return std::make_shared<HeightSource>(ConstantProperty<HeightReference>::create(reference));
}

void HeightSource::set_height_reference(std::shared_ptr<Property<HeightReference>> height_reference)
{
    if (height_reference_ == height_reference) {
        return;
    }

    height_reference_listener_.release();
    height_reference_ = std::move(height_reference);
    if (height_reference_) {
        height_reference_listener_ = events::ScopedListener(
            height_reference_->definition_changed(),
            [this] { definition_changed_.raise(); });
    }
    definition_changed_.raise();
}

HeightReference HeightSource::height_reference_at(const JulianDate& time) const
{
    return property::get_value_or_default(height_reference_.get(), time, HeightReference::None);
}

} // namespace geoclamp::datasources
