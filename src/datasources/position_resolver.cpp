/**
 * @file position_resolver.cpp
 * @brief Position resolver implementations
 */

#include "geoclamp/datasources/position_resolver.h"
#include <stdexcept>

namespace geoclamp::datasources {

// ============================================================================
// FunctionPositionResolver
// ============================================================================

FunctionPositionResolver::FunctionPositionResolver(Function function)
    : function_(std::move(function))
{
    if (!function_) {
        throw std::invalid_argument("FunctionPositionResolver: function is required");
    }
}

std::shared_ptr<PositionResolver> FunctionPositionResolver::create(Function function)
{
    return std::make_shared<FunctionPositionResolver>(std::move(function));
}

std::optional<Vec3> FunctionPositionResolver::resolve_position(const JulianDate& time)
{
    return function_(time);
}

// ============================================================================
// PropertyPositionResolver
// ============================================================================

PropertyPositionResolver::PropertyPositionResolver(std::shared_ptr<Property<Vec3>> position)
    : position_(std::move(position))
{
    if (!position_) {
        throw std::invalid_argument("PropertyPositionResolver: position property is required");
    }
}

std::optional<Vec3> PropertyPositionResolver::resolve_position(const JulianDate& time)
{
    return position_->get_value(time);
}

// ============================================================================
// CentroidPositionResolver
// ============================================================================

CentroidPositionResolver::CentroidPositionResolver(
    std::shared_ptr<Property<std::vector<Vec3>>> positions)
    : positions_(std::move(positions))
{
    if (!positions_) {
        throw std::invalid_argument("CentroidPositionResolver: positions property is required");
    }
}

std::optional<Vec3> CentroidPositionResolver::resolve_position(const JulianDate& time)
{
    std::optional<std::vector<Vec3>> positions = positions_->get_value(time);
    if (!positions || positions->empty()) {
        return std::nullopt;
    }

    Vec3 sum = Vec3::Zero();
    for (const auto& p : *positions) {
        sum = sum + p;
    }
    return sum / static_cast<Real>(positions->size());
}

} // namespace geoclamp::datasources
