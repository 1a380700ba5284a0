/**
 * @file globe.cpp
 * @brief Height update handle implementation
 */

#include "geoclamp/scene/globe.h"
#include <utility>

namespace geoclamp::scene {

HeightUpdateHandle::HeightUpdateHandle(Canceller canceller)
    : canceller_(std::move(canceller)) {}

HeightUpdateHandle::~HeightUpdateHandle()
{
    cancel();
}

HeightUpdateHandle::HeightUpdateHandle(HeightUpdateHandle&& other) noexcept
    : canceller_(std::exchange(other.canceller_, nullptr)) {}

HeightUpdateHandle& HeightUpdateHandle::operator=(HeightUpdateHandle&& other) noexcept
{
    if (this != &other) {
        cancel();
        canceller_ = std::exchange(other.canceller_, nullptr);
    }
    return *this;
}

void HeightUpdateHandle::cancel()
{
    if (!canceller_) {
        return;
    }
    Canceller canceller = std::exchange(canceller_, nullptr);
    canceller();
}

} // namespace geoclamp::scene
