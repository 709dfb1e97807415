/**
 * @file Clock.cpp
 * @brief SystemClock and ManualClock implementations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/core/Clock.hpp"

namespace spc::core {

TimePoint SystemClock::now() const
{
    return SystemClockType::now();
}

ManualClock::ManualClock(TimePoint start)
    : _ticks(start.time_since_epoch().count())
{
}

TimePoint ManualClock::now() const
{
    return TimePoint{Duration{_ticks.load(std::memory_order_acquire)}};
}

void ManualClock::set(TimePoint instant) noexcept
{
    _ticks.store(instant.time_since_epoch().count(), std::memory_order_release);
}

void ManualClock::advance(Duration delta) noexcept
{
    _ticks.fetch_add(delta.count(), std::memory_order_acq_rel);
}

} // namespace spc::core
