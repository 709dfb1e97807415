/**
 * @file Clock.hpp
 * @brief Injectable wall clock.
 *
 * Decay and deadline logic never read the time on their own: every
 * scoring function receives "now" explicitly and components that need a
 * default reference take an IClock.  SystemClock is used in production,
 * ManualClock lets tests place every instant exactly.
 *
 * Wall-clock (system_clock) time points are used because Truth Lock
 * deadlines are persisted and must survive a process restart.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_CLOCK_HPP
    #define SPC_CORE_CLOCK_HPP

    #include "Types.hpp"

    #include <atomic>
    #include <chrono>

namespace spc::core {

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;
using Duration        = SystemClockType::duration;
using Milliseconds    = std::chrono::milliseconds;

/**
 * @brief Source of the current wall-clock instant.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/**
 * @brief IClock backed by std::chrono::system_clock.
 */
class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint now() const override;
};

/**
 * @brief Manually driven clock.  Safe to read from several threads.
 */
class ManualClock final : public IClock {
public:
    /// @param start Initial instant (defaults to the system_clock epoch).
    explicit ManualClock(TimePoint start = TimePoint{});

    [[nodiscard]] TimePoint now() const override;

    void set(TimePoint instant) noexcept;
    void advance(Duration delta) noexcept;

private:
    std::atomic<Duration::rep> _ticks;
};

/**
 * @brief Signed elapsed time from @p earlier to @p later in minutes.
 */
[[nodiscard]] inline f64 minutesBetween(TimePoint earlier, TimePoint later) noexcept
{
    return std::chrono::duration<f64, std::ratio<60>>(later - earlier).count();
}

/**
 * @brief Milliseconds since the epoch, used for ids and persisted records.
 */
[[nodiscard]] inline i64 toEpochMillis(TimePoint tp) noexcept
{
    return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

/**
 * @brief Inverse of toEpochMillis().
 */
[[nodiscard]] inline TimePoint fromEpochMillis(i64 millis) noexcept
{
    return TimePoint{std::chrono::duration_cast<Duration>(Milliseconds{millis})};
}

} // namespace spc::core

#endif // SPC_CORE_CLOCK_HPP
