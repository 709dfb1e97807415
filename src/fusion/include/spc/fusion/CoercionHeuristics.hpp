/**
 * @file CoercionHeuristics.hpp
 * @brief Turns raw interaction events into coercion signals.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_COERCION_HEURISTICS_HPP
    #define SPC_FUSION_COERCION_HEURISTICS_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/Types.hpp>
    #include <spc/fusion/DomainTraits.hpp>

    #include <deque>
    #include <mutex>
    #include <optional>
    #include <string>
    #include <vector>

namespace spc::fusion {

/**
 * @brief Signal proposed by a heuristic, ready for CoercionMonitor::addSignal().
 */
struct CoercionCandidate {
    CoercionKind kind;
    double       value = 0.0;
    std::string  description;
};

/**
 * @brief Touch, unlock and navigation pattern detectors.
 *
 * Each record call returns the coercion signals it raised, possibly
 * none.  The caller forwards them to the coercion monitor.
 *
 * - Touch: a baseline of mean pressure and speed is fixed after the
 *   first 10 touches.  Once more than 20 touches are retained, the last
 *   10 are compared against it: pressure variance above 0.3 raises
 *   @c shaking_hands, mean speed above twice the baseline raises
 *   @c erratic_touch.
 * - Unlock: three unlocks each less than 5 s after the previous one
 *   raise @c forced_unlock.
 * - Navigation: five navigations within 3 s raise @c rapid_navigation.
 */
class CoercionHeuristics final {
public:
    static constexpr core::usize kTouchHistory          = 50;
    static constexpr core::usize kTouchBaselineSamples  = 10;
    static constexpr core::usize kTouchAnalysisMinimum  = 20;
    static constexpr core::usize kTouchAnalysisWindow   = 10;
    static constexpr double      kShakingVariance       = 0.3;
    static constexpr double      kErraticSpeedFactor    = 2.0;
    static constexpr double      kErraticTouchValue     = 35.0;
    static constexpr double      kDefaultPressure       = 0.5;

    static constexpr auto        kRapidUnlockGap        = std::chrono::seconds{5};
    static constexpr core::u32   kRapidUnlockCount      = 3;
    static constexpr double      kForcedUnlockValue     = 45.0;

    static constexpr core::usize kNavigationHistory     = 20;
    static constexpr core::usize kNavigationBurst       = 5;
    static constexpr auto        kNavigationBurstSpan   = std::chrono::seconds{3};
    static constexpr double      kRapidNavigationValue  = 40.0;

    /**
     * @brief Record one touch.
     * @param pressure Touch force or contact-area estimate; 0 means unknown
     *                 and is replaced by 0.5.
     * @param at       Touch instant.
     * @return Raised signals, or @c kInvalidArgument for a negative or
     *         non-finite pressure.
     */
    [[nodiscard]] core::Expected<std::vector<CoercionCandidate>> recordTouch(double pressure, core::TimePoint at);

    /// @brief Record the device becoming visible / unlocked at @p at.
    [[nodiscard]] std::vector<CoercionCandidate> recordUnlock(core::TimePoint at);

    /// @brief Record a navigation to @p path at @p at.
    [[nodiscard]] std::vector<CoercionCandidate> recordNavigation(std::string path, core::TimePoint at);

    [[nodiscard]] bool hasTouchBaseline() const;
    [[nodiscard]] core::u32 rapidUnlockCount() const;

    /// @brief Forget baselines, counters and histories.
    void reset();

private:
    struct Touch {
        double          pressure;
        double          speed;
        core::TimePoint at;
    };

    struct Baseline {
        double pressure;
        double speed;
    };

    struct Navigation {
        std::string     path;
        core::TimePoint at;
    };

    mutable std::mutex              _mutex;
    std::deque<Touch>               _touches;
    std::optional<Baseline>         _baseline;
    std::optional<core::TimePoint>  _lastUnlock;
    core::u32                       _unlockCount = 0;
    std::deque<Navigation>          _navigations;
};

} // namespace spc::fusion

#endif // SPC_FUSION_COERCION_HEURISTICS_HPP
