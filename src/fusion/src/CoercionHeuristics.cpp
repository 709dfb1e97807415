/**
 * @file CoercionHeuristics.cpp
 * @brief CoercionHeuristics implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/fusion/CoercionHeuristics.hpp"

#include <spc/core/Log.hpp>
#include <spc/math/Statistics.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace spc::fusion {

// ─── Touch ──────────────────────────────────────────────────────────────────

core::Expected<std::vector<CoercionCandidate>> CoercionHeuristics::recordTouch(double pressure, core::TimePoint at)
{
    if (!std::isfinite(pressure) || pressure < 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "touch pressure must be finite and non-negative");

    std::lock_guard<std::mutex> lock{_mutex};

    double speed = 0.0;
    if (!_touches.empty()) {
        // Same-millisecond touches are clamped to a 1 ms gap.
        const auto gapMs = std::max<core::i64>(1,
            std::chrono::duration_cast<core::Milliseconds>(at - _touches.back().at).count());
        speed = 1000.0 / static_cast<double>(gapMs);
    }

    _touches.push_back({pressure > 0.0 ? pressure : kDefaultPressure, speed, at});
    if (_touches.size() > kTouchHistory)
        _touches.pop_front();

    if (!_baseline && _touches.size() >= kTouchBaselineSamples) {
        std::vector<double> pressures;
        std::vector<double> speeds;
        for (const auto &t : _touches) {
            pressures.push_back(t.pressure);
            speeds.push_back(t.speed);
        }
        _baseline = Baseline{math::Statistics::mean(pressures), math::Statistics::mean(speeds)};
        core::Log::debug("FUSION", std::format("touch baseline pressure {:.2f} speed {:.2f}",
            _baseline->pressure, _baseline->speed));
    }

    std::vector<CoercionCandidate> raised;
    if (!_baseline || _touches.size() <= kTouchAnalysisMinimum)
        return raised;

    std::vector<double> pressures;
    std::vector<double> speeds;
    for (auto it = _touches.end() - static_cast<std::ptrdiff_t>(kTouchAnalysisWindow); it != _touches.end(); ++it) {
        pressures.push_back(it->pressure);
        speeds.push_back(it->speed);
    }

    const double variance = math::Statistics::variance(pressures);
    if (variance > kShakingVariance)
        raised.push_back({CoercionKind::kShakingHands, std::min(50.0, variance * 100.0),
                          "Trembling touch detected"});

    if (math::Statistics::mean(speeds) > _baseline->speed * kErraticSpeedFactor)
        raised.push_back({CoercionKind::kErraticTouch, kErraticTouchValue,
                          "Erratic touch speed"});

    return raised;
}

// ─── Unlock ─────────────────────────────────────────────────────────────────

std::vector<CoercionCandidate> CoercionHeuristics::recordUnlock(core::TimePoint at)
{
    std::lock_guard<std::mutex> lock{_mutex};

    std::vector<CoercionCandidate> raised;
    if (_lastUnlock && at - *_lastUnlock < kRapidUnlockGap) {
        ++_unlockCount;
        if (_unlockCount >= kRapidUnlockCount) {
            raised.push_back({CoercionKind::kForcedUnlock, kForcedUnlockValue,
                              "Rapid consecutive unlocks"});
            _unlockCount = 0;
        }
    } else if (_unlockCount > 0) {
        --_unlockCount;
    }

    _lastUnlock = at;
    return raised;
}

// ─── Navigation ─────────────────────────────────────────────────────────────

std::vector<CoercionCandidate> CoercionHeuristics::recordNavigation(std::string path, core::TimePoint at)
{
    std::lock_guard<std::mutex> lock{_mutex};

    _navigations.push_back({std::move(path), at});
    if (_navigations.size() > kNavigationHistory)
        _navigations.pop_front();

    std::vector<CoercionCandidate> raised;
    if (_navigations.size() < kNavigationBurst)
        return raised;

    const auto &first = _navigations[_navigations.size() - kNavigationBurst];
    if (_navigations.back().at - first.at < kNavigationBurstSpan)
        raised.push_back({CoercionKind::kRapidNavigation, kRapidNavigationValue,
                          "Rapid navigation detected"});
    return raised;
}

// ─── State ──────────────────────────────────────────────────────────────────

bool CoercionHeuristics::hasTouchBaseline() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _baseline.has_value();
}

core::u32 CoercionHeuristics::rapidUnlockCount() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _unlockCount;
}

void CoercionHeuristics::reset()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _touches.clear();
    _baseline.reset();
    _lastUnlock.reset();
    _unlockCount = 0;
    _navigations.clear();
}

} // namespace spc::fusion
