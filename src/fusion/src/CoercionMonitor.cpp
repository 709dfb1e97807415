/**
 * @file CoercionMonitor.cpp
 * @brief CoercionMonitor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/fusion/CoercionMonitor.hpp"

#include <spc/core/Log.hpp>

namespace spc::fusion {

CoercionMonitor::CoercionMonitor(const core::IClock &clock)
    : DomainMonitor<CoercionTraits>(clock)
{
}

bool CoercionMonitor::isDetected() const
{
    return level() != CoercionLevel::kNone;
}

bool CoercionMonitor::silentMode() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _silentMode;
}

void CoercionMonitor::enableSilentMode()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _silentMode = true;
    core::Log::info("FUSION", "coercion silent mode enabled");
}

void CoercionMonitor::fakeShutdown()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _silentMode = true;
    core::Log::info("FUSION", "coercion fake shutdown, monitoring continues silently");
}

void CoercionMonitor::resetSilentMode()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _silentMode = false;
    core::Log::info("FUSION", "coercion silent mode cleared");
}

void CoercionMonitor::afterEvaluate(const State &state, const Transition &, core::TimePoint)
{
    if (state.level == CoercionLevel::kConfirmed && !_silentMode) {
        _silentMode = true;
        core::Log::warn("FUSION", "coercion confirmed, silent mode engaged");
    }
}

void CoercionMonitor::decorateAlert(alert::Alert &alert) const
{
    alert.message += "; silent mode engaged";
}

void CoercionMonitor::afterReset()
{
    _silentMode = false;
}

} // namespace spc::fusion
