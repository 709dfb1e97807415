/**
 * @file DangerMonitor.cpp
 * @brief DangerMonitor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/fusion/DangerMonitor.hpp"

#include <spc/core/Log.hpp>

namespace spc::fusion {

DangerMonitor::DangerMonitor(const core::IClock &clock)
    : DomainMonitor<DangerTraits>(clock)
{
}

void DangerMonitor::setAutonomousMode(bool enabled)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _autonomousMode = enabled;
    core::Log::info("FUSION", enabled ? "danger autonomous mode on" : "danger autonomous mode off");
}

bool DangerMonitor::toggleAutonomousMode()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _autonomousMode = !_autonomousMode;
    core::Log::info("FUSION", _autonomousMode ? "danger autonomous mode on" : "danger autonomous mode off");
    return _autonomousMode;
}

bool DangerMonitor::autonomousMode() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _autonomousMode;
}

void DangerMonitor::decorateAlert(alert::Alert &alert) const
{
    alert.autonomousResponse = _autonomousMode;
    if (_autonomousMode)
        alert.message += "; autonomous emergency response engaged";
}

} // namespace spc::fusion
