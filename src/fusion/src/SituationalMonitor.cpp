/**
 * @file SituationalMonitor.cpp
 * @brief SituationalMonitor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/fusion/SituationalMonitor.hpp"

#include <algorithm>

namespace spc::fusion {

SituationalMonitor::SituationalMonitor(const core::IClock &clock)
    : DomainMonitor<SituationalTraits>(clock)
{
}

std::vector<SituationalTrigger> SituationalMonitor::triggers() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return triggersLocked();
}

core::Duration SituationalMonitor::timeInState(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (!_enteredAt || now < *_enteredAt)
        return core::Duration::zero();
    return now - *_enteredAt;
}

core::Duration SituationalMonitor::timeInState() const
{
    return timeInState(_clock.now());
}

void SituationalMonitor::afterEvaluate(const State &state, const Transition &, core::TimePoint now)
{
    if (state.level == SituationalLevel::kNone)
        _enteredAt.reset();
    else if (!_enteredAt)
        _enteredAt = now;
}

void SituationalMonitor::decorateAlert(alert::Alert &alert) const
{
    const auto active = triggersLocked();
    if (active.empty())
        return;

    alert.message += "; triggers:";
    for (const auto t : active) {
        alert.message += ' ';
        alert.message += triggerName(t);
    }
}

void SituationalMonitor::afterReset()
{
    _enteredAt.reset();
}

std::vector<SituationalTrigger> SituationalMonitor::triggersLocked() const
{
    const auto &history = historyLocked();
    const auto any = [&history](SituationalKind kind, auto predicate) {
        return std::any_of(history.begin(), history.end(), [&](const auto &s) {
            return s.kind == kind && predicate(s.value);
        });
    };

    std::vector<SituationalTrigger> out;
    if (any(SituationalKind::kLocation,  [](double v) { return v > 30.0; }))
        out.push_back(SituationalTrigger::kRouteDeviation);
    if (any(SituationalKind::kHandling,  [](double v) { return v > 40.0; }))
        out.push_back(SituationalTrigger::kGripTension);
    if (any(SituationalKind::kNoise,     [](double v) { return v < 20.0; }))
        out.push_back(SituationalTrigger::kSuddenSilence);
    if (any(SituationalKind::kStillness, [](double v) { return v > 50.0; }))
        out.push_back(SituationalTrigger::kProlongedStillness);
    if (any(SituationalKind::kTime,      [](double v) { return v > 30.0; }))
        out.push_back(SituationalTrigger::kUnusualTime);
    return out;
}

} // namespace spc::fusion
