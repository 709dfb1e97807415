// /////////////////////////////////////////////////////////////////////////////
/// @file DomainMonitor.inl
/// @brief Template implementation for DomainMonitor<Traits>.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/core/Log.hpp>

#include <format>
#include <utility>

namespace spc::fusion {

// -------------------------------------------------------------------------- //
//  Construction / lifecycle                                                  //
// -------------------------------------------------------------------------- //

template <DomainTraits Traits>
DomainMonitor<Traits>::DomainMonitor(const core::IClock &clock)
    : _clock{clock}
{
}

template <DomainTraits Traits>
void DomainMonitor<Traits>::start()
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (_monitoring)
        return;
    _monitoring = true;
    core::Log::info("FUSION", std::format("{} monitor started", alert::domainName(Traits::kDomain)));
}

template <DomainTraits Traits>
void DomainMonitor<Traits>::stop()
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (!_monitoring)
        return;
    _monitoring = false;
    core::Log::info("FUSION", std::format("{} monitor stopped ({} signals retained)",
        alert::domainName(Traits::kDomain), _aggregator.history().size()));
}

template <DomainTraits Traits>
bool DomainMonitor<Traits>::isMonitoring() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _monitoring;
}

// -------------------------------------------------------------------------- //
//  Ingestion                                                                 //
// -------------------------------------------------------------------------- //

template <DomainTraits Traits>
core::Expected<typename DomainMonitor<Traits>::State>
DomainMonitor<Traits>::addSignal(Kind kind, double value, std::string description)
{
    return addSignal(kind, value, std::move(description), _clock.now());
}

template <DomainTraits Traits>
core::Expected<typename DomainMonitor<Traits>::State>
DomainMonitor<Traits>::addSignal(Kind kind, double value, std::string description, core::TimePoint observedAt)
{
    Pending pending;
    {
        std::lock_guard<std::mutex> lock{_mutex};

        if (!_monitoring)
            return core::makeError(core::ErrorCode::kMonitorStopped,
                std::format("{} monitor is stopped", alert::domainName(Traits::kDomain)));

        const core::TimePoint now = _clock.now();
        auto result = _aggregator.addSignal(kind, value, std::move(description), observedAt, now);
        if (!result) {
            core::Log::warn("FUSION", std::format("{} signal rejected: {}",
                alert::domainName(Traits::kDomain), result.error().message()));
            return std::unexpected(std::move(result.error()));
        }

        core::Log::debug("FUSION", std::format("{} +{}({:.1f}) -> score {}",
            alert::domainName(Traits::kDomain), Traits::kindName(kind), value, result->score));

        pending = applyLocked(std::move(*result), now);
    }

    dispatch(pending);
    return std::move(pending.state);
}

template <DomainTraits Traits>
core::Expected<typename DomainMonitor<Traits>::State>
DomainMonitor<Traits>::addSignal(std::string_view kindName, double value, std::string description)
{
    auto kind = parseKind<Traits>(kindName);
    if (!kind) {
        core::Log::warn("FUSION", std::format("{} signal rejected: {}",
            alert::domainName(Traits::kDomain), kind.error().message()));
        return std::unexpected(std::move(kind.error()));
    }
    return addSignal(*kind, value, std::move(description));
}

// -------------------------------------------------------------------------- //
//  Polling                                                                   //
// -------------------------------------------------------------------------- //

template <DomainTraits Traits>
typename DomainMonitor<Traits>::State DomainMonitor<Traits>::evaluate(core::TimePoint now)
{
    Pending pending;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        pending = applyLocked(_aggregator.evaluate(now), now);
    }
    dispatch(pending);
    return std::move(pending.state);
}

template <DomainTraits Traits>
typename DomainMonitor<Traits>::State DomainMonitor<Traits>::evaluate()
{
    return evaluate(_clock.now());
}

template <DomainTraits Traits>
typename DomainMonitor<Traits>::State DomainMonitor<Traits>::state() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _last;
}

template <DomainTraits Traits>
typename DomainMonitor<Traits>::Level DomainMonitor<Traits>::level() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _last.level;
}

template <DomainTraits Traits>
core::i32 DomainMonitor<Traits>::score() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _last.score;
}

// -------------------------------------------------------------------------- //
//  Callbacks / reset                                                         //
// -------------------------------------------------------------------------- //

template <DomainTraits Traits>
void DomainMonitor<Traits>::onLevelChange(LevelChangeCallback callback)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _onLevelChange = std::move(callback);
}

template <DomainTraits Traits>
void DomainMonitor<Traits>::onAlert(AlertCallback callback)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _onAlert = std::move(callback);
}

template <DomainTraits Traits>
void DomainMonitor<Traits>::reset()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _aggregator.clear();
    _tracker.reset();
    _last = State{};
    afterReset();
    core::Log::info("FUSION", std::format("{} monitor reset", alert::domainName(Traits::kDomain)));
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

template <DomainTraits Traits>
typename DomainMonitor<Traits>::Pending
DomainMonitor<Traits>::applyLocked(State state, core::TimePoint now)
{
    Pending pending;
    const Transition t = _tracker.update(state.level);

    afterEvaluate(state, t, now);

    if (t.changed) {
        core::Log::info("FUSION", std::format("{} level {} -> {} (score {})",
            alert::domainName(Traits::kDomain), Traits::levelName(t.from), Traits::levelName(t.to), state.score));
        pending.transition    = t;
        pending.onLevelChange = _onLevelChange;
    }

    if (t.enteredHighest) {
        alert::Alert a;
        a.domain   = Traits::kDomain;
        a.level    = std::string{Traits::levelName(state.level)};
        a.score    = state.score;
        a.raisedAt = now;
        a.message  = std::format("{} level reached {} (score {})",
            alert::domainName(Traits::kDomain), Traits::levelName(state.level), state.score);
        a.signals.reserve(state.signals.size());
        for (const auto &s : state.signals)
            a.signals.push_back({std::string{Traits::kindName(s.kind)}, s.value, s.timestamp, s.description});
        decorateAlert(a);

        pending.alert   = std::move(a);
        pending.onAlert = _onAlert;
    }

    _last         = state;
    pending.state = std::move(state);
    return pending;
}

template <DomainTraits Traits>
void DomainMonitor<Traits>::dispatch(Pending &pending)
{
    if (pending.transition && pending.onLevelChange)
        pending.onLevelChange(pending.transition->from, pending.transition->to, pending.state);

    if (pending.alert && pending.onAlert)
        pending.onAlert(*pending.alert);
}

} // namespace spc::fusion
