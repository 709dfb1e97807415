/**
 * @file ConfidenceAggregator.inl
 * @brief Template implementation for ConfidenceAggregator<Traits>.
 * @author MasterLaplace
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <utility>

namespace spc::fusion {

template <DomainTraits Traits>
core::Expected<typename ConfidenceAggregator<Traits>::State>
ConfidenceAggregator<Traits>::addSignal(
    Kind kind, double value, std::string description,
    core::TimePoint observedAt, core::TimePoint now)
{
    if (!isKnownKind<Traits>(kind))
        return core::makeError(core::ErrorCode::kUnknownKind, "signal kind outside the domain table");

    if (!std::isfinite(value) || value < 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "signal value must be finite and non-negative");

    _history.push(Signal<Kind>{kind, value, observedAt, std::move(description)});
    return evaluate(now);
}

template <DomainTraits Traits>
typename ConfidenceAggregator<Traits>::State
ConfidenceAggregator<Traits>::evaluate(core::TimePoint now) const
{
    State state;
    state.score = score(now);
    state.level = Traits::levelFor(state.score);
    state.signals.assign(_history.begin(), _history.end());
    return state;
}

template <DomainTraits Traits>
core::i32 ConfidenceAggregator<Traits>::score(core::TimePoint now) const
{
    double weighted = 0.0;
    for (const auto &s : _history)
        weighted += s.value * Traits::weight(s.kind) * decay(s.timestamp, now);

    const double scaled = std::round(weighted / Traits::kNormalizer);
    return static_cast<core::i32>(std::min(100.0, scaled));
}

template <DomainTraits Traits>
double ConfidenceAggregator<Traits>::decay(core::TimePoint observedAt, core::TimePoint now) noexcept
{
    const double ageMinutes = std::max(0.0, core::minutesBetween(observedAt, now));
    return std::max(0.0, 1.0 - ageMinutes / Traits::kHalfLifeMinutes);
}

} // namespace spc::fusion
