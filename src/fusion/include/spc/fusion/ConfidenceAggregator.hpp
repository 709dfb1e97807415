/**
 * @file ConfidenceAggregator.hpp
 * @brief Decaying weighted-sum engine shared by every fusion domain.
 *
 * Score formula, evaluated lazily at an explicit instant @c now:
 *
 *     decay(s) = max(0, 1 - age_minutes(s) / HALF_LIFE)
 *     score    = min(100, round(sum(value * weight[kind] * decay) / NORMALIZER))
 *
 * Signals are never removed except by FIFO capacity eviction; decay
 * alone lowers the score as time passes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_CONFIDENCE_AGGREGATOR_HPP
    #define SPC_FUSION_CONFIDENCE_AGGREGATOR_HPP

    #include <spc/fusion/DomainTraits.hpp>
    #include <spc/fusion/Signal.hpp>

    #include <spc/core/Clock.hpp>
    #include <spc/core/Expected.hpp>

    #include <string>
    #include <vector>

namespace spc::fusion {

/**
 * @brief Derived confidence of one domain at one instant.
 */
template <DomainTraits Traits>
struct ConfidenceState {
    core::i32                                score = 0;
    typename Traits::Level                   level = Traits::kLowest;
    std::vector<Signal<typename Traits::Kind>> signals;
};

/**
 * @brief Bounded signal history plus the scoring function over it.
 *
 * Not thread-safe; the owning monitor serialises access.
 *
 * @tparam Traits Domain description (weights, thresholds, decay, capacity).
 */
template <DomainTraits Traits>
class ConfidenceAggregator {
public:
    using Kind    = typename Traits::Kind;
    using Level   = typename Traits::Level;
    using History = SignalHistory<Kind, Traits::kCapacity>;
    using State   = ConfidenceState<Traits>;

    /**
     * @brief Validate and append a signal, then re-derive the state.
     *
     * @param kind        Domain signal kind.
     * @param value       Non-negative finite magnitude.
     * @param description Provenance string (not scored).
     * @param observedAt  Instant of observation.
     * @param now         Evaluation instant.
     * @return The new state, or @c kUnknownKind / @c kInvalidArgument with
     *         the history left unchanged.
     */
    [[nodiscard]] core::Expected<State> addSignal(
        Kind kind, double value, std::string description,
        core::TimePoint observedAt, core::TimePoint now);

    /**
     * @brief Re-derive score and level from the current history.
     */
    [[nodiscard]] State evaluate(core::TimePoint now) const;

    /**
     * @brief Score only, without copying the history.
     */
    [[nodiscard]] core::i32 score(core::TimePoint now) const;

    /**
     * @brief Linear decay factor of a signal observed at @p observedAt.
     *
     * A timestamp ahead of @p now counts as fresh (factor 1).
     */
    [[nodiscard]] static double decay(core::TimePoint observedAt, core::TimePoint now) noexcept;

    [[nodiscard]] const History &history() const noexcept { return _history; }

    void clear() noexcept { _history.clear(); }

private:
    History _history;
};

} // namespace spc::fusion

    #include "ConfidenceAggregator.inl"

#endif // SPC_FUSION_CONFIDENCE_AGGREGATOR_HPP
