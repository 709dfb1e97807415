// /////////////////////////////////////////////////////////////////////////////
/// @file DomainMonitor.hpp
/// @brief Thread-safe owner of one domain's aggregator and escalation state.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/alert/Alert.hpp>
#include <spc/core/Clock.hpp>
#include <spc/core/Expected.hpp>
#include <spc/fusion/ConfidenceAggregator.hpp>
#include <spc/fusion/DomainTraits.hpp>
#include <spc/fusion/EscalationTracker.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace spc::fusion {

// /////////////////////////////////////////////////////////////////////////////
/// @class DomainMonitor
/// @brief Single-writer monitor for one fusion domain.
///
/// Every insertion and poll runs under the monitor mutex, so concurrent
/// appenders are serialised.  Callbacks are collected under the lock and
/// invoked after it is released; a callback may call back into the
/// monitor.
///
/// - @ref onLevelChange fires once per level change, in either direction.
/// - @ref onAlert fires once per crossing into the domain's highest level;
///   staying at that level never refires.
///
/// @ref stop rejects further insertions with @c kMonitorStopped but keeps
/// the history, so decay keeps applying to the original timestamps after
/// a @ref start.
///
/// @tparam Traits Domain description.
// /////////////////////////////////////////////////////////////////////////////
template <DomainTraits Traits>
class DomainMonitor
{
public:
    using Kind       = typename Traits::Kind;
    using Level      = typename Traits::Level;
    using Aggregator = ConfidenceAggregator<Traits>;
    using State      = ConfidenceState<Traits>;
    using Transition = typename EscalationTracker<Level>::Transition;

    using LevelChangeCallback = std::function<void(Level from, Level to, const State &state)>;
    using AlertCallback       = std::function<void(const alert::Alert &alert)>;

    /// @param clock Time source for the overloads without an explicit instant.
    explicit DomainMonitor(const core::IClock &clock);
    virtual ~DomainMonitor() = default;

    DomainMonitor(const DomainMonitor &)            = delete;
    DomainMonitor &operator=(const DomainMonitor &) = delete;

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    void start();
    void stop();
    [[nodiscard]] bool isMonitoring() const;

    // --------------------------------------------------------------------- //
    //  Ingestion                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Append a signal observed now.
    [[nodiscard]] core::Expected<State> addSignal(Kind kind, double value, std::string description);

    /// @brief Append a signal observed at @p observedAt, scored at the clock's now.
    [[nodiscard]] core::Expected<State> addSignal(
        Kind kind, double value, std::string description, core::TimePoint observedAt);

    /// @brief String boundary for capture collaborators.
    /// @return @c kUnknownKind when @p kindName is not part of the domain.
    [[nodiscard]] core::Expected<State> addSignal(
        std::string_view kindName, double value, std::string description);

    // --------------------------------------------------------------------- //
    //  Polling                                                               //
    // --------------------------------------------------------------------- //

    /// @brief Re-derive the state at @p now (decay poll).
    State evaluate(core::TimePoint now);
    State evaluate();

    /// @brief State as of the last insertion or poll.
    [[nodiscard]] State state() const;
    [[nodiscard]] Level level() const;
    [[nodiscard]] core::i32 score() const;

    // --------------------------------------------------------------------- //
    //  Callbacks                                                             //
    // --------------------------------------------------------------------- //

    void onLevelChange(LevelChangeCallback callback);
    void onAlert(AlertCallback callback);

    /// @brief Forget every signal and return to the lowest level.
    void reset();

protected:
    /// @brief Hook run under the lock after every re-derivation.
    virtual void afterEvaluate(const State &, const Transition &, core::TimePoint) {}

    /// @brief Hook run under the lock before an alert leaves the monitor.
    virtual void decorateAlert(alert::Alert &) const {}

    /// @brief Hook run under the lock at the end of @ref reset.
    virtual void afterReset() {}

    [[nodiscard]] const typename Aggregator::History &historyLocked() const noexcept
    {
        return _aggregator.history();
    }

    mutable std::mutex  _mutex;
    const core::IClock &_clock;

private:
    struct Pending {
        std::optional<Transition>  transition;
        std::optional<alert::Alert> alert;
        State                      state;
        LevelChangeCallback        onLevelChange;
        AlertCallback              onAlert;
    };

    Pending applyLocked(State state, core::TimePoint now);
    static void dispatch(Pending &pending);

    Aggregator                _aggregator;
    EscalationTracker<Level>  _tracker{Traits::kLowest, Traits::kHighest};
    State                     _last;
    bool                      _monitoring = false;
    LevelChangeCallback       _onLevelChange;
    AlertCallback             _onAlert;
};

} // namespace spc::fusion

#include "DomainMonitor.inl"
