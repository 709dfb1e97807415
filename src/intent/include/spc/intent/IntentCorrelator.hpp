// /////////////////////////////////////////////////////////////////////////////
/// @file IntentCorrelator.hpp
/// @brief Short-window multi-event rule that gates high-consequence actions.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/core/Clock.hpp>
#include <spc/core/Constants.hpp>
#include <spc/core/Expected.hpp>
#include <spc/core/NonCopyable.hpp>
#include <spc/intent/IntentEvent.hpp>

#include <deque>
#include <functional>
#include <mutex>

namespace spc::intent {

// /////////////////////////////////////////////////////////////////////////////
/// @class IntentCorrelator
/// @brief Confirms user intent from a combination of distress events.
///
/// Over the events younger than two minutes, intent is confirmed when
/// either
///   - at least one @c phone_drop and one @c keyword_detected are present, or
///   - at least two @c keyword_detected are present.
///
/// Scream, stress and stillness events only raise the advisory score.
/// Older events stay in the bounded history but are ignored by the rule.
///
/// The confirmation callback is latched: it fires once, and only
/// @ref resetIntent re-arms it.
// /////////////////////////////////////////////////////////////////////////////
class IntentCorrelator final : public core::NonCopyable<IntentCorrelator>
{
public:
    using ConfirmedCallback = std::function<void(const IntentState &state)>;

    explicit IntentCorrelator(const core::IClock &clock);

    /// @brief Register an event observed now.
    /// @return @c kInvalidArgument when @p confidence is outside [0, 1].
    [[nodiscard]] core::Expected<IntentState> registerEvent(IntentKind kind, double confidence = 1.0);

    /// @brief Register an event observed at @p now and evaluate at @p now.
    [[nodiscard]] core::Expected<IntentState> registerEvent(IntentKind kind, double confidence, core::TimePoint now);

    /// @brief String boundary for capture collaborators.
    [[nodiscard]] core::Expected<IntentState> registerEvent(std::string_view kindName, double confidence);

    [[nodiscard]] core::Expected<IntentState> registerPhoneDrop(double confidence = 1.0)   { return registerEvent(IntentKind::kPhoneDrop, confidence); }
    [[nodiscard]] core::Expected<IntentState> registerKeyword(double confidence = 1.0)     { return registerEvent(IntentKind::kKeywordDetected, confidence); }
    [[nodiscard]] core::Expected<IntentState> registerScream(double confidence = 1.0)      { return registerEvent(IntentKind::kScreamDetected, confidence); }
    [[nodiscard]] core::Expected<IntentState> registerStressSpike(double confidence = 1.0) { return registerEvent(IntentKind::kStressSpike, confidence); }
    [[nodiscard]] core::Expected<IntentState> registerStillness(double confidence = 1.0)   { return registerEvent(IntentKind::kStillness, confidence); }

    /// @brief Evaluate the rule at @p now without registering anything.
    [[nodiscard]] IntentState evaluate(core::TimePoint now) const;

    /// @brief True once the confirmation callback has fired.
    [[nodiscard]] bool isTriggered() const;

    void onConfirmed(ConfirmedCallback callback);

    /// @brief Clear the history and re-arm the confirmation latch.
    void resetIntent();

    // ---- Rule (pure) ------------------------------------------------------

    [[nodiscard]] static bool inWindow(const IntentEvent &event, core::TimePoint now) noexcept;

    template <typename Range>
    [[nodiscard]] static bool isConfirmed(const Range &events, core::TimePoint now);

    template <typename Range>
    [[nodiscard]] static double confirmationScore(const Range &events, core::TimePoint now);

private:
    [[nodiscard]] IntentState evaluateLocked(core::TimePoint now) const;

    mutable std::mutex       mutex_;
    const core::IClock      &clock_;
    std::deque<IntentEvent>  events_;
    bool                     triggered_ = false;
    ConfirmedCallback        onConfirmed_;
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename Range>
bool IntentCorrelator::isConfirmed(const Range &events, core::TimePoint now)
{
    bool        drop     = false;
    core::usize keywords = 0;
    for (const IntentEvent &e : events)
    {
        if (!inWindow(e, now))
            continue;
        drop     = drop || e.kind == IntentKind::kPhoneDrop;
        keywords += e.kind == IntentKind::kKeywordDetected ? 1u : 0u;
    }
    return (drop && keywords >= 1) || keywords >= 2;
}

template <typename Range>
double IntentCorrelator::confirmationScore(const Range &events, core::TimePoint now)
{
    double      score    = 0.0;
    bool        drop     = false;
    bool        scream   = false;
    core::usize keywords = 0;

    for (const IntentEvent &e : events)
    {
        if (!inWindow(e, now))
            continue;

        switch (e.kind)
        {
            case IntentKind::kPhoneDrop:       drop = true;   score += 30.0 * e.confidence; break;
            case IntentKind::kKeywordDetected: ++keywords;    score += 25.0 * e.confidence; break;
            case IntentKind::kScreamDetected:  scream = true; score += 20.0 * e.confidence; break;
            case IntentKind::kStressSpike:                    score += 15.0 * e.confidence; break;
            case IntentKind::kStillness:                      score += 10.0 * e.confidence; break;
        }
    }

    if (drop && keywords >= 1)
        score += 20.0;
    if (scream && keywords >= 1)
        score += 15.0;
    if (keywords >= 2)
        score += 25.0;

    return score < 100.0 ? score : 100.0;
}

} // namespace spc::intent
