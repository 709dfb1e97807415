// /////////////////////////////////////////////////////////////////////////////
/// @file IntentCorrelator.cpp
/// @brief IntentCorrelator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/intent/IntentCorrelator.hpp>
#include <spc/core/Log.hpp>

#include <cmath>
#include <format>
#include <utility>

namespace spc::intent {

core::Expected<IntentKind> parseIntentKind(std::string_view name)
{
    for (core::usize i = 0; i < kIntentKindCount; ++i)
    {
        const auto kind = static_cast<IntentKind>(i);
        if (intentKindName(kind) == name)
            return kind;
    }
    return core::makeError(core::ErrorCode::kUnknownKind, std::format("unknown intent event '{}'", name));
}

// -------------------------------------------------------------------------- //
//  Construction                                                              //
// -------------------------------------------------------------------------- //

IntentCorrelator::IntentCorrelator(const core::IClock &clock)
    : clock_{clock}
{
}

// -------------------------------------------------------------------------- //
//  Registration                                                              //
// -------------------------------------------------------------------------- //

core::Expected<IntentState> IntentCorrelator::registerEvent(IntentKind kind, double confidence)
{
    return registerEvent(kind, confidence, clock_.now());
}

core::Expected<IntentState> IntentCorrelator::registerEvent(std::string_view kindName, double confidence)
{
    auto kind = parseIntentKind(kindName);
    if (!kind)
    {
        core::Log::warn("INTENT", kind.error().message());
        return std::unexpected(std::move(kind.error()));
    }
    return registerEvent(*kind, confidence);
}

core::Expected<IntentState> IntentCorrelator::registerEvent(IntentKind kind, double confidence, core::TimePoint now)
{
    if (static_cast<core::usize>(kind) >= kIntentKindCount)
        return core::makeError(core::ErrorCode::kUnknownKind, "intent kind outside the event table");

    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0)
    {
        core::Log::warn("INTENT", std::format("{} rejected: confidence {} outside [0, 1]",
            intentKindName(kind), confidence));
        return core::makeError(core::ErrorCode::kInvalidArgument, "intent confidence must lie in [0, 1]");
    }

    IntentState       state;
    ConfirmedCallback callback;
    {
        std::lock_guard<std::mutex> lock{mutex_};

        events_.push_back({kind, confidence, now});
        if (events_.size() > core::kIntentHistoryCapacity)
            events_.pop_front();

        state = evaluateLocked(now);
        core::Log::debug("INTENT", std::format("{} ({:.2f}) score {:.1f}",
            intentKindName(kind), confidence, state.confirmationScore));

        if (state.confirmed && !triggered_)
        {
            triggered_ = true;
            callback   = onConfirmed_;
            core::Log::warn("INTENT", std::format("intent confirmed (score {:.1f})", state.confirmationScore));
        }
    }

    if (callback)
        callback(state);
    return state;
}

// -------------------------------------------------------------------------- //
//  Queries                                                                   //
// -------------------------------------------------------------------------- //

IntentState IntentCorrelator::evaluate(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return evaluateLocked(now);
}

bool IntentCorrelator::isTriggered() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return triggered_;
}

void IntentCorrelator::onConfirmed(ConfirmedCallback callback)
{
    std::lock_guard<std::mutex> lock{mutex_};
    onConfirmed_ = std::move(callback);
}

void IntentCorrelator::resetIntent()
{
    std::lock_guard<std::mutex> lock{mutex_};
    events_.clear();
    triggered_ = false;
    core::Log::info("INTENT", "intent correlator re-armed");
}

bool IntentCorrelator::inWindow(const IntentEvent &event, core::TimePoint now) noexcept
{
    return now - event.timestamp < core::kIntentWindow;
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

IntentState IntentCorrelator::evaluateLocked(core::TimePoint now) const
{
    IntentState state;
    state.confirmed         = isConfirmed(events_, now);
    state.confirmationScore = confirmationScore(events_, now);
    state.events.assign(events_.begin(), events_.end());

    for (const auto &e : events_)
    {
        if (e.kind == IntentKind::kKeywordDetected && inWindow(e, now))
            ++state.keywordCount;
        if (e.kind == IntentKind::kPhoneDrop && (!state.lastDropTime || e.timestamp > *state.lastDropTime))
            state.lastDropTime = e.timestamp;
    }
    return state;
}

} // namespace spc::intent
