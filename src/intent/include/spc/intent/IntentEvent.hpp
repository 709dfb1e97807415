/**
 * @file IntentEvent.hpp
 * @brief Discrete distress events fed to the intent correlator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_INTENT_INTENT_EVENT_HPP
    #define SPC_INTENT_INTENT_EVENT_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/Types.hpp>

    #include <optional>
    #include <string>
    #include <string_view>
    #include <vector>

namespace spc::intent {

enum class IntentKind : core::u8 {
    kPhoneDrop = 0,
    kKeywordDetected,
    kScreamDetected,
    kStressSpike,
    kStillness,
};

inline constexpr core::usize kIntentKindCount = 5;

[[nodiscard]] constexpr std::string_view intentKindName(IntentKind kind) noexcept
{
    switch (kind) {
        case IntentKind::kPhoneDrop:       return "phone_drop";
        case IntentKind::kKeywordDetected: return "keyword_detected";
        case IntentKind::kScreamDetected:  return "scream_detected";
        case IntentKind::kStressSpike:     return "stress_spike";
        case IntentKind::kStillness:       return "stillness";
    }
    return "unknown";
}

/**
 * @brief Map a capture-collaborator event name onto IntentKind.
 * @return The kind, or @c kUnknownKind.
 */
[[nodiscard]] core::Expected<IntentKind> parseIntentKind(std::string_view name);

struct IntentEvent {
    IntentKind      kind;
    /// Detector confidence in [0, 1].
    double          confidence = 1.0;
    core::TimePoint timestamp{};
};

/**
 * @brief Correlator verdict after an event or poll.
 */
struct IntentState {
    /// Confirmation rule holds over the trailing window.
    bool                           confirmed = false;
    /// Advisory 0-100 score; never gates @ref confirmed.
    double                         confirmationScore = 0.0;
    core::usize                    keywordCount = 0;
    std::optional<core::TimePoint> lastDropTime;
    std::vector<IntentEvent>       events;
};

} // namespace spc::intent

#endif // SPC_INTENT_INTENT_EVENT_HPP
