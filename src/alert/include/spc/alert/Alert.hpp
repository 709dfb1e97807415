/**
 * @file Alert.hpp
 * @brief Notification payload handed to the alerting collaborator.
 *
 * An Alert is produced on an edge-triggered level crossing, an intent
 * confirmation or a Truth Lock release.  It carries a copy of the signals
 * that produced it so the collaborator never reads back into monitor
 * state.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_ALERT_ALERT_HPP
    #define SPC_ALERT_ALERT_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Types.hpp>

    #include <string>
    #include <string_view>
    #include <vector>

namespace spc::alert {

/**
 * @brief Originating subsystem of an alert.
 */
enum class Domain : core::u8 {
    kDanger = 0,
    kCoercion,
    kSituational,
    kIntent,
    kTruthLock,
};

inline constexpr core::usize kDomainCount = 5;

[[nodiscard]] constexpr std::string_view domainName(Domain domain) noexcept
{
    switch (domain) {
        case Domain::kDanger:      return "danger";
        case Domain::kCoercion:    return "coercion";
        case Domain::kSituational: return "situational";
        case Domain::kIntent:      return "intent";
        case Domain::kTruthLock:   return "truth_lock";
    }
    return "unknown";
}

/**
 * @brief Copy of one signal or event that contributed to an alert.
 */
struct SignalSnapshot {
    std::string     kind;
    double          value = 0.0;
    core::TimePoint timestamp{};
    std::string     description;
};

/**
 * @brief Payload delivered to IAlertSink::notify().
 */
struct Alert {
    Domain                      domain = Domain::kDanger;
    std::string                 level;
    core::i32                   score = 0;
    std::vector<SignalSnapshot> signals;
    std::string                 message;
    /// Lock id or incident id the alert refers to, empty otherwise.
    std::string                 reference;
    core::TimePoint             raisedAt{};
    bool                        autonomousResponse = false;
};

} // namespace spc::alert

#endif // SPC_ALERT_ALERT_HPP
