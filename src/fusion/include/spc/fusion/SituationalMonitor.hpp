/**
 * @file SituationalMonitor.hpp
 * @brief Pre-danger situational risk monitor.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_SITUATIONAL_MONITOR_HPP
    #define SPC_FUSION_SITUATIONAL_MONITOR_HPP

    #include <spc/fusion/DomainMonitor.hpp>

    #include <optional>
    #include <string_view>
    #include <vector>

namespace spc::fusion {

/**
 * @brief Named conditions raised from the retained situational history.
 */
enum class SituationalTrigger : core::u8 {
    kRouteDeviation = 0,   ///< location > 30
    kGripTension,          ///< handling > 40
    kSuddenSilence,        ///< noise < 20
    kProlongedStillness,   ///< stillness > 50
    kUnusualTime,          ///< time > 30
};

[[nodiscard]] constexpr std::string_view triggerName(SituationalTrigger trigger) noexcept
{
    switch (trigger) {
        case SituationalTrigger::kRouteDeviation:     return "route_deviation";
        case SituationalTrigger::kGripTension:        return "grip_tension";
        case SituationalTrigger::kSuddenSilence:      return "sudden_silence";
        case SituationalTrigger::kProlongedStillness: return "prolonged_stillness";
        case SituationalTrigger::kUnusualTime:        return "unusual_time";
    }
    return "unknown";
}

/**
 * @brief Watches weak early-warning signals and arms the emergency
 *        systems before an overt danger is detected.
 */
class SituationalMonitor final : public DomainMonitor<SituationalTraits> {
public:
    explicit SituationalMonitor(const core::IClock &clock);

    /// @brief Triggers present in the retained history, in enum order.
    [[nodiscard]] std::vector<SituationalTrigger> triggers() const;

    /// @brief Time spent above @c none, zero while at @c none.
    [[nodiscard]] core::Duration timeInState(core::TimePoint now) const;
    [[nodiscard]] core::Duration timeInState() const;

protected:
    void afterEvaluate(const State &state, const Transition &transition, core::TimePoint now) override;
    void decorateAlert(alert::Alert &alert) const override;
    void afterReset() override;

private:
    [[nodiscard]] std::vector<SituationalTrigger> triggersLocked() const;

    std::optional<core::TimePoint> _enteredAt;
};

} // namespace spc::fusion

#endif // SPC_FUSION_SITUATIONAL_MONITOR_HPP
