/**
 * @file CoercionMonitor.hpp
 * @brief Coercion confidence monitor with sticky silent mode.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_COERCION_MONITOR_HPP
    #define SPC_FUSION_COERCION_MONITOR_HPP

    #include <spc/fusion/DomainMonitor.hpp>

namespace spc::fusion {

/**
 * @brief Detects that the user is operating the device under duress.
 *
 * Reaching @c confirmed sets silent mode: the application keeps looking
 * normal while escalation continues in the background.  Silent mode is
 * separate state, not a function of the score, and only
 * resetSilentMode() or reset() clear it.
 */
class CoercionMonitor final : public DomainMonitor<CoercionTraits> {
public:
    explicit CoercionMonitor(const core::IClock &clock);

    /// @brief Level is above @c none.
    [[nodiscard]] bool isDetected() const;

    [[nodiscard]] bool silentMode() const;

    /// @brief Engage silent mode by hand.
    void enableSilentMode();

    /// @brief Pretend to shut down: silent mode on, no alert, monitoring
    ///        continues.
    void fakeShutdown();

    void resetSilentMode();

protected:
    void afterEvaluate(const State &state, const Transition &transition, core::TimePoint now) override;
    void decorateAlert(alert::Alert &alert) const override;
    void afterReset() override;

private:
    bool _silentMode = false;
};

} // namespace spc::fusion

#endif // SPC_FUSION_COERCION_MONITOR_HPP
