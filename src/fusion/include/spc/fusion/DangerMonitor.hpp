/**
 * @file DangerMonitor.hpp
 * @brief Overt-danger confidence monitor.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_DANGER_MONITOR_HPP
    #define SPC_FUSION_DANGER_MONITOR_HPP

    #include <spc/fusion/DomainMonitor.hpp>

namespace spc::fusion {

/**
 * @brief Fuses motion, voice, inactivity, location, time and pattern
 *        signals into a danger score.
 *
 * In autonomous mode the emergency alert is flagged so the alerting
 * collaborator starts the emergency response without user interaction.
 */
class DangerMonitor final : public DomainMonitor<DangerTraits> {
public:
    explicit DangerMonitor(const core::IClock &clock);

    void setAutonomousMode(bool enabled);
    bool toggleAutonomousMode();
    [[nodiscard]] bool autonomousMode() const;

protected:
    void decorateAlert(alert::Alert &alert) const override;

private:
    bool _autonomousMode = false;
};

} // namespace spc::fusion

#endif // SPC_FUSION_DANGER_MONITOR_HPP
