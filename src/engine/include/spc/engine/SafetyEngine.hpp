// /////////////////////////////////////////////////////////////////////////////
/// @file SafetyEngine.hpp
/// @brief Top-level safety core façade (Façade pattern).
///
/// Single entry-point that owns every decision component and wires them
/// one-directionally: monitors, intent correlator and vault release feed
/// the alert dispatcher; scream detections feed the intent correlator;
/// intent confirmation may lock an incident.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <spc/alert/AlertDispatcher.hpp>
#include <spc/alert/IAlertSink.hpp>
#include <spc/biometric/VoiceprintEnrollment.hpp>
#include <spc/core/Clock.hpp>
#include <spc/core/Expected.hpp>
#include <spc/engine/Config.hpp>
#include <spc/fusion/CoercionHeuristics.hpp>
#include <spc/fusion/CoercionMonitor.hpp>
#include <spc/fusion/DangerMonitor.hpp>
#include <spc/fusion/SituationalMonitor.hpp>
#include <spc/intent/IntentCorrelator.hpp>
#include <spc/intent/ScreamClassifier.hpp>
#include <spc/vault/ILockStore.hpp>
#include <spc/vault/TruthLock.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spc::engine {

/// @brief Point-in-time view across every domain.
struct SafetyStatus
{
    fusion::DangerLevel      dangerLevel{fusion::DangerLevel::kSafe};
    core::i32                dangerScore{0};
    fusion::CoercionLevel    coercionLevel{fusion::CoercionLevel::kNone};
    core::i32                coercionScore{0};
    bool                     silentMode{false};
    fusion::SituationalLevel situationalLevel{fusion::SituationalLevel::kNone};
    core::i32                situationalScore{0};
    bool                     intentConfirmed{false};
    double                   intentScore{0.0};
    vault::LockState         lockState{vault::LockState::kUnlocked};
    core::Duration           lockCountdown{};
};

/// @brief Copy of the current vault; unaffected when the engine replaces it.
struct VaultSnapshot
{
    vault::LockState                     state{vault::LockState::kUnlocked};
    std::optional<vault::LockRecord>     record;
    std::optional<vault::ReleaseOutcome> outcome;
    std::vector<vault::EvidenceItem>     evidence;
    core::Duration                       countdown{};
};

/// @brief Top-level safety core façade.
///
/// Collaborators (clock, alert sink, lock store) are borrowed and must
/// outlive the engine. Alerts are posted with no engine lock held, so an
/// inline sink may call back into the engine.
class SafetyEngine
{
public:
    SafetyEngine(Config config, const core::IClock &clock, alert::IAlertSink &sink, vault::ILockStore &store);
    ~SafetyEngine();

    SafetyEngine(const SafetyEngine&) = delete;
    SafetyEngine& operator=(const SafetyEngine&) = delete;

    // ---- Lifecycle ---------------------------------------------------------

    /// @brief Start every monitor and restore an unreleased lock.
    /// @return The store's error when the restore failed; monitors run anyway.
    [[nodiscard]] core::ExpectedVoid start(core::TimePoint now);

    /// @brief Stop every monitor (history is kept) and flush pending alerts.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// @brief Recurring evaluation: decay polls and the vault deadline.
    [[nodiscard]] core::ExpectedVoid tick(core::TimePoint now);

    // ---- Capture hand-off --------------------------------------------------

    /// @brief Feed a touch through the coercion heuristics.
    /// @return The coercion signals that were derived and recorded.
    [[nodiscard]] core::Expected<std::vector<fusion::CoercionCandidate>> recordTouch(
        double pressure, core::TimePoint at);
    [[nodiscard]] core::Expected<std::vector<fusion::CoercionCandidate>> recordUnlock(core::TimePoint at);
    [[nodiscard]] core::Expected<std::vector<fusion::CoercionCandidate>> recordNavigation(
        std::string path, core::TimePoint at);

    /// @brief Classify an audio frame; a detection becomes a scream intent event.
    [[nodiscard]] core::Expected<intent::ScreamResult> analyzeAudio(
        const intent::ScreamFrame &frame, core::TimePoint at);

    // ---- Truth Lock --------------------------------------------------------

    [[nodiscard]] core::Expected<vault::EvidenceItem> addEvidence(
        std::string type, std::string payload, core::TimePoint now);

    /// @brief Lock with the configured auto-release delay.
    [[nodiscard]] core::Expected<vault::LockRecord> lockIncident(std::string incidentId, core::TimePoint now);
    [[nodiscard]] core::Expected<vault::LockRecord> lockIncident(
        std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now);

    [[nodiscard]] core::ExpectedVoid cancelLock(core::TimePoint now);
    [[nodiscard]] core::Expected<vault::ReleaseOutcome> releaseEvidence(core::TimePoint now);

    // ---- Components --------------------------------------------------------

    [[nodiscard]] fusion::DangerMonitor&             danger() noexcept;
    [[nodiscard]] fusion::CoercionMonitor&           coercion() noexcept;
    [[nodiscard]] fusion::SituationalMonitor&        situational() noexcept;
    [[nodiscard]] intent::IntentCorrelator&          intent() noexcept;
    [[nodiscard]] biometric::VoiceprintEnrollment&   enrollment() noexcept;
    [[nodiscard]] alert::AlertDispatcher&            dispatcher() noexcept;

    /// @brief Snapshot of the current vault, empty before any evidence or lock.
    [[nodiscard]] std::optional<VaultSnapshot>       truthLock(core::TimePoint now) const;

    [[nodiscard]] SafetyStatus status(core::TimePoint now) const;

    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace spc::engine
