/**
 * @file TruthLock.hpp
 * @brief Time-locked evidence vault.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_VAULT_TRUTH_LOCK_HPP
    #define SPC_VAULT_TRUTH_LOCK_HPP

    #include <spc/alert/Alert.hpp>
    #include <spc/core/Clock.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/NonCopyable.hpp>
    #include <spc/vault/Evidence.hpp>
    #include <spc/vault/ILockStore.hpp>
    #include <spc/vault/LockRecord.hpp>

    #include <functional>
    #include <mutex>
    #include <optional>
    #include <string>
    #include <vector>

namespace spc::vault {

/**
 * @brief Observable lifecycle of a lock.
 *
 * @c kCancellable and @c kSealed are both "locked"; they differ only in
 * whether the cancellation window is still open.
 */
enum class LockState : core::u8 {
    kUnlocked = 0,
    kCancellable,
    kSealed,
    kCancelled,
    kReleasedManually,
    kReleasedByDeadline,
};

[[nodiscard]] constexpr std::string_view lockStateName(LockState state) noexcept
{
    switch (state) {
        case LockState::kUnlocked:           return "unlocked";
        case LockState::kCancellable:        return "cancellable";
        case LockState::kSealed:             return "sealed";
        case LockState::kCancelled:          return "cancelled";
        case LockState::kReleasedManually:   return "released_manually";
        case LockState::kReleasedByDeadline: return "released_by_deadline";
    }
    return "unknown";
}

/**
 * @brief Append-only evidence ledger with one irrevocable release deadline.
 *
 * A lock is single-use: once it reached a terminal outcome, every
 * mutating call fails with @c kAlreadyTerminal.  Deadline semantics are
 * "deadline exceeded", not "timer fired": every call that takes @c now
 * first releases the lock if the deadline has passed, so a late poll
 * still honours it.
 *
 * The release callback runs after the internal mutex is released and
 * fires exactly once, for manual and deadline releases only.
 */
class TruthLock final : public core::NonCopyable<TruthLock> {
public:
    using ReleaseCallback = std::function<void(const alert::Alert &alert)>;

    TruthLock(const core::IClock &clock, ILockStore &store);

    // ---- Evidence ----------------------------------------------------------

    /**
     * @brief Append an item; allowed until the lock reaches a terminal state.
     * @return The stored item, @c kInvalidArgument for an empty type,
     *         @c kAlreadyTerminal once released.
     */
    [[nodiscard]] core::Expected<EvidenceItem> addEvidence(std::string type, std::string payload);
    [[nodiscard]] core::Expected<EvidenceItem> addEvidence(
        std::string type, std::string payload, core::TimePoint now);

    // ---- Lifecycle ---------------------------------------------------------

    /**
     * @brief Seal the current evidence and schedule release.
     * @return The persisted record.  @c kAlreadyLocked while locked,
     *         @c kAlreadyTerminal after release (including a deadline this
     *         call honoured), @c kInvalidArgument for an
     *         empty incident id or zero hours, or the store's error (the
     *         lock is then not taken).
     */
    [[nodiscard]] core::Expected<LockRecord> lockIncident(
        std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now);
    [[nodiscard]] core::Expected<LockRecord> lockIncident(
        std::string incidentId, core::u32 autoReleaseHours = core::kDefaultAutoReleaseHours);

    /**
     * @brief Call the lock off inside the cancellation window.
     * @return @c kNotLocked, @c kAlreadyTerminal (including when the deadline
     *         has just been honoured), or @c kWindowExpired once
     *         @c now - lockedAt reaches ten minutes.
     */
    [[nodiscard]] core::ExpectedVoid cancelLock(core::TimePoint now);
    [[nodiscard]] core::ExpectedVoid cancelLock();

    /**
     * @brief Release early.  Past the deadline this is the deadline release.
     * @return The outcome that won, @c kNotLocked or @c kAlreadyTerminal.
     */
    [[nodiscard]] core::Expected<ReleaseOutcome> releaseEvidence(core::TimePoint now);
    [[nodiscard]] core::Expected<ReleaseOutcome> releaseEvidence();

    /**
     * @brief Recurring deadline check.
     * @return @c true when this call performed the deadline release.
     */
    [[nodiscard]] core::Expected<bool> tick(core::TimePoint now);

    /**
     * @brief Reload the unreleased lock from the store and honour its
     *        deadline retroactively.
     * @return @c true when a lock was restored.
     */
    [[nodiscard]] core::Expected<bool> restore(core::TimePoint now);

    void onRelease(ReleaseCallback callback);

    // ---- Derived views -----------------------------------------------------

    /// @brief A lock whose deadline has passed reads as released by deadline,
    ///        even before a mutating call records the release.
    [[nodiscard]] LockState state(core::TimePoint now) const;
    [[nodiscard]] bool isLocked() const;
    [[nodiscard]] bool isTerminal() const;
    [[nodiscard]] std::optional<ReleaseOutcome> outcome() const;
    [[nodiscard]] std::optional<LockRecord> record() const;
    [[nodiscard]] std::vector<EvidenceItem> evidence() const;

    [[nodiscard]] bool canCancel(core::TimePoint now) const;

    /// @brief Time left until the deadline, zero when not locked or overdue.
    [[nodiscard]] core::Duration countdown(core::TimePoint now) const;

    /// @brief Countdown as @c "Hh Mm Ss".
    [[nodiscard]] std::string formatCountdown(core::TimePoint now) const;

private:
    struct Pending {
        std::optional<alert::Alert> alert;
        ReleaseCallback             callback;
    };

    [[nodiscard]] core::Expected<EvidenceItem> addEvidenceLocked(
        std::string type, std::string payload, core::TimePoint now, Pending &pending);
    [[nodiscard]] core::Expected<LockRecord> lockIncidentLocked(
        std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now, Pending &pending);
    [[nodiscard]] core::ExpectedVoid cancelLocked(core::TimePoint now, Pending &pending);
    [[nodiscard]] core::Expected<ReleaseOutcome> releaseEvidenceLocked(core::TimePoint now, Pending &pending);
    [[nodiscard]] core::Expected<bool> restoreLocked(core::TimePoint now, Pending &pending);
    [[nodiscard]] core::ExpectedVoid releaseLocked(ReleaseOutcome outcome, core::TimePoint now, Pending &pending);
    [[nodiscard]] core::Expected<bool> honourDeadlineLocked(core::TimePoint now, Pending &pending);
    [[nodiscard]] core::ExpectedVoid guardLockedLocked() const;
    [[nodiscard]] alert::Alert makeReleaseAlert(ReleaseOutcome outcome, core::TimePoint now) const;
    static void dispatch(Pending &pending);

    const core::IClock           &_clock;
    ILockStore                   &_store;
    mutable std::mutex            _mutex;
    std::vector<EvidenceItem>     _evidence;
    std::optional<LockRecord>     _record;
    std::optional<ReleaseOutcome> _outcome;
    ReleaseCallback               _onRelease;
};

} // namespace spc::vault

#endif // SPC_VAULT_TRUTH_LOCK_HPP
