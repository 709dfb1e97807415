/**
 * @file LockRecord.hpp
 * @brief Persisted Truth Lock metadata.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_VAULT_LOCK_RECORD_HPP
    #define SPC_VAULT_LOCK_RECORD_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Constants.hpp>
    #include <spc/core/Types.hpp>

    #include <string>
    #include <string_view>

namespace spc::vault {

/**
 * @brief The three mutually exclusive ways a lock ends.
 */
enum class ReleaseOutcome : core::u8 {
    kCancelled = 0,
    kManual,
    kDeadline,
};

[[nodiscard]] constexpr std::string_view releaseOutcomeName(ReleaseOutcome outcome) noexcept
{
    switch (outcome) {
        case ReleaseOutcome::kCancelled: return "cancelled";
        case ReleaseOutcome::kManual:    return "released_manually";
        case ReleaseOutcome::kDeadline:  return "released_by_deadline";
    }
    return "unknown";
}

/**
 * @brief Lock metadata handed to the persistence collaborator.
 */
struct LockRecord {
    std::string     lockId;
    std::string     incidentId;
    core::TimePoint lockedAt{};
    core::TimePoint unlockDeadline{};
    core::u32       autoReleaseHours = core::kDefaultAutoReleaseHours;
    std::string     evidenceHash;

    /// Instant at which cancelLock() stops being accepted.
    [[nodiscard]] core::TimePoint cancelWindowEnd() const { return lockedAt + core::kCancelWindow; }
};

/**
 * @brief Deterministic lock id: @c "lock-" followed by the FNV-1a digest of
 *        the incident id and the lock instant in epoch milliseconds.
 */
[[nodiscard]] std::string makeLockId(std::string_view incidentId, core::TimePoint lockedAt);

} // namespace spc::vault

#endif // SPC_VAULT_LOCK_RECORD_HPP
