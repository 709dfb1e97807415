/**
 * @file ILockStore.hpp
 * @brief Persistence collaborator for Truth Lock metadata.
 * @author MasterLaplace
 */

#pragma once

#include <spc/core/Expected.hpp>
#include <spc/vault/LockRecord.hpp>

#include <optional>
#include <string_view>

namespace spc::vault {

/**
 * @brief Durable store of lock records.
 *
 * Failures are reported as @c kIoError or @c kResourceUnavailable; the
 * vault never retries.
 */
class ILockStore {
public:
    virtual ~ILockStore() = default;

    [[nodiscard]] virtual core::ExpectedVoid save(const LockRecord &record) = 0;

    [[nodiscard]] virtual core::ExpectedVoid markReleased(
        std::string_view lockId, core::TimePoint releasedAt, ReleaseOutcome outcome) = 0;

    /// @brief Most recent lock that was never released, if any.
    [[nodiscard]] virtual core::Expected<std::optional<LockRecord>> loadUnreleased() = 0;
};

} // namespace spc::vault
