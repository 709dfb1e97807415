/**
 * @file Evidence.cpp
 * @brief Evidence and lock id hashing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/vault/Evidence.hpp"
#include "spc/vault/LockRecord.hpp"

#include <spc/math/StateHash.hpp>

namespace spc::vault {

std::string evidenceHash(std::string_view payload)
{
    return math::StateHash::toHex(math::StateHash::of(payload));
}

std::string snapshotHash(std::span<const EvidenceItem> items)
{
    math::StateHash hash;
    for (const auto &item : items) {
        hash.hashString(item.type);
        hash.hashString(item.integrityHash);
    }
    return math::StateHash::toHex(hash.digest());
}

std::string makeLockId(std::string_view incidentId, core::TimePoint lockedAt)
{
    math::StateHash hash;
    hash.hashString(incidentId).combine(core::toEpochMillis(lockedAt));
    return "lock-" + math::StateHash::toHex(hash.digest());
}

} // namespace spc::vault
