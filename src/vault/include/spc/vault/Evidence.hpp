/**
 * @file Evidence.hpp
 * @brief Evidence items appended to a Truth Lock.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_VAULT_EVIDENCE_HPP
    #define SPC_VAULT_EVIDENCE_HPP

    #include <spc/core/Clock.hpp>

    #include <span>
    #include <string>
    #include <string_view>

namespace spc::vault {

/**
 * @brief One piece of evidence (recording reference, location fix, note).
 *
 * @c integrityHash depends only on @c payload: the same payload always
 * hashes to the same 16 hex characters.
 */
struct EvidenceItem {
    std::string     type;
    std::string     payload;
    core::TimePoint timestamp{};
    std::string     integrityHash;
};

/**
 * @brief FNV-1a digest of @p payload, rendered as 16 lowercase hex chars.
 */
[[nodiscard]] std::string evidenceHash(std::string_view payload);

/**
 * @brief Digest of an evidence snapshot, in append order.
 *
 * Each item contributes its type and its own integrity hash.
 */
[[nodiscard]] std::string snapshotHash(std::span<const EvidenceItem> items);

} // namespace spc::vault

#endif // SPC_VAULT_EVIDENCE_HPP
