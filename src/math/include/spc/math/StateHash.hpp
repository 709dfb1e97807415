/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash for evidence integrity digests.
 *
 * Every evidence item appended to a Truth Lock is sealed with the digest
 * of its own payload, and the lock itself is sealed with the digest of
 * the evidence snapshot at lock time.  FNV-1a is deterministic across
 * processes and platforms, so the same payload always yields the same
 * digest.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_MATH_STATE_HASH_HPP
    #define SPC_MATH_STATE_HASH_HPP

    #include <spc/core/Types.hpp>
    #include <spc/core/Concepts.hpp>

    #include <span>
    #include <string>
    #include <string_view>

namespace spc::math {

/**
 * @brief Incremental 64-bit FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data);

    /**
     * @brief Feed the characters of a string into the hash.
     * @param text Characters to hash (no terminator).
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashString(std::string_view text);

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <core::Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const core::byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /**
     * @brief Finalise and return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() { _hash = kOffsetBasis; }

    /**
     * @brief One-shot digest of a string.
     */
    [[nodiscard]] static core::u64 of(std::string_view text);

    /**
     * @brief Render a digest as 16 lowercase hexadecimal characters.
     */
    [[nodiscard]] static std::string toHex(core::u64 digest);

private:
    core::u64 _hash = kOffsetBasis;
};

} // namespace spc::math

#endif // SPC_MATH_STATE_HASH_HPP
