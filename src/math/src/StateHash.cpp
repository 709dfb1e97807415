/**
 * @file StateHash.cpp
 * @brief FNV-1a hashing implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/math/StateHash.hpp"

#include <array>

namespace spc::math {

StateHash &StateHash::hashBytes(std::span<const core::byte> data)
{
    for (const core::byte b : data) {
        _hash ^= static_cast<core::u64>(b);
        _hash *= kPrime;
    }
    return *this;
}

StateHash &StateHash::hashString(std::string_view text)
{
    return hashBytes(std::as_bytes(std::span<const char>{text.data(), text.size()}));
}

core::u64 StateHash::of(std::string_view text)
{
    StateHash h;
    h.hashString(text);
    return h.digest();
}

std::string StateHash::toHex(core::u64 digest)
{
    static constexpr std::array<char, 16> kDigits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    std::string out(16, '0');
    for (core::usize i = 0; i < 16; ++i) {
        out[15 - i] = kDigits[digest & 0xFu];
        digest >>= 4;
    }
    return out;
}

} // namespace spc::math
