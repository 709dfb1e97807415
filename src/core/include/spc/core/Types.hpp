/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every SafePulse Core module.
 *
 * Provides fixed-width integer aliases and floating-point aliases so that
 * numeric widths are explicit at every module boundary.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_TYPES_HPP
    #define SPC_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace spc::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

using byte = std::byte;

} // namespace spc::core

#endif // SPC_CORE_TYPES_HPP
