/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the core.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_CONCEPTS_HPP
    #define SPC_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace spc::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to feed byte-wise into a hash.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

/**
 * @brief A closed enumeration usable as a lookup-table index.
 */
template <typename E>
concept ScopedEnum = std::is_enum_v<E> && !std::is_convertible_v<E, std::underlying_type_t<E>>;

} // namespace spc::core

#endif // SPC_CORE_CONCEPTS_HPP
