/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * SPC_TRY / SPC_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_EXPECTED_HPP
    #define SPC_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace spc::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace spc::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type spc::core::Expected<U>.
 */
#define SPC_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_spc_result = (expr);                                       \
        if (!_spc_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_spc_result.error()));         \
        std::move(_spc_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type spc::core::ExpectedVoid.
 */
#define SPC_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_spc_result = (expr);                                       \
        if (!_spc_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_spc_result.error()));         \
    } while (false)

#endif // SPC_CORE_EXPECTED_HPP
