/**
 * @file Assert.hpp
 * @brief Debug assertions with source location.
 *
 * Provides SPC_ASSERT (debug-only) for internal invariants that callers
 * cannot violate through the public API.  Caller-controlled input is
 * always reported through core::Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_ASSERT_HPP
    #define SPC_CORE_ASSERT_HPP

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace spc::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[SPC ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace spc::core::detail

    #ifdef SPC_DEBUG
        #define SPC_ASSERT(cond)                                          \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::spc::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define SPC_ASSERT(cond) ((void)0)
    #endif

#endif // SPC_CORE_ASSERT_HPP
