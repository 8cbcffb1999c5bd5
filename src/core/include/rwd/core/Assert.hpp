/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * RWD_ASSERT is evaluated in debug builds only (RWD_DEBUG) and is reserved
 * for programming errors inside the library. Recoverable conditions are
 * reported through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_ASSERT_HPP
    #define RWD_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rwd::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RWD ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rwd::core::detail

    #ifdef RWD_DEBUG
        #define RWD_ASSERT(cond)                                          \
            do {                                                           \
                if (RWD_UNLIKELY(!(cond)))                                 \
                    ::rwd::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define RWD_ASSERT(cond) ((void)0)
    #endif

#endif // RWD_CORE_ASSERT_HPP
