/**
 * @file Assert.hpp
 * @brief Debug-only invariant checks.
 *
 * RWN_ASSERT is compiled in when RWN_DEBUG is defined and guards internal
 * invariants of the rollback machinery (never external input, which is
 * reported through Expected). RWN_UNREACHABLE marks dead switch arms.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_ASSERT_HPP
    #define RWN_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rwn::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RWN ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rwn::core::detail

    #ifdef RWN_DEBUG
        #define RWN_ASSERT(cond)                                          \
            do {                                                           \
                if (RWN_UNLIKELY(!(cond)))                                 \
                    ::rwn::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define RWN_ASSERT(cond) ((void)0)
    #endif

    #define RWN_UNREACHABLE()                                             \
        do {                                                               \
            ::rwn::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // RWN_CORE_ASSERT_HPP
