/**
 * @file Assert.hpp
 * @brief Internal consistency checks of the sort engine.
 *
 * RDX_ASSERT guards index arithmetic (bucket heads, digit indices) and is
 * compiled only with RDX_DEBUG.  RDX_UNREACHABLE marks the exhaustive ends
 * of enum switches.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_ASSERT_HPP
    #define RDX_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rdx::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[rdx] %s:%u (%s): check `%s` failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rdx::core::detail

    #ifdef RDX_DEBUG
        #define RDX_ASSERT(cond)                                          \
            do {                                                           \
                if (RDX_UNLIKELY(!(cond)))                                 \
                    ::rdx::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define RDX_ASSERT(cond) ((void)0)
    #endif

    #define RDX_UNREACHABLE()                                             \
        do {                                                               \
            ::rdx::core::detail::assertFail("unreachable");                \
        } while (false)

#endif // RDX_CORE_ASSERT_HPP
