/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * ASTRO_ASSERT is evaluated only when ASTRO_DEBUG is defined and guards
 * internal bookkeeping invariants.  It logs the failing expression with
 * file, line and function before aborting.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_CORE_ASSERT_HPP
    #define ASTRO_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace astro::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[ASTRO ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace astro::core::detail

    #ifdef ASTRO_DEBUG
        #define ASTRO_ASSERT(cond)                                        \
            do {                                                           \
                if (ASTRO_UNLIKELY(!(cond)))                               \
                    ::astro::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define ASTRO_ASSERT(cond) ((void)0)
    #endif

#endif // ASTRO_CORE_ASSERT_HPP
