/**
 * @file Assert.hpp
 * @brief Debug-only internal invariant checks.
 *
 * SLP_ASSERT guards conditions the decoder itself guarantees (a validated
 * port index, a read width checked by the caller). A failure is reported
 * through Log::fatal under the "ASSERT" tag and aborts. Release builds
 * compile the check away. Anything a malformed stream can trigger is an
 * Expected error instead.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_ASSERT_HPP
    #define SLP_CORE_ASSERT_HPP

    #include "Log.hpp"

    #include <cstdlib>
    #include <source_location>

namespace slp::core::detail {

[[noreturn]] inline void assertFail(const char *expr,
                                    std::source_location loc = std::source_location::current())
{
    Log::fatal("ASSERT", "{}:{} in {}: \"{}\" failed", loc.file_name(), loc.line(),
               loc.function_name(), expr);
    std::abort();
}

} // namespace slp::core::detail

    #if !defined(NDEBUG) && !defined(SLP_DEBUG)
        #define SLP_DEBUG 1
    #endif

    #ifdef SLP_DEBUG
        #define SLP_ASSERT(cond)                                           \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::slp::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define SLP_ASSERT(cond) ((void)0)
    #endif

#endif // SLP_CORE_ASSERT_HPP
