/**
 * @file Assert.hpp
 * @brief Contract checks for programming errors.
 *
 * HOP_ASSERT is compiled only in HOP_DEBUG builds; HOP_VERIFY always runs.
 * A failed check is logged at fatal level under the "contract" tag with
 * its source location, then the process aborts.
 *
 * Runtime failures (bad input, lost peers, I/O) are reported through
 * Expected, never through these macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_ASSERT_HPP
    #define HOP_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <source_location>

namespace hop::core::detail {

/**
 * @brief Logs the violated contract and aborts.
 * @param kind "assert" or "verify".
 * @param expr Stringified condition.
 */
[[noreturn]] void contractViolation(
    const char *kind,
    const char *expr,
    std::source_location where = std::source_location::current());

} // namespace hop::core::detail

    #ifdef HOP_DEBUG
        #define HOP_ASSERT(cond)                                          \
            do {                                                           \
                if (HOP_UNLIKELY(!(cond)))                                 \
                    ::hop::core::detail::contractViolation("assert", #cond); \
            } while (false)
    #else
        #define HOP_ASSERT(cond) ((void)0)
    #endif

    #define HOP_VERIFY(cond)                                              \
        do {                                                               \
            if (HOP_UNLIKELY(!(cond)))                                     \
                ::hop::core::detail::contractViolation("verify", #cond);   \
        } while (false)

    /// @brief Marks a branch no valid value can reach, such as the tail of
    ///        an exhaustive switch over an internal enum.
    #define HOP_UNREACHABLE() ::hop::core::detail::contractViolation("unreachable", "control reached this point")

#endif // HOP_CORE_ASSERT_HPP
