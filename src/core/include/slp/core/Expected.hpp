/**
 * @file Expected.hpp
 * @brief Result type used by every fallible decoder operation.
 *
 * Expected<T> is std::expected<T, Error>. Fatal stream conditions travel
 * up through SLP_TRY / SLP_TRY_VOID; recoverable ones are logged with
 * describe() and dropped at the record boundary.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_EXPECTED_HPP
    #define SLP_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <format>
    #include <string>

namespace slp::core {

template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief One-line rendering of an error for log output.
 *
 * Format: `<message> [<CodeName> at <file>:<line>]`.
 */
[[nodiscard]] inline std::string describe(const Error &error)
{
    const auto loc = error.location();
    return std::format("{} [{} at {}:{}]", error.message(), toString(error.code()),
                       loc.file_name(), loc.line());
}

} // namespace slp::core

/**
 * @brief Unwraps an Expected<U> or returns its error from the enclosing
 *        function.
 *
 * The enclosing function must itself return an Expected. Relies on the
 * GNU statement-expression extension (GCC and Clang).
 */
#define SLP_TRY(expr)                                                      \
    ({                                                                     \
        auto &&_slp_try = (expr);                                          \
        if (!_slp_try.has_value()) [[unlikely]]                            \
            return std::unexpected(std::move(_slp_try.error()));           \
        std::move(_slp_try.value());                                       \
    })

/// @brief SLP_TRY for Expected<void>; yields nothing.
#define SLP_TRY_VOID(expr)                                                 \
    do {                                                                   \
        auto &&_slp_try = (expr);                                          \
        if (!_slp_try.has_value()) [[unlikely]]                            \
            return std::unexpected(std::move(_slp_try.error()));           \
    } while (false)

#endif // SLP_CORE_EXPECTED_HPP
