/**
 * @file Error.hpp
 * @brief Error codes and the Error value carried by Expected.
 *
 * Record-level codes (BufferUnderflow, OutOfRange, CorruptedData) describe
 * one malformed record; the dispatcher logs them and skips the record.
 * Stream-level codes (UnknownCommand, VersionTooLow, IoError, InvalidState)
 * end decoding of the current stream and reach the caller.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_ERROR_HPP
    #define SLP_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace slp::core {

enum class ErrorCode : u8 {
    BufferUnderflow,  ///< Read past the end of a record slice.
    OutOfRange,       ///< A field value outside its domain (port index).
    CorruptedData,    ///< Malformed descriptor or table input.
    UnknownCommand,   ///< Command byte with no declared length.
    VersionTooLow,    ///< Stream older than the minimum, not opted in.
    IoError,          ///< Byte source or file failure.
    InvalidState      ///< Operation on a closed or unconfigured object.
};

[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::BufferUnderflow: return "BufferUnderflow";
    case ErrorCode::OutOfRange:      return "OutOfRange";
    case ErrorCode::CorruptedData:   return "CorruptedData";
    case ErrorCode::UnknownCommand:  return "UnknownCommand";
    case ErrorCode::VersionTooLow:   return "VersionTooLow";
    case ErrorCode::IoError:         return "IoError";
    case ErrorCode::InvalidState:    return "InvalidState";
    }
    return "Unknown";
}

/**
 * @brief Code, message and the location that raised it.
 */
class Error final {
public:
    explicit Error(ErrorCode code, std::string message,
                   std::source_location loc = std::source_location::current())
        : _code(code), _message(std::move(message)), _location(loc)
    {}

    [[nodiscard]] ErrorCode            code() const { return _code; }
    [[nodiscard]] const std::string   &message() const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Builds the std::unexpected returned from a failing operation.
[[nodiscard]] inline std::unexpected<Error> makeError(
    ErrorCode code, std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace slp::core

#endif // SLP_CORE_ERROR_HPP
