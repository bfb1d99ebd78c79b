/**
 * @file Log.hpp
 * @brief Tagged logging façade with runtime severity filtering.
 *
 * Every message carries a subsystem tag ("PROTO", "SESSION", "TABLES",
 * "TRANSPORT"). Messages take a std::format string; arguments are only
 * formatted when the level passes the current threshold, so per-record
 * debug logs cost a comparison when filtered out.
 *
 * The sink is an ILogger. The default one writes to stderr; tests
 * install their own through ScopedLogger.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_LOG_HPP
    #define SLP_CORE_LOG_HPP

    #include "Types.hpp"

    #include <format>
    #include <string_view>
    #include <utility>

namespace slp::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

[[nodiscard]] constexpr std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kFatal: return "FATAL";
    }
    return "?";
}

/**
 * @brief Destination for formatted log entries.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Process-wide logging entry points.
 *
 * Not synchronised; a decoder and its logger live on one thread.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    [[nodiscard]] static ILogger *logger();

    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    /// @brief Writes a pre-formatted message, subject to filtering.
    static void write(LogLevel level, std::string_view tag, std::string_view message);

    template <typename... Args>
    static void debug(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        emit(LogLevel::kDebug, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        emit(LogLevel::kInfo, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        emit(LogLevel::kWarn, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        emit(LogLevel::kError, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
    {
        emit(LogLevel::kFatal, tag, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    static void emit(LogLevel level, std::string_view tag, std::format_string<Args...> fmt,
                     Args &&...args)
    {
        if (!enabled(level))
            return;
        write(level, tag, std::format(fmt, std::forward<Args>(args)...));
    }
};

/**
 * @brief Installs a logger and threshold for the lifetime of the object,
 *        then restores the previous ones.
 */
class ScopedLogger final {
public:
    explicit ScopedLogger(ILogger &logger, LogLevel minLevel = LogLevel::kDebug)
        : _previousLogger(Log::logger()), _previousLevel(Log::minLevel())
    {
        Log::setLogger(&logger);
        Log::setMinLevel(minLevel);
    }

    ~ScopedLogger()
    {
        Log::setLogger(_previousLogger);
        Log::setMinLevel(_previousLevel);
    }

    ScopedLogger(const ScopedLogger &)            = delete;
    ScopedLogger &operator=(const ScopedLogger &) = delete;

private:
    ILogger *_previousLogger;
    LogLevel _previousLevel;
};

} // namespace slp::core

#endif // SLP_CORE_LOG_HPP
