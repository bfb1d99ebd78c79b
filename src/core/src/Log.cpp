/**
 * @file Log.cpp
 * @brief Log state and the default stderr sink.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "slp/core/Log.hpp"

#include <cstdio>

namespace slp::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto name = toString(level);
        std::fprintf(stderr, "[slp][%-5.*s][%.*s] %.*s\n",
                     static_cast<int>(name.size()), name.data(),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

StderrLogger gStderrLogger;
ILogger     *gLogger   = &gStderrLogger;
LogLevel     gMinLevel = LogLevel::kInfo;

} // anonymous namespace

void Log::setLogger(ILogger *logger) { gLogger = logger ? logger : &gStderrLogger; }
ILogger *Log::logger() { return gLogger; }

void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel() { return gMinLevel; }
bool Log::enabled(LogLevel level) { return level >= gMinLevel; }

void Log::write(LogLevel level, std::string_view tag, std::string_view message)
{
    if (enabled(level))
        gLogger->write(level, tag, message);
}

} // namespace slp::core
