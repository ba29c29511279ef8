#ifndef INCLUDE_COFFER_DIAGNOSTICS_LOG_HPP
#define INCLUDE_COFFER_DIAGNOSTICS_LOG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string_view>

namespace coffer::diagnostics
{

// Never pass passphrases, keys, nonces or entry fields to these functions.

enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

// Receives one fully formatted line without the trailing newline.
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

void setLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel logLevel() noexcept;
[[nodiscard]] bool isEnabled(LogLevel level) noexcept;

// An empty sink restores the default, which writes to std::cerr.
void setLogSink(LogSink sink);

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

// Adds the timestamp and level tag, then hands the line to the sink.
void write(LogLevel level, std::string_view message);

template <typename... Args> void log(LogLevel level, const Args&... args)
{
    if (!isEnabled(level))
    {
        return;
    }
    std::ostringstream message;
    (message << ... << args);
    write(level, message.view());
}

template <typename... Args> void debug(const Args&... args)
{
    log(LogLevel::Debug, args...);
}

template <typename... Args> void info(const Args&... args)
{
    log(LogLevel::Info, args...);
}

template <typename... Args> void warning(const Args&... args)
{
    log(LogLevel::Warning, args...);
}

template <typename... Args> void error(const Args&... args)
{
    log(LogLevel::Error, args...);
}

} // namespace coffer::diagnostics

#endif // INCLUDE_COFFER_DIAGNOSTICS_LOG_HPP
