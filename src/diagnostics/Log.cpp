#include "coffer/diagnostics/Log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace coffer::diagnostics
{
namespace
{

std::atomic<LogLevel> g_level{ LogLevel::Warning };
std::mutex g_sinkMutex;
LogSink g_sink;

void writeToStderr(std::string_view line)
{
    std::cerr << line << '\n';
}

// UTC, millisecond precision: 2026-01-31T12:34:56.789Z
[[nodiscard]] std::string utcTimestamp()
{
    const auto now{ std::chrono::system_clock::now() };
    const std::time_t seconds{ std::chrono::system_clock::to_time_t(now) };
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000 };

    std::tm utc{};
    ::gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

} // namespace

void setLogLevel(LogLevel level) noexcept
{
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() noexcept
{
    return g_level.load(std::memory_order_relaxed);
}

bool isEnabled(LogLevel level) noexcept
{
    const LogLevel threshold{ logLevel() };
    return level != LogLevel::Off && threshold != LogLevel::Off && level >= threshold;
}

void setLogSink(LogSink sink)
{
    const std::lock_guard<std::mutex> guard{ g_sinkMutex };
    g_sink = std::move(sink);
}

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
    if (name == "debug")
    {
        return LogLevel::Debug;
    }
    if (name == "info")
    {
        return LogLevel::Info;
    }
    if (name == "warning" || name == "warn")
    {
        return LogLevel::Warning;
    }
    if (name == "error")
    {
        return LogLevel::Error;
    }
    if (name == "off")
    {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void write(LogLevel level, std::string_view message)
{
    if (!isEnabled(level))
    {
        return;
    }

    std::string line{ "[" };
    line += utcTimestamp();
    line += "] [";
    line += toString(level);
    line += "] ";
    line += message;

    const std::lock_guard<std::mutex> guard{ g_sinkMutex };
    if (g_sink)
    {
        g_sink(level, line);
        return;
    }
    writeToStderr(line);
}

} // namespace coffer::diagnostics
