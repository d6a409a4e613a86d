#include "relay_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
std::mutex g_write_mtx;

std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ','
        << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

} // namespace

void set_log_level(LogLevel level)
{
    g_level.store(static_cast<int>(level));
}

LogLevel log_level()
{
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level)
{
    return static_cast<int>(level) >= g_level.load();
}

LogLevel parse_log_level(const std::string& text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::debug;
    if (lower == "info")
        return LogLevel::info;
    if (lower == "warning" || lower == "warn")
        return LogLevel::warning;
    if (lower == "error")
        return LogLevel::error;
    throw std::invalid_argument("unknown log level '" + text + "'");
}

const char* log_level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warning:
        return "WARNING";
    case LogLevel::error:
        return "ERROR";
    }
    return "INFO";
}

void write_log_line(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(g_write_mtx);
    std::ostream& out = level >= LogLevel::warning ? std::cerr : std::cout;
    out << timestamp() << " - " << log_level_name(level) << " - " << message << std::endl;
}
