#ifndef RELAY_LOG_H
#define RELAY_LOG_H

#include <sstream>
#include <string>

enum class LogLevel { debug, info, warning, error };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Accepts debug/info/warning/warn/error, any case. Throws std::invalid_argument.
LogLevel parse_log_level(const std::string& text);
const char* log_level_name(LogLevel level);

// "2026-10-19 18:45:00,123 - INFO - message", INFO/DEBUG to stdout, the rest to stderr
void write_log_line(LogLevel level, const std::string& message);

// Collects one line with operator<< and writes it on destruction
class LogLine {
public:
    explicit LogLine(LogLevel level) : level_(level) {}
    ~LogLine() { write_log_line(level_, out_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <class T>
    LogLine& operator<<(const T& value)
    {
        out_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream out_;
};

#define RELAY_LOG(level) \
    if (!log_enabled(LogLevel::level)) {} else LogLine(LogLevel::level)

#define RELAY_LOG_DEBUG RELAY_LOG(debug)
#define RELAY_LOG_INFO RELAY_LOG(info)
#define RELAY_LOG_WARNING RELAY_LOG(warning)
#define RELAY_LOG_ERROR RELAY_LOG(error)

#endif // RELAY_LOG_H
