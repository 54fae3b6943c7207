#pragma once
#include <mutex>
#include <string>

namespace qwstream {

enum class LogLevel { Debug, Info, Warn, Error };

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "warn";
}

// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
// Unknown names yield `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Warn);

// Injected diagnostics sink. Components log through a reference to this
// instead of writing to the console themselves.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(LogLevel level, const std::string& tag, const std::string& message) = 0;

    void debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
    void info(const std::string& tag, const std::string& message) { log(LogLevel::Info, tag, message); }
    void warn(const std::string& tag, const std::string& message) { log(LogLevel::Warn, tag, message); }
    void error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }
};

// Writes "[tag] message" lines to std::cerr, dropping anything below min_level.
class StderrLogger : public Logger {
public:
    explicit StderrLogger(LogLevel min_level = LogLevel::Warn) : min_level_(min_level) {}

    void log(LogLevel level, const std::string& tag, const std::string& message) override;

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

private:
    LogLevel min_level_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
};

} // namespace qwstream
