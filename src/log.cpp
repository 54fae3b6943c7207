#include "log.hpp"
#include "util.hpp"

#include <iostream>

namespace qwstream {

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return fallback;
}

void StderrLogger::log(LogLevel level, const std::string& tag, const std::string& message) {
    if (level < min_level_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::Warn) std::cerr << "Warning: ";
    else if (level == LogLevel::Error) std::cerr << "Error: ";
    std::cerr << message << '\n';
}

} // namespace qwstream
