#include "health-monitor/logger.h"
#include "health-monitor/clock.h"

#include <sstream>
#include <unistd.h>

namespace hmon {

Logger::Logger(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level), pid_(getpid()) {}

void Logger::set_level(LogLevel level) {
    min_level_.store(level);
}

LogLevel Logger::level() const {
    return min_level_.load();
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel Logger::level_from_string(std::string_view name) {
    if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "warn") {
        return LogLevel::Warn;
    } else if (name == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

// 2024-05-01T12:00:00.000Z [INFO] health-monitor[812]: message
void Logger::log(LogLevel level, std::string_view msg) {
    if (level < min_level_.load()) {
        return;
    }

    std::ostringstream line;
    line << format_iso8601(std::chrono::system_clock::now())
         << " [" << level_to_string(level) << "] health-monitor[" << pid_ << "]: "
         << msg << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
    out_.flush();
}

} // namespace hmon
