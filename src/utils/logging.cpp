#include "agentbridge/utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace agentbridge {
namespace utils {

namespace {
    std::atomic<int> currentLevel{static_cast<int>(LogLevel::WARN)};
    std::mutex writeMutex;
}

void setLogLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(currentLevel.load());
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::OFF: return "OFF";
    }
    return "UNKNOWN";
}

bool shouldLog(LogLevel level) {
    return level != LogLevel::OFF && static_cast<int>(level) >= currentLevel.load();
}

void writeLog(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(writeMutex);
    std::cerr << "[" << logLevelName(level) << "] " << message << std::endl;
}

} // namespace utils
} // namespace agentbridge
