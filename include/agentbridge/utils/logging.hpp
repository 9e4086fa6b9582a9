#ifndef AGENTBRIDGE_UTILS_LOGGING_HPP
#define AGENTBRIDGE_UTILS_LOGGING_HPP

#include <sstream>
#include <string>

namespace agentbridge {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    CRITICAL = 4,
    OFF = 5
};

/**
 * @brief Set the process-wide logging threshold.
 *
 * Messages below the threshold are discarded before formatting.
 */
void setLogLevel(LogLevel level);
LogLevel logLevel();

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical", "off").
 * @throws std::invalid_argument on an unknown name
 */
LogLevel parseLogLevel(const std::string& name);
const char* logLevelName(LogLevel level);

bool shouldLog(LogLevel level);

// Writes one line to std::cerr. Serialized across threads.
void writeLog(LogLevel level, const std::string& message);

} // namespace utils
} // namespace agentbridge

#define XLOG(level, message) \
    do { \
        if (::agentbridge::utils::shouldLog(level)) { \
            std::ostringstream xlog_stream_; \
            xlog_stream_ << message; \
            ::agentbridge::utils::writeLog(level, xlog_stream_.str()); \
        } \
    } while (false)

#define XLOG_DEBUG(message)    XLOG(::agentbridge::utils::LogLevel::DEBUG, message)
#define XLOG_INFO(message)     XLOG(::agentbridge::utils::LogLevel::INFO, message)
#define XLOG_WARN(message)     XLOG(::agentbridge::utils::LogLevel::WARN, message)
#define XLOG_ERROR(message)    XLOG(::agentbridge::utils::LogLevel::ERROR, message)
#define XLOG_CRITICAL(message) XLOG(::agentbridge::utils::LogLevel::CRITICAL, message)

#endif // AGENTBRIDGE_UTILS_LOGGING_HPP
