#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace phasecloud {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name (trace, debug, info, warning, error, critical).
 * Throws ConfigException for anything else.
 */
LogLevel parseLogLevel(const std::string& name);

std::string logLevelToString(LogLevel level);

/**
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Append log lines to filename, creating its directory if needed
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Get current log file path, empty when not logging to a file
     */
    std::string getCurrentLogFile() const;

    /**
     * Flush all pending log messages
     */
    void flush();

    /**
     * Log message
     */
    void log(LogLevel level, const std::string& message,
             const std::string& component = "");

    // Convenience methods
    void trace(const std::string& msg, const std::string& component = "") {
        log(LogLevel::TRACE, msg, component);
    }

    void debug(const std::string& msg, const std::string& component = "") {
        log(LogLevel::DEBUG, msg, component);
    }

    void info(const std::string& msg, const std::string& component = "") {
        log(LogLevel::INFO, msg, component);
    }

    void warning(const std::string& msg, const std::string& component = "") {
        log(LogLevel::WARNING, msg, component);
    }

    void error(const std::string& msg, const std::string& component = "") {
        log(LogLevel::ERROR, msg, component);
    }

    void critical(const std::string& msg, const std::string& component = "") {
        log(LogLevel::CRITICAL, msg, component);
    }

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& component) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str(), component_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define PHASECLOUD_LOG_TRACE(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::TRACE, component)

#define PHASECLOUD_LOG_DEBUG(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::DEBUG, component)

#define PHASECLOUD_LOG_INFO(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::INFO, component)

#define PHASECLOUD_LOG_WARNING(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::WARNING, component)

#define PHASECLOUD_LOG_ERROR(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::ERROR, component)

#define PHASECLOUD_LOG_CRITICAL(component) \
    phasecloud::core::LogStream(phasecloud::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace phasecloud
