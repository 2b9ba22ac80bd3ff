#ifndef VEILCHAT_UTIL_LOGGER_HPP
#define VEILCHAT_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Thread-safe process logger for VeilChat.
 *
 * Usage:
 *   - Logger::getInstance().info("[DeliveryManager] started");
 *   - logger::debug("[PeerDiscovery] datagram from 10.0.0.4");
 *   - logger::enableFileOutput("veilchat.log");
 *
 * Lines are tagged with the emitting component in brackets. Warnings and
 * errors go to stderr, everything else to stdout.
 */

namespace veilchat {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name (case-insensitive: debug, info, warn/warning, error, critical).
 * @throw std::runtime_error for unknown names.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::WARN;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    if (lower == "critical") {
        return LogLevel::CRITICAL;
    }
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    bool isEnabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= logLevel_;
    }

    /**
     * @brief Mirror log lines into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg)
    {
        log(LogLevel::DEBUG, msg);
    }

    void info(const std::string &msg)
    {
        log(LogLevel::INFO, msg);
    }

    void warn(const std::string &msg)
    {
        log(LogLevel::WARN, msg);
    }

    void error(const std::string &msg)
    {
        log(LogLevel::ERROR, msg);
    }

    void critical(const std::string &msg)
    {
        log(LogLevel::CRITICAL, msg);
    }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "."
             << std::setw(3) << std::setfill('0') << millis << "]["
             << levelName(level) << "] " << msg << "\n";

        std::ostream &console = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        console << line.str();
        console.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace veilchat

#endif // VEILCHAT_UTIL_LOGGER_HPP
