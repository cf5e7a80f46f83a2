#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for piiguard.
 *
 * Log lines go to stderr, because stdout is reserved for anonymized output
 * of the command line tool. A log file can be added on top.
 *
 * Usage:
 *   - logger::info("Anonymizer: masked 3 spans");
 *   - logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
 *   - logger::enableFileOutput("piiguard.log");
 *
 * Never pass original document text to the logger.
 */

namespace piiguard {
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
 * @brief Parse a level name ("debug", "INFO", ...) as found in config files.
 * @throw std::invalid_argument if the name is not a known level.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "?";
}

/**
 * @class Logger
 * @brief Process-wide sink. Lines look like
 *        [2024-05-01T09:30:12.045Z][WARN] message
 *        with UTC timestamps, so they line up with audit log timestamps.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

    bool isEnabled(LogLevel level) const
    {
        return level >= getLogLevel();
    }

    /**
     * @brief Mirror every line into a file as well.
     * @return false if the file could not be opened (stderr logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        auto stream = std::make_unique<std::ofstream>(
            filename, std::ios::out | (append ? std::ios::app : std::ios::trunc));
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream->is_open()) {
            std::cerr << "[Logger] cannot open log file " << filename << ", logging to stderr only\n";
            return false;
        }
        file_ = std::move(stream);
        return true;
    }

    void write(LogLevel level, const std::string &msg)
    {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
#ifdef _WIN32
        gmtime_s(&tm_buf, &seconds);
#else
        gmtime_r(&seconds, &tm_buf);
#endif
        std::ostringstream line;
        line << '[' << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << millis << "Z]["
             << levelName(level) << "] " << msg << '\n';
        const std::string text = line.str();

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        std::cerr << text << std::flush;
        if (file_) {
            *file_ << text << std::flush;
        }
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel threshold_ = LogLevel::INFO;
    std::unique_ptr<std::ofstream> file_;
};

inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void debug(const std::string &msg)    { Logger::getInstance().write(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg)     { Logger::getInstance().write(LogLevel::INFO, msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().write(LogLevel::WARN, msg); }
inline void error(const std::string &msg)    { Logger::getInstance().write(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().write(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP
