#ifndef PIIREDACTOR_UTIL_LOGGER_HPP
#define PIIREDACTOR_UTIL_LOGGER_HPP

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
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief Thread-safe logging for pii_redactor.
 *
 * Console output goes to stderr: the CLI writes its JSON results to stdout and the
 * two streams must never interleave.
 *
 * Entity values must never reach the logger. A text is referred to by its
 * hashing::fingerprint(), and work on behalf of one text can be tagged for the
 * current thread with a logger::Scope:
 *
 *   @code
 *   logger::Scope scope("job " + jobId.substr(0, 8));
 *   logger::info("stored");   // [2024-05-01 10:00:00][INFO][job 3fa2c1d0] stored
 *   @endcode
 */

namespace piiredactor {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

inline const char* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

/**
 * @brief Parse a level name (DEBUG, INFO, WARN/WARNING, ERROR, CRITICAL), case-insensitive.
 * @throw std::invalid_argument on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                           LogLevel::ERROR, LogLevel::CRITICAL}) {
        if (upper == levelName(level)) {
            return level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

namespace detail {

// Tag of the work the calling thread is doing; empty outside any Scope.
inline std::string& threadTag()
{
    thread_local std::string tag;
    return tag;
}

} // namespace detail

/**
 * @class Scope
 * @brief Tags every line logged by this thread until the scope ends. Scopes nest; the
 *        previous tag is restored on exit.
 */
class Scope
{
public:
    explicit Scope(const std::string &tag)
        : previous_(detail::threadTag())
    {
        detail::threadTag() = tag;
    }

    ~Scope() { detail::threadTag() = previous_; }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

private:
    std::string previous_;
};

/**
 * @class Logger
 * @brief Process-wide sink: a level filter, stderr, and an optional log file.
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
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    // Lets callers skip building a message nobody will see.
    bool enabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= logLevel_;
    }

    void setConsoleOutput(bool on)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = on;
    }

    /**
     * @brief Also write every line to a file.
     * @param append If false the file is truncated first.
     * @return false if the file could not be opened; console output is unaffected.
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stream = std::make_unique<std::ofstream>(
            filename, std::ios::out | (append ? std::ios::app : std::ios::trunc));
        if (!stream->is_open()) {
            return false;
        }
        fileStream_ = std::move(stream);
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fileStream_.reset();
    }

    void write(LogLevel level, const std::string &msg)
    {
        const std::string &tag = detail::threadTag();

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream line;
        line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "][" << levelName(level) << ']';
        if (!tag.empty()) {
            line << '[' << tag << ']';
        }
        line << ' ' << msg << '\n';

        if (consoleEnabled_) {
            std::cerr << line.str() << std::flush;
        }
        if (fileStream_) {
            *fileStream_ << line.str() << std::flush;
        }
    }

private:
    Logger() : logLevel_(LogLevel::INFO), consoleEnabled_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Shortcuts
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }

inline bool enabled(LogLevel level) { return Logger::getInstance().enabled(level); }

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg)    { Logger::getInstance().write(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg)     { Logger::getInstance().write(LogLevel::INFO, msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().write(LogLevel::WARN, msg); }
inline void error(const std::string &msg)    { Logger::getInstance().write(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().write(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_LOGGER_HPP
