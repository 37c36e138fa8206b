#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace SeoAudit {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_DEBUG   = 1 << 0,
    LOG_INFO    = 1 << 1,
    LOG_WARN    = 1 << 2,
    LOG_ERROR   = 1 << 3,
    LOG_SUCCESS = 1 << 4,
    LOG_ALL     = LOG_DEBUG | LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS,
    LOG_DEFAULT = LOG_ALL & ~LOG_DEBUG
};

// Sink handed to every component that reports progress or failures.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { log(LOG_DEBUG, message); }
    void info(const std::string& message) { log(LOG_INFO, message); }
    void success(const std::string& message) { log(LOG_SUCCESS, message); }
    void warn(const std::string& message) { log(LOG_WARN, message); }
    void error(const std::string& message) { log(LOG_ERROR, message); }
};

class NullLogger : public Logger {
public:
    void log(LogLevel /*level*/, const std::string& /*message*/) override {}
};

// Coloured console output, optionally mirrored to a plain-text log file.
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(int level = LOG_DEFAULT);
    ConsoleLogger(int level, const std::string& log_file);

    ConsoleLogger(const ConsoleLogger&)            = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

    void set_level(int level);
    int  level() const;
    bool has_log_file() const;

    void log(LogLevel level, const std::string& message) override;

private:
    int           level_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

const char* level_name(LogLevel level);

}  // namespace Core
}  // namespace SeoAudit
