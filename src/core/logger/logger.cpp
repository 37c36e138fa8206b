#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SeoAudit {
namespace Core {

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";
const std::string GREY   = "\033[90m";

const std::string& level_color(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return GREY;
        case LOG_WARN: return YELLOW;
        case LOG_ERROR: return RED;
        case LOG_SUCCESS: return GREEN;
        default: return BLUE;
    }
}

std::string timestamp() {
    auto        now  = std::chrono::system_clock::now();
    std::time_t t    = std::chrono::system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
}  // namespace

const char* level_name(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARN: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_SUCCESS: return "SUCCESS";
        default: return "LOG";
    }
}

ConsoleLogger::ConsoleLogger(int level) : level_(level) {
}

ConsoleLogger::ConsoleLogger(int level, const std::string& log_file) : level_(level) {
    if (log_file.empty())
        return;

    file_.open(log_file, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << YELLOW << "[WARN] " << RESET << "Cannot open log file: " << log_file
                  << std::endl;
    }
}

void ConsoleLogger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int ConsoleLogger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool ConsoleLogger::has_log_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    std::ostream& out = (level == LOG_WARN || level == LOG_ERROR) ? std::cerr : std::cout;
    out << level_color(level) << "[" << level_name(level) << "] " << RESET << message << std::endl;

    if (file_.is_open()) {
        file_ << timestamp() << " - " << level_name(level) << " - " << message << '\n';
        file_.flush();
    }
}

}  // namespace Core
}  // namespace SeoAudit
