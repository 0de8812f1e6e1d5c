#include "logger.hpp"
#include <iostream>

namespace Wikipath {
namespace Core {

int        Logger::level_ = LogLevel::LOG_DEFAULT;
std::mutex Logger::mutex_;

namespace {

const char* RESET = "\033[0m";

const char* color_of(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "\033[90m";
        case LOG_INFO: return "\033[34m";
        case LOG_WARN: return "\033[33m";
        case LOG_ERROR: return "\033[31m";
        case LOG_SUCCESS: return "\033[32m";
        default: return RESET;
    }
}

const char* tag_of(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "[DEBUG] ";
        case LOG_INFO: return "[INFO] ";
        case LOG_WARN: return "[WARN] ";
        case LOG_ERROR: return "[ERROR] ";
        case LOG_SUCCESS: return "[SUCCESS] ";
        default: return "";
    }
}

}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) {
    return (Logger::level() & level) != 0;
}

void Logger::write(LogLevel level, std::ostream& out, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & level) {
        out << color_of(level) << tag_of(level) << RESET << message << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, std::cout, message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, std::cout, message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, std::cout, message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, std::cerr, message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, std::cerr, message);
}

}  // namespace Core
}  // namespace Wikipath
