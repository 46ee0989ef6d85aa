#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace livenotes {
namespace utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

} // namespace

bool Logger::initialized_ = false;

void Logger::initialize(LogLevel level) {
    setLevel(level);
    if (!initialized_) {
        initialized_ = true;
        info("Logger initialized");
    }
}

void Logger::setLevel(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, "INFO", message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, "WARN", message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, "ERROR", message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, "DEBUG", message);
}

void Logger::write(LogLevel level, const char* tag, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) {
        return;
    }

    std::string line = timestamp() + " [" + tag + "] " + message;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (level == LogLevel::ERROR) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

} // namespace utils
} // namespace livenotes
