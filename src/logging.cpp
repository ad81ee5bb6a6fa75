///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>


///////////////////////////
///        STATE        ///
///////////////////////////
static std::atomic<int> gThreshold{static_cast<int>(LogLevel::INFO)};

/// Serializes writes so lines from different threads stay whole.
static std::mutex gWriteMutex;


///////////////////////////
///       LOGGING       ///
///////////////////////////
void setLogLevel(LogLevel level) {
    gThreshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(gThreshold.load(std::memory_order_relaxed));
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::OFF &&
           static_cast<int>(level) >= gThreshold.load(std::memory_order_relaxed);
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    if (lower == "trace") { out = LogLevel::TRACE; return true; }
    if (lower == "debug") { out = LogLevel::DEBUG; return true; }
    if (lower == "info")  { out = LogLevel::INFO;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARN; return true; }
    if (lower == "error") { out = LogLevel::ERROR; return true; }
    if (lower == "off")   { out = LogLevel::OFF;   return true; }
    return false;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

LogLine::LogLine(LogLevel level, const char* component)
        : level_(level),
          component_(component),
          enabled_(logEnabled(level)) {}

/**
 * @brief Flush the buffered line with a millisecond timestamp and level tag.
 */
LogLine::~LogLine() {
    if (!enabled_) return;

    auto now = std::chrono::system_clock::now().time_since_epoch();
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

    std::lock_guard<std::mutex> lock(gWriteMutex);
    std::cerr << "[" << ms / 1000 << "." << std::setw(3) << std::setfill('0') << ms % 1000
              << std::setfill(' ') << "] "
              << std::left << std::setw(5) << toString(level_) << std::right
              << " " << component_ << ": " << buffer_.str() << "\n";
}
