#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <sstream>
#include <string>


///////////////////////////
///       LOGGING       ///
///////////////////////////
/**
 * @brief Severity of a log line, in increasing order.
 */
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, OFF };

/// Set the process-wide threshold; lines below it are dropped.
void setLogLevel(LogLevel level);

/// Current process-wide threshold.
LogLevel logLevel();

/// Whether a line at the given level would be written.
bool logEnabled(LogLevel level);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off").
 *
 * Case-insensitive. Leaves @p out untouched and returns false on unknown names.
 */
bool parseLogLevel(const std::string& name, LogLevel& out);

/// Upper-case name of a level (e.g., "INFO").
const char* toString(LogLevel level);

/**
 * @brief One log line, written to std::cerr when it goes out of scope.
 *
 * Usage: LogLine(LogLevel::INFO, "service") << "generate committed " << n;
 * Lines from concurrent threads are never interleaved.
 */
class LogLine {
public:
    LogLine(LogLevel level, const char* component);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) buffer_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    bool enabled_;
    std::ostringstream buffer_;
};
