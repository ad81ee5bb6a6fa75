///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
int EngineConfig::iterationLimit(int slotCount) const {
    if (maxIterations > 0) return maxIterations;
    long long derived = 3LL * slotCount * slotCount;
    if (derived < 1) return 1;
    if (derived > 100000000LL) return 100000000;
    return (int)derived;
}

/**
 * @brief Parse a strictly positive integer flag value.
 */
static bool parsePositive(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value <= 0) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/**
 * @brief Parse an integer flag value that may be zero or negative.
 */
static bool parseInteger(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

DemoConfig parseDemoConfig(int argc, char** argv) {
    DemoConfig cfg;

    if (const char* env = std::getenv("UNCONF_LOG_LEVEL")) {
        if (!parseLogLevel(env, cfg.engine.logLevel)) {
            LogLine(LogLevel::WARN, "config") << "ignoring UNCONF_LOG_LEVEL=" << env;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.find('=') == std::string::npos) {
            LogLine(LogLevel::WARN, "config") << "ignoring argument '" << arg << "' (expected --key=value)";
            continue;
        }
        std::string key = arg.substr(2, arg.find('=') - 2);
        std::string value = arg.substr(arg.find('=') + 1);

        bool ok = true;
        if (key == "iterations") {
            ok = parseInteger(value, cfg.engine.maxIterations);
        } else if (key == "time-budget-ms") {
            ok = parseInteger(value, cfg.engine.timeBudgetMs);
        } else if (key == "threads") {
            ok = parsePositive(value, cfg.engine.numThreads);
        } else if (key == "batch-size") {
            ok = parsePositive(value, cfg.engine.batchSize);
        } else if (key == "log-level") {
            ok = parseLogLevel(value, cfg.engine.logLevel);
        } else if (key == "size") {
            ok = parseDemoSize(value, cfg.size);
        } else if (key == "editors") {
            ok = parsePositive(value, cfg.editors);
        } else {
            LogLine(LogLevel::WARN, "config") << "unknown flag --" << key;
            continue;
        }

        if (!ok) {
            LogLine(LogLevel::WARN, "config") << "invalid value '" << value << "' for --" << key
                                              << ", keeping default";
        }
    }

    setLogLevel(cfg.engine.logLevel);
    return cfg;
}
