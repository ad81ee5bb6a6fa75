#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logging.hpp"
#include "demo_instances.hpp"
#include <string>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief Tunables of the optimizer back ends and the service.
 *
 * Defaults are suitable for interactive use on an unconference of a few
 * hundred slots.
 */
struct EngineConfig {
    /**
     * Maximum number of local-search iterations (applied moves).
     * Zero or negative means "derive from the instance": 3 * slots^2.
     */
    int maxIterations = 0;

    /// Wall-clock budget for one local search in milliseconds; <= 0 disables it.
    int timeBudgetMs = 2000;

    /// Worker threads for the threaded back end (and per MPI rank).
    int numThreads = 4;

    /// Candidate moves per OpenCL evaluation batch.
    int batchSize = 4096;

    /// Threshold applied to the process-wide logger.
    LogLevel logLevel = LogLevel::INFO;

    /**
     * @brief Iteration limit for an instance with the given number of slots.
     *
     * Returns maxIterations when positive, otherwise 3 * slots^2 (at least 1).
     */
    int iterationLimit(int slotCount) const;
};

/**
 * @brief Settings of the demo executables: engine tunables plus the input.
 */
struct DemoConfig {
    EngineConfig engine; ///< Optimizer/service tunables.
    DemoSize size = DemoSize::M; ///< Which synthetic unconference to build.
    int editors = 4; ///< Concurrent editor threads in the threaded demo.
};

/**
 * @brief Parse --key=value flags into a DemoConfig.
 *
 * Recognized keys: iterations, time-budget-ms, threads, batch-size,
 * log-level, size (S, M, L, XL) and editors. The UNCONF_LOG_LEVEL environment
 * variable sets the log level before flags are applied. Unknown keys and
 * malformed values are reported on the log and leave the default in place.
 */
DemoConfig parseDemoConfig(int argc, char** argv);
