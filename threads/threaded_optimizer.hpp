#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "local_search.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Best candidate of [begin, end), scanned by up to @p numThreads threads.
 *
 * The range is split into balanced contiguous chunks; chunk results are
 * reduced in index order, so the result equals nb.bestInRange(begin, end).
 * Ranges shorter than minParallel are scanned on the calling thread.
 */
MoveChoice parallelBestInRange(const Neighborhood& nb, int begin, int end, int numThreads, int minParallel);


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Multithreaded construction + local search optimizer.
 *
 * Each local-search iteration splits the candidate index range into one
 * contiguous chunk per worker thread; every worker returns its best candidate
 * and the chunk results are reduced with the MoveChoice ordering, which
 * yields exactly the sequential choice.
 */
class ThreadedOptimizer : public LocalSearchOptimizer {
public:
    /**
     * @brief Create a threaded optimizer.
     *
     * @param config Budgets and numThreads (worker threads per iteration).
     */
    explicit ThreadedOptimizer(const EngineConfig& config = EngineConfig());

    const char* name() const override { return "threaded"; }

    /// Neighborhoods smaller than this are scanned on the calling thread.
    static constexpr int kMinParallelCandidates = 2048;

protected:
    /**
     * @brief Parallel neighborhood scan with deterministic reduction.
     *
     * Falls back to a sequential scan when the neighborhood is small or only
     * one thread is configured.
     */
    MoveChoice selectMove(const Neighborhood& nb) const override;
};
