#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include <atomic>
#include <memory>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Shared cancellation flag of one optimizer run.
 *
 * Set by whoever supersedes the run; polled by the optimizer between
 * local-search iterations.
 */
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

/// Create a fresh, unset cancellation flag.
inline CancelFlag makeCancelFlag() { return std::make_shared<std::atomic<bool>>(false); }

/**
 * @brief Outcome of one optimizer run.
 *
 * The assignment always satisfies the structural invariants for the catalog
 * the instance was built from, even when the run stopped early.
 */
struct OptimizerResult {
    /// Best assignment found, entries in canonical slot order.
    Assignment assignment;

    /// Objective value: sum of votes over assigned sessions (higher is better).
    long long totalVotes = 0;

    /// Number of improving moves applied by the local search.
    int iterations = 0;

    /// True if the search stopped on the iteration or time budget instead of a local optimum.
    bool budgetExhausted = false;

    /// True if the run was cancelled; the assignment must then be discarded.
    bool cancelled = false;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface of the assignment optimizers.
 *
 * Implementations may be sequential, multithreaded, GPU-accelerated or
 * distributed via MPI, but all produce the same assignment for the same
 * input: construction by vote priority followed by best-improvement local
 * search with deterministic tie-breaking.
 */
class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    /**
     * @brief Compute an assignment for the instance.
     *
     * @param inst   Snapshot of eligible slots and sessions.
     * @param seed   Optional starting assignment; when given, construction is
     *               skipped and the local search starts from it (entries that
     *               no longer fit the instance are dropped). May be null.
     * @param cancel Optional cancellation flag; may be null.
     */
    virtual OptimizerResult optimize(const ScheduleInstance& inst,
                                     const Assignment* seed,
                                     const CancelFlag& cancel) const = 0;

    /// Short back-end name used in logs ("sequential", "threaded", ...).
    virtual const char* name() const = 0;
};
