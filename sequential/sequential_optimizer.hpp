#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "local_search.hpp"


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Single-threaded construction + local search optimizer.
 *
 * Scans the whole neighborhood on the calling thread. This is the reference
 * back end the others are checked against.
 */
class SequentialOptimizer : public LocalSearchOptimizer {
public:
    /**
     * @brief Construct a sequential optimizer.
     *
     * @param config Iteration/time budgets of the local search.
     */
    explicit SequentialOptimizer(const EngineConfig& config = EngineConfig());

    const char* name() const override { return "sequential"; }

protected:
    MoveChoice selectMove(const Neighborhood& nb) const override;
};
