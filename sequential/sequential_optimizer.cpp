///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_optimizer.hpp"


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
SequentialOptimizer::SequentialOptimizer(const EngineConfig& config)
        : LocalSearchOptimizer(config) {}

/**
 * @brief Linear scan over every candidate index.
 */
MoveChoice SequentialOptimizer::selectMove(const Neighborhood& nb) const {
    return nb.bestInRange(0, nb.size());
}
