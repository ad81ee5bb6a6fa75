///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_optimizer.hpp"
#include <algorithm>
#include <vector>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
OpenCLOptimizer::OpenCLOptimizer(const EngineConfig& config)
        : LocalSearchOptimizer(config),
          clctx_(std::make_unique<MoveGainOpenCLContext>()) {}

/**
 * @brief Evaluate the neighborhood on the device batch by batch.
 *
 * Batches are visited in index order and each is scanned in index order,
 * so ties still resolve to the lowest candidate index.
 */
MoveChoice OpenCLOptimizer::selectMove(const Neighborhood& nb) const {
    MoveChoice best;
    int total = nb.size();
    if (total == 0) return best;

    clctx_->loadNeighborhood(nb);

    int batchSize = std::max(1, config().batchSize);
    std::vector<int> gains;
    for (int begin = 0; begin < total; begin += batchSize) {
        int count = std::min(batchSize, total - begin);
        clctx_->evaluateBatch(begin, count, gains);
        for (int i = 0; i < count; ++i) {
            MoveChoice candidate{gains[i], begin + i};
            if (candidate.betterThan(best)) best = candidate;
        }
    }
    return best;
}
