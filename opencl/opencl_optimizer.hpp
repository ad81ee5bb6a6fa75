#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "local_search.hpp"
#include "opencl_evaluator.hpp"
#include <memory>


///////////////////////////
///     OPTIMIZERS      ///
///////////////////////////
/**
 * @brief Local search that offloads candidate gain evaluation to OpenCL.
 *
 * Each iteration uploads the neighborhood's vote arrays once, then evaluates
 * the candidate index range in batches of EngineConfig::batchSize on the
 * device. The host reduces each batch with the MoveChoice ordering, so the
 * chosen move matches the CPU back ends.
 */
class OpenCLOptimizer : public LocalSearchOptimizer {
public:
    /**
     * @brief Construct an OpenCL optimizer.
     *
     * Sets up the OpenCL device; throws std::runtime_error if none is usable.
     *
     * @param config Budgets and batchSize (candidates per device batch).
     */
    explicit OpenCLOptimizer(const EngineConfig& config = EngineConfig());

    const char* name() const override { return "opencl"; }

protected:
    MoveChoice selectMove(const Neighborhood& nb) const override;

private:
    /// OpenCL context and kernel used for batched gain evaluation.
    std::unique_ptr<MoveGainOpenCLContext> clctx_;
};
