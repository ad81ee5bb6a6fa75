#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "constraints.hpp"
#include "local_search.hpp"
#include <mpi.h>
#include <vector>


///////////////////////////
///      OPTIMIZER      ///
///////////////////////////
/**
 * @brief MPI + threads back end of the local search.
 *
 * Rank 0 broadcasts the instance (and the seed, if any) so every rank searches
 * the same state. Each iteration, every rank scans its contiguous share of
 * the neighborhood with worker threads; the shares are combined with
 * MPI_Allreduce(MPI_2INT, MPI_MAXLOC), which picks the highest gain and, on
 * ties, the lowest candidate index. Every rank then applies the same move, so
 * the states never diverge. Stop decisions (budget, cancellation) are taken
 * by rank 0 and broadcast. The final assignment is broadcast from rank 0.
 *
 * Every run opens with a broadcast command, so worker ranks can wait in
 * serveWorkers() for however many runs rank 0 issues until stopWorkers().
 */
class MPIOptimizer : public LocalSearchOptimizer {
public:
    /**
     * @brief Construct an MPI optimizer over a communicator.
     *
     * @param config Budgets; numThreads is the thread count per rank.
     * @param comm   Communicator of the participating ranks.
     */
    explicit MPIOptimizer(const EngineConfig& config = EngineConfig(), MPI_Comm comm = MPI_COMM_WORLD);

    /**
     * @brief Collective optimize: must be called on every rank of the communicator.
     *
     * Only rank 0's instance, seed and cancellation flag are used; the other
     * ranks may pass an empty instance. Every rank returns rank 0's result.
     */
    OptimizerResult optimize(const ScheduleInstance& inst,
                             const Assignment* seed,
                             const CancelFlag& cancel) const override;

    const char* name() const override { return "mpi"; }

    /**
     * @brief Worker-rank loop: join every run rank 0 starts until it calls stopWorkers().
     *
     * @return Number of runs joined.
     */
    int serveWorkers() const;

    /**
     * @brief Rank 0: release the ranks waiting in serveWorkers().
     */
    void stopWorkers() const;

    /// Ranks scan their share on one thread below this many candidates.
    static constexpr int kMinParallelCandidates = 2048;

protected:
    /**
     * @brief Scan this rank's share and reduce across ranks.
     */
    MoveChoice selectMove(const Neighborhood& nb) const override;

    /**
     * @brief Adopt rank 0's stop decision.
     */
    StopReason coordinateStop(StopReason local) const override;

private:
    /// Command broadcast by rank 0 at the start of every collective exchange.
    enum Command : int { RUN = 1, STOP = 0 };

    /// Communicator of the participating ranks.
    MPI_Comm comm_;

    int rank_ = 0;
    int size_ = 1;

    /**
     * @brief Body of a run once every rank has received RUN.
     */
    OptimizerResult runCollective(const ScheduleInstance& inst,
                                  const Assignment* seed,
                                  const CancelFlag& cancel) const;

    /**
     * @brief Broadcast a flat int buffer from rank 0 (length first, then data).
     */
    void broadcastBuffer(std::vector<int>& buffer) const;

    /**
     * @brief Serialize an instance into a flat int buffer.
     *
     * Layout: slot count, (roomId, timeslotId) per slot, session count,
     * (id, votes) per session. Titles and bodies are not needed by the search.
     */
    static void serializeInstance(const ScheduleInstance& inst, std::vector<int>& buffer);

    static void deserializeInstance(const std::vector<int>& buffer, ScheduleInstance& inst);

    /**
     * @brief Serialize assignment entries as (roomId, timeslotId, sessionId) triples.
     */
    static void serializeAssignment(const Assignment& assignment, std::vector<int>& buffer);

    static void deserializeAssignment(const std::vector<int>& buffer, Assignment& assignment);
};
