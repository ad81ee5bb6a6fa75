///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_optimizer.hpp"
#include "logging.hpp"
#include "../threads/threaded_optimizer.hpp"
#include <algorithm>


///////////////////////////
///      OPTIMIZER      ///
///////////////////////////
MPIOptimizer::MPIOptimizer(const EngineConfig& config, MPI_Comm comm)
        : LocalSearchOptimizer(config),
          comm_(comm) {
    MPI_Comm_rank(comm_, &rank_);
    MPI_Comm_size(comm_, &size_);
}

void MPIOptimizer::serializeInstance(const ScheduleInstance& inst, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(2 + 2 * inst.slots.size() + 2 * inst.sessions.size());
    buffer.push_back((int)inst.slots.size());
    for (const Slot& s : inst.slots) {
        buffer.push_back(s.roomId);
        buffer.push_back(s.timeslotId);
    }
    buffer.push_back((int)inst.sessions.size());
    for (const Session& s : inst.sessions) {
        buffer.push_back(s.id);
        buffer.push_back(s.votes);
    }
}

void MPIOptimizer::deserializeInstance(const std::vector<int>& buffer, ScheduleInstance& inst) {
    size_t pos = 0;
    int slotCount = buffer[pos++];
    inst.slots.resize(slotCount);
    for (int i = 0; i < slotCount; ++i) {
        inst.slots[i].roomId     = buffer[pos++];
        inst.slots[i].timeslotId = buffer[pos++];
    }
    int sessionCount = buffer[pos++];
    inst.sessions.resize(sessionCount);
    for (int i = 0; i < sessionCount; ++i) {
        Session& s = inst.sessions[i];
        s.id      = buffer[pos++];
        s.votes   = buffer[pos++];
        s.ownerId = 0;
    }
}

void MPIOptimizer::serializeAssignment(const Assignment& assignment, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(3 * assignment.entries.size());
    for (const AssignmentEntry& e : assignment.entries) {
        buffer.push_back(e.slot.roomId);
        buffer.push_back(e.slot.timeslotId);
        buffer.push_back(e.sessionId);
    }
}

void MPIOptimizer::deserializeAssignment(const std::vector<int>& buffer, Assignment& assignment) {
    size_t count = buffer.size() / 3;
    assignment.entries.resize(count);
    for (size_t i = 0; i < count; ++i) {
        assignment.entries[i].slot.roomId     = buffer[3 * i + 0];
        assignment.entries[i].slot.timeslotId = buffer[3 * i + 1];
        assignment.entries[i].sessionId       = buffer[3 * i + 2];
    }
}

void MPIOptimizer::broadcastBuffer(std::vector<int>& buffer) const {
    int len = (int)buffer.size();
    MPI_Bcast(&len, 1, MPI_INT, 0, comm_);
    buffer.resize(len);
    if (len > 0) {
        MPI_Bcast(buffer.data(), len, MPI_INT, 0, comm_);
    }
}

OptimizerResult MPIOptimizer::optimize(const ScheduleInstance& inst,
                                       const Assignment* seed,
                                       const CancelFlag& cancel) const {
    int command = RUN;
    MPI_Bcast(&command, 1, MPI_INT, 0, comm_);
    if (command != RUN) return OptimizerResult();
    return runCollective(inst, seed, cancel);
}

int MPIOptimizer::serveWorkers() const {
    int runs = 0;
    ScheduleInstance ignored;
    while (true) {
        int command = STOP;
        MPI_Bcast(&command, 1, MPI_INT, 0, comm_);
        if (command != RUN) break;
        runCollective(ignored, nullptr, CancelFlag());
        ++runs;
    }
    LogLine(LogLevel::DEBUG, name()) << "rank " << rank_ << " served " << runs << " runs";
    return runs;
}

void MPIOptimizer::stopWorkers() const {
    int command = STOP;
    MPI_Bcast(&command, 1, MPI_INT, 0, comm_);
}

/**
 * @brief Replicate rank 0's input, search in lockstep, replicate the result.
 */
OptimizerResult MPIOptimizer::runCollective(const ScheduleInstance& inst,
                                            const Assignment* seed,
                                            const CancelFlag& cancel) const {
    std::vector<int> buf;
    if (rank_ == 0) serializeInstance(inst, buf);
    broadcastBuffer(buf);
    ScheduleInstance localInst;
    deserializeInstance(buf, localInst);

    int hasSeed = (rank_ == 0 && seed) ? 1 : 0;
    MPI_Bcast(&hasSeed, 1, MPI_INT, 0, comm_);
    Assignment localSeed;
    if (hasSeed) {
        if (rank_ == 0) serializeAssignment(*seed, buf);
        broadcastBuffer(buf);
        deserializeAssignment(buf, localSeed);
    }

    if (rank_ == 0) {
        LogLine(LogLevel::DEBUG, name()) << "searching " << localInst.slots.size() << " slots, "
                                         << localInst.sessions.size() << " sessions on " << size_
                                         << " ranks x " << config().numThreads << " threads";
    }

    // Only rank 0 polls the caller's flag; coordinateStop() spreads its decision.
    OptimizerResult result = LocalSearchOptimizer::optimize(localInst, hasSeed ? &localSeed : nullptr,
                                                            rank_ == 0 ? cancel : CancelFlag());

    // Ranks applied identical moves; rank 0's copy is authoritative.
    if (rank_ == 0) serializeAssignment(result.assignment, buf);
    broadcastBuffer(buf);
    deserializeAssignment(buf, result.assignment);

    long long totals[1] = {result.totalVotes};
    MPI_Bcast(totals, 1, MPI_LONG_LONG, 0, comm_);
    result.totalVotes = totals[0];
    return result;
}

/**
 * @brief Rank-local threaded scan followed by a MAXLOC reduction.
 *
 * Rank r scans indices [r * n / p, (r + 1) * n / p). An empty share reports
 * (INT_MIN, -1), which loses against every real move.
 */
MoveChoice MPIOptimizer::selectMove(const Neighborhood& nb) const {
    long long total = nb.size();
    int begin = (int)(total * rank_ / size_);
    int end = (int)(total * (rank_ + 1) / size_);

    MoveChoice local = parallelBestInRange(nb, begin, end, config().numThreads, kMinParallelCandidates);

    struct {
        int gain;
        int index;
    } in{local.gain, local.index}, out{MoveChoice::kNoMove, -1};

    MPI_Allreduce(&in, &out, 1, MPI_2INT, MPI_MAXLOC, comm_);

    MoveChoice global;
    global.gain = out.gain;
    global.index = out.gain == MoveChoice::kNoMove ? -1 : out.index;
    return global;
}

StopReason MPIOptimizer::coordinateStop(StopReason local) const {
    int code = (int)local;
    MPI_Bcast(&code, 1, MPI_INT, 0, comm_);
    return (StopReason)code;
}
