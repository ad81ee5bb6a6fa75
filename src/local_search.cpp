///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "local_search.hpp"
#include "logging.hpp"
#include "scorer.hpp"
#include <algorithm>
#include <chrono>
#include <climits>
#include <functional>


///////////////////////////
///    NEIGHBORHOOD     ///
///////////////////////////
long long editedRowProductSum(const int* votes, int count, int removeVotes, int insertVotes) {
    long long sum = 0;
    long long prev = 0;
    bool removed = removeVotes <= 0;
    bool inserted = insertVotes <= 0;
    for (int k = 0; k < count; ++k) {
        int v = votes[k];
        if (!removed && v == removeVotes) {
            removed = true;
            continue;
        }
        if (!inserted && insertVotes >= v) {
            sum += prev * insertVotes;
            prev = insertVotes;
            inserted = true;
        }
        sum += prev * v;
        prev = v;
    }
    if (!inserted) sum += prev * insertVotes;
    return sum;
}

Neighborhood::Neighborhood(const SearchState& state, Objective objective)
        : objective_(objective) {
    std::vector<std::vector<int>> rows(state.rowCount());
    for (int s = 0; s < state.slotCount(); ++s) {
        int session = state.sessionAt(s);
        if (session == SearchState::kNone) {
            emptySlots_.push_back(s);
            emptyRows_.push_back(state.rowOf(s));
        } else {
            int votes = state.votesOf(session);
            assignedSlots_.push_back(s);
            assignedVotes_.push_back(votes);
            assignedPinned_.push_back(state.pinned(s) ? 1 : 0);
            assignedRows_.push_back(state.rowOf(s));
            if (votes > 0) rows[state.rowOf(s)].push_back(votes);
        }
    }
    for (int i = 0; i < state.sessionCount(); ++i) {
        if (state.slotOf(i) == SearchState::kNone) {
            unplacedSessions_.push_back(i);
            unplacedVotes_.push_back(state.votesOf(i));
        }
    }

    rowStarts_.push_back(0);
    for (int r = 0; r < (int)rows.size(); ++r) {
        std::sort(rows[r].begin(), rows[r].end(), std::greater<int>());
        rowVotes_.insert(rowVotes_.end(), rows[r].begin(), rows[r].end());
        rowStarts_.push_back((int)rowVotes_.size());
        rowPenalties_.push_back(rowPenalty(r, 0, 0));
    }

    int nA = assignedCount();
    int nE = emptyCount();
    int nU = unplacedCount();
    if (objective_ == Objective::PENALTY) {
        swapEnd_ = nA * nA;
        moveEnd_ = swapEnd_ + nA * nE;
        exchangeEnd_ = moveEnd_;
        size_ = exchangeEnd_;
    } else {
        swapEnd_ = 0;
        moveEnd_ = 0;
        exchangeEnd_ = nA * nU;
        size_ = exchangeEnd_ + nU * nE;
    }
}

int Neighborhood::blockStart(MoveType type) const {
    switch (type) {
        case MoveType::SWAP_ASSIGNED:       return 0;
        case MoveType::MOVE_TO_EMPTY:       return swapEnd_;
        case MoveType::EXCHANGE_UNASSIGNED: return moveEnd_;
        case MoveType::PLACE_UNASSIGNED:    return exchangeEnd_;
    }
    return size_;
}

MoveCandidate Neighborhood::describe(int index) const {
    int nA = assignedCount();
    int nE = emptyCount();
    int nU = unplacedCount();

    if (index < swapEnd_) {
        return {MoveType::SWAP_ASSIGNED, assignedSlots_[index / nA], assignedSlots_[index % nA]};
    }
    if (index < moveEnd_) {
        int k = index - swapEnd_;
        return {MoveType::MOVE_TO_EMPTY, assignedSlots_[k / nE], emptySlots_[k % nE]};
    }
    if (index < exchangeEnd_) {
        int k = index - moveEnd_;
        return {MoveType::EXCHANGE_UNASSIGNED, assignedSlots_[k / nU], unplacedSessions_[k % nU]};
    }
    int k = index - exchangeEnd_;
    return {MoveType::PLACE_UNASSIGNED, unplacedSessions_[k / nE], emptySlots_[k % nE]};
}

long long Neighborhood::rowPenalty(int row, int removeVotes, int insertVotes) const {
    const int* votes = rowVotes_.data() + rowStarts_[row];
    int count = rowStarts_[row + 1] - rowStarts_[row];
    return editedRowProductSum(votes, count, removeVotes, insertVotes) * rowWeightTenths(row);
}

int Neighborhood::relocationGain(int rowA, int votesA, int rowB, int votesB) const {
    if (rowA == rowB || votesA == votesB) return 0;
    long long before = rowPenalties_[rowA] + rowPenalties_[rowB];
    long long after = rowPenalty(rowA, votesA, votesB) + rowPenalty(rowB, votesB, votesA);
    long long reduction = before - after;
    if (reduction > INT_MAX) return INT_MAX;
    if (reduction < -INT_MAX) return -INT_MAX;
    return (int)reduction;
}

/**
 * @brief Objective change of one candidate.
 *
 * VOTES: exchanges gain the vote difference and placements the placed
 * session's votes. PENALTY: swaps and moves gain the reduction of the
 * weighted penalty (in tenths) of the two rows involved. A pinned slot is
 * never the source of a swap, move or exchange.
 */
int Neighborhood::gain(int index) const {
    int nA = assignedCount();
    int nE = emptyCount();
    int nU = unplacedCount();

    if (index < 0 || index >= size_) return MoveChoice::kNoMove;

    if (index < swapEnd_) {
        int i = index / nA;
        int j = index % nA;
        if (i >= j || assignedPinned_[i] || assignedPinned_[j]) return MoveChoice::kNoMove;
        return relocationGain(assignedRows_[i], assignedVotes_[i], assignedRows_[j], assignedVotes_[j]);
    }
    if (index < moveEnd_) {
        int k = index - swapEnd_;
        int i = k / nE;
        if (assignedPinned_[i]) return MoveChoice::kNoMove;
        return relocationGain(assignedRows_[i], assignedVotes_[i], emptyRows_[k % nE], 0);
    }
    if (index < exchangeEnd_) {
        int k = index - moveEnd_;
        int i = k / nU;
        if (assignedPinned_[i]) return MoveChoice::kNoMove;
        return unplacedVotes_[k % nU] - assignedVotes_[i];
    }
    int k = index - exchangeEnd_;
    return unplacedVotes_[k / nE];
}

MoveChoice Neighborhood::bestInRange(int begin, int end) const {
    MoveChoice best;
    if (begin < 0) begin = 0;
    if (end > size_) end = size_;
    for (int i = begin; i < end; ++i) {
        MoveChoice candidate{gain(i), i};
        if (candidate.betterThan(best)) best = candidate;
    }
    return best;
}

void Neighborhood::apply(int index, SearchState& state) const {
    MoveCandidate move = describe(index);
    switch (move.type) {
        case MoveType::SWAP_ASSIGNED:
        case MoveType::MOVE_TO_EMPTY:
            state.swapSlots(move.first, move.second);
            break;
        case MoveType::EXCHANGE_UNASSIGNED:
            state.exchange(move.first, move.second);
            break;
        case MoveType::PLACE_UNASSIGNED:
            state.place(move.first, move.second);
            break;
    }
}


///////////////////////////
///    CONSTRUCTION     ///
///////////////////////////
int constructGreedy(SearchState& state) {
    int placed = 0;
    int nextSlot = 0;
    for (int session = 0; session < state.sessionCount(); ++session) {
        while (nextSlot < state.slotCount() && state.sessionAt(nextSlot) != SearchState::kNone) {
            ++nextSlot;
        }
        if (nextSlot >= state.slotCount()) break;
        if (state.place(session, nextSlot)) ++placed;
    }
    return placed;
}


///////////////////////////
///    LOCAL  SEARCH    ///
///////////////////////////
LocalSearchOptimizer::LocalSearchOptimizer(const EngineConfig& config)
        : config_(config) {}

/**
 * @brief Construction (or pinned seeding) followed by best-improvement local search.
 *
 * Each iteration scans the VOTES neighborhood and, if it holds no strictly
 * improving move, the PENALTY neighborhood, and applies the best candidate
 * if its gain is strictly positive. Vote moves raise the total and penalty
 * moves keep it while lowering an integer penalty, so the search ends at a
 * local optimum of both, on the iteration/time budget, or on cancellation.
 */
OptimizerResult LocalSearchOptimizer::optimize(const ScheduleInstance& inst,
                                               const Assignment* seed,
                                               const CancelFlag& cancel) const {
    OptimizerResult result;
    SearchState state(inst);

    if (seed) {
        int skipped = state.seed(*seed, true);
        if (skipped > 0) {
            LogLine(LogLevel::DEBUG, name()) << "seed: dropped " << skipped << " stale entries";
        }
    } else {
        int placed = constructGreedy(state);
        LogLine(LogLevel::DEBUG, name()) << "construction placed " << placed << " of "
                                         << inst.sessions.size() << " sessions in "
                                         << inst.slots.size() << " slots";
    }

    const int limit = config_.iterationLimit((int)inst.slots.size());
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        StopReason local = StopReason::NONE;
        if (cancel && cancel->load()) {
            local = StopReason::CANCELLED;
        } else if (result.iterations >= limit) {
            local = StopReason::BUDGET;
        } else if (config_.timeBudgetMs > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start).count();
            if (elapsed >= config_.timeBudgetMs) local = StopReason::BUDGET;
        }

        StopReason agreed = coordinateStop(local);
        if (agreed == StopReason::CANCELLED) {
            result.cancelled = true;
            break;
        }
        if (agreed == StopReason::BUDGET) {
            result.budgetExhausted = true;
            break;
        }

        Neighborhood votes(state, Objective::VOTES);
        MoveChoice best = selectMove(votes);
        const char* kind = "votes";
        if (best.valid() && best.gain > 0) {
            votes.apply(best.index, state);
        } else {
            Neighborhood penalty(state, Objective::PENALTY);
            best = selectMove(penalty);
            if (!best.valid() || best.gain <= 0) {
                // No strictly improving move: local optimum.
                break;
            }
            penalty.apply(best.index, state);
            kind = "penalty";
        }

        ++result.iterations;
        LogLine(LogLevel::TRACE, name()) << "iteration " << result.iterations << ": " << kind
                                         << " candidate " << best.index << " gain " << best.gain
                                         << " total " << state.totalVotes();
    }

    result.assignment = state.toAssignment();
    result.totalVotes = state.totalVotes();
    return result;
}
