#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "constraints.hpp"
#include "optimizer_base.hpp"
#include <climits>
#include <vector>


///////////////////////////
///    NEIGHBORHOOD     ///
///////////////////////////
/**
 * @brief Kinds of single-step changes the local search considers.
 */
enum class MoveType {
    SWAP_ASSIGNED, ///< Exchange the sessions of two occupied slots.
    MOVE_TO_EMPTY, ///< Move a placed session into an empty slot.
    EXCHANGE_UNASSIGNED, ///< Replace a placed session with an unplaced one.
    PLACE_UNASSIGNED ///< Put an unplaced session into an empty slot.
};

/**
 * @brief Decoded candidate move.
 *
 * For SWAP_ASSIGNED and MOVE_TO_EMPTY, first/second are slot indices.
 * For EXCHANGE_UNASSIGNED, first is a slot index and second a session index.
 * For PLACE_UNASSIGNED, first is a session index and second a slot index.
 */
struct MoveCandidate {
    MoveType type;
    int first;
    int second;
};

/**
 * @brief Best move seen so far during a neighborhood scan.
 *
 * Ordering: higher gain wins; equal gains go to the lower candidate index.
 * This is the same rule MPI_MAXLOC applies, which keeps the distributed
 * reduction identical to the sequential scan.
 */
struct MoveChoice {
    int gain = kNoMove; ///< Objective change of the move, or kNoMove.
    int index = -1; ///< Candidate index in the neighborhood, or -1.

    /// Gain of candidates that do not denote a move (e.g., swapping a slot with itself).
    static constexpr int kNoMove = INT_MIN;

    bool valid() const { return index >= 0 && gain != kNoMove; }

    /// True if this choice should replace @p other.
    bool betterThan(const MoveChoice& other) const {
        if (!valid()) return false;
        if (!other.valid()) return true;
        if (gain != other.gain) return gain > other.gain;
        return index < other.index;
    }
};

/**
 * @brief Which objective a neighborhood scores its candidates by.
 *
 * The search is lexicographic: VOTES first, then PENALTY among layouts with
 * the same vote total.
 */
enum class Objective {
    VOTES, ///< Gain = change of the assigned vote total (blocks 3 and 4 only).
    PENALTY ///< Gain = reduction of the weighted penalty in tenths (blocks 1 and 2 only).
};

/**
 * @brief Conflict penalty of a row of votes after an optional edit.
 *
 * @p votes holds the positive votes of one row in descending order. One
 * occurrence of @p removeVotes is dropped and @p insertVotes is merged in;
 * a non-positive value means "none" (zero-vote sessions never conflict).
 * Equals adjacentProductSum() of the edited row.
 */
long long editedRowProductSum(const int* votes, int count, int removeVotes, int insertVotes);

/**
 * @brief Enumerable single-step neighborhood of a search state.
 *
 * Candidates are laid out in four consecutive blocks:
 *  1. SWAP_ASSIGNED        nA * nA  (pairs with i >= j carry kNoMove)
 *  2. MOVE_TO_EMPTY        nA * nE
 *  3. EXCHANGE_UNASSIGNED  nA * nU
 *  4. PLACE_UNASSIGNED     nU * nE
 * where nA/nE are the occupied/empty slots in slot order and nU the unplaced
 * sessions in priority order. Relocations (blocks 1 and 2) never change the
 * vote total and exchanges/placements of equal votes never change the
 * penalty, so a VOTES neighborhood holds blocks 3 and 4 only and a PENALTY
 * neighborhood blocks 1 and 2 only; the other blocks are empty. Candidates
 * touching a pinned slot carry kNoMove. The layout is a pure function of the
 * state, so every back end (and every MPI rank) enumerates the same indices.
 */
class Neighborhood {
public:
    /**
     * @brief Capture the occupied/empty/unplaced lists and the row votes of a state.
     */
    explicit Neighborhood(const SearchState& state, Objective objective = Objective::VOTES);

    Objective objective() const { return objective_; }

    /// Total number of candidate indices.
    int size() const { return size_; }

    /// Objective gain of the candidate, or MoveChoice::kNoMove.
    int gain(int index) const;

    /// Decode a candidate index.
    MoveCandidate describe(int index) const;

    /**
     * @brief Scan [begin, end) and return the best candidate.
     *
     * Returns an invalid choice if the range holds no move.
     */
    MoveChoice bestInRange(int begin, int end) const;

    /**
     * @brief Apply the candidate to a state.
     *
     * The state must be the one this neighborhood was built from.
     */
    void apply(int index, SearchState& state) const;

    int assignedCount() const { return (int)assignedSlots_.size(); }
    int emptyCount() const { return (int)emptySlots_.size(); }
    int unplacedCount() const { return (int)unplacedSessions_.size(); }

    /// Votes of the sessions in occupied slots, in slot order.
    const std::vector<int>& assignedVotes() const { return assignedVotes_; }

    /// 1 for occupied slots that are pinned, in slot order.
    const std::vector<int>& assignedPinned() const { return assignedPinned_; }

    /// Row of each occupied slot, in slot order.
    const std::vector<int>& assignedRows() const { return assignedRows_; }

    /// Row of each empty slot, in slot order.
    const std::vector<int>& emptyRows() const { return emptyRows_; }

    /// Votes of the unplaced sessions, in priority order.
    const std::vector<int>& unplacedVotes() const { return unplacedVotes_; }

    /// rowVotes()[rowStarts()[r], rowStarts()[r + 1]) are the positive votes of row r, descending.
    const std::vector<int>& rowStarts() const { return rowStarts_; }
    const std::vector<int>& rowVotes() const { return rowVotes_; }

    /// Weighted penalty of each row in tenths, as it stands.
    const std::vector<long long>& rowPenalties() const { return rowPenalties_; }

    /// First index of each block (SWAP, MOVE, EXCHANGE, PLACE) and the end.
    int blockStart(MoveType type) const;

private:
    Objective objective_;

    std::vector<int> assignedSlots_;
    std::vector<int> emptySlots_;
    std::vector<int> unplacedSessions_;
    std::vector<int> assignedVotes_;
    std::vector<int> assignedPinned_;
    std::vector<int> assignedRows_;
    std::vector<int> emptyRows_;
    std::vector<int> unplacedVotes_;

    std::vector<int> rowStarts_;
    std::vector<int> rowVotes_;
    std::vector<long long> rowPenalties_;

    int swapEnd_ = 0;
    int moveEnd_ = 0;
    int exchangeEnd_ = 0;
    int size_ = 0;

    /// Weighted penalty of a row after removing one vote count and inserting another.
    long long rowPenalty(int row, int removeVotes, int insertVotes) const;

    /// Penalty reduction of exchanging the contents of two slots (0 votes for an empty one).
    int relocationGain(int rowA, int votesA, int rowB, int votesB) const;
};


///////////////////////////
///    CONSTRUCTION     ///
///////////////////////////
/**
 * @brief Greedy construction on an empty state.
 *
 * Sessions are taken in priority order (votes descending, id ascending) and
 * each goes into the first empty slot in canonical order, until sessions or
 * slots run out.
 *
 * @return Number of sessions placed.
 */
int constructGreedy(SearchState& state);


///////////////////////////
///    LOCAL  SEARCH    ///
///////////////////////////
/**
 * @brief Why a local search stopped before reaching a local optimum.
 */
enum class StopReason { NONE, CANCELLED, BUDGET };

/**
 * @brief Shared driver of all optimizer back ends.
 *
 * Runs construction (or pinned seeding), then repeatedly asks the back end
 * for the best move of the current VOTES neighborhood and, when none
 * improves, of the PENALTY neighborhood, applying it while it strictly
 * improves. Back ends differ only in how they scan a neighborhood
 * (selectMove) and, for distributed runs, how the stop decision is agreed on
 * (coordinateStop).
 */
class LocalSearchOptimizer : public IOptimizer {
public:
    explicit LocalSearchOptimizer(const EngineConfig& config);

    OptimizerResult optimize(const ScheduleInstance& inst,
                             const Assignment* seed,
                             const CancelFlag& cancel) const override;

    const EngineConfig& config() const { return config_; }

protected:
    /**
     * @brief Return the best candidate of the neighborhood.
     *
     * Must honour MoveChoice ordering so that all back ends agree.
     */
    virtual MoveChoice selectMove(const Neighborhood& nb) const = 0;

    /**
     * @brief Turn a locally observed stop reason into the agreed one.
     *
     * Single-process back ends return @p local unchanged.
     */
    virtual StopReason coordinateStop(StopReason local) const { return local; }

private:
    EngineConfig config_;
};
