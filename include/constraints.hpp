#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///     INVARIANTS      ///
///////////////////////////
/**
 * @brief Structural invariant an assignment can break.
 */
enum class ViolationKind {
    DUPLICATE_SLOT, ///< Two entries share a (room, timeslot) slot.
    DUPLICATE_SESSION, ///< A session is booked in more than one slot.
    BLOCKED_SLOT, ///< An entry sits in a blocked timeslot.
    DANGLING_REFERENCE ///< An entry references a room, timeslot or session missing from the catalog.
};

/**
 * @brief First invariant violation found in an assignment.
 */
struct Violation {
    ViolationKind kind; ///< Which invariant is broken.
    std::string detail; ///< Human-readable description naming the offending ids.
};

/// Stable upper-case name of a violation kind (e.g., "DUPLICATE_SLOT").
const char* toString(ViolationKind kind);

/**
 * @brief Check an assignment against the structural invariants.
 *
 * Pure and total: never mutates its inputs and accepts any entry list.
 * Checks run in the order dangling reference, blocked slot, duplicate slot,
 * duplicate session; the first violation found is reported.
 *
 * @return std::nullopt if the assignment is valid for the catalog.
 */
std::optional<Violation> validateAssignment(const Assignment& assignment, const Catalog& catalog);


///////////////////////////
///    SEARCH  STATE    ///
///////////////////////////
/**
 * @brief Immutable input of one optimizer run.
 *
 * Eligible slots are stored in canonical order and sessions in priority
 * order (votes descending, id ascending). The optimizer treats both as a
 * snapshot: later vote changes do not affect a run in progress.
 */
struct ScheduleInstance {
    std::vector<Slot> slots; ///< Eligible slots, canonical order.
    std::vector<Session> sessions; ///< Sessions, votes descending then id ascending.

    /// Build an instance from the catalog (blocked timeslots excluded).
    static ScheduleInstance fromCatalog(const Catalog& catalog);
};

/**
 * @brief Incremental slot/session occupancy of a candidate assignment.
 *
 * Indices refer to ScheduleInstance::slots and ScheduleInstance::sessions.
 * place() refuses any placement that would break the bijection, so every
 * state reachable through place()/undo() satisfies the invariants.
 */
class SearchState {
public:
    /**
     * @brief Construct an empty state for a given instance.
     */
    explicit SearchState(const ScheduleInstance& inst);

    /**
     * @brief Try to place a session in a slot.
     *
     * Fails (returning false, leaving the state unchanged) if either index is
     * out of range, the slot is occupied or the session is already placed.
     */
    bool place(int sessionIndex, int slotIndex);

    /**
     * @brief Undo a previously successful placement.
     */
    void undo(int sessionIndex, int slotIndex);

    /**
     * @brief Exchange the occupants of two slots (either may be empty).
     */
    void swapSlots(int slotA, int slotB);

    /**
     * @brief Replace the session in an occupied slot with an unplaced one.
     *
     * The displaced session becomes unplaced.
     */
    void exchange(int slotIndex, int unplacedSessionIndex);

    /// Session index at a slot, or kNone.
    int sessionAt(int slotIndex) const { return slotSession_[slotIndex]; }

    /// Slot index of a session, or kNone.
    int slotOf(int sessionIndex) const { return sessionSlot_[sessionIndex]; }

    /// Vote count of the session at the given index.
    int votesOf(int sessionIndex) const { return inst_.sessions[sessionIndex].votes; }

    /// Sum of votes of all placed sessions.
    long long totalVotes() const { return totalVotes_; }

    int slotCount() const { return (int)slotSession_.size(); }
    int sessionCount() const { return (int)sessionSlot_.size(); }

    /**
     * @brief Seed the state from an existing assignment.
     *
     * Entries whose slot is not eligible or whose session is unknown are
     * skipped, as are entries that would double-book a slot or a session.
     *
     * @param pin When true, the seeded slots are pinned: the local search
     *            never moves, swaps or evicts their sessions.
     * @return Number of entries that were skipped.
     */
    int seed(const Assignment& assignment, bool pin = false);

    /// Whether the slot holds a pinned entry.
    bool pinned(int slotIndex) const { return pinned_[slotIndex] != 0; }

    /// Row of a slot: index of its timeslot among the eligible timeslots in start order.
    int rowOf(int slotIndex) const { return slotRow_[slotIndex]; }

    int rowCount() const { return rowCount_; }

    /**
     * @brief Convert the state back to an assignment in canonical slot order.
     */
    Assignment toAssignment() const;

    const ScheduleInstance& instance() const { return inst_; }

    /// Sentinel used to mark empty slots and unplaced sessions.
    static constexpr int kNone = -1;

private:
    /// Reference to the instance this state belongs to.
    const ScheduleInstance& inst_;

    /// slotSession_[slot] = session index or kNone.
    std::vector<int> slotSession_;

    /// sessionSlot_[session] = slot index or kNone.
    std::vector<int> sessionSlot_;

    /// pinned_[slot] != 0 for slots seeded with pin = true.
    std::vector<char> pinned_;

    /// slotRow_[slot] = timeslot row of the slot.
    std::vector<int> slotRow_;
    int rowCount_ = 0;

    /// Running objective value.
    long long totalVotes_ = 0;

    int slotIndex(const Slot& slot) const;
    int sessionIndex(int sessionId) const;
};
