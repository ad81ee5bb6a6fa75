#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment_store.hpp"
#include "command_result.hpp"
#include "model.hpp"
#include "optimizer_base.hpp"
#include "scorer.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       SERVICE       ///
///////////////////////////
/**
 * @brief Command surface of the schedule: generation, point edits, catalog edits.
 *
 * Every mutating command checks the caller's role on every call, then runs as
 * one store transaction, so it is applied entirely or not at all. Checks run
 * in the order permission, expected version, existence, blocked target,
 * occupancy.
 *
 * generate() and improve() run the optimizer outside the store lock on a
 * snapshot and commit only if no room, timeslot or session was added,
 * removed, re-timed or (un)blocked meanwhile. A newer generate/improve
 * request cancels one still in flight (last request wins).
 *
 * Reads take no caller: every role, viewer included, may read.
 */
class ScheduleService {
public:
    /**
     * @brief Bind a service to a store and an optimizer back end.
     *
     * @param store     Store of the unconference; must outlive the service.
     * @param optimizer Back end used by generate() and improve().
     */
    ScheduleService(AssignmentStore& store, std::unique_ptr<IOptimizer> optimizer);

    ScheduleService(const ScheduleService&) = delete;
    ScheduleService& operator=(const ScheduleService&) = delete;

    /// Optional assignment version a point edit was based on.
    using ExpectedVersion = std::optional<uint64_t>;

    /**
     * @brief Replace the whole assignment with the optimizer's result.
     *
     * Fails with CONFLICT if the catalog structure changed while the
     * optimizer ran, with CANCELLED if a newer generate()/improve()
     * superseded this one and with OPTIMIZER_FAILED if the back end threw.
     */
    CommandResult generate(const Caller& caller);

    /**
     * @brief Local search seeded with the current assignment.
     *
     * Existing entries stay where they are; the search only fills empty
     * slots and rearranges the sessions it placed itself. Same commit
     * protocol as generate(); additionally fails with CONFLICT if the
     * assignment was edited while the search ran.
     */
    CommandResult improve(const Caller& caller);

    /// Remove every entry; the catalog is untouched.
    CommandResult clear(const Caller& caller, ExpectedVersion expected = std::nullopt);

    /**
     * @brief Move the session at @p from to @p to.
     *
     * An empty target receives the session; an occupied target exchanges the
     * two sessions in one step. from == to is a successful no-op.
     */
    CommandResult move(const Caller& caller, const Slot& from, const Slot& to,
                       ExpectedVersion expected = std::nullopt);

    /// Exchange the sessions of two occupied slots.
    CommandResult swap(const Caller& caller, const Slot& a, const Slot& b,
                       ExpectedVersion expected = std::nullopt);

    /**
     * @brief Put an unassigned session into an empty eligible slot.
     *
     * ALREADY_SCHEDULED if the session has a slot, CONFLICT if the target is
     * occupied.
     */
    CommandResult place(const Caller& caller, int sessionId, const Slot& slot,
                        ExpectedVersion expected = std::nullopt);

    /**
     * @brief Put an unassigned session into the first empty eligible slot.
     *
     * ALREADY_SCHEDULED if the session has a slot, SCHEDULE_FULL if no
     * eligible slot is empty.
     */
    CommandResult addToSchedule(const Caller& caller, int sessionId,
                                ExpectedVersion expected = std::nullopt);

    /// Remove the entry at a slot; its session becomes unassigned.
    CommandResult unassign(const Caller& caller, const Slot& slot,
                           ExpectedVersion expected = std::nullopt);

    CommandResult addRoom(const Caller& caller, const Room& room);

    /// Remove a room and, in the same transaction, every entry in it.
    CommandResult removeRoom(const Caller& caller, int roomId);

    /// Add a timeslot; a blocked one needs a non-empty reason.
    CommandResult addTimeslot(const Caller& caller, const Timeslot& timeslot);

    /// Remove a timeslot and, in the same transaction, every entry in it.
    CommandResult removeTimeslot(const Caller& caller, int timeslotId);

    /// Block a timeslot with a reason and evict its entries.
    CommandResult blockTimeslot(const Caller& caller, int timeslotId, const std::string& reason);

    CommandResult unblockTimeslot(const Caller& caller, int timeslotId);

    /// Insert a session or refresh an existing one (title, votes, tag).
    CommandResult upsertSession(const Caller& caller, const Session& session);

    /// Remove a session and its entry, if it had one.
    CommandResult removeSession(const Caller& caller, int sessionId);

    /// Consistent view of catalog, assignment and versions.
    StoreSnapshot snapshot() const;

    /// Current assignment in canonical slot order.
    Assignment assignment() const;

    /// Sessions without a slot, votes descending then id ascending.
    std::vector<Session> unassignedSessions() const;

    /// Empty eligible slots in canonical order.
    std::vector<Slot> freeSlots() const;

    /// Quality report of the current assignment.
    ScheduleScore evaluate() const;

    const IOptimizer& optimizer() const { return *optimizer_; }

private:
    AssignmentStore& store_;
    std::unique_ptr<IOptimizer> optimizer_;

    /// Guards the in-flight optimizer run. Never held while taking the store mutex.
    mutable std::mutex computeMutex_;
    CancelFlag running_;
    uint64_t ticket_ = 0;

    CommandResult runOptimizer(const Caller& caller, bool seeded);

    /**
     * @brief Role check plus one store transaction.
     *
     * The mutator records the slots it changes in @p touched. On success the
     * result carries them and the new version; on failure nothing.
     */
    CommandResult execute(const char* op, const Caller& caller, ExpectedVersion expected,
                          const std::function<std::optional<CommandError>(StoreDraft&, std::vector<SlotState>&)>& mutator);
};
