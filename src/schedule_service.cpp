///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_service.hpp"
#include "constraints.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string describeSlot(const Slot& slot) {
    std::ostringstream out;
    out << "(room " << slot.roomId << ", timeslot " << slot.timeslotId << ")";
    return out.str();
}

static CommandError makeError(ErrorKind kind, const std::string& message) {
    return CommandError{kind, message};
}

/// NOT_FOUND unless both the room and the timeslot of the slot exist.
static std::optional<CommandError> requireSlot(const Catalog& catalog, const Slot& slot) {
    if (!catalog.findRoom(slot.roomId)) {
        return makeError(ErrorKind::NOT_FOUND, "room " + std::to_string(slot.roomId) + " does not exist");
    }
    if (!catalog.findTimeslot(slot.timeslotId)) {
        return makeError(ErrorKind::NOT_FOUND, "timeslot " + std::to_string(slot.timeslotId) + " does not exist");
    }
    return std::nullopt;
}

/// SLOT_BLOCKED if the slot's timeslot is blocked. The slot must exist.
static std::optional<CommandError> requireOpen(const Catalog& catalog, const Slot& slot) {
    const Timeslot* t = catalog.findTimeslot(slot.timeslotId);
    if (t && t->isBlocked()) {
        return makeError(ErrorKind::SLOT_BLOCKED,
                         "timeslot " + std::to_string(t->id) + " is blocked: " + *t->blockedReason);
    }
    return std::nullopt;
}

/**
 * @brief Remove every entry matching the predicate, recording the freed slots.
 */
template <typename Pred>
static void evictWhere(Assignment& assignment, Pred pred, std::vector<SlotState>& touched) {
    for (const AssignmentEntry& e : assignment.entries) {
        if (pred(e)) touched.push_back(SlotState{e.slot, std::nullopt});
    }
    assignment.entries.erase(std::remove_if(assignment.entries.begin(), assignment.entries.end(), pred),
                             assignment.entries.end());
}


///////////////////////////
///       SERVICE       ///
///////////////////////////
ScheduleService::ScheduleService(AssignmentStore& store, std::unique_ptr<IOptimizer> optimizer)
        : store_(store),
          optimizer_(std::move(optimizer)) {}

CommandResult ScheduleService::execute(
        const char* op, const Caller& caller, ExpectedVersion expected,
        const std::function<std::optional<CommandError>(StoreDraft&, std::vector<SlotState>&)>& mutator) {
    if (!caller.canEdit()) {
        LogLine(LogLevel::DEBUG, "service") << op << " denied for user " << caller.userId;
        return CommandResult::failure(ErrorKind::PERMISSION_DENIED,
                                      "only facilitators and admins may change the schedule",
                                      store_.assignmentVersion());
    }

    std::vector<SlotState> touched;
    CommitOutcome outcome = store_.transact([&](StoreDraft& draft) -> std::optional<CommandError> {
        if (expected && *expected != draft.assignmentVersion) {
            return makeError(ErrorKind::CONFLICT,
                             "schedule changed (version " + std::to_string(draft.assignmentVersion) +
                             ", expected " + std::to_string(*expected) + "); refresh and retry");
        }
        return mutator(draft, touched);
    });

    CommandResult result;
    result.version = outcome.assignmentVersion;
    if (outcome.error) {
        LogLine(LogLevel::DEBUG, "service") << op << " rejected (" << toString(outcome.error->kind)
                                            << "): " << outcome.error->message;
        result.error = std::move(outcome.error);
        return result;
    }

    LogLine(LogLevel::DEBUG, "service") << op << (outcome.committed ? " committed" : " changed nothing")
                                        << " by user " << caller.userId << ", version " << result.version;
    result.touched = std::move(touched);
    return result;
}


///////////////////////////
///     GENERATION      ///
///////////////////////////
CommandResult ScheduleService::generate(const Caller& caller) {
    return runOptimizer(caller, false);
}

CommandResult ScheduleService::improve(const Caller& caller) {
    return runOptimizer(caller, true);
}

/**
 * @brief Snapshot, optimize off-lock, then commit if still current.
 *
 * Registering the run cancels the previous one. The ticket is re-checked
 * inside the commit transaction, so a run superseded after its search
 * finished still commits nothing. Only structural catalog changes (rooms,
 * timeslots, the session set) void the result; vote refreshes do not. A
 * back end that throws yields OPTIMIZER_FAILED.
 */
CommandResult ScheduleService::runOptimizer(const Caller& caller, bool seeded) {
    const char* op = seeded ? "improve" : "generate";
    if (!caller.canEdit()) {
        LogLine(LogLevel::DEBUG, "service") << op << " denied for user " << caller.userId;
        return CommandResult::failure(ErrorKind::PERMISSION_DENIED,
                                      "only facilitators and admins may generate the schedule",
                                      store_.assignmentVersion());
    }

    StoreSnapshot snap = store_.snapshot();

    CancelFlag cancel = makeCancelFlag();
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(computeMutex_);
        if (running_) running_->store(true);
        running_ = cancel;
        ticket = ++ticket_;
    }

    ScheduleInstance inst = ScheduleInstance::fromCatalog(*snap.catalog);
    const auto start = std::chrono::steady_clock::now();
    OptimizerResult run;
    std::optional<std::string> failure;
    try {
        run = optimizer_->optimize(inst, seeded ? &snap.assignment : nullptr, cancel);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

    CommitOutcome outcome;
    if (failure) {
        LogLine(LogLevel::ERROR, "service") << op << ": " << optimizer_->name() << " optimizer failed: " << *failure;
        outcome.error = makeError(ErrorKind::OPTIMIZER_FAILED, std::string(op) + " failed: " + *failure);
        outcome.assignmentVersion = store_.assignmentVersion();
    } else if (run.cancelled) {
        outcome.error = makeError(ErrorKind::CANCELLED, std::string(op) + " superseded by a newer request");
        outcome.assignmentVersion = store_.assignmentVersion();
    } else {
        outcome = store_.transact([&](StoreDraft& draft) -> std::optional<CommandError> {
            {
                std::lock_guard<std::mutex> lock(computeMutex_);
                if (ticket != ticket_) {
                    return makeError(ErrorKind::CANCELLED, std::string(op) + " superseded by a newer request");
                }
            }
            if (draft.structureVersion != snap.structureVersion) {
                return makeError(ErrorKind::CONFLICT, "catalog changed while the schedule was computed; retry");
            }
            if (seeded && draft.assignmentVersion != snap.assignmentVersion) {
                return makeError(ErrorKind::CONFLICT, "schedule edited while it was being improved; retry");
            }
            draft.assignment = run.assignment;
            return std::nullopt;
        });
    }

    {
        std::lock_guard<std::mutex> lock(computeMutex_);
        if (running_ == cancel) running_.reset();
    }

    CommandResult result;
    result.version = outcome.assignmentVersion;
    if (outcome.error) {
        LogLine(LogLevel::INFO, "service") << op << " rejected (" << toString(outcome.error->kind)
                                           << ") after " << elapsedMs << " ms: " << outcome.error->message;
        result.error = std::move(outcome.error);
        return result;
    }

    LogLine(LogLevel::INFO, "service") << op << " committed " << run.assignment.size() << " entries, "
                                       << run.totalVotes << " votes, " << run.iterations << " moves in "
                                       << elapsedMs << " ms (" << optimizer_->name()
                                       << (run.budgetExhausted ? ", budget exhausted" : "")
                                       << "), version " << result.version;
    result.assignment = std::move(run.assignment);
    return result;
}


///////////////////////////
///     POINT EDITS     ///
///////////////////////////
CommandResult ScheduleService::clear(const Caller& caller, ExpectedVersion expected) {
    CommandResult result = execute("clear", caller, expected,
                                   [](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        evictWhere(draft.assignment, [](const AssignmentEntry&) { return true; }, touched);
        return std::nullopt;
    });
    if (result.ok()) result.assignment = Assignment{};
    return result;
}

CommandResult ScheduleService::move(const Caller& caller, const Slot& from, const Slot& to,
                                    ExpectedVersion expected) {
    return execute("move", caller, expected,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        const Catalog& catalog = draft.catalog();
        if (auto err = requireSlot(catalog, from)) return err;
        if (auto err = requireSlot(catalog, to)) return err;
        if (auto err = requireOpen(catalog, to)) return err;

        std::optional<int> moving = draft.assignment.sessionAt(from);
        if (!moving) {
            return makeError(ErrorKind::NOT_FOUND, "no session at " + describeSlot(from));
        }
        if (from == to) {
            draft.unchanged = true;
            touched.push_back(SlotState{from, moving});
            return std::nullopt;
        }

        std::optional<int> displaced = draft.assignment.sessionAt(to);
        for (AssignmentEntry& e : draft.assignment.entries) {
            if (e.slot == from) {
                e.slot = to;
            } else if (displaced && e.slot == to) {
                e.slot = from;
            }
        }
        touched.push_back(SlotState{from, displaced});
        touched.push_back(SlotState{to, moving});
        return std::nullopt;
    });
}

CommandResult ScheduleService::swap(const Caller& caller, const Slot& a, const Slot& b,
                                    ExpectedVersion expected) {
    return execute("swap", caller, expected,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        const Catalog& catalog = draft.catalog();
        if (auto err = requireSlot(catalog, a)) return err;
        if (auto err = requireSlot(catalog, b)) return err;
        if (auto err = requireOpen(catalog, a)) return err;
        if (auto err = requireOpen(catalog, b)) return err;

        std::optional<int> first = draft.assignment.sessionAt(a);
        std::optional<int> second = draft.assignment.sessionAt(b);
        if (!first) return makeError(ErrorKind::NOT_FOUND, "no session at " + describeSlot(a));
        if (!second) return makeError(ErrorKind::NOT_FOUND, "no session at " + describeSlot(b));
        if (!catalog.findSession(*first)) {
            return makeError(ErrorKind::NOT_FOUND, "session " + std::to_string(*first) + " no longer exists");
        }
        if (!catalog.findSession(*second)) {
            return makeError(ErrorKind::NOT_FOUND, "session " + std::to_string(*second) + " no longer exists");
        }
        if (a == b) {
            draft.unchanged = true;
            touched.push_back(SlotState{a, first});
            return std::nullopt;
        }

        for (AssignmentEntry& e : draft.assignment.entries) {
            if (e.slot == a) {
                e.slot = b;
            } else if (e.slot == b) {
                e.slot = a;
            }
        }
        touched.push_back(SlotState{a, second});
        touched.push_back(SlotState{b, first});
        return std::nullopt;
    });
}

CommandResult ScheduleService::place(const Caller& caller, int sessionId, const Slot& slot,
                                     ExpectedVersion expected) {
    return execute("place", caller, expected,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        const Catalog& catalog = draft.catalog();
        if (!catalog.findSession(sessionId)) {
            return makeError(ErrorKind::NOT_FOUND, "session " + std::to_string(sessionId) + " does not exist");
        }
        if (auto err = requireSlot(catalog, slot)) return err;
        if (auto err = requireOpen(catalog, slot)) return err;
        if (std::optional<Slot> current = draft.assignment.slotOf(sessionId)) {
            return makeError(ErrorKind::ALREADY_SCHEDULED,
                             "session " + std::to_string(sessionId) + " is already at " + describeSlot(*current));
        }
        if (std::optional<int> occupant = draft.assignment.sessionAt(slot)) {
            return makeError(ErrorKind::CONFLICT, describeSlot(slot) + " is taken by session " +
                                                  std::to_string(*occupant) + "; refresh and retry");
        }

        draft.assignment.entries.push_back(AssignmentEntry{slot, sessionId});
        touched.push_back(SlotState{slot, sessionId});
        return std::nullopt;
    });
}

CommandResult ScheduleService::addToSchedule(const Caller& caller, int sessionId, ExpectedVersion expected) {
    return execute("addToSchedule", caller, expected,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        const Catalog& catalog = draft.catalog();
        if (!catalog.findSession(sessionId)) {
            return makeError(ErrorKind::NOT_FOUND, "session " + std::to_string(sessionId) + " does not exist");
        }
        if (std::optional<Slot> current = draft.assignment.slotOf(sessionId)) {
            return makeError(ErrorKind::ALREADY_SCHEDULED,
                             "session " + std::to_string(sessionId) + " is already at " + describeSlot(*current));
        }

        for (const Slot& slot : catalog.eligibleSlots()) {
            if (!draft.assignment.sessionAt(slot)) {
                draft.assignment.entries.push_back(AssignmentEntry{slot, sessionId});
                touched.push_back(SlotState{slot, sessionId});
                return std::nullopt;
            }
        }
        return makeError(ErrorKind::SCHEDULE_FULL, "no free slot left for session " + std::to_string(sessionId));
    });
}

CommandResult ScheduleService::unassign(const Caller& caller, const Slot& slot, ExpectedVersion expected) {
    return execute("unassign", caller, expected,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        if (!draft.assignment.removeAt(slot)) {
            return makeError(ErrorKind::NOT_FOUND, "no session at " + describeSlot(slot));
        }
        touched.push_back(SlotState{slot, std::nullopt});
        return std::nullopt;
    });
}


///////////////////////////
///    CATALOG EDITS    ///
///////////////////////////
CommandResult ScheduleService::addRoom(const Caller& caller, const Room& room) {
    return execute("addRoom", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>&) -> std::optional<CommandError> {
        if (draft.catalog().findRoom(room.id)) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "room " + std::to_string(room.id) + " already exists");
        }
        if (room.availableSpots < 0) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "room capacity must not be negative");
        }
        draft.editCatalog().rooms.push_back(room);
        return std::nullopt;
    });
}

CommandResult ScheduleService::removeRoom(const Caller& caller, int roomId) {
    return execute("removeRoom", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        if (!draft.catalog().findRoom(roomId)) {
            return makeError(ErrorKind::NOT_FOUND, "room " + std::to_string(roomId) + " does not exist");
        }
        std::vector<Room>& rooms = draft.editCatalog().rooms;
        rooms.erase(std::remove_if(rooms.begin(), rooms.end(), [&](const Room& r) { return r.id == roomId; }),
                    rooms.end());
        evictWhere(draft.assignment, [&](const AssignmentEntry& e) { return e.slot.roomId == roomId; }, touched);
        return std::nullopt;
    });
}

CommandResult ScheduleService::addTimeslot(const Caller& caller, const Timeslot& timeslot) {
    return execute("addTimeslot", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>&) -> std::optional<CommandError> {
        if (draft.catalog().findTimeslot(timeslot.id)) {
            return makeError(ErrorKind::INVALID_ARGUMENT,
                             "timeslot " + std::to_string(timeslot.id) + " already exists");
        }
        if (timeslot.endMinute <= timeslot.startMinute) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "timeslot must end after it starts");
        }
        if (timeslot.blockedReason && timeslot.blockedReason->empty()) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "a blocked timeslot needs a reason");
        }
        draft.editCatalog().timeslots.push_back(timeslot);
        return std::nullopt;
    });
}

CommandResult ScheduleService::removeTimeslot(const Caller& caller, int timeslotId) {
    return execute("removeTimeslot", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        if (!draft.catalog().findTimeslot(timeslotId)) {
            return makeError(ErrorKind::NOT_FOUND, "timeslot " + std::to_string(timeslotId) + " does not exist");
        }
        std::vector<Timeslot>& timeslots = draft.editCatalog().timeslots;
        timeslots.erase(std::remove_if(timeslots.begin(), timeslots.end(),
                                       [&](const Timeslot& t) { return t.id == timeslotId; }),
                        timeslots.end());
        evictWhere(draft.assignment, [&](const AssignmentEntry& e) { return e.slot.timeslotId == timeslotId; },
                   touched);
        return std::nullopt;
    });
}

CommandResult ScheduleService::blockTimeslot(const Caller& caller, int timeslotId, const std::string& reason) {
    return execute("blockTimeslot", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        if (!draft.catalog().findTimeslot(timeslotId)) {
            return makeError(ErrorKind::NOT_FOUND, "timeslot " + std::to_string(timeslotId) + " does not exist");
        }
        if (reason.empty()) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "a blocked timeslot needs a reason");
        }
        for (Timeslot& t : draft.editCatalog().timeslots) {
            if (t.id == timeslotId) t.blockedReason = reason;
        }
        evictWhere(draft.assignment, [&](const AssignmentEntry& e) { return e.slot.timeslotId == timeslotId; },
                   touched);
        return std::nullopt;
    });
}

CommandResult ScheduleService::unblockTimeslot(const Caller& caller, int timeslotId) {
    return execute("unblockTimeslot", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>&) -> std::optional<CommandError> {
        const Timeslot* t = draft.catalog().findTimeslot(timeslotId);
        if (!t) {
            return makeError(ErrorKind::NOT_FOUND, "timeslot " + std::to_string(timeslotId) + " does not exist");
        }
        if (!t->isBlocked()) {
            draft.unchanged = true;
            return std::nullopt;
        }
        for (Timeslot& edit : draft.editCatalog().timeslots) {
            if (edit.id == timeslotId) edit.blockedReason.reset();
        }
        return std::nullopt;
    });
}

CommandResult ScheduleService::upsertSession(const Caller& caller, const Session& session) {
    return execute("upsertSession", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>&) -> std::optional<CommandError> {
        if (session.votes < 0) {
            return makeError(ErrorKind::INVALID_ARGUMENT, "vote count must not be negative");
        }
        std::vector<Session>& sessions = draft.editCatalog().sessions;
        auto it = std::find_if(sessions.begin(), sessions.end(),
                               [&](const Session& s) { return s.id == session.id; });
        if (it != sessions.end()) {
            *it = session;
        } else {
            sessions.push_back(session);
        }
        return std::nullopt;
    });
}

CommandResult ScheduleService::removeSession(const Caller& caller, int sessionId) {
    return execute("removeSession", caller, std::nullopt,
                   [&](StoreDraft& draft, std::vector<SlotState>& touched) -> std::optional<CommandError> {
        if (!draft.catalog().findSession(sessionId)) {
            return makeError(ErrorKind::NOT_FOUND, "session " + std::to_string(sessionId) + " does not exist");
        }
        std::vector<Session>& sessions = draft.editCatalog().sessions;
        sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                      [&](const Session& s) { return s.id == sessionId; }),
                       sessions.end());
        evictWhere(draft.assignment, [&](const AssignmentEntry& e) { return e.sessionId == sessionId; }, touched);
        return std::nullopt;
    });
}


///////////////////////////
///        READS        ///
///////////////////////////
StoreSnapshot ScheduleService::snapshot() const {
    return store_.snapshot();
}

Assignment ScheduleService::assignment() const {
    return store_.snapshot().assignment;
}

std::vector<Session> ScheduleService::unassignedSessions() const {
    StoreSnapshot snap = store_.snapshot();
    std::vector<Session> result;
    for (const Session& s : snap.catalog->sessions) {
        if (!snap.assignment.slotOf(s.id)) result.push_back(s);
    }
    std::sort(result.begin(), result.end(), [](const Session& a, const Session& b) {
        if (a.votes != b.votes) return a.votes > b.votes;
        return a.id < b.id;
    });
    return result;
}

std::vector<Slot> ScheduleService::freeSlots() const {
    StoreSnapshot snap = store_.snapshot();
    std::vector<Slot> result;
    for (const Slot& slot : snap.catalog->eligibleSlots()) {
        if (!snap.assignment.sessionAt(slot)) result.push_back(slot);
    }
    return result;
}

ScheduleScore ScheduleService::evaluate() const {
    StoreSnapshot snap = store_.snapshot();
    return scoreAssignment(snap.assignment, *snap.catalog);
}
