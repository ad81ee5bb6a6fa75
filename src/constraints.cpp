///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>


///////////////////////////
///     INVARIANTS      ///
///////////////////////////
const char* toString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::DUPLICATE_SLOT:     return "DUPLICATE_SLOT";
        case ViolationKind::DUPLICATE_SESSION:  return "DUPLICATE_SESSION";
        case ViolationKind::BLOCKED_SLOT:       return "BLOCKED_SLOT";
        case ViolationKind::DANGLING_REFERENCE: return "DANGLING_REFERENCE";
    }
    return "UNKNOWN";
}

/**
 * @brief Check referential integrity, blocked slots and the bijection.
 *
 * Each pass walks the entry list once; the catalog lookups are linear, which
 * is fine for the size of an unconference (tens of rooms and timeslots).
 */
std::optional<Violation> validateAssignment(const Assignment& assignment, const Catalog& catalog) {
    // Referential integrity first: later checks assume the entities exist.
    for (const AssignmentEntry& e : assignment.entries) {
        if (!catalog.findRoom(e.slot.roomId)) {
            std::ostringstream ss;
            ss << "entry for session " << e.sessionId << " references unknown room " << e.slot.roomId;
            return Violation{ViolationKind::DANGLING_REFERENCE, ss.str()};
        }
        if (!catalog.findTimeslot(e.slot.timeslotId)) {
            std::ostringstream ss;
            ss << "entry for session " << e.sessionId << " references unknown timeslot " << e.slot.timeslotId;
            return Violation{ViolationKind::DANGLING_REFERENCE, ss.str()};
        }
        if (!catalog.findSession(e.sessionId)) {
            std::ostringstream ss;
            ss << "slot (room " << e.slot.roomId << ", timeslot " << e.slot.timeslotId
               << ") references unknown session " << e.sessionId;
            return Violation{ViolationKind::DANGLING_REFERENCE, ss.str()};
        }
    }

    for (const AssignmentEntry& e : assignment.entries) {
        const Timeslot* t = catalog.findTimeslot(e.slot.timeslotId);
        if (t->isBlocked()) {
            std::ostringstream ss;
            ss << "session " << e.sessionId << " placed in blocked timeslot " << t->id
               << " (" << *t->blockedReason << ")";
            return Violation{ViolationKind::BLOCKED_SLOT, ss.str()};
        }
    }

    std::set<Slot> seenSlots;
    for (const AssignmentEntry& e : assignment.entries) {
        if (!seenSlots.insert(e.slot).second) {
            std::ostringstream ss;
            ss << "slot (room " << e.slot.roomId << ", timeslot " << e.slot.timeslotId
               << ") holds more than one session";
            return Violation{ViolationKind::DUPLICATE_SLOT, ss.str()};
        }
    }

    std::set<int> seenSessions;
    for (const AssignmentEntry& e : assignment.entries) {
        if (!seenSessions.insert(e.sessionId).second) {
            std::ostringstream ss;
            ss << "session " << e.sessionId << " is booked in more than one slot";
            return Violation{ViolationKind::DUPLICATE_SESSION, ss.str()};
        }
    }

    return std::nullopt;
}


///////////////////////////
///    SEARCH  STATE    ///
///////////////////////////
/**
 * @brief Snapshot the catalog into optimizer input.
 *
 * Sessions are ordered by votes descending and id ascending, which is both
 * the construction order and the tie-break order of the whole optimizer.
 */
ScheduleInstance ScheduleInstance::fromCatalog(const Catalog& catalog) {
    ScheduleInstance inst;
    inst.slots = catalog.eligibleSlots();
    inst.sessions = catalog.sessions;
    std::sort(inst.sessions.begin(), inst.sessions.end(),
              [](const Session& a, const Session& b) {
                  if (a.votes != b.votes) return a.votes > b.votes;
                  return a.id < b.id;
              });
    return inst;
}

/**
 * Slots come in canonical order, so each run of equal timeslot ids is one row.
 */
SearchState::SearchState(const ScheduleInstance& inst) : inst_(inst) {
    slotSession_.assign(inst.slots.size(), kNone);
    sessionSlot_.assign(inst.sessions.size(), kNone);
    pinned_.assign(inst.slots.size(), 0);

    slotRow_.resize(inst.slots.size());
    for (size_t s = 0; s < inst.slots.size(); ++s) {
        if (s > 0 && inst.slots[s].timeslotId != inst.slots[s - 1].timeslotId) ++rowCount_;
        slotRow_[s] = rowCount_;
    }
    if (!inst.slots.empty()) ++rowCount_;
}

bool SearchState::place(int sessionIndex, int slotIndex) {
    if (sessionIndex < 0 || sessionIndex >= sessionCount()) return false;
    if (slotIndex < 0 || slotIndex >= slotCount()) return false;
    if (slotSession_[slotIndex] != kNone) return false;
    if (sessionSlot_[sessionIndex] != kNone) return false;

    slotSession_[slotIndex] = sessionIndex;
    sessionSlot_[sessionIndex] = slotIndex;
    totalVotes_ += votesOf(sessionIndex);
    return true;
}

void SearchState::undo(int sessionIndex, int slotIndex) {
    if (slotSession_[slotIndex] != sessionIndex) return;
    slotSession_[slotIndex] = kNone;
    sessionSlot_[sessionIndex] = kNone;
    totalVotes_ -= votesOf(sessionIndex);
}

void SearchState::swapSlots(int slotA, int slotB) {
    int sessionA = slotSession_[slotA];
    int sessionB = slotSession_[slotB];
    slotSession_[slotA] = sessionB;
    slotSession_[slotB] = sessionA;
    if (sessionA != kNone) sessionSlot_[sessionA] = slotB;
    if (sessionB != kNone) sessionSlot_[sessionB] = slotA;
}

void SearchState::exchange(int slotIndex, int unplacedSessionIndex) {
    int displaced = slotSession_[slotIndex];
    if (displaced != kNone) {
        undo(displaced, slotIndex);
    }
    place(unplacedSessionIndex, slotIndex);
}

int SearchState::seed(const Assignment& assignment, bool pin) {
    int skipped = 0;
    for (const AssignmentEntry& e : assignment.entries) {
        int slotIdx = slotIndex(e.slot);
        int sessionIdx = sessionIndex(e.sessionId);
        if (slotIdx == kNone || sessionIdx == kNone || !place(sessionIdx, slotIdx)) {
            ++skipped;
            continue;
        }
        if (pin) pinned_[slotIdx] = 1;
    }
    return skipped;
}

/**
 * @brief Emit the placed sessions as assignment entries.
 *
 * Slots are walked in instance order, which is canonical order, so the
 * result needs no further sorting.
 */
Assignment SearchState::toAssignment() const {
    Assignment out;
    for (int s = 0; s < slotCount(); ++s) {
        int sessionIdx = slotSession_[s];
        if (sessionIdx == kNone) continue;
        out.entries.push_back(AssignmentEntry{inst_.slots[s], inst_.sessions[sessionIdx].id});
    }
    return out;
}

int SearchState::slotIndex(const Slot& slot) const {
    for (int i = 0; i < (int)inst_.slots.size(); ++i)
        if (inst_.slots[i] == slot)
            return i;
    return kNone;
}

int SearchState::sessionIndex(int sessionId) const {
    for (int i = 0; i < (int)inst_.sessions.size(); ++i)
        if (inst_.sessions[i].id == sessionId)
            return i;
    return kNone;
}
