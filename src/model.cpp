///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <algorithm>
#include <limits>


///////////////////////////
///     ASSIGNMENT      ///
///////////////////////////
std::optional<int> Assignment::sessionAt(const Slot& slot) const {
    for (const AssignmentEntry& e : entries) {
        if (e.slot == slot) return e.sessionId;
    }
    return std::nullopt;
}

std::optional<Slot> Assignment::slotOf(int sessionId) const {
    for (const AssignmentEntry& e : entries) {
        if (e.sessionId == sessionId) return e.slot;
    }
    return std::nullopt;
}

bool Assignment::removeAt(const Slot& slot) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const AssignmentEntry& e) { return e.slot == slot; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}


///////////////////////////
///       CATALOG       ///
///////////////////////////
const Room* Catalog::findRoom(int id) const {
    for (const Room& r : rooms)
        if (r.id == id) return &r;
    return nullptr;
}

const Timeslot* Catalog::findTimeslot(int id) const {
    for (const Timeslot& t : timeslots)
        if (t.id == id) return &t;
    return nullptr;
}

const Session* Catalog::findSession(int id) const {
    for (const Session& s : sessions)
        if (s.id == id) return &s;
    return nullptr;
}

bool Catalog::hasSlot(const Slot& slot) const {
    return findRoom(slot.roomId) != nullptr && findTimeslot(slot.timeslotId) != nullptr;
}

/**
 * @brief Enumerate every (room, timeslot) pair that may receive a session.
 *
 * Blocked timeslots are skipped. The result follows canonical slot order so
 * that construction and "first free slot" lookups are deterministic.
 */
std::vector<Slot> Catalog::eligibleSlots() const {
    std::vector<const Timeslot*> open;
    for (const Timeslot& t : timeslots) {
        if (!t.isBlocked()) open.push_back(&t);
    }
    std::sort(open.begin(), open.end(), [](const Timeslot* a, const Timeslot* b) {
        if (a->startMinute != b->startMinute) return a->startMinute < b->startMinute;
        return a->id < b->id;
    });

    std::vector<int> roomIds;
    roomIds.reserve(rooms.size());
    for (const Room& r : rooms) roomIds.push_back(r.id);
    std::sort(roomIds.begin(), roomIds.end());

    std::vector<Slot> slots;
    slots.reserve(open.size() * roomIds.size());
    for (const Timeslot* t : open) {
        for (int roomId : roomIds) {
            slots.push_back(Slot{roomId, t->id});
        }
    }
    return slots;
}

bool Catalog::slotPrecedes(const Slot& a, const Slot& b) const {
    // Unknown timeslots get the largest start so dangling entries sort last.
    auto startOf = [&](int timeslotId) -> int {
        const Timeslot* t = findTimeslot(timeslotId);
        return t ? t->startMinute : std::numeric_limits<int>::max();
    };
    int startA = startOf(a.timeslotId);
    int startB = startOf(b.timeslotId);
    if (startA != startB) return startA < startB;
    if (a.timeslotId != b.timeslotId) return a.timeslotId < b.timeslotId;
    return a.roomId < b.roomId;
}

void Catalog::sortCanonical(Assignment& assignment) const {
    std::stable_sort(assignment.entries.begin(), assignment.entries.end(),
                     [this](const AssignmentEntry& x, const AssignmentEntry& y) {
                         return slotPrecedes(x.slot, y.slot);
                     });
}
