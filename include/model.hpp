#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief A talk proposal submitted to the unconference.
 *
 * Vote counts come from the external vote store and are treated as read-only
 * input by the scheduler.
 */
struct Session {
    int id; ///< Unique session identifier.
    std::string title; ///< Short human-readable title.
    std::string body; ///< Proposal text.
    int votes; ///< Number of attendee votes (non-negative).
    std::optional<std::string> tag; ///< Optional single topic tag.
    int ownerId; ///< Id of the user who submitted the proposal.
};

/**
 * @brief A room sessions can be held in.
 */
struct Room {
    int id; ///< Unique room identifier.
    std::string name; ///< Room name/label (e.g., "Main Hall").
    std::string location; ///< Free-form location label (floor, building).
    int availableSpots; ///< Capacity; informational only, not enforced by scheduling.
};

/**
 * @brief A time window shared by all rooms.
 *
 * Times are minutes since midnight. A blocked timeslot (lunch, keynote)
 * carries the reason it is not schedulable and never receives sessions.
 */
struct Timeslot {
    int id; ///< Unique timeslot identifier.
    int startMinute; ///< Start time in minutes since midnight.
    int endMinute; ///< End time in minutes since midnight.
    std::optional<std::string> blockedReason; ///< Set iff the timeslot is blocked.

    int duration() const { return endMinute - startMinute; }
    bool isBlocked() const { return blockedReason.has_value(); }
};

/**
 * @brief The atomic schedulable unit: one room during one timeslot.
 */
struct Slot {
    int roomId; ///< Room of the slot.
    int timeslotId; ///< Timeslot of the slot.

    bool operator==(const Slot& other) const {
        return roomId == other.roomId && timeslotId == other.timeslotId;
    }
    bool operator!=(const Slot& other) const { return !(*this == other); }

    /// Id-based ordering, used for keyed containers only (not the display order).
    bool operator<(const Slot& other) const {
        if (timeslotId != other.timeslotId) return timeslotId < other.timeslotId;
        return roomId < other.roomId;
    }
};

/**
 * @brief One mapping of the assignment: a session placed in a slot.
 */
struct AssignmentEntry {
    Slot slot; ///< Where the session takes place.
    int sessionId; ///< Which session takes place there.

    bool operator==(const AssignmentEntry& other) const {
        return slot == other.slot && sessionId == other.sessionId;
    }
    bool operator!=(const AssignmentEntry& other) const { return !(*this == other); }
};

/**
 * @brief Partial injective mapping from slots to sessions.
 *
 * Stored as a flat entry list so that a malformed candidate (duplicate slot,
 * double-booked session) can be represented and rejected by the validator.
 * Committed assignments are kept in canonical slot order.
 */
struct Assignment {
    std::vector<AssignmentEntry> entries; ///< Entries in canonical slot order once committed.

    /// Session placed at the slot, if any.
    std::optional<int> sessionAt(const Slot& slot) const;

    /// Slot the session is placed in, if any.
    std::optional<Slot> slotOf(int sessionId) const;

    /// Remove the entry at the slot; returns true if one was removed.
    bool removeAt(const Slot& slot);

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }

    bool operator==(const Assignment& other) const { return entries == other.entries; }
    bool operator!=(const Assignment& other) const { return !(*this == other); }
};

/**
 * @brief Everything the scheduler knows about one unconference.
 *
 * Rooms and timeslots come from the organizer's catalog management, sessions
 * and votes from the session store.
 */
struct Catalog {
    std::vector<Room> rooms; ///< All rooms.
    std::vector<Timeslot> timeslots; ///< All timeslots, blocked ones included.
    std::vector<Session> sessions; ///< All sessions with their current votes.

    const Room* findRoom(int id) const;
    const Timeslot* findTimeslot(int id) const;
    const Session* findSession(int id) const;

    /// Whether both the room and the timeslot of the slot exist.
    bool hasSlot(const Slot& slot) const;

    /**
     * @brief All schedulable slots in canonical order.
     *
     * Cartesian product of non-blocked timeslots and rooms, ordered by
     * timeslot start time, then timeslot id, then room id.
     */
    std::vector<Slot> eligibleSlots() const;

    /**
     * @brief Strict weak ordering of slots in canonical order.
     *
     * Slots referencing unknown timeslots sort after all known ones.
     */
    bool slotPrecedes(const Slot& a, const Slot& b) const;

    /// Sort the entries of an assignment into canonical slot order.
    void sortCanonical(Assignment& assignment) const;
};

/**
 * @brief Role of a caller, as supplied by the identity collaborator.
 */
enum class Role { VIEWER, FACILITATOR, ADMIN };

/**
 * @brief Identity of whoever issues a command.
 */
struct Caller {
    int userId; ///< Authenticated user id.
    Role role; ///< Role resolved by the identity collaborator.

    /// Only facilitators and admins may change the schedule.
    bool canEdit() const { return role == Role::FACILITATOR || role == Role::ADMIN; }
};
