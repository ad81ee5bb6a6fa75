///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/// Width of one room column in the grid.
static const int kCellWidth = 22;

/// Width of the time column in the grid.
static const int kTimeWidth = 11;

/**
 * @brief Cut a label to the cell width, marking the cut with "~".
 */
static std::string fitCell(const std::string& text) {
    if ((int)text.size() <= kCellWidth) return text;
    return text.substr(0, kCellWidth - 1) + "~";
}

std::string formatMinutes(int minutes) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << (minutes / 60) << ":"
        << std::setfill('0') << std::setw(2) << (minutes % 60);
    return out.str();
}

std::string formatSlot(const Catalog& catalog, const Slot& slot) {
    const Room* room = catalog.findRoom(slot.roomId);
    const Timeslot* ts = catalog.findTimeslot(slot.timeslotId);
    std::string roomName = room ? room->name : "room " + std::to_string(slot.roomId);
    std::string time = ts ? formatMinutes(ts->startMinute) : "timeslot " + std::to_string(slot.timeslotId);
    return roomName + " @ " + time;
}

/**
 * @brief Print the header row: time column plus one column per room.
 */
static void printGridHeader(const std::vector<const Room*>& rooms, std::ostream& out) {
    out << "    " << std::left << std::setw(kTimeWidth) << "Time";
    for (const Room* r : rooms) {
        out << " | " << std::left << std::setw(kCellWidth) << fitCell(r->name);
    }
    out << "\n";

    // Underline with a matching ASCII separator line.
    out << "    " << std::string(kTimeWidth, '-');
    for (size_t i = 0; i < rooms.size(); ++i) {
        out << "-+-" << std::string(kCellWidth, '-');
    }
    out << "\n";
}

/**
 * @brief Print the timetable grid and the unassigned sessions.
 *
 * Rows follow timeslot start order, columns room id order, so the grid reads
 * in canonical slot order left to right, top to bottom.
 */
void printSchedule(const Catalog& catalog, const Assignment& assignment, std::ostream& out) {
    std::vector<const Room*> rooms;
    for (const Room& r : catalog.rooms) rooms.push_back(&r);
    std::sort(rooms.begin(), rooms.end(), [](const Room* a, const Room* b) { return a->id < b->id; });

    std::vector<const Timeslot*> timeslots;
    for (const Timeslot& t : catalog.timeslots) timeslots.push_back(&t);
    std::sort(timeslots.begin(), timeslots.end(), [](const Timeslot* a, const Timeslot* b) {
        if (a->startMinute != b->startMinute) return a->startMinute < b->startMinute;
        return a->id < b->id;
    });

    out << "----------------------------------------\n";
    out << "Schedule (" << assignment.size() << " of " << catalog.sessions.size() << " sessions placed):\n\n";

    if (rooms.empty() || timeslots.empty()) {
        out << "  (no rooms or timeslots)\n";
    } else {
        printGridHeader(rooms, out);

        for (const Timeslot* t : timeslots) {
            std::string range = formatMinutes(t->startMinute) + "-" + formatMinutes(t->endMinute);
            out << "    " << std::left << std::setw(kTimeWidth) << range;

            if (t->isBlocked()) {
                out << " | [blocked: " << *t->blockedReason << "]\n";
                continue;
            }

            for (const Room* r : rooms) {
                std::string cell = "-";
                if (std::optional<int> sessionId = assignment.sessionAt(Slot{r->id, t->id})) {
                    const Session* s = catalog.findSession(*sessionId);
                    // Fallback label makes a dangling entry obvious in the printout.
                    cell = s ? s->title + " (" + std::to_string(s->votes) + ")"
                             : "UnknownSession#" + std::to_string(*sessionId);
                }
                out << " | " << std::left << std::setw(kCellWidth) << fitCell(cell);
            }
            out << "\n";
        }
    }

    std::vector<const Session*> unassigned;
    for (const Session& s : catalog.sessions) {
        if (!assignment.slotOf(s.id)) unassigned.push_back(&s);
    }
    std::sort(unassigned.begin(), unassigned.end(), [](const Session* a, const Session* b) {
        if (a->votes != b->votes) return a->votes > b->votes;
        return a->id < b->id;
    });

    out << "\n";
    if (unassigned.empty()) {
        out << "  (every session has a slot)\n";
    } else {
        out << "  Unassigned:\n";
        for (const Session* s : unassigned) {
            out << "    #" << s->id << " " << s->title << " (" << s->votes << " votes)\n";
        }
    }
    out << "\n";
}

void printCommandResult(const char* op, const Catalog& catalog, const CommandResult& result, std::ostream& out) {
    if (!result.ok()) {
        out << op << ": " << toString(result.error->kind) << " - " << result.error->message
            << " (version " << result.version << ")\n";
        return;
    }

    out << op << ": ok (version " << result.version << ")";
    if (result.assignment) {
        out << ", " << result.assignment->size() << " entries";
    }
    out << "\n";
    for (const SlotState& state : result.touched) {
        out << "    " << std::left << std::setw(kCellWidth) << formatSlot(catalog, state.slot) << " <- ";
        if (state.sessionId) {
            const Session* s = catalog.findSession(*state.sessionId);
            out << (s ? s->title : "#" + std::to_string(*state.sessionId));
        } else {
            out << "(empty)";
        }
        out << "\n";
    }
}

void printScore(const ScheduleScore& score, std::ostream& out) {
    out << "Assigned votes:   " << score.assignedVotes << "\n";
    out << "Conflict penalty: " << score.conflictPenalty << "\n";
    out << "Missing penalty:  " << score.missingPenalty << "\n";
    out << "Late penalty:     " << score.latePenalty << "\n";
    out << "Weighted penalty: " << std::fixed << std::setprecision(1) << score.weighted
        << std::defaultfloat << "\n";
}
