#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Discriminated failure of a schedule command.
 */
enum class ErrorKind {
    PERMISSION_DENIED, ///< Caller role may not change the schedule.
    SLOT_BLOCKED, ///< Target timeslot is blocked.
    NOT_FOUND, ///< Referenced session, room, timeslot or slot entry is gone.
    CONFLICT, ///< Stale request: the state changed underneath it; refresh and retry.
    INVARIANT_VIOLATION, ///< Candidate state failed validation; a programming error.
    INVALID_ARGUMENT, ///< Malformed catalog input.
    ALREADY_SCHEDULED, ///< Session already has a slot.
    SCHEDULE_FULL, ///< No empty eligible slot left.
    CANCELLED, ///< Superseded by a newer generate/improve request.
    OPTIMIZER_FAILED ///< The optimizer back end failed (e.g., device or thread error); nothing was applied.
};

/// Stable upper-case name of an error kind (e.g., "NOT_FOUND").
const char* toString(ErrorKind kind);

/**
 * @brief Error kind plus a message meant for the editor's screen.
 */
struct CommandError {
    ErrorKind kind;
    std::string message;
};


///////////////////////////
///       RESULTS       ///
///////////////////////////
/**
 * @brief Post-command content of one slot.
 */
struct SlotState {
    Slot slot; ///< The slot.
    std::optional<int> sessionId; ///< Session now in the slot, or empty.

    bool operator==(const SlotState& other) const {
        return slot == other.slot && sessionId == other.sessionId;
    }
};

/**
 * @brief Structured outcome of every schedule command.
 *
 * On success, @c touched lists the slots the command changed (both slots of a
 * move or swap, the entries removed by a cascade) and @c assignment carries
 * the full assignment for wholesale commands (generate, improve, clear). On
 * failure nothing was applied.
 */
struct CommandResult {
    std::optional<CommandError> error; ///< Set iff the command was rejected.
    std::vector<SlotState> touched; ///< Slots changed by the command.
    std::optional<Assignment> assignment; ///< Full assignment after wholesale commands.
    uint64_t version = 0; ///< Assignment version after the command (current version on failure).

    bool ok() const { return !error.has_value(); }

    /// Kind of the error; only meaningful when !ok().
    ErrorKind kind() const { return error ? error->kind : ErrorKind::INVARIANT_VIOLATION; }

    static CommandResult failure(ErrorKind kind, std::string message, uint64_t version = 0) {
        CommandResult r;
        r.error = CommandError{kind, std::move(message)};
        r.version = version;
        return r;
    }
};
