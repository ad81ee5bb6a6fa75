#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "command_result.hpp"
#include "scorer.hpp"
#include <iostream>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Render minutes since midnight as "HH:MM".
std::string formatMinutes(int minutes);

/// Render a slot as "<room name> @ HH:MM" (ids when the catalog lacks them).
std::string formatSlot(const Catalog& catalog, const Slot& slot);

/**
 * @brief Print the timetable as a grid: one row per timeslot, one column per room.
 *
 * Blocked timeslots show their reason across the row; unassigned sessions are
 * listed below the grid.
 */
void printSchedule(const Catalog& catalog, const Assignment& assignment, std::ostream& out = std::cout);

/// Print the outcome of a command: error kind and message, or the touched slots.
void printCommandResult(const char* op, const Catalog& catalog, const CommandResult& result,
                        std::ostream& out = std::cout);

/// Print a score report.
void printScore(const ScheduleScore& score, std::ostream& out = std::cout);
