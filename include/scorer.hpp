#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///       SCORING       ///
///////////////////////////
/**
 * @brief Quality report of an assignment.
 *
 * The optimizer maximizes assignedVotes first; among layouts with the same
 * votes it lowers the weighted penalty, which measures how attendee-friendly
 * the timetable is. Lower weighted penalty is better.
 */
struct ScheduleScore {
    long long assignedVotes = 0; ///< Sum of votes over assigned sessions.
    long long conflictPenalty = 0; ///< Popular sessions competing in the same timeslot.
    long long missingPenalty = 0; ///< Popular sessions left without a slot.
    long long latePenalty = 0; ///< Conflicting popular sessions late in the day.
    double weighted = 0.0; ///< Weighted sum of the three penalties.
};

/// Weights of the penalties in tenths, for exact integer comparisons.
constexpr int kConflictWeightTenths = 3;
constexpr int kMissingWeightTenths = 5;
constexpr int kLateWeightTenths = 2;

/// Weights of the penalties in ScheduleScore::weighted.
constexpr double kConflictWeight = kConflictWeightTenths / 10.0;
constexpr double kMissingWeight = kMissingWeightTenths / 10.0;
constexpr double kLateWeight = kLateWeightTenths / 10.0;

/**
 * @brief Weight (in tenths) of one unit of conflict penalty in a given row.
 *
 * A row contributes its conflict penalty once as conflict and once, scaled
 * by the row index, as late penalty.
 */
constexpr long long rowWeightTenths(int row) { return kConflictWeightTenths + (long long)kLateWeightTenths * row; }

/**
 * @brief Sum of products of adjacent values once sorted in descending order.
 *
 * Non-positive values are ignored. E.g., {5, 10, 8} -> 10*8 + 8*5 = 120.
 */
long long adjacentProductSum(std::vector<int> votes);

/**
 * @brief Score an assignment against its catalog.
 *
 * Rows are the non-blocked timeslots in start order; the late penalty of a
 * row is its conflict penalty times the row index. Entries referencing
 * unknown sessions count as zero votes.
 */
ScheduleScore scoreAssignment(const Assignment& assignment, const Catalog& catalog);

/// Combine the three penalties with the fixed weights.
double weightPenalties(long long conflict, long long missing, long long late);
