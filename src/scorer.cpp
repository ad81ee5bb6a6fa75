///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "scorer.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <set>


///////////////////////////
///       SCORING       ///
///////////////////////////
long long adjacentProductSum(std::vector<int> votes) {
    votes.erase(std::remove_if(votes.begin(), votes.end(), [](int v) { return v <= 0; }), votes.end());
    std::sort(votes.begin(), votes.end(), std::greater<int>());

    long long sum = 0;
    for (size_t i = 1; i < votes.size(); ++i) {
        sum += (long long)votes[i - 1] * votes[i];
    }
    return sum;
}

double weightPenalties(long long conflict, long long missing, long long late) {
    return kConflictWeight * (double)conflict +
           kMissingWeight * (double)missing +
           kLateWeight * (double)late;
}

/**
 * @brief Group entries into timeslot rows and apply the three penalties.
 */
ScheduleScore scoreAssignment(const Assignment& assignment, const Catalog& catalog) {
    ScheduleScore score;

    // Row index of each non-blocked timeslot, in start order.
    std::map<int, int> rowOf;
    {
        std::vector<const Timeslot*> open;
        for (const Timeslot& t : catalog.timeslots) {
            if (!t.isBlocked()) open.push_back(&t);
        }
        std::sort(open.begin(), open.end(), [](const Timeslot* a, const Timeslot* b) {
            if (a->startMinute != b->startMinute) return a->startMinute < b->startMinute;
            return a->id < b->id;
        });
        for (size_t i = 0; i < open.size(); ++i) rowOf[open[i]->id] = (int)i;
    }

    std::vector<std::vector<int>> rows(rowOf.size());
    std::set<int> placed;
    for (const AssignmentEntry& e : assignment.entries) {
        const Session* s = catalog.findSession(e.sessionId);
        int votes = s ? s->votes : 0;
        placed.insert(e.sessionId);
        score.assignedVotes += votes;

        auto row = rowOf.find(e.slot.timeslotId);
        if (row != rowOf.end()) rows[row->second].push_back(votes);
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        long long rowPenalty = adjacentProductSum(rows[i]);
        score.conflictPenalty += rowPenalty;
        score.latePenalty += rowPenalty * (long long)i;
    }

    std::vector<int> missing;
    for (const Session& s : catalog.sessions) {
        if (!placed.count(s.id)) missing.push_back(s.votes);
    }
    score.missingPenalty = adjacentProductSum(missing);

    score.weighted = weightPenalties(score.conflictPenalty, score.missingPenalty, score.latePenalty);
    return score;
}
