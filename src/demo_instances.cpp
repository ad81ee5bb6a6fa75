///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <random>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static const std::array<const char*, 12> kRoomNames = {
        "Main Hall", "Room A", "Room B", "Room C", "Lab 1", "Lab 2",
        "Library", "Lounge", "Studio", "Atrium", "Garden", "Loft"
};

static const std::array<const char*, 6> kTags = {
        "systems", "languages", "web", "data", "community", "security"
};

static const std::array<const char*, 10> kTopics = {
        "Rust vs C++ in production", "Writing a tiny allocator", "Property testing",
        "Onboarding new contributors", "Zero-downtime migrations", "Fuzzing parsers",
        "Observability on a budget", "Packaging for distros", "Lock-free queues",
        "Accessibility checklists"
};

/**
 * @brief Shared builder for all demo sizes.
 *
 * Timeslots are one hour long starting at 09:00; the timeslots listed in
 * blockedIndices get a lunch/keynote reason. Every session id is 100 + i.
 */
static Catalog buildDemo(int numRooms, int numTimeslots, const std::vector<int>& blockedIndices,
                         int numSessions, unsigned seed) {
    Catalog catalog;

    for (int r = 0; r < numRooms; ++r) {
        Room room;
        room.id = r + 1;
        room.name = kRoomNames[r % kRoomNames.size()];
        room.location = "Floor " + std::to_string(r / 4 + 1);
        room.availableSpots = 20 + 10 * (r % 4);
        catalog.rooms.push_back(room);
    }

    for (int t = 0; t < numTimeslots; ++t) {
        Timeslot ts;
        ts.id = t + 1;
        ts.startMinute = 9 * 60 + 60 * t;
        ts.endMinute = ts.startMinute + 60;
        if (std::find(blockedIndices.begin(), blockedIndices.end(), t) != blockedIndices.end()) {
            ts.blockedReason = (t == 0) ? "Opening keynote" : "Lunch";
        }
        catalog.timeslots.push_back(ts);
    }

    // Skewed votes: a few popular sessions, a long tail of niche ones.
    std::mt19937 rng(seed);
    std::geometric_distribution<int> voteDist(0.12);
    for (int i = 0; i < numSessions; ++i) {
        Session s;
        s.id = 100 + i;
        s.title = std::string(kTopics[i % kTopics.size()]) + " #" + std::to_string(i + 1);
        s.body = "Proposal text for session " + std::to_string(s.id) + ".";
        s.votes = voteDist(rng);
        if (i % 3 != 2) s.tag = kTags[i % kTags.size()];
        s.ownerId = 1 + i % 17;
        catalog.sessions.push_back(s);
    }

    return catalog;
}


///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
Catalog makeDemoInstance(DemoSize size) {
    switch (size) {
        case DemoSize::S:  return buildDemo(3, 3, {1}, 8, 1234u);
        case DemoSize::M:  return buildDemo(5, 6, {3}, 36, 1235u);
        case DemoSize::L:  return buildDemo(8, 10, {0, 4}, 90, 1236u);
        case DemoSize::XL: return buildDemo(12, 14, {0, 5}, 200, 1237u);
    }
    return buildDemo(3, 3, {1}, 8, 1234u);
}

bool parseDemoSize(const std::string& name, DemoSize& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    if (upper == "S")  { out = DemoSize::S;  return true; }
    if (upper == "M")  { out = DemoSize::M;  return true; }
    if (upper == "L")  { out = DemoSize::L;  return true; }
    if (upper == "XL") { out = DemoSize::XL; return true; }
    return false;
}
