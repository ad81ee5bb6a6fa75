///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_optimizer.hpp"
#include "assignment_store.hpp"
#include "config.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "model.hpp"
#include "schedule_service.hpp"
#include <iostream>
#include <chrono>
#include <memory>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential schedule generator.
 *
 * Builds a demo unconference, generates the schedule on a single thread,
 * prints the grid and its score, then walks through a few point edits the
 * way an organizer would issue them.
 */
int main(int argc, char** argv) {
    DemoConfig config = parseDemoConfig(argc, argv);

    AssignmentStore store(makeDemoInstance(config.size));
    ScheduleService service(store, std::make_unique<SequentialOptimizer>(config.engine));

    Caller organizer{1, Role::FACILITATOR};
    Caller attendee{42, Role::VIEWER};

    // Measure wall-clock time of the whole generate command.
    auto start = std::chrono::high_resolution_clock::now();
    CommandResult generated = service.generate(organizer);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    StoreSnapshot snap = service.snapshot();

    std::cout << "========================================\n";
    std::cout << "SEQUENTIAL SCHEDULE GENERATION\n";
    std::cout << "Rooms: " << snap.catalog->rooms.size()
              << ", timeslots: " << snap.catalog->timeslots.size()
              << ", sessions: " << snap.catalog->sessions.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";
    printCommandResult("generate", *snap.catalog, generated);
    printSchedule(*snap.catalog, snap.assignment);
    printScore(service.evaluate());

    // Point edits against the generated schedule.
    std::cout << "----------------------------------------\n";
    std::cout << "Point edits:\n";

    if (!snap.assignment.empty()) {
        const Slot first = snap.assignment.entries.front().slot;
        std::vector<Slot> free = service.freeSlots();
        if (!free.empty()) {
            printCommandResult("move to free slot", *snap.catalog,
                               service.move(organizer, first, free.front(), snap.assignmentVersion));
        }
        if (snap.assignment.size() >= 2) {
            const Slot second = service.snapshot().assignment.entries[1].slot;
            const Slot third = service.snapshot().assignment.entries.back().slot;
            printCommandResult("swap", *snap.catalog, service.swap(organizer, second, third));
        }
        // Stale version: the edits above moved the schedule on.
        printCommandResult("stale move", *snap.catalog,
                           service.move(organizer, first, first, snap.assignmentVersion));
        printCommandResult("viewer move", *snap.catalog, service.move(attendee, first, first));
    }

    std::vector<Session> waiting = service.unassignedSessions();
    if (!waiting.empty()) {
        printCommandResult("add to schedule", *snap.catalog, service.addToSchedule(organizer, waiting.front().id));
    }

    StoreSnapshot after = service.snapshot();
    printSchedule(*after.catalog, after.assignment);
    std::cout << "========================================\n";
    return 0;
}
