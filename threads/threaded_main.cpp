///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_optimizer.hpp"
#include "assignment_store.hpp"
#include "config.hpp"
#include "constraints.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "model.hpp"
#include "schedule_service.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <random>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Tally of the commands one editor thread issued.
 */
struct EditorStats {
    int committed = 0; ///< Edits applied.
    int conflicts = 0; ///< Edits rejected as stale.
    int other = 0; ///< Edits rejected for any other reason.
};

/**
 * @brief Simulated editor: drag-and-drop moves between random eligible slots.
 *
 * Each edit is based on the version the editor last saw, so concurrent
 * editors regularly hit CONFLICT and refresh, as a browser would.
 */
static EditorStats runEditor(ScheduleService& service, int editorId, int edits) {
    EditorStats stats;
    Caller caller{100 + editorId, Role::FACILITATOR};
    std::mt19937 rng(7u + (unsigned)editorId);

    for (int i = 0; i < edits; ++i) {
        StoreSnapshot view = service.snapshot();
        if (view.assignment.empty()) break;

        std::vector<Slot> slots = view.catalog->eligibleSlots();
        std::uniform_int_distribution<size_t> pickEntry(0, view.assignment.size() - 1);
        std::uniform_int_distribution<size_t> pickSlot(0, slots.size() - 1);

        Slot from = view.assignment.entries[pickEntry(rng)].slot;
        Slot to = slots[pickSlot(rng)];

        CommandResult result = (i % 2 == 0)
                ? service.move(caller, from, to, view.assignmentVersion)
                : service.swap(caller, from, view.assignment.entries[pickEntry(rng)].slot, view.assignmentVersion);

        if (result.ok()) {
            ++stats.committed;
        } else if (result.kind() == ErrorKind::CONFLICT) {
            ++stats.conflicts;
        } else {
            ++stats.other;
        }
    }
    return stats;
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded generator under concurrent editing.
 *
 * Generates the schedule with the multithreaded optimizer, then lets several
 * editor threads move and swap sessions concurrently while generate requests
 * race each other (only the last one may commit). Finally the committed
 * assignment is re-validated and printed.
 */
int main(int argc, char** argv) {
    DemoConfig config = parseDemoConfig(argc, argv);

    AssignmentStore store(makeDemoInstance(config.size));
    ScheduleService service(store, std::make_unique<ThreadedOptimizer>(config.engine));
    Caller organizer{1, Role::ADMIN};

    auto start = std::chrono::high_resolution_clock::now();
    CommandResult generated = service.generate(organizer);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    StoreSnapshot snap = service.snapshot();

    std::cout << "========================================\n";
    std::cout << "THREADED SCHEDULE GENERATION\n";
    std::cout << "Threads: " << config.engine.numThreads << "\n";
    std::cout << "Sessions: " << snap.catalog->sessions.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";
    printCommandResult("generate", *snap.catalog, generated);

    // Concurrent editors plus racing generate requests.
    const int editsPerEditor = 50;
    std::vector<std::future<EditorStats>> editors;
    for (int e = 0; e < config.editors; ++e) {
        editors.push_back(std::async(std::launch::async, runEditor, std::ref(service), e, editsPerEditor));
    }

    std::vector<std::future<CommandResult>> generates;
    for (int g = 0; g < 3; ++g) {
        generates.push_back(std::async(std::launch::async, [&service, &organizer]() {
            return service.generate(organizer);
        }));
    }

    EditorStats total;
    for (auto& f : editors) {
        EditorStats s = f.get();
        total.committed += s.committed;
        total.conflicts += s.conflicts;
        total.other += s.other;
    }

    int generateCommitted = 0, generateCancelled = 0, generateOther = 0;
    for (auto& f : generates) {
        CommandResult r = f.get();
        if (r.ok()) {
            ++generateCommitted;
        } else if (r.kind() == ErrorKind::CANCELLED) {
            ++generateCancelled;
        } else {
            ++generateOther;
        }
    }

    std::cout << "----------------------------------------\n";
    std::cout << "Editors: " << config.editors << " x " << editsPerEditor << " edits\n";
    std::cout << "  committed: " << total.committed << ", stale: " << total.conflicts
              << ", rejected: " << total.other << "\n";
    std::cout << "Racing generates: committed " << generateCommitted << ", cancelled "
              << generateCancelled << ", rejected " << generateOther << "\n";

    StoreSnapshot after = service.snapshot();
    std::optional<Violation> violation = validateAssignment(after.assignment, *after.catalog);
    std::cout << "Final version: " << after.assignmentVersion << ", invariants: "
              << (violation ? violation->detail : "ok") << "\n";

    printSchedule(*after.catalog, after.assignment);
    printScore(service.evaluate());
    std::cout << "========================================\n";
    return violation ? 1 : 0;
}
