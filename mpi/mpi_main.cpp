///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_optimizer.hpp"
#include "assignment_store.hpp"
#include "config.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "schedule_service.hpp"
#include <mpi.h>
#include <iostream>
#include <memory>
#include <utility>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the distributed schedule generation demo.
 *
 * Rank 0 owns the store and the service and issues generate() followed by
 * improve(); every other rank serves whatever collective optimizer runs
 * those commands start until rank 0 stops the workers. Rank 0 prints the
 * resulting timetable and its score.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    DemoConfig config = parseDemoConfig(argc, argv);

    // Only rank 0 prints a brief header about the MPI configuration.
    if (rank == 0) {
        std::cout << "========================================\n";
        std::cout << "MPI+THREADS SCHEDULE GENERATION\n";
        std::cout << "Processes: " << size << "\n";
        std::cout << "Threads per process: " << config.engine.numThreads << "\n";
        std::cout << "========================================\n";
    }

    if (rank == 0) {
        AssignmentStore store(makeDemoInstance(config.size));
        auto optimizer = std::make_unique<MPIOptimizer>(config.engine);
        const MPIOptimizer* coordinator = optimizer.get();
        ScheduleService service(store, std::move(optimizer));
        Caller organizer{1, Role::ADMIN};

        CommandResult generated = service.generate(organizer);
        CommandResult improved = service.improve(organizer);
        coordinator->stopWorkers();

        StoreSnapshot snap = service.snapshot();
        printCommandResult("generate", *snap.catalog, generated);
        printCommandResult("improve", *snap.catalog, improved);
        printSchedule(*snap.catalog, snap.assignment);
        printScore(service.evaluate());
        std::cout << "========================================\n";
    } else {
        MPIOptimizer worker(config.engine);
        worker.serveWorkers();
    }

    MPI_Finalize();
    return 0;
}
