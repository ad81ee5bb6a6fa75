///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "assignment_store.hpp"
#include "config.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include "logging.hpp"
#include "opencl_optimizer.hpp"
#include "schedule_service.hpp"
#include <iostream>
#include <chrono>
#include <memory>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL-accelerated schedule generator.
 *
 * Builds a demo unconference, generates the schedule with candidate gains
 * evaluated on the OpenCL device, and prints the grid and its score.
 */
int main(int argc, char** argv) {
    DemoConfig config = parseDemoConfig(argc, argv);

    std::cout << "========================================\n";
    std::cout << "OPENCL SCHEDULE GENERATION\n";
    std::cout << "Batch size: " << config.engine.batchSize << "\n";
    std::cout << "========================================\n";

    std::unique_ptr<OpenCLOptimizer> optimizer;
    try {
        optimizer = std::make_unique<OpenCLOptimizer>(config.engine);
    } catch (const std::runtime_error& e) {
        LogLine(LogLevel::ERROR, "opencl") << e.what();
        return 1;
    }

    AssignmentStore store(makeDemoInstance(config.size));
    ScheduleService service(store, std::move(optimizer));
    Caller organizer{1, Role::ADMIN};

    // Measure wall-clock time for the OpenCL-backed generate.
    auto start = std::chrono::high_resolution_clock::now();
    CommandResult generated;
    try {
        generated = service.generate(organizer);
    } catch (const std::runtime_error& e) {
        LogLine(LogLevel::ERROR, "opencl") << "generate failed: " << e.what();
        return 1;
    }
    auto end = std::chrono::high_resolution_clock::now();
    double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "OpenCL generate time: " << elapsedMs << " ms\n";

    StoreSnapshot snap = service.snapshot();
    printCommandResult("generate", *snap.catalog, generated);
    printSchedule(*snap.catalog, snap.assignment);
    printScore(service.evaluate());
    std::cout << "========================================\n";
    return generated.ok() ? 0 : 1;
}
