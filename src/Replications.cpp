#include "Replications.hpp"
#include "Reporting.hpp"

#include <exception>

std::vector<ReplicationResult> runReplications(const SimulationConfig& config) {
    const long numReplications = static_cast<long>(config.replications);
    std::vector<ReplicationResult> results(config.replications);
    // exceptions must not leave the parallel region
    std::vector<std::exception_ptr> errors(config.replications);

#pragma omp parallel for schedule(dynamic)
    for (long rep = 0; rep < numReplications; ++rep) {
        try {
            Simulation simulation(config, config.baseSeed + static_cast<uint64_t>(rep));
            CsvRecorder recorder(config.name, static_cast<size_t>(rep));
            simulation.addReporter(recorder);
            simulation.run();

            ReplicationResult& result = results[rep];
            result.history = simulation.history();
            result.survivors = RoundStats{
                simulation.currentRound(),
                simulation.population().size(),
                simulation.population().stats()
            };
            result.csvLines = recorder.lines();
        } catch (...) {
            errors[rep] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}
