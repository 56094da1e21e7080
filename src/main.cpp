#include "Params.hpp"
#include "Replications.hpp"
#include "Reporting.hpp"
#include "Simulation.hpp"
#include "Utils.hpp"
#include <exception>
#include <iostream>
#include <omp.h>
#include <string>
#include <vector>

int main() {
    std::vector<SimulationConfig> configurations;
    try {
        configurations = makeConfigurations();

        // Narrate the first replication of the baseline configuration
        const SimulationConfig& baseline = configurations.front();
        Simulation simulation(baseline, baseline.baseSeed);
        ConsoleReporter console(std::cout);
        simulation.addReporter(console);
        simulation.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    std::cout << "Number of configurations: " << configurations.size() << '\n';
    std::cout << "Threads available: " << omp_get_max_threads() << '\n';

    std::string outputDir = "../output";
    for (size_t idx = 0; idx < configurations.size(); ++idx) {
        const SimulationConfig& config = configurations[idx];

        std::vector<ReplicationResult> results;
        try {
            results = runReplications(config);
        } catch (const std::exception& e) {
            std::cerr << "Error in configuration " << config.name << ": " << e.what() << '\n';
            return 1;
        }

        std::vector<std::string> csvData;
        csvData.push_back(CsvRecorder::header());
        for (const auto& result : results) {
            csvData.insert(csvData.end(), result.csvLines.begin(), result.csvLines.end());
        }
        if (writeAndCompressCSV(outputDir, "borrow_lend_" + config.name, csvData).empty()) {
            std::cerr << "Results of configuration " << config.name << " were not saved\n";
        }

        std::cout << "Completed configuration " << idx + 1 << " of " << configurations.size()
        << " (processed " << results.size() << " replications)" << '\n';
    }
}
