#ifndef REPLICATIONS_HPP
#define REPLICATIONS_HPP

#include <string>
#include <vector>
#include "Simulation.hpp"
#include "Types.hpp"

struct ReplicationResult {
    std::vector<RoundStats> history;
    RoundStats survivors;
    std::vector<std::string> csvLines;
};

// Runs every replication of a configuration, replication r seeded with
// baseSeed + r. Replications are independent and run in parallel; results
// come back in replication order.
std::vector<ReplicationResult> runReplications(const SimulationConfig& config);

#endif // REPLICATIONS_HPP
