#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "Population.hpp"
#include "Reporting.hpp"
#include "Types.hpp"

struct SimulationConfig {
    std::string name;
    GameParams payoffs = defaultGameParams;
    std::vector<AgentDefinition> roster;
    double initialEnergy = 256.0;
    size_t rounds = 20;
    uint64_t baseSeed = 0;
    size_t replications = 1;
};

// Runs the borrow/lend game for a fixed number of rounds. Each round the
// reporters see the population, every pair of agents plays both roles and
// agents with no energy left are removed.
class Simulation {
public:
    Simulation(const SimulationConfig& config, uint64_t seed);
    Simulation(Population population, const GameParams& payoffs, size_t rounds);

    void addReporter(Reporter& reporter) { reporters.push_back(&reporter); }

    // Plays all remaining rounds and returns the stats seen before each one.
    const std::vector<RoundStats>& run();
    // Plays a single round. Returns false once all rounds have been played.
    bool step();

    const Population& population() const { return agents; }
    const std::vector<RoundStats>& history() const { return roundHistory; }
    size_t currentRound() const { return round; }

private:
    Population agents;
    GameParams payoffs;
    size_t rounds;
    size_t round = 0;
    bool announced = false;
    bool finished = false;
    std::vector<Reporter*> reporters;
    std::vector<RoundStats> roundHistory;

    RoundStats collectStats() const;
    void finish();
};

#endif // SIMULATION_HPP
