#ifndef PARAMS_HPP
#define PARAMS_HPP

#include "Simulation.hpp"
#include "Strategies.hpp"
#include "Types.hpp"

#include <memory>
#include <string>
#include <vector>

inline AgentDefinition reputationTrackers(size_t count, const GameParams& params, bool optimistic, bool revenging = false) {
    return {
        optimistic ? "optimistic reputation tracker" : "pessimistic reputation tracker",
        [params, optimistic, revenging](uint64_t) -> std::unique_ptr<Strategy> {
            return std::make_unique<ReputationTracker>(params, optimistic, revenging);
        },
        count
    };
}

inline AgentDefinition randomAgents(size_t count, double acceptProbability, double cooperateProbability, const std::string& label) {
    return {
        label,
        [acceptProbability, cooperateProbability, label](uint64_t seed) -> std::unique_ptr<Strategy> {
            return std::make_unique<RandomStrategy>(acceptProbability, cooperateProbability, label, seed);
        },
        count
    };
}

inline AgentDefinition pureEvil(size_t count) {
    return {"pure evil", makePureEvil, count};
}

// Borrowing a device: using it pays 2, stealing it pays 3. The lender loses
// 1 to effort and wear, or 3 when the device is gone.
inline SimulationConfig makeBaseConfig(const std::string& name) {
    SimulationConfig config;
    config.name = name;
    config.payoffs = defaultGameParams;
    config.initialEnergy = 256.0;
    config.rounds = 20;
    config.baseSeed = 20240917;
    config.replications = 16;
    return config;
}

inline std::vector<SimulationConfig> makeConfigurations() {
    std::vector<SimulationConfig> configurations;

    // Trackers against a minority of pure defectors
    SimulationConfig baseline = makeBaseConfig("trackers_vs_evil");
    baseline.roster = {
        reputationTrackers(32, baseline.payoffs, true),
        pureEvil(16)
    };
    configurations.push_back(baseline);

    SimulationConfig cautious = makeBaseConfig("pessimists_vs_evil");
    cautious.roster = {
        reputationTrackers(32, cautious.payoffs, false),
        pureEvil(16)
    };
    configurations.push_back(cautious);

    SimulationConfig mixed = makeBaseConfig("mixed_population");
    mixed.rounds = 50;
    mixed.roster = {
        reputationTrackers(16, mixed.payoffs, true),
        reputationTrackers(8, mixed.payoffs, true, true),
        randomAgents(8, 0.5, 0.5, "coin flipper"),
        randomAgents(8, 0.9, 0.2, "freeloader"),
        pureEvil(8)
    };
    configurations.push_back(mixed);

    // Theft costs the lender far more than it gains the thief
    SimulationConfig harsh = makeBaseConfig("harsh_theft");
    harsh.payoffs = GameParams{-1.0, -8.0, 2.0, 3.0};
    harsh.roster = {
        reputationTrackers(32, harsh.payoffs, true),
        randomAgents(16, 0.5, 0.5, "coin flipper")
    };
    configurations.push_back(harsh);

    return configurations;
}

#endif // PARAMS_HPP
