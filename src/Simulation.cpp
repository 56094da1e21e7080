#include "Simulation.hpp"

#include <utility>

Simulation::Simulation(const SimulationConfig& config, uint64_t seed)
    : agents(config.roster, config.initialEnergy, seed), payoffs(config.payoffs), rounds(config.rounds) {}

Simulation::Simulation(Population population, const GameParams& payoffs, size_t rounds)
    : agents(std::move(population)), payoffs(payoffs), rounds(rounds) {}

const std::vector<RoundStats>& Simulation::run() {
    while (step()) {
    }
    return roundHistory;
}

bool Simulation::step() {
    if (!announced) {
        for (Reporter* reporter : reporters) {
            reporter->reportAgents(agents.agents());
        }
        announced = true;
    }

    if (round >= rounds) {
        finish();
        return false;
    }

    RoundStats stats = collectStats();
    for (Reporter* reporter : reporters) {
        reporter->reportRound(stats);
    }
    roundHistory.push_back(std::move(stats));

    agents.interact(payoffs);
    // dead agents still finished the round they died in
    agents.cull();

    round++;
    if (round == rounds) {
        finish();
        return false;
    }
    return true;
}

RoundStats Simulation::collectStats() const {
    return RoundStats{round, agents.size(), agents.stats()};
}

void Simulation::finish() {
    if (finished) {
        return;
    }
    RoundStats stats = collectStats();
    for (Reporter* reporter : reporters) {
        reporter->reportFinal(stats);
    }
    finished = true;
}
