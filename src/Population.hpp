#ifndef POPULATION_HPP
#define POPULATION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "Agent.hpp"
#include "Types.hpp"

using StrategyFactory = std::function<std::unique_ptr<Strategy>(uint64_t seed)>;

// Roster entry: how many agents to create with a given strategy factory.
struct AgentDefinition {
    std::string name;
    StrategyFactory factory;
    size_t count;
};

// Living agents of one simulation. Agents are created once from the roster
// and only ever removed afterwards.
class Population {
public:
Population(const std::vector<AgentDefinition>& roster, double initialEnergy, uint64_t seed);
explicit Population(std::vector<Agent> agents);

// Every pair (i, j), i < j, plays i lending to j then j lending to i.
void interact(const GameParams& params);
// Removes agents with no energy left. Returns how many were removed.
size_t cull();
// Count and mean energy per strategy label, sorted by label.
std::vector<StrategyStats> stats() const;

const std::vector<Agent>& agents() const { return members; }
Agent& agent(size_t index) { return members[index]; }
size_t size() const { return members.size(); }
bool empty() const { return members.empty(); }

private:
std::vector<Agent> members;

void checkUniqueIds() const;
};

// Seed for the strategy of agent `id` in a simulation seeded with `seed`.
uint64_t deriveStrategySeed(uint64_t seed, size_t id);

#endif // POPULATION_HPP
