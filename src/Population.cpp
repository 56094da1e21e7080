#include "Population.hpp"
#include "Encounter.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

uint64_t deriveStrategySeed(uint64_t seed, size_t id) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(id),
        static_cast<uint32_t>(static_cast<uint64_t>(id) >> 32)
    };
    std::array<uint32_t, 2> words{};
    seq.generate(words.begin(), words.end());
    return (static_cast<uint64_t>(words[0]) << 32) | words[1];
}

Population::Population(const std::vector<AgentDefinition>& roster, double initialEnergy, uint64_t seed) {
    size_t total = 0;
    for (const auto& definition : roster) {
        total += definition.count;
    }
    members.reserve(total);

    // Ids are handed out in roster order and never reused
    size_t nextId = 0;
    for (const auto& definition : roster) {
        if (!definition.factory) {
            throw std::runtime_error("No strategy factory for roster entry '" + definition.name + "'");
        }
        for (size_t i = 0; i < definition.count; ++i) {
            size_t id = nextId++;
            std::unique_ptr<Strategy> strategy;
            try {
                strategy = definition.factory(deriveStrategySeed(seed, id));
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to create strategy for roster entry '" +
                                         definition.name + "': " + e.what());
            }
            if (!strategy) {
                throw std::runtime_error("Strategy factory for roster entry '" + definition.name +
                                         "' returned nothing");
            }
            members.push_back(Agent{id, initialEnergy, std::move(strategy)});
        }
    }
    checkUniqueIds();
}

Population::Population(std::vector<Agent> agents) : members(std::move(agents)) {
    for (const auto& agent : members) {
        if (!agent.strategy) {
            throw std::invalid_argument("Agent " + std::to_string(agent.id) + " has no strategy");
        }
    }
    checkUniqueIds();
}

void Population::interact(const GameParams& params) {
    // Indices rather than iterators: both agents of a pair are mutated
    const size_t n = members.size();
    for (size_t i = 0; i + 1 < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            encounter(members[i], members[j], params);
            encounter(members[j], members[i], params);
        }
    }
}

size_t Population::cull() {
    const size_t before = members.size();
    std::erase_if(members, [](const Agent& agent) { return agent.energy <= 0.0; });
    return before - members.size();
}

std::vector<StrategyStats> Population::stats() const {
    std::map<std::string, std::pair<size_t, double>> totals; // label -> (count, energy sum)
    for (const auto& agent : members) {
        auto& [count, sum] = totals[agent.strategy->describeType()];
        count++;
        sum += agent.energy;
    }

    std::vector<StrategyStats> result;
    result.reserve(totals.size());
    for (const auto& [label, total] : totals) {
        result.push_back({label, total.first, total.second / static_cast<double>(total.first)});
    }
    return result;
}

void Population::checkUniqueIds() const {
    std::unordered_set<size_t> seen;
    for (const auto& agent : members) {
        if (!seen.insert(agent.id).second) {
            throw std::logic_error("Duplicate agent id " + std::to_string(agent.id));
        }
    }
}
