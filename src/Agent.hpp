#ifndef AGENT_HPP
#define AGENT_HPP

#include <memory>
#include <sstream>
#include <string>
#include "Strategies.hpp"

struct Agent {
    size_t id = 0;
    double energy = 0.0;
    std::unique_ptr<Strategy> strategy;

    // id|energy|strategy
    std::string toString() const {
        std::ostringstream out;
        out << id << '|' << energy << '|' << strategy->describeType();
        return out.str();
    }

    Agent clone() const {
        return Agent{id, energy, strategy->clone()};
    }
};

#endif // AGENT_HPP
