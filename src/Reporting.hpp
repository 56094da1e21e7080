#ifndef REPORTING_HPP
#define REPORTING_HPP

#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "Agent.hpp"
#include "Types.hpp"

// Receives what a simulation has to say. Write-only: nothing flows back.
class Reporter {
public:
    virtual ~Reporter() = default;
    virtual void reportAgents(const std::vector<Agent>& agents) = 0;
    // called before the encounters of each round
    virtual void reportRound(const RoundStats& stats) = 0;
    // called once after the last round with the survivors
    virtual void reportFinal(const RoundStats& stats) = 0;
};

class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out) : out(out) {}

    void reportAgents(const std::vector<Agent>& agents) override;
    void reportRound(const RoundStats& stats) override;
    void reportFinal(const RoundStats& stats) override;

private:
    std::ostream& out;

    void printStrategies(const RoundStats& stats);
};

// Collects one CSV line per round and strategy label.
class CsvRecorder : public Reporter {
public:
    CsvRecorder(std::string configuration, size_t replication)
        : configuration(std::move(configuration)), replication(replication) {}

    void reportAgents(const std::vector<Agent>&) override {}
    void reportRound(const RoundStats& stats) override;
    void reportFinal(const RoundStats& stats) override;

    const std::vector<std::string>& lines() const { return csvLines; }

    static std::string header();

private:
    std::string configuration;
    size_t replication;
    std::vector<std::string> csvLines;
};

#endif // REPORTING_HPP
