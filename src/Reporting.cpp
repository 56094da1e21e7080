#include "Reporting.hpp"

void ConsoleReporter::reportAgents(const std::vector<Agent>& agents) {
    for (const auto& agent : agents) {
        out << agent.toString() << '\n';
    }
    out << '\n';
}

void ConsoleReporter::reportRound(const RoundStats& stats) {
    out << "Round " << stats.round << ".\n";
    printStrategies(stats);
}

void ConsoleReporter::reportFinal(const RoundStats& stats) {
    out << "Final.\n";
    printStrategies(stats);
}

void ConsoleReporter::printStrategies(const RoundStats& stats) {
    for (const auto& strategy : stats.strategies) {
        out << strategy.label << ":\n";
        out << " - count: " << strategy.count << '\n';
        out << " - mean energy: " << strategy.meanEnergy << '\n';
    }
    out << '\n';
}

std::string CsvRecorder::header() {
    return "configuration,replication,round,strategy,count,mean_energy";
}

void CsvRecorder::reportRound(const RoundStats& stats) {
    for (const auto& strategy : stats.strategies) {
        csvLines.push_back(
            configuration + "," +
            std::to_string(replication) + "," +
            std::to_string(stats.round) + "," +
            strategy.label + "," +
            std::to_string(strategy.count) + "," +
            std::to_string(strategy.meanEnergy));
    }
}

void CsvRecorder::reportFinal(const RoundStats& stats) {
    // the final state is the round after the last one that was played
    reportRound(stats);
}
