#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>

enum Decision { Accept, Reject };
enum Action { Cooperate, Defect };
enum Outcome { Rejected, Cooperated, Defected };

// Payoffs applied to lender and borrower energy after an accepted request
struct GameParams {
    double lenderCoop;
    double lenderDefect;
    double borrowerCoop;
    double borrowerDefect;
};

inline constexpr GameParams defaultGameParams{
    -1.0, // lending effort + device wear
    -3.0, // loses the device
    2.0,  // uses the device
    3.0   // steals the device
};

struct StrategyStats {
    std::string label;
    size_t count = 0;
    double meanEnergy = 0.0;

    bool operator==(const StrategyStats&) const = default;
};

struct RoundStats {
    size_t round = 0;
    size_t populationSize = 0;
    std::vector<StrategyStats> strategies; // sorted by label

    bool operator==(const RoundStats&) const = default;
};

#endif // TYPES_HPP
