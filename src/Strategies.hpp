#ifndef STRATEGIES_HPP
#define STRATEGIES_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include "Types.hpp"

// Behavior of one agent. Each instance is owned by exactly one agent and
// only ever sees peers through their ids.
class Strategy {
public:
  virtual ~Strategy() = default;

  // asked when the owner is the lender and peer wants to borrow
  virtual Decision acceptOrRejectRequest(size_t peer) = 0;
  // told when the owner was the borrower and peer refused to lend
  virtual void notifyAboutRejection(size_t peer) = 0;
  // asked when the owner is the borrower and peer agreed to lend
  virtual Action coopOrDefect(size_t peer) = 0;
  // told when the owner lent to peer and peer decided
  virtual void notifyCoopOrDefect(size_t peer, bool cooperated) = 0;

  virtual std::string describeType() const = 0;
  virtual std::unique_ptr<Strategy> clone() const = 0;
};

// Keeps a running score per peer: what the peer paid out to us as a lender
// plus what we earned from borrowing from it. Lends only to peers with a
// positive score (or an unknown / zero score when optimistic).
class ReputationTracker : public Strategy {
public:
  ReputationTracker(const GameParams &params, bool optimistic,
                    bool revenging = false);

  Decision acceptOrRejectRequest(size_t peer) override;
  void notifyAboutRejection(size_t peer) override;
  Action coopOrDefect(size_t peer) override;
  void notifyCoopOrDefect(size_t peer, bool cooperated) override;
  std::string describeType() const override;
  std::unique_ptr<Strategy> clone() const override;

  std::optional<double> reputationOf(size_t peer) const;
  bool isOptimistic() const { return optimistic; }

private:
  void addToReputation(size_t peer, double delta);

  GameParams params;
  std::unordered_map<size_t, double> reputations;
  bool optimistic;
  bool revenging; // defect against lenders we owe nothing to
};

// Memoryless policy: lends and cooperates with fixed probabilities.
class RandomStrategy : public Strategy {
public:
  RandomStrategy(double acceptProbability, double cooperateProbability,
                 std::string label, uint64_t seed);

  Decision acceptOrRejectRequest(size_t peer) override;
  void notifyAboutRejection(size_t peer) override;
  Action coopOrDefect(size_t peer) override;
  void notifyCoopOrDefect(size_t peer, bool cooperated) override;
  std::string describeType() const override;
  std::unique_ptr<Strategy> clone() const override;

private:
  double acceptProbability;
  double cooperateProbability;
  std::string label;
  std::mt19937 gen;
};

// Never lends and always defects as a borrower.
std::unique_ptr<Strategy> makePureEvil(uint64_t seed);

#endif // STRATEGIES_HPP
