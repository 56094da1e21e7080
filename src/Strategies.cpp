#include "Strategies.hpp"

#include <stdexcept>
#include <utility>

ReputationTracker::ReputationTracker(const GameParams &params, bool optimistic,
                                     bool revenging)
    : params(params), optimistic(optimistic), revenging(revenging) {}

Decision ReputationTracker::acceptOrRejectRequest(size_t peer) {
  auto it = reputations.find(peer);
  if (it == reputations.end()) {
    return optimistic ? Decision::Accept : Decision::Reject;
  }

  double score = it->second;
  if (score > 0.0 || (score == 0.0 && optimistic)) {
    return Decision::Accept;
  }
  return Decision::Reject;
}

void ReputationTracker::notifyAboutRejection(size_t) {}

Action ReputationTracker::coopOrDefect(size_t peer) {
  addToReputation(peer, params.borrowerCoop);

  if (revenging && reputations[peer] <= 0.0) {
    return Action::Defect;
  }
  return Action::Cooperate;
}

void ReputationTracker::notifyCoopOrDefect(size_t peer, bool cooperated) {
  addToReputation(peer, cooperated ? params.lenderCoop : params.lenderDefect);
}

std::string ReputationTracker::describeType() const {
  std::string type = "reputation tracker";
  if (!optimistic) {
    type += " (pessimistic)";
  }
  if (revenging) {
    type += " (revenging)";
  }
  return type;
}

std::unique_ptr<Strategy> ReputationTracker::clone() const {
  return std::make_unique<ReputationTracker>(*this);
}

std::optional<double> ReputationTracker::reputationOf(size_t peer) const {
  auto it = reputations.find(peer);
  if (it == reputations.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ReputationTracker::addToReputation(size_t peer, double delta) {
  // operator[] value-initializes an absent entry to 0.0
  reputations[peer] += delta;
}

RandomStrategy::RandomStrategy(double acceptProbability,
                               double cooperateProbability, std::string label,
                               uint64_t seed)
    : acceptProbability(acceptProbability),
      cooperateProbability(cooperateProbability), label(std::move(label)) {
  if (acceptProbability < 0.0 || acceptProbability > 1.0) {
    throw std::invalid_argument("Accept probability out of range: " +
                                std::to_string(acceptProbability));
  }
  if (cooperateProbability < 0.0 || cooperateProbability > 1.0) {
    throw std::invalid_argument("Cooperate probability out of range: " +
                                std::to_string(cooperateProbability));
  }

  std::seed_seq seq{static_cast<uint32_t>(seed),
                    static_cast<uint32_t>(seed >> 32)};
  gen.seed(seq);
}

Decision RandomStrategy::acceptOrRejectRequest(size_t) {
  std::bernoulli_distribution dist(acceptProbability);
  return dist(gen) ? Decision::Accept : Decision::Reject;
}

void RandomStrategy::notifyAboutRejection(size_t) {}

Action RandomStrategy::coopOrDefect(size_t) {
  std::bernoulli_distribution dist(cooperateProbability);
  return dist(gen) ? Action::Cooperate : Action::Defect;
}

void RandomStrategy::notifyCoopOrDefect(size_t, bool) {}

std::string RandomStrategy::describeType() const { return label; }

std::unique_ptr<Strategy> RandomStrategy::clone() const {
  // copies the generator state too, so the clone replays the same draws
  return std::make_unique<RandomStrategy>(*this);
}

std::unique_ptr<Strategy> makePureEvil(uint64_t seed) {
  return std::make_unique<RandomStrategy>(0.0, 0.0, "pure evil", seed);
}
