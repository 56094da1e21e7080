#include "Encounter.hpp"
#include "RecordingStrategy.hpp"
#include "Strategies.hpp"
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static const GameParams params{-1.5, -4.0, 2.25, 3.5};

static Agent makeAgent(size_t id, Decision decision, Action action, std::vector<std::string>* log = nullptr) {
    return Agent{id, 100.0, std::make_unique<RecordingStrategy>(id, decision, action, log)};
}

static void testCooperationPayoffs() {
    std::vector<std::string> log;
    Agent lender = makeAgent(0, Decision::Accept, Action::Defect, &log);
    Agent borrower = makeAgent(1, Decision::Reject, Action::Cooperate, &log);

    assert(encounter(lender, borrower, params) == Outcome::Cooperated);
    assert(lender.energy == 100.0 + params.lenderCoop);
    assert(borrower.energy == 100.0 + params.borrowerCoop);
    assert((log == std::vector<std::string>{"0 request 1", "1 borrow 0", "0 cooperated 1"}));
}

static void testDefectionPayoffs() {
    std::vector<std::string> log;
    Agent lender = makeAgent(3, Decision::Accept, Action::Cooperate, &log);
    Agent borrower = makeAgent(8, Decision::Accept, Action::Defect, &log);

    assert(encounter(lender, borrower, params) == Outcome::Defected);
    assert(lender.energy == 100.0 + params.lenderDefect);
    assert(borrower.energy == 100.0 + params.borrowerDefect);
    assert((log == std::vector<std::string>{"3 request 8", "8 borrow 3", "3 defected 8"}));
}

static void testRejectionChangesNothing() {
    std::vector<std::string> log;
    Agent lender = makeAgent(0, Decision::Reject, Action::Cooperate, &log);
    Agent borrower = makeAgent(1, Decision::Accept, Action::Defect, &log);

    assert(encounter(lender, borrower, params) == Outcome::Rejected);
    assert(lender.energy == 100.0);
    assert(borrower.energy == 100.0);
    // the borrower is told, and never asked to cooperate
    assert((log == std::vector<std::string>{"0 request 1", "1 rejected 0"}));
}

static void testEnergyMayGoNegative() {
    Agent lender = makeAgent(0, Decision::Accept, Action::Cooperate);
    Agent borrower = makeAgent(1, Decision::Accept, Action::Defect);
    lender.energy = 1.0;
    encounter(lender, borrower, params);
    assert(lender.energy == 1.0 + params.lenderDefect);
    assert(lender.energy < 0.0);
}

static void testTrackerAgainstDefector() {
    Agent tracker{0, 256.0, std::make_unique<ReputationTracker>(defaultGameParams, false)};
    Agent evil{1, 256.0, makePureEvil(5)};
    auto* ledger = dynamic_cast<ReputationTracker*>(tracker.strategy.get());

    // seed a bad reputation, then the pessimist refuses
    ledger->notifyCoopOrDefect(1, false);
    assert(encounter(tracker, evil, defaultGameParams) == Outcome::Rejected);
    assert(evil.energy == 256.0);
    assert(tracker.energy == 256.0);
}

static void testSelfEncounterIsAnError() {
    Agent agent = makeAgent(4, Decision::Accept, Action::Cooperate);
    bool threw = false;
    try {
        encounter(agent, agent, params);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(agent.energy == 100.0);
}

static void testAgentToString() {
    Agent agent{12, 256.0, makePureEvil(1)};
    assert(agent.toString() == "12|256|pure evil");
    agent.energy = 253.5;
    assert(agent.toString() == "12|253.5|pure evil");

    Agent copy = agent.clone();
    copy.energy = 1.0;
    assert(copy.id == 12);
    assert(agent.energy == 253.5);
    assert(copy.strategy.get() != agent.strategy.get());
}

int main() {
    testCooperationPayoffs();
    testDefectionPayoffs();
    testRejectionChangesNothing();
    testEnergyMayGoNegative();
    testTrackerAgainstDefector();
    testSelfEncounterIsAnError();
    testAgentToString();
    return 0;
}
