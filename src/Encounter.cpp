#include "Encounter.hpp"

#include <stdexcept>
#include <string>

Outcome encounter(Agent& lender, Agent& borrower, const GameParams& params) {
    if (lender.id == borrower.id) {
        throw std::logic_error("Agent " + std::to_string(lender.id) + " cannot lend to itself");
    }

    if (lender.strategy->acceptOrRejectRequest(borrower.id) == Decision::Reject) {
        borrower.strategy->notifyAboutRejection(lender.id);
        return Outcome::Rejected;
    }

    Action action = borrower.strategy->coopOrDefect(lender.id);
    bool cooperated = action == Action::Cooperate;
    lender.strategy->notifyCoopOrDefect(borrower.id, cooperated);

    if (cooperated) {
        lender.energy += params.lenderCoop;
        borrower.energy += params.borrowerCoop;
        return Outcome::Cooperated;
    }

    lender.energy += params.lenderDefect;
    borrower.energy += params.borrowerDefect;
    return Outcome::Defected;
}
