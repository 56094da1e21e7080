#ifndef ENCOUNTER_HPP
#define ENCOUNTER_HPP

#include "Agent.hpp"
#include "Types.hpp"

// One lending transaction. The lender decides whether to lend, the borrower
// then cooperates or defects and both energies move by the matching payoffs.
// Nothing changes hands on a rejection.
Outcome encounter(Agent& lender, Agent& borrower, const GameParams& params);

#endif // ENCOUNTER_HPP
