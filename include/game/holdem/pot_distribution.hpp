#ifndef POT_DISTRIBUTION_HPP
#define POT_DISTRIBUTION_HPP

#include "game/game_error.hpp"
#include "game/holdem/hand_comparison.hpp"
#include "game/holdem/pot_ledger.hpp"
#include "util/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// A non-folded player at showdown
struct Contender {
    PlayerHand hand;
    bool allIn;
};

struct DistributionResult {
    std::map<std::string, int> winnings;
    int undistributed; // Floor-division remainders nobody received
};

// Contenders must be listed in seat order. Winnings are only computed here, the caller applies them to the
// bank rolls in one pass. With awardRemainder set, split remainders go to the first player in seat order
// within the split group instead of being left undistributed.
Result<DistributionResult, GameError> distributePots(
    int mainPot,
    const std::vector<SidePot>& sidePots,
    const std::vector<Contender>& contenders,
    const std::optional<Winner>& winner,
    bool awardRemainder
);

#endif // POT_DISTRIBUTION_HPP
