#include "strategy/betting_strategies.hpp"

#include "game/decision_provider.hpp"
#include "game/game_types.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace {
// Returns the forced bet when the bank roll leaves no choice
std::optional<Bet> getForcedBet(const BetArgs& args, int bankRoll) {
    if (bankRoll == 0) {
        return Bet{ .type = BetType::Fold };
    }
    if (bankRoll <= args.call) {
        return Bet{ .type = BetType::AllIn, .amount = bankRoll };
    }
    return std::nullopt;
}

Bet callOrCheck(const BetArgs& args) {
    return (args.call == 0) ? Bet{ .type = BetType::Check } : Bet{ .type = BetType::Call };
}

bool isPlayablePreFlop(const HoleCards& holeCards) {
    Card high = std::max(holeCards[0], holeCards[1]);
    Card low = std::min(holeCards[0], holeCards[1]);
    bool suited = (high.suit == low.suit);

    if (high.rank == low.rank) {
        return true;
    }

    switch (high.rank) {
        case Rank::Ace:
            return (low.rank > Rank::Ten) || (suited && low.rank > Rank::Four);
        case Rank::King:
            return (low.rank > Rank::Ten) || (suited && low.rank > Rank::Nine);
        case Rank::Queen:
            return low.rank > Rank::Ten;
        default:
            return false;
    }
}
} // namespace

Bet defaultStrategy(const BetArgs& args, const HoleCards& /*holeCards*/, int bankRoll, std::mt19937& /*rng*/) {
    std::optional<Bet> forced = getForcedBet(args, bankRoll);
    return forced ? *forced : callOrCheck(args);
}

Bet modestStrategy(const BetArgs& args, const HoleCards& /*holeCards*/, int bankRoll, std::mt19937& rng) {
    std::optional<Bet> forced = getForcedBet(args, bankRoll);
    if (forced) {
        return *forced;
    }

    // Always keep at least one chip back
    int lowest = args.call + args.min;
    int highest = std::min(args.call + 2 * args.min, bankRoll - 1);
    std::bernoulli_distribution coin(0.5);
    if (lowest > highest || !coin(rng)) {
        return callOrCheck(args);
    }

    std::uniform_int_distribution<int> raiseDistribution(lowest, highest);
    return Bet{ .type = BetType::Raise, .amount = raiseDistribution(rng) };
}

Bet sixMaxStrategy(const BetArgs& args, const HoleCards& holeCards, int bankRoll, std::mt19937& /*rng*/) {
    std::optional<Bet> forced = getForcedBet(args, bankRoll);
    if (forced) {
        return *forced;
    }

    if (args.stage == Stage::PreFlop && !isPlayablePreFlop(holeCards)) {
        return (args.call == 0) ? Bet{ .type = BetType::Check } : Bet{ .type = BetType::Fold };
    }

    int raise = args.call + args.min;
    if (args.cycle < 2 && raise < bankRoll) {
        return Bet{ .type = BetType::Raise, .amount = raise };
    }
    return callOrCheck(args);
}

std::optional<BettingStrategy> getStrategyFromName(const std::string& name) {
    std::string lowerName = toLower(name);
    if (lowerName == "default") {
        return BettingStrategy{ defaultStrategy };
    }
    else if (lowerName == "modest") {
        return BettingStrategy{ modestStrategy };
    }
    else if (lowerName == "six-max") {
        return BettingStrategy{ sixMaxStrategy };
    }
    return std::nullopt;
}

AutoDecisionProvider::AutoDecisionProvider(BettingStrategy strategy, std::uint32_t seed) : m_strategy{ std::move(strategy) }, m_rng{ seed } {}

std::optional<Bet> AutoDecisionProvider::decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) {
    return m_strategy(args, holeCards, bankRoll, m_rng);
}
