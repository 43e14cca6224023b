#ifndef BETTING_STRATEGIES_HPP
#define BETTING_STRATEGIES_HPP

#include "game/decision_provider.hpp"
#include "game/game_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>

using BettingStrategy = std::function<Bet(const BetArgs& args, const HoleCards& holeCards, int bankRoll, std::mt19937& rng)>;

// Folds with an empty bank roll, goes all in when the call takes everything, checks when possible, otherwise calls
Bet defaultStrategy(const BetArgs& args, const HoleCards& holeCards, int bankRoll, std::mt19937& rng);

// Like the default strategy, but flips a coin between calling and raising by one to two minimum raises
Bet modestStrategy(const BetArgs& args, const HoleCards& holeCards, int bankRoll, std::mt19937& rng);

// Only plays pairs and strong aces, kings and queens pre-flop, raising at most twice per stage
Bet sixMaxStrategy(const BetArgs& args, const HoleCards& holeCards, int bankRoll, std::mt19937& rng);

std::optional<BettingStrategy> getStrategyFromName(const std::string& name);

// Plays for a computer player
class AutoDecisionProvider : public IDecisionProvider {
public:
    AutoDecisionProvider(BettingStrategy strategy, std::uint32_t seed);

    std::optional<Bet> decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) override;

private:
    BettingStrategy m_strategy;
    std::mt19937 m_rng;
};

#endif // BETTING_STRATEGIES_HPP
