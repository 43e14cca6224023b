#ifndef HAND_COMPARISON_HPP
#define HAND_COMPARISON_HPP

#include "game/game_types.hpp"
#include "game/holdem/hand.hpp"

#include <compare>
#include <optional>
#include <string>
#include <vector>

struct PlayerHand {
    std::string name;
    BestHand bestHand;
    std::vector<Card> cards; // Hole cards plus community cards
};

// A single entry for a sole winner, several entries for a draw
struct Winner {
    std::vector<PlayerHand> hands;

    bool isDraw() const;
    const PlayerHand& getSoleWinner() const;
    std::vector<std::string> getNames() const;
};

PlayerHand buildPlayerHand(const std::string& name, const std::vector<Card>& cards);

// Category first, then the embedded ranks, then the remaining kickers
std::strong_ordering compareHandStrength(const BestHand& lhs, const BestHand& rhs);
Winner compareHands(const PlayerHand& lhs, const PlayerHand& rhs);

// Folds the hands pairwise into a sole leader or a draw group. Returns nothing for an empty list.
std::optional<Winner> determineWinner(const std::vector<PlayerHand>& hands);

#endif // HAND_COMPARISON_HPP
