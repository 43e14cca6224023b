#include "game/holdem/hand_comparison.hpp"

#include "game/game_types.hpp"
#include "game/holdem/card_grouping.hpp"
#include "game/holdem/hand.hpp"
#include "game/holdem/hand_evaluation.hpp"

#include <algorithm>
#include <cassert>
#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace {
std::strong_ordering compareKickers(std::vector<Card> lhsCards, std::vector<Card> rhsCards) {
    sortByRankDescending(lhsCards);
    sortByRankDescending(rhsCards);

    std::size_t numCards = std::min(lhsCards.size(), rhsCards.size());
    for (std::size_t i = 0; i < numCards; ++i) {
        std::strong_ordering order = lhsCards[i].rank <=> rhsCards[i].rank;
        if (order != std::strong_ordering::equal) {
            return order;
        }
    }
    return std::strong_ordering::equal;
}
} // namespace

bool Winner::isDraw() const {
    return hands.size() > 1;
}

const PlayerHand& Winner::getSoleWinner() const {
    assert(hands.size() == 1);
    return hands[0];
}

std::vector<std::string> Winner::getNames() const {
    std::vector<std::string> names;
    for (const PlayerHand& hand : hands) {
        names.push_back(hand.name);
    }
    return names;
}

PlayerHand buildPlayerHand(const std::string& name, const std::vector<Card>& cards) {
    return PlayerHand{ .name = name, .bestHand = getBestHand(cards), .cards = cards };
}

std::strong_ordering compareHandStrength(const BestHand& lhs, const BestHand& rhs) {
    std::strong_ordering order = lhs.hand <=> rhs.hand;
    if (order != std::strong_ordering::equal) {
        return order;
    }

    switch (lhs.hand.category) {
        // These are fully determined by their embedded ranks
        case HandCategory::Straight:
        case HandCategory::StraightFlush:
        case HandCategory::FullHouse:
            return std::strong_ordering::equal;
        default:
            return compareKickers(lhs.cards, rhs.cards);
    }
}

Winner compareHands(const PlayerHand& lhs, const PlayerHand& rhs) {
    std::strong_ordering order = compareHandStrength(lhs.bestHand, rhs.bestHand);
    if (order == std::strong_ordering::greater) {
        return Winner{ .hands = { lhs } };
    }
    else if (order == std::strong_ordering::less) {
        return Winner{ .hands = { rhs } };
    }
    else {
        return Winner{ .hands = { lhs, rhs } };
    }
}

std::optional<Winner> determineWinner(const std::vector<PlayerHand>& hands) {
    if (hands.empty()) {
        return std::nullopt;
    }

    Winner winner{ .hands = { hands[0] } };
    for (std::size_t i = 1; i < hands.size(); ++i) {
        const PlayerHand& challenger = hands[i];

        // Every member of a draw group is equal, so the first one stands in for all of them
        std::strong_ordering order = compareHandStrength(challenger.bestHand, winner.hands[0].bestHand);
        if (order == std::strong_ordering::greater) {
            winner.hands = { challenger };
        }
        else if (order == std::strong_ordering::equal) {
            winner.hands.push_back(challenger);
        }
    }
    return winner;
}
