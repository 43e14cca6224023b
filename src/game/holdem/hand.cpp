#include "game/holdem/hand.hpp"

#include "game/game_utils.hpp"

#include <cassert>
#include <string>

std::string getHandCategoryName(HandCategory category) {
    switch (category) {
        case HandCategory::HighCard:
            return "High Card";
        case HandCategory::OnePair:
            return "One Pair";
        case HandCategory::TwoPair:
            return "Two Pair";
        case HandCategory::ThreeOfAKind:
            return "Three of a Kind";
        case HandCategory::Straight:
            return "Straight";
        case HandCategory::Flush:
            return "Flush";
        case HandCategory::FullHouse:
            return "Full House";
        case HandCategory::FourOfAKind:
            return "Four of a Kind";
        case HandCategory::StraightFlush:
            return "Straight Flush";
        default:
            assert(false);
            return "";
    }
}

std::string getHandName(const Hand& hand) {
    std::string categoryName = getHandCategoryName(hand.category);
    if (hand.ranks.empty()) {
        return categoryName;
    }

    switch (hand.category) {
        case HandCategory::TwoPair:
            return categoryName + " (" + getRankName(hand.ranks[0]) + " and " + getRankName(hand.ranks[1]) + ")";
        case HandCategory::Straight:
        case HandCategory::StraightFlush:
            return categoryName + " (ending " + getRankName(hand.ranks[0]) + ")";
        case HandCategory::Flush:
            return categoryName + " (" + getRankName(hand.ranks.front()) + " to " + getRankName(hand.ranks.back()) + ")";
        case HandCategory::FullHouse:
            return categoryName + " (" + getRankName(hand.ranks[0]) + " " + getRankName(hand.ranks[1]) + ")";
        default:
            return categoryName + " (" + getRankName(hand.ranks[0]) + ")";
    }
}
