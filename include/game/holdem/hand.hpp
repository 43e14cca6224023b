#ifndef HAND_HPP
#define HAND_HPP

#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "util/fixed_vector.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

// Declared from weakest to strongest
enum class HandCategory : std::uint8_t {
    HighCard,
    OnePair,
    TwoPair,
    ThreeOfAKind,
    Straight,
    Flush,
    FullHouse,
    FourOfAKind,
    StraightFlush
};

// Embedded ranks, highest first:
// HighCard(high card), OnePair(pair), TwoPair(high pair, low pair), ThreeOfAKind(triple),
// Straight(top), Flush(all five), FullHouse(triple, pair), FourOfAKind(quad), StraightFlush(top)
struct Hand {
    HandCategory category;
    FixedVector<Rank, holdem::HandSize> ranks;

    auto operator<=>(const Hand&) const = default;
};

struct BestHand {
    Hand hand;
    std::vector<Card> cards; // The cards realizing the hand, at most five
};

std::string getHandCategoryName(HandCategory category);
std::string getHandName(const Hand& hand);

#endif // HAND_HPP
