#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <vector>

using CardID = std::uint8_t;
using CardSet = std::uint64_t;

// Ace is always high
enum class Rank : std::uint8_t {
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

enum class Suit : std::uint8_t {
    Clubs,
    Diamonds,
    Hearts,
    Spades
};

struct Card {
    Rank rank;
    Suit suit;

    auto operator<=>(const Card&) const = default;
};

using HoleCards = std::array<Card, 2>;

enum class Stage : std::uint8_t {
    Blinds,
    Hole,
    PreFlop,
    Flop,
    Turn,
    River,
    ShowDown
};

enum class BetType : std::uint8_t {
    Fold,
    Check,
    Call,
    Raise,
    AllIn
};

// For Raise the amount is the number of chips paid by the raiser, for AllIn it is the player's bank roll.
// Bets reported by the engine carry the chips actually paid for Call as well.
// The amount is ignored for every other bet type.
struct Bet {
    BetType type;
    int amount = 0;

    bool operator==(const Bet&) const = default;
};

#endif // GAME_TYPES_HPP
