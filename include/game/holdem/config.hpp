#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <limits>

namespace holdem {
constexpr int DeckSize = 52;
constexpr int NumHoleCards = 2;
constexpr int NumCommunityCards = 5;
constexpr int NumFlopCards = 3;
constexpr int HandSize = 5;
constexpr int MaxEvaluatedCards = NumHoleCards + NumCommunityCards;

constexpr int MinPlayers = 2;
constexpr int MaxPlayers = 6;

// Every player joins with this many big blinds
constexpr int BuyInBigBlinds = 100;

// Keeps every chip count of a full table within an int
constexpr int MaxBigBlind = std::numeric_limits<int>::max() / (BuyInBigBlinds * MaxPlayers);
} // namespace holdem

#endif // CONFIG_HPP
