#ifndef CARD_GROUPING_HPP
#define CARD_GROUPING_HPP

#include "game/game_types.hpp"

#include <span>
#include <vector>

using CardGroup = std::vector<Card>;

// Groups sorted by descending size, then descending rank. Cards within a group are sorted by descending suit.
std::vector<CardGroup> groupByRank(std::span<const Card> cards);

// Groups sorted by descending size, then descending suit. Cards within a group are sorted by descending rank.
std::vector<CardGroup> groupBySuit(std::span<const Card> cards);

// One card per rank of the longest run of consecutive ranks, highest rank first.
// Ties between equally long runs go to the higher run. Aces only count high.
CardGroup longestSequence(std::span<const Card> cards);

void sortByRankDescending(std::vector<Card>& cards);

#endif // CARD_GROUPING_HPP
