#include "game/holdem/card_grouping.hpp"

#include "game/game_types.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <span>
#include <vector>

namespace {
void sortGroups(std::vector<CardGroup>& groups) {
    std::sort(groups.begin(), groups.end(), [](const CardGroup& lhs, const CardGroup& rhs) {
        if (lhs.size() != rhs.size()) {
            return lhs.size() > rhs.size();
        }
        return lhs.front() > rhs.front();
    });
}
} // namespace

std::vector<CardGroup> groupByRank(std::span<const Card> cards) {
    std::array<CardGroup, 13> byRank;
    for (Card card : cards) {
        byRank[static_cast<int>(card.rank)].push_back(card);
    }

    std::vector<CardGroup> groups;
    for (CardGroup& group : byRank) {
        if (!group.empty()) {
            std::sort(group.begin(), group.end(), std::greater<Card>());
            groups.push_back(std::move(group));
        }
    }

    sortGroups(groups);
    return groups;
}

std::vector<CardGroup> groupBySuit(std::span<const Card> cards) {
    std::array<CardGroup, 4> bySuit;
    for (Card card : cards) {
        bySuit[static_cast<int>(card.suit)].push_back(card);
    }

    std::vector<CardGroup> groups;
    for (CardGroup& group : bySuit) {
        if (!group.empty()) {
            sortByRankDescending(group);
            groups.push_back(std::move(group));
        }
    }

    std::sort(groups.begin(), groups.end(), [](const CardGroup& lhs, const CardGroup& rhs) {
        if (lhs.size() != rhs.size()) {
            return lhs.size() > rhs.size();
        }
        return lhs.front().suit > rhs.front().suit;
    });
    return groups;
}

CardGroup longestSequence(std::span<const Card> cards) {
    if (cards.empty()) {
        return {};
    }

    // Highest card of each rank present
    std::array<const Card*, 13> representatives{};
    for (const Card& card : cards) {
        const Card*& representative = representatives[static_cast<int>(card.rank)];
        if (representative == nullptr || card.suit > representative->suit) {
            representative = &card;
        }
    }

    int bestLength = 0;
    int bestTop = -1;
    int currentLength = 0;
    for (int rank = 0; rank < 13; ++rank) {
        currentLength = (representatives[rank] != nullptr) ? currentLength + 1 : 0;
        if (currentLength > 0 && currentLength >= bestLength) {
            bestLength = currentLength;
            bestTop = rank;
        }
    }

    CardGroup sequence;
    for (int rank = bestTop; rank > bestTop - bestLength; --rank) {
        sequence.push_back(*representatives[rank]);
    }
    return sequence;
}

void sortByRankDescending(std::vector<Card>& cards) {
    std::sort(cards.begin(), cards.end(), std::greater<Card>());
}
