#include "game/holdem/hand_evaluation.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/card_grouping.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/hand.hpp"

#include <algorithm>
#include <cassert>
#include <initializer_list>
#include <span>
#include <vector>

namespace {
// Highest cards that are not part of the made hand
std::vector<Card> getKickers(std::span<const Card> cards, const std::vector<Card>& madeCards, int count) {
    CardSet madeSet = buildCardSet(madeCards);

    std::vector<Card> remaining;
    for (Card card : cards) {
        if (!setContainsCard(madeSet, card)) {
            remaining.push_back(card);
        }
    }
    sortByRankDescending(remaining);

    if (static_cast<int>(remaining.size()) > count) {
        remaining.resize(count);
    }
    return remaining;
}

BestHand buildBestHand(HandCategory category, std::vector<Card> madeCards, std::span<const Card> cards, std::initializer_list<Rank> ranks) {
    int numKickers = holdem::HandSize - static_cast<int>(madeCards.size());
    std::vector<Card> kickers = getKickers(cards, madeCards, numKickers);
    madeCards.insert(madeCards.end(), kickers.begin(), kickers.end());

    return BestHand{
        .hand = Hand{ .category = category, .ranks = ranks },
        .cards = std::move(madeCards)
    };
}

std::vector<Card> takeFirst(const CardGroup& group, int count) {
    assert(static_cast<int>(group.size()) >= count);
    return std::vector<Card>(group.begin(), group.begin() + count);
}
} // namespace

BestHand getBestHand(std::span<const Card> cards) {
    assert(cards.size() >= holdem::HandSize && cards.size() <= holdem::MaxEvaluatedCards);
    assert(getSetSize(buildCardSet(cards)) == static_cast<int>(cards.size()));

    std::vector<CardGroup> rankGroups = groupByRank(cards);
    std::vector<CardGroup> suitGroups = groupBySuit(cards);
    CardGroup sequence = longestSequence(cards);

    const CardGroup& largestRankGroup = rankGroups[0];
    const CardGroup& largestSuitGroup = suitGroups[0];
    bool hasFlush = largestSuitGroup.size() >= holdem::HandSize;

    if (hasFlush) {
        CardGroup suitedSequence = longestSequence(largestSuitGroup);
        if (suitedSequence.size() >= holdem::HandSize) {
            return buildBestHand(HandCategory::StraightFlush, takeFirst(suitedSequence, 5), cards, { suitedSequence[0].rank });
        }
    }

    if (largestRankGroup.size() == 4) {
        return buildBestHand(HandCategory::FourOfAKind, largestRankGroup, cards, { largestRankGroup[0].rank });
    }

    // Two triples still make a full house, the lower one supplies the pair
    if (largestRankGroup.size() == 3 && rankGroups.size() > 1 && rankGroups[1].size() >= 2) {
        std::vector<Card> madeCards = largestRankGroup;
        madeCards.push_back(rankGroups[1][0]);
        madeCards.push_back(rankGroups[1][1]);
        return buildBestHand(HandCategory::FullHouse, madeCards, cards, { largestRankGroup[0].rank, rankGroups[1][0].rank });
    }

    if (hasFlush) {
        std::vector<Card> flushCards = takeFirst(largestSuitGroup, 5);
        return buildBestHand(
            HandCategory::Flush,
            flushCards,
            cards,
            { flushCards[0].rank, flushCards[1].rank, flushCards[2].rank, flushCards[3].rank, flushCards[4].rank }
        );
    }

    if (sequence.size() >= holdem::HandSize) {
        return buildBestHand(HandCategory::Straight, takeFirst(sequence, 5), cards, { sequence[0].rank });
    }

    if (largestRankGroup.size() == 3) {
        return buildBestHand(HandCategory::ThreeOfAKind, largestRankGroup, cards, { largestRankGroup[0].rank });
    }

    if (largestRankGroup.size() == 2 && rankGroups[1].size() == 2) {
        std::vector<Card> madeCards = largestRankGroup;
        madeCards.insert(madeCards.end(), rankGroups[1].begin(), rankGroups[1].end());
        return buildBestHand(HandCategory::TwoPair, madeCards, cards, { largestRankGroup[0].rank, rankGroups[1][0].rank });
    }

    if (largestRankGroup.size() == 2) {
        return buildBestHand(HandCategory::OnePair, largestRankGroup, cards, { largestRankGroup[0].rank });
    }

    std::vector<Card> highCards = getKickers(cards, {}, holdem::HandSize);
    return BestHand{
        .hand = Hand{ .category = HandCategory::HighCard, .ranks = { highCards[0].rank } },
        .cards = highCards
    };
}
