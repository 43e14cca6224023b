#include "game/game_utils.hpp"

#include "game/game_types.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <bit>
#include <cassert>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {
const std::string CardRankNames = "23456789TJQKA";
const std::string CardSuitNames = "cdhs";
} // namespace

CardID getCardID(Card card) {
    CardID cardID = static_cast<CardID>((static_cast<int>(card.rank) * 4) + static_cast<int>(card.suit));
    assert(cardID < 52);
    return cardID;
}

Card getCardFromID(CardID cardID) {
    assert(cardID < 52);
    return Card{ .rank = static_cast<Rank>(cardID / 4), .suit = static_cast<Suit>(cardID % 4) };
}

std::string getCardName(Card card) {
    std::string cardName = { CardRankNames[static_cast<int>(card.rank)], CardSuitNames[static_cast<int>(card.suit)] };
    return cardName;
}

std::string getRankName(Rank rank) {
    switch (rank) {
        case Rank::Jack:
            return "Jack";
        case Rank::Queen:
            return "Queen";
        case Rank::King:
            return "King";
        case Rank::Ace:
            return "Ace";
        default:
            return std::to_string(static_cast<int>(rank) + 2);
    }
}

Result<Card> getCardFromName(const std::string& cardName) {
    if (cardName.size() != 2) {
        return "Error parsing card: \"" + cardName + "\" must be a rank character followed by a suit character.";
    }

    std::size_t rank = CardRankNames.find(cardName[0]);
    if (rank == std::string::npos) {
        return "Error parsing card: \"" + cardName + "\" has an invalid rank.";
    }

    std::size_t suit = CardSuitNames.find(cardName[1]);
    if (suit == std::string::npos) {
        return "Error parsing card: \"" + cardName + "\" has an invalid suit.";
    }

    return Card{ .rank = static_cast<Rank>(rank), .suit = static_cast<Suit>(suit) };
}

Result<std::vector<Card>> getCardsFromString(const std::string& cardsString) {
    std::vector<Card> cards;
    CardSet seenCards = 0;
    for (const std::string& cardName : parseTokens(cardsString, ',')) {
        Result<Card> cardResult = getCardFromName(cardName);
        if (cardResult.isError()) {
            return cardResult.getError();
        }

        Card card = cardResult.getValue();
        if (setContainsCard(seenCards, card)) {
            return "Error parsing cards: \"" + cardName + "\" appears more than once.";
        }

        seenCards |= cardToSet(card);
        cards.push_back(card);
    }
    return cards;
}

std::string getCardListName(std::span<const Card> cards) {
    std::vector<std::string> cardNames;
    for (Card card : cards) {
        cardNames.push_back(getCardName(card));
    }
    return join(cardNames, " ");
}

std::vector<Card> buildOrderedDeck() {
    std::vector<Card> deck;
    deck.reserve(52);
    for (CardID cardID = 0; cardID < 52; ++cardID) {
        deck.push_back(getCardFromID(cardID));
    }
    return deck;
}

CardSet cardToSet(Card card) {
    return (1ULL << getCardID(card));
}

CardSet buildCardSet(std::span<const Card> cards) {
    CardSet cardSet = 0;
    for (Card card : cards) {
        cardSet |= cardToSet(card);
    }
    return cardSet;
}

int getSetSize(CardSet cardSet) {
    return std::popcount(cardSet);
}

bool setContainsCard(CardSet cardSet, Card card) {
    return (cardSet >> getCardID(card)) & 1;
}

Stage nextStage(Stage stage) {
    switch (stage) {
        case Stage::Blinds:
            return Stage::Hole;
        case Stage::Hole:
            return Stage::PreFlop;
        case Stage::PreFlop:
            return Stage::Flop;
        case Stage::Flop:
            return Stage::Turn;
        case Stage::Turn:
            return Stage::River;
        case Stage::River:
            return Stage::ShowDown;
        default:
            assert(false);
            return Stage::ShowDown;
    }
}

std::string getStageName(Stage stage) {
    switch (stage) {
        case Stage::Blinds:
            return "Blinds";
        case Stage::Hole:
            return "Hole";
        case Stage::PreFlop:
            return "Pre-Flop";
        case Stage::Flop:
            return "Flop";
        case Stage::Turn:
            return "Turn";
        case Stage::River:
            return "River";
        case Stage::ShowDown:
            return "Showdown";
        default:
            assert(false);
            return "";
    }
}

std::string getBetName(const Bet& bet) {
    switch (bet.type) {
        case BetType::Fold:
            return "Fold";
        case BetType::Check:
            return "Check";
        case BetType::Call:
            return (bet.amount > 0) ? "Call (" + std::to_string(bet.amount) + ")" : "Call";
        case BetType::Raise:
            return "Raise (" + std::to_string(bet.amount) + ")";
        case BetType::AllIn:
            return "All in (" + std::to_string(bet.amount) + ")";
        default:
            assert(false);
            return "";
    }
}
