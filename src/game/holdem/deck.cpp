#include "game/holdem/deck.hpp"

#include "game/game_error.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

Deck::Deck(std::vector<Card> cards) : m_cards{ std::move(cards) } {}

Deck Deck::buildShuffled(std::mt19937& rng) {
    std::vector<Card> cards = buildOrderedDeck();
    std::shuffle(cards.begin(), cards.end(), rng);
    return Deck{ std::move(cards) };
}

Result<std::vector<Card>, GameError> Deck::takeCards(int numCards) {
    if (numCards > size()) {
        return GameError{
            .kind = GameError::Kind::DeckExhausted,
            .message = "Cannot take " + std::to_string(numCards) + " cards, only " + std::to_string(size()) + " left."
        };
    }

    std::vector<Card> taken(m_cards.begin(), m_cards.begin() + numCards);
    m_cards.erase(m_cards.begin(), m_cards.begin() + numCards);
    return taken;
}

GameStatus Deck::burnCard() {
    if (m_cards.empty()) {
        return GameError{ .kind = GameError::Kind::DeckExhausted, .message = "No cards left to burn." };
    }

    m_burned.push_back(m_cards.front());
    m_cards.erase(m_cards.begin());
    return std::monostate{};
}

int Deck::size() const {
    return static_cast<int>(m_cards.size());
}

const std::vector<Card>& Deck::getCards() const {
    return m_cards;
}

const std::vector<Card>& Deck::getBurnedCards() const {
    return m_burned;
}
