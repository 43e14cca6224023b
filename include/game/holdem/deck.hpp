#ifndef DECK_HPP
#define DECK_HPP

#include "game/game_error.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <random>
#include <vector>

class Deck {
public:
    // Cards are dealt from the front
    explicit Deck(std::vector<Card> cards);

    static Deck buildShuffled(std::mt19937& rng);

    Result<std::vector<Card>, GameError> takeCards(int numCards);
    GameStatus burnCard();

    int size() const;
    const std::vector<Card>& getCards() const;
    const std::vector<Card>& getBurnedCards() const;

private:
    std::vector<Card> m_cards;
    std::vector<Card> m_burned;
};

#endif // DECK_HPP
