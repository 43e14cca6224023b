#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <vector>

// Card functions
CardID getCardID(Card card);
Card getCardFromID(CardID cardID);
std::string getCardName(Card card);
std::string getRankName(Rank rank);
Result<Card> getCardFromName(const std::string& cardName);
Result<std::vector<Card>> getCardsFromString(const std::string& cardsString);
std::string getCardListName(std::span<const Card> cards);
std::vector<Card> buildOrderedDeck();

// CardSet functions
CardSet cardToSet(Card card);
CardSet buildCardSet(std::span<const Card> cards);
int getSetSize(CardSet cardSet);
bool setContainsCard(CardSet cardSet, Card card);

// Stage functions
Stage nextStage(Stage stage);
std::string getStageName(Stage stage);

// Bet functions
std::string getBetName(const Bet& bet);

#endif // GAME_UTILS_HPP
