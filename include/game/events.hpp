#ifndef EVENTS_HPP
#define EVENTS_HPP

#include "game/game_types.hpp"

#include <string>
#include <variant>
#include <vector>

struct PlayerJoined {
    std::string name;
    int bankRoll;
};

// Only ever delivered to the player holding the cards
struct HoleCardsDealt {
    std::string name;
    HoleCards cards;
};

struct BetPlaced {
    std::string name;
    Bet bet;
    int pot; // Main pot plus every side pot after the bet
};

struct StageDeclared {
    Stage stage;
    std::vector<Card> communityCards;
};

struct PlayerInfo {
    std::string name;
    int bankRoll;
};

struct PlayersInfo {
    std::vector<PlayerInfo> players;
    std::string dealer;
};

struct RoundWinner {
    std::vector<std::string> names;
    std::vector<std::string> handNames; // An empty name when everyone else folded before five cards were out
    std::vector<int> bankRolls;
};

struct GameWinner {
    std::string name;
};

using GameEvent = std::variant<PlayerJoined, HoleCardsDealt, BetPlaced, StageDeclared, PlayersInfo, RoundWinner, GameWinner>;

std::string describeEvent(const GameEvent& event);

#endif // EVENTS_HPP
