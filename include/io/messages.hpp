#ifndef MESSAGES_HPP
#define MESSAGES_HPP

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <string>

// Wire messages are JSON objects tagged by their "type" field

std::string encodeEvent(const GameEvent& event);
std::string encodeBetRequest(const BetArgs& args, const HoleCards& holeCards, int bankRoll);
std::string encodeBet(const Bet& bet);

// Expects a PlayerBet message
Result<Bet> decodeBet(const std::string& message);

#endif // MESSAGES_HPP
