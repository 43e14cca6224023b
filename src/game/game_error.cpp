#include "game/game_error.hpp"

#include <cassert>
#include <string>

bool isRecoverable(const GameError& error) {
    return error.kind == GameError::Kind::DeckExhausted;
}

std::string getErrorKindName(GameError::Kind kind) {
    switch (kind) {
        case GameError::Kind::TableFull:
            return "Table full";
        case GameError::Kind::NotEnoughPlayers:
            return "Not enough players";
        case GameError::Kind::ProtocolViolation:
            return "Protocol violation";
        case GameError::Kind::DeckExhausted:
            return "Deck exhausted";
        case GameError::Kind::NoDecision:
            return "No decision";
        case GameError::Kind::DistributionInconsistency:
            return "Distribution inconsistency";
        case GameError::Kind::InvalidDeck:
            return "Invalid deck";
        default:
            assert(false);
            return "";
    }
}
