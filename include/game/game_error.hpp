#ifndef GAME_ERROR_HPP
#define GAME_ERROR_HPP

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <variant>

struct GameError {
    enum class Kind : std::uint8_t {
        TableFull,
        NotEnoughPlayers,
        ProtocolViolation,
        DeckExhausted,
        NoDecision,
        DistributionInconsistency,
        InvalidDeck
    };

    Kind kind;
    std::string message;
};

// Only after DeckExhausted may the caller retry the round, e.g. once a full deck is set.
// Aborted rounds are refunded either way.
bool isRecoverable(const GameError& error);
std::string getErrorKindName(GameError::Kind kind);

using GameStatus = Result<std::monostate, GameError>;

#endif // GAME_ERROR_HPP
