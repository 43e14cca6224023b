#ifndef CONSOLE_PLAYER_HPP
#define CONSOLE_PLAYER_HPP

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <iostream>
#include <optional>
#include <string>

// Accepts "R <amount>", "C", "Ch", "A" or "F", case insensitive
Result<Bet> parseBetInput(const std::string& input, int bankRoll);

// Asks a human at the terminal. Gives no decision once the input stream ends.
class ConsoleDecisionProvider : public IDecisionProvider {
public:
    ConsoleDecisionProvider(std::istream& input, std::ostream& output);

    std::optional<Bet> decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) override;

private:
    std::istream& m_input;
    std::ostream& m_output;
};

class ConsoleEventSink : public IEventSink {
public:
    explicit ConsoleEventSink(std::ostream& output);

    void notify(const GameEvent& event) override;

private:
    std::ostream& m_output;
};

#endif // CONSOLE_PLAYER_HPP
