#include "cli/console_player.hpp"

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/hand.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

Result<Bet> parseBetInput(const std::string& input, int bankRoll) {
    std::vector<std::string> tokens = parseTokens(input, ' ');
    if (tokens.empty()) {
        return "No bet entered.";
    }

    std::string command = toLower(tokens[0]);
    if (tokens.size() == 2) {
        if (command != "r") {
            return "Only a raise takes an amount.";
        }

        std::optional<int> amountOption = parseInt(tokens[1]);
        if (!amountOption || *amountOption <= 0) {
            return "Raise amount must be a positive integer.";
        }
        return Bet{ .type = BetType::Raise, .amount = *amountOption };
    }
    else if (tokens.size() > 2) {
        return "Too many arguments: " + input;
    }

    if (command == "c") {
        return Bet{ .type = BetType::Call };
    }
    else if (command == "ch") {
        return Bet{ .type = BetType::Check };
    }
    else if (command == "a") {
        return Bet{ .type = BetType::AllIn, .amount = bankRoll };
    }
    else if (command == "f") {
        return Bet{ .type = BetType::Fold };
    }
    else if (command == "r") {
        return "A raise needs an amount.";
    }
    return "Unknown bet: " + tokens[0];
}

ConsoleDecisionProvider::ConsoleDecisionProvider(std::istream& input, std::ostream& output) : m_input{ input }, m_output{ output } {}

std::optional<Bet> ConsoleDecisionProvider::decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) {
    m_output << "Your turn to bet in the " << getStageName(args.stage) << ".\n";
    m_output << "Hole cards: " << getCardListName(holeCards) << "\n";
    if (!args.communityCards.empty()) {
        m_output << "Community cards: " << getCardListName(args.communityCards) << "\n";

        std::vector<Card> cards = args.communityCards;
        cards.insert(cards.end(), holeCards.begin(), holeCards.end());
        if (static_cast<int>(cards.size()) >= holdem::HandSize) {
            m_output << "Best hand: " << getHandName(getBestHand(cards).hand) << "\n";
        }
    }
    m_output << "To call: " << args.call << " (minimum raise " << args.min << "). Bank roll: " << bankRoll << "\n";

    while (true) {
        m_output << "Enter R <amount> (raise), C (call), Ch (check), A (all in) or F (fold): " << std::flush;

        std::string line;
        if (!std::getline(m_input, line)) {
            return std::nullopt;
        }

        Result<Bet> betResult = parseBetInput(line, bankRoll);
        if (betResult.isValue()) {
            return betResult.getValue();
        }
        m_output << "Error: " << betResult.getError() << "\n";
    }
}

ConsoleEventSink::ConsoleEventSink(std::ostream& output) : m_output{ output } {}

void ConsoleEventSink::notify(const GameEvent& event) {
    m_output << describeEvent(event) << "\n";
}
