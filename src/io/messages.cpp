#include "io/messages.hpp"

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <type_traits>
#include <variant>

using json = nlohmann::ordered_json;

namespace {
std::string getStageWireName(Stage stage) {
    switch (stage) {
        case Stage::Blinds:
            return "Blinds";
        case Stage::Hole:
            return "Hole";
        case Stage::PreFlop:
            return "PreFlop";
        case Stage::Flop:
            return "Flop";
        case Stage::Turn:
            return "Turn";
        case Stage::River:
            return "River";
        case Stage::ShowDown:
            return "ShowDown";
        default:
            assert(false);
            return "";
    }
}

std::string getBetTypeWireName(BetType type) {
    switch (type) {
        case BetType::Fold:
            return "Fold";
        case BetType::Check:
            return "Check";
        case BetType::Call:
            return "Call";
        case BetType::Raise:
            return "Raise";
        case BetType::AllIn:
            return "AllIn";
        default:
            assert(false);
            return "";
    }
}

json buildJSONCards(std::span<const Card> cards) {
    json j = json::array();
    for (Card card : cards) {
        j.push_back(getCardName(card));
    }
    return j;
}

json buildJSONBet(const Bet& bet) {
    json j;
    j["type"] = getBetTypeWireName(bet.type);
    if (bet.type == BetType::Raise || bet.type == BetType::AllIn || (bet.type == BetType::Call && bet.amount > 0)) {
        j["amount"] = bet.amount;
    }
    return j;
}

json buildJSONEvent(const GameEvent& event) {
    return std::visit([](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;

        json j;
        if constexpr (std::is_same_v<T, PlayerJoined>) {
            j["type"] = "Player";
            j["name"] = e.name;
            j["bank_roll"] = e.bankRoll;
        }
        else if constexpr (std::is_same_v<T, HoleCardsDealt>) {
            j["type"] = "HoleCards";
            j["cards"] = buildJSONCards(e.cards);
        }
        else if constexpr (std::is_same_v<T, BetPlaced>) {
            j["type"] = "BetPlaced";
            j["player"] = e.name;
            j["bet"] = buildJSONBet(e.bet);
            j["pot"] = e.pot;
        }
        else if constexpr (std::is_same_v<T, StageDeclared>) {
            j["type"] = "StageDeclared";
            j["stage"] = getStageWireName(e.stage);
            j["community_cards"] = buildJSONCards(e.communityCards);
        }
        else if constexpr (std::is_same_v<T, PlayersInfo>) {
            j["type"] = "PlayersInfo";
            j["players"] = json::array();
            for (const PlayerInfo& player : e.players) {
                j["players"].push_back({ { "name", player.name }, { "bank_roll", player.bankRoll } });
            }
            j["dealer"] = e.dealer;
        }
        else if constexpr (std::is_same_v<T, RoundWinner>) {
            j["type"] = "RoundWinner";
            j["winners"] = json::array();
            for (std::size_t i = 0; i < e.names.size(); ++i) {
                json winner;
                winner["name"] = e.names[i];
                if (i < e.handNames.size()) {
                    winner["hand"] = e.handNames[i];
                }
                if (i < e.bankRolls.size()) {
                    winner["bank_roll"] = e.bankRolls[i];
                }
                j["winners"].push_back(winner);
            }
        }
        else {
            j["type"] = "GameWinner";
            j["name"] = e.name;
        }
        return j;
    }, event);
}

Result<BetType> getBetTypeFromWireName(const std::string& name) {
    for (BetType type : { BetType::Fold, BetType::Check, BetType::Call, BetType::Raise, BetType::AllIn }) {
        if (getBetTypeWireName(type) == name) {
            return type;
        }
    }
    return "Unknown bet type: " + name;
}
} // namespace

std::string encodeEvent(const GameEvent& event) {
    return buildJSONEvent(event).dump();
}

std::string encodeBetRequest(const BetArgs& args, const HoleCards& holeCards, int bankRoll) {
    json j;
    j["type"] = "PlaceBet";
    j["args"]["call"] = args.call;
    j["args"]["min"] = args.min;
    j["args"]["stage"] = getStageWireName(args.stage);
    j["args"]["cycle"] = args.cycle;
    j["args"]["community_cards"] = buildJSONCards(args.communityCards);
    j["hole_cards"] = buildJSONCards(holeCards);
    j["bank_roll"] = bankRoll;
    return j.dump();
}

std::string encodeBet(const Bet& bet) {
    json j;
    j["type"] = "PlayerBet";
    j["bet"] = buildJSONBet(bet);
    return j.dump();
}

Result<Bet> decodeBet(const std::string& message) {
    json j = json::parse(message, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return "Malformed message: " + message;
    }

    if (!j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>() != "PlayerBet") {
        return "Expected a PlayerBet message: " + message;
    }

    if (!j.contains("bet") || !j["bet"].is_object()) {
        return "PlayerBet message without a bet: " + message;
    }

    const json& betJSON = j["bet"];
    if (!betJSON.contains("type") || !betJSON["type"].is_string()) {
        return "Bet without a type: " + message;
    }

    Result<BetType> typeResult = getBetTypeFromWireName(betJSON["type"].get<std::string>());
    if (typeResult.isError()) {
        return typeResult.getError();
    }

    Bet bet{ .type = typeResult.getValue() };
    if (betJSON.contains("amount")) {
        if (!betJSON["amount"].is_number_integer()) {
            return "Bet amount is not an integer: " + message;
        }
        std::int64_t amount = betJSON["amount"].get<std::int64_t>();
        if (amount < 0 || amount > std::numeric_limits<int>::max()) {
            return "Bet amount out of range: " + message;
        }
        bet.amount = static_cast<int>(amount);
    }
    else if (bet.type == BetType::Raise) {
        return "Raise without an amount: " + message;
    }
    return bet;
}
