#include "game/events.hpp"

#include "game/game_utils.hpp"
#include "util/string_utils.hpp"

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

std::string describeEvent(const GameEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, PlayerJoined>) {
            return e.name + " joined with " + std::to_string(e.bankRoll) + " chips.";
        }
        else if constexpr (std::is_same_v<T, HoleCardsDealt>) {
            return e.name + " was dealt " + getCardListName(e.cards) + ".";
        }
        else if constexpr (std::is_same_v<T, BetPlaced>) {
            return e.name + ": " + getBetName(e.bet) + ", pot is " + std::to_string(e.pot) + ".";
        }
        else if constexpr (std::is_same_v<T, StageDeclared>) {
            std::string description = "--- " + getStageName(e.stage) + " ---";
            if (!e.communityCards.empty()) {
                description += " Board: " + getCardListName(e.communityCards);
            }
            return description;
        }
        else if constexpr (std::is_same_v<T, PlayersInfo>) {
            std::vector<std::string> entries;
            for (const PlayerInfo& player : e.players) {
                std::string entry = player.name + " (" + std::to_string(player.bankRoll) + ")";
                if (player.name == e.dealer) {
                    entry += " [D]";
                }
                entries.push_back(entry);
            }
            return "Players: " + join(entries, ", ");
        }
        else if constexpr (std::is_same_v<T, RoundWinner>) {
            std::vector<std::string> entries;
            for (std::size_t i = 0; i < e.names.size(); ++i) {
                std::string entry = e.names[i];
                if (i < e.handNames.size() && !e.handNames[i].empty()) {
                    entry += " with " + e.handNames[i];
                }
                if (i < e.bankRolls.size()) {
                    entry += ", now at " + std::to_string(e.bankRolls[i]);
                }
                entries.push_back(entry);
            }
            return ((e.names.size() > 1) ? "Round draw: " : "Round winner: ") + join(entries, "; ");
        }
        else {
            return e.name + " wins the game!";
        }
    }, event);
}
