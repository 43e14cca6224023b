#include "io/settings_loader.hpp"

#include "game/holdem/config.hpp"
#include "game/holdem/game.hpp"
#include "strategy/betting_strategies.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return true;
        }
        catch (const YAML::Exception& e) {
            std::cerr << "Error: Field " << join(indices, "::") << " has the wrong type. " << e.what() << "\n";
            return false;
        }
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
bool loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cerr << "Error: Could not load field " << join(indices, "::") << ".\n";
        return false;
    }

    return true;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
        field = defaultValue;
    }
}
} // namespace

TableSettings getDefaultTableSettings() {
    return TableSettings{
        .game = GameSettings{
            .bigBlind = 20,
            .maxPlayers = holdem::MaxPlayers,
            .seed = std::nullopt,
            .maxRounds = 0,
            .awardRemainder = false
        },
        .autoPlayers = 3,
        .playerName = "Player",
        .autoStrategy = "modest",
        .autoFoldOnNoDecision = false,
        .decisionTimeoutMs = 0
    };
}

Result<TableSettings> loadTableSettings(const YAML::Node& root) {
    TableSettings defaults = getDefaultTableSettings();
    TableSettings settings = defaults;

    if (!root.IsMap()) {
        return "Table settings must be a map of fields.";
    }

    if (!loadFieldRequired(settings.game.bigBlind, root, { "big-blind" })) {
        return "Missing big blind.";
    }
    if (settings.game.bigBlind < 2 || settings.game.bigBlind > holdem::MaxBigBlind) {
        return "Big blind must be between 2 and " + std::to_string(holdem::MaxBigBlind) + ".";
    }

    loadFieldOptional(settings.game.maxPlayers, root, { "max-players" }, defaults.game.maxPlayers);
    if (settings.game.maxPlayers < holdem::MinPlayers || settings.game.maxPlayers > holdem::MaxPlayers) {
        return "Maximum players must be between " + std::to_string(holdem::MinPlayers) + " and " + std::to_string(holdem::MaxPlayers) + ".";
    }

    // The human seat in "play" takes one place at the table
    loadFieldOptional(settings.autoPlayers, root, { "auto-players" }, defaults.autoPlayers);
    if (settings.autoPlayers < 1 || settings.autoPlayers > settings.game.maxPlayers - 1) {
        return "Auto players must be between 1 and " + std::to_string(settings.game.maxPlayers - 1) + ".";
    }

    loadFieldOptional(settings.playerName, root, { "player-name" }, defaults.playerName);
    settings.playerName = trim(settings.playerName);
    if (settings.playerName.empty()) {
        return "Player name must not be empty.";
    }

    loadFieldOptional(settings.autoStrategy, root, { "auto-strategy" }, defaults.autoStrategy);
    if (!getStrategyFromName(settings.autoStrategy)) {
        return "Unknown auto strategy " + settings.autoStrategy + ", expected default, modest or six-max.";
    }

    std::uint32_t seed = 0;
    if (loadField(seed, root, { "seed" }, 0)) {
        settings.game.seed = seed;
    }
    else {
        std::cout << "Could not load field seed, using a random seed.\n";
    }

    loadFieldOptional(settings.game.maxRounds, root, { "max-rounds" }, defaults.game.maxRounds);
    if (settings.game.maxRounds < 0) {
        return "Maximum rounds must not be negative.";
    }

    loadFieldOptional(settings.game.awardRemainder, root, { "award-remainder" }, defaults.game.awardRemainder);
    loadFieldOptional(settings.autoFoldOnNoDecision, root, { "auto-fold-on-no-decision" }, defaults.autoFoldOnNoDecision);

    loadFieldOptional(settings.decisionTimeoutMs, root, { "decision-timeout-ms" }, defaults.decisionTimeoutMs);
    if (settings.decisionTimeoutMs < 0) {
        return "Decision timeout must not be negative.";
    }

    return settings;
}

Result<TableSettings> loadTableSettingsFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        return "Could not load settings file. " + std::string{ e.what() };
    }

    std::cout << "Loading table settings from " << path << ":\n";
    return loadTableSettings(root);
}

void printTableSettings(const TableSettings& settings) {
    std::cout << "Big blind: " << settings.game.bigBlind << " (small blind " << settings.game.bigBlind / 2
        << ", buy-in " << holdem::BuyInBigBlinds * settings.game.bigBlind << ")\n";
    std::cout << "Maximum players: " << settings.game.maxPlayers << "\n";
    std::cout << "Auto players: " << settings.autoPlayers << " (" << settings.autoStrategy << ")\n";
    std::cout << "Player name: " << settings.playerName << "\n";
    std::cout << "Seed: " << (settings.game.seed ? std::to_string(*settings.game.seed) : "random") << "\n";
    std::cout << "Maximum rounds: " << ((settings.game.maxRounds > 0) ? std::to_string(settings.game.maxRounds) : "unlimited") << "\n";
    std::cout << "Award remainder chips: " << (settings.game.awardRemainder ? "yes" : "no") << "\n";
    std::cout << "Fold on no decision: " << (settings.autoFoldOnNoDecision ? "yes" : "no") << "\n";
}
