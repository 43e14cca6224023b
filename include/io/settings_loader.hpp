#ifndef SETTINGS_LOADER_HPP
#define SETTINGS_LOADER_HPP

#include "game/holdem/game.hpp"
#include "util/result.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

// Everything needed to set up a table from the command line
struct TableSettings {
    GameSettings game;
    int autoPlayers;
    std::string playerName;
    std::string autoStrategy;
    bool autoFoldOnNoDecision;
    int decisionTimeoutMs;
};

Result<TableSettings> loadTableSettings(const YAML::Node& root);
Result<TableSettings> loadTableSettingsFromFile(const std::string& path);

TableSettings getDefaultTableSettings();
void printTableSettings(const TableSettings& settings);

#endif // SETTINGS_LOADER_HPP
