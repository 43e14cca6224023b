#ifndef GAME_COMMANDS_HPP
#define GAME_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "io/settings_loader.hpp"

struct TableContext {
    TableSettings settings;
    bool settingsLoaded;
    int numThreads;
};

TableContext buildDefaultTableContext();
bool registerAllCommands(CliDispatcher& dispatcher, TableContext& context);

#endif // GAME_COMMANDS_HPP
