#include "cli/cli_dispatcher.hpp"
#include "cli/game_commands.hpp"

int main() {
    CliDispatcher dispatcher("HoldemEngine", Version{ .major = 1, .minor = 0, .patch = 0 });
    TableContext context = buildDefaultTableContext();
    registerAllCommands(dispatcher, context);

    dispatcher.run();

    return 0;
}
