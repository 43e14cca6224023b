#include "cli/game_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "cli/console_player.hpp"
#include "game/decision_provider.hpp"
#include "game/game_error.hpp"
#include "game/holdem/game.hpp"
#include "io/settings_loader.hpp"
#include "strategy/betting_strategies.hpp"
#include "util/names.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
struct SimulationResult {
    std::optional<std::string> winner;
    std::string error;
    int rounds;
};

void printDefaultSettingsNotice(const TableContext& context) {
    if (!context.settingsLoaded) {
        std::cout << "No settings file loaded, using the default table settings. Run \"config <file>\" to change them.\n";
    }
}

std::uint32_t getSeed(const GameSettings& settings, int offset) {
    if (settings.seed) {
        return *settings.seed + static_cast<std::uint32_t>(offset);
    }

    std::random_device device;
    return device();
}

// Seats the auto players, returns false if any of them could not join
bool seatAutoPlayers(Game& game, const TableSettings& settings, int numPlayers, std::uint32_t seedBase) {
    std::optional<BettingStrategy> strategy = getStrategyFromName(settings.autoStrategy);
    if (!strategy) {
        std::cerr << "Error: Unknown auto strategy " << settings.autoStrategy << ".\n";
        return false;
    }

    std::vector<std::string> names = getDefaultNames(numPlayers);
    for (std::size_t i = 0; i < names.size(); ++i) {
        std::uint32_t seed = seedBase + static_cast<std::uint32_t>(i);
        Result<std::string, GameError> joinResult = game.join(names[i], std::make_shared<AutoDecisionProvider>(*strategy, seed), nullptr);
        if (joinResult.isError()) {
            std::cerr << "Error: " << joinResult.getError().message << "\n";
            return false;
        }
    }
    return true;
}

bool reportGameResult(const Result<std::string, GameError>& result, const Game& game) {
    if (result.isError()) {
        const GameError& error = result.getError();
        std::cerr << "Error: " << getErrorKindName(error.kind) << ": " << error.message << "\n";
        return false;
    }

    std::cout << "Game over after " << game.getRoundsPlayed() << " rounds. Winner: " << result.getValue() << "\n";
    if (game.getUndistributedChips() > 0) {
        std::cout << "Chips lost to uneven splits: " << game.getUndistributedChips() << "\n";
    }
    return true;
}

bool handleConfig(TableContext& context, const std::string& argument) {
    Result<TableSettings> settingsResult = loadTableSettingsFromFile(argument);
    if (settingsResult.isError()) {
        std::cerr << "Error: " << settingsResult.getError() << "\n";
        return false;
    }

    context.settings = settingsResult.getValue();
    context.settingsLoaded = true;
    std::cout << "Successfully loaded table settings.\n\n";
    printTableSettings(context.settings);
    return true;
}

bool handlePlay(TableContext& context) {
    printDefaultSettingsNotice(context);
    const TableSettings& settings = context.settings;

    Game game{ settings.game };

    std::shared_ptr<IDecisionProvider> human = std::make_shared<ConsoleDecisionProvider>(std::cin, std::cout);
    if (settings.autoFoldOnNoDecision) {
        human = std::make_shared<FoldOnNoDecision>(human);
    }

    Result<std::string, GameError> joinResult = game.join(settings.playerName, human, std::make_shared<ConsoleEventSink>(std::cout));
    if (joinResult.isError()) {
        std::cerr << "Error: " << joinResult.getError().message << "\n";
        return false;
    }

    if (!seatAutoPlayers(game, settings, settings.autoPlayers, getSeed(settings.game, 1))) {
        return false;
    }

    std::cout << "Starting a game as " << joinResult.getValue() << ".\n";
    return reportGameResult(game.play(), game);
}

bool handleWatch(TableContext& context) {
    printDefaultSettingsNotice(context);
    const TableSettings& settings = context.settings;

    Game game{ settings.game };
    game.addObserver(std::make_shared<ConsoleEventSink>(std::cout));

    // The seat a human would take in "play" goes to another auto player
    if (!seatAutoPlayers(game, settings, settings.autoPlayers + 1, getSeed(settings.game, 1))) {
        return false;
    }

    return reportGameResult(game.play(), game);
}

bool handleSimulate(TableContext& context, const std::string& argument) {
    std::optional<int> numGamesOption = parseInt(argument);
    if (!numGamesOption || *numGamesOption < 1) {
        std::cerr << "Error: Number of games must be a positive integer.\n";
        return false;
    }

    printDefaultSettingsNotice(context);
    const TableSettings& settings = context.settings;
    int numGames = *numGamesOption;
    std::vector<SimulationResult> results(numGames);
    std::uint32_t seedBase = getSeed(settings.game, 0);

    auto runGame = [&settings, &results, seedBase](int gameIndex) {
        GameSettings gameSettings = settings.game;
        std::uint32_t gameSeed = seedBase + static_cast<std::uint32_t>(gameIndex) * 1000;
        gameSettings.seed = gameSeed;

        Game game{ gameSettings };
        SimulationResult& result = results[gameIndex];
        if (!seatAutoPlayers(game, settings, settings.autoPlayers + 1, gameSeed + 1)) {
            result.error = "Could not seat the players.";
            return;
        }

        Result<std::string, GameError> gameResult = game.play();
        result.rounds = game.getRoundsPlayed();
        if (gameResult.isError()) {
            result.error = gameResult.getError().message;
        }
        else {
            result.winner = gameResult.getValue();
        }
    };

    #ifdef _OPENMP
    omp_set_num_threads(context.numThreads);
    std::cout << "Simulating " << numGames << " games in parallel with " << context.numThreads << " threads.\n" << std::flush;

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < numGames; ++i) {
        runGame(i);
    }
    #else
    std::cout << "Simulating " << numGames << " games in single-threaded mode.\n" << std::flush;
    for (int i = 0; i < numGames; ++i) {
        runGame(i);
    }
    #endif

    std::map<std::string, int> wins;
    int totalRounds = 0;
    int numFailed = 0;
    for (int i = 0; i < numGames; ++i) {
        const SimulationResult& result = results[i];
        totalRounds += result.rounds;
        if (result.winner) {
            ++wins[*result.winner];
        }
        else {
            ++numFailed;
            std::cerr << "Error: Game " << i + 1 << " failed: " << result.error << "\n";
        }
    }

    std::cout << "Finished " << numGames << " games, " << totalRounds << " rounds in total.\n";
    for (const auto& [name, count] : wins) {
        std::cout << name << ": " << count << " wins\n";
    }
    return numFailed == 0;
}

bool handleSetNumThreads(TableContext& context, const std::string& argument) {
    #ifdef _OPENMP
    std::optional<int> numThreadsOption = parseInt(argument);
    if (!numThreadsOption) {
        std::cerr << "Error: Thread count must be an integer.\n";
        return false;
    }

    int numThreads = *numThreadsOption;
    if (numThreads < 1 || numThreads > 64) {
        std::cerr << "Error: Thread count must be between 1 and 64.\n";
        return false;
    }

    context.numThreads = numThreads;
    std::cout << "Successfully set number of threads to " << numThreads << ".\n";
    return true;
    #else
    context.numThreads = 1;
    std::cerr << "Error: OpenMP is not enabled, ignoring. Only single-threaded mode is supported.\n";
    return false;
    #endif
}
} // namespace

TableContext buildDefaultTableContext() {
    return TableContext{
        .settings = getDefaultTableSettings(),
        .settingsLoaded = false,
        #ifdef _OPENMP
        .numThreads = 6
        #else
        .numThreads = 1
        #endif
    };
}

bool registerAllCommands(CliDispatcher& dispatcher, TableContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "config",
        "file",
        "Loads table settings from a YAML file.",
        [&context](const std::string& argument) { return handleConfig(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "play",
        "Plays a game against the auto players.",
        [&context]() { return handlePlay(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "watch",
        "Watches a game between auto players.",
        [&context]() { return handleWatch(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "simulate",
        "games",
        "Plays the given number of auto player games and reports the winners.",
        [&context](const std::string& argument) { return handleSimulate(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "threads",
        "count",
        "Sets the number of threads used by simulate.",
        [&context](const std::string& argument) { return handleSetNumThreads(context, argument); }
    );

    return allSuccess;
}
