#ifndef GAME_HPP
#define GAME_HPP

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_error.hpp"
#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/hand_comparison.hpp"
#include "game/holdem/player.hpp"
#include "game/holdem/pot_distribution.hpp"
#include "game/holdem/pot_ledger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct GameSettings {
    int bigBlind;
    int maxPlayers = holdem::MaxPlayers;
    std::optional<std::uint32_t> seed;
    int maxRounds = 0; // Zero means no limit
    bool awardRemainder = false;
};

// Runs rounds of Texas Hold'em for the seated players.
// A Game is owned and driven by a single thread. The only suspension points are the decide() calls into
// the players' decision providers.
class Game {
public:
    explicit Game(const GameSettings& settings);

    // Returns the name the player was seated under
    Result<std::string, GameError> join(const std::string& name, std::shared_ptr<IDecisionProvider> provider, std::shared_ptr<IEventSink> sink);
    void addObserver(std::shared_ptr<IEventSink> observer);

    // Plays rounds until a single player is left or the round limit is hit, then returns the game winner
    Result<std::string, GameError> play();
    GameStatus playRound();

    // Steps of a round
    void orderPlayers();
    void anteUp();
    GameStatus dealHoleCards();
    GameStatus dealFlop();
    GameStatus dealTurn();
    GameStatus dealRiver();
    GameStatus placeBets();
    std::optional<Winner> showdown();
    GameStatus distributePots();
    void resetAfterRound();
    // Refunds the chips of an unfinished round and clears it. The dealer and seats stay as they were.
    void abortRound();

    // Replaces the deck for the current round. The cards must not be in play already.
    GameStatus setDeck(Deck deck);
    void setBankRoll(const std::string& name, int bankRoll);

    Stage getStage() const;
    const Player& getPlayer(const std::string& name) const;
    bool hasPlayer(const std::string& name) const;
    const std::vector<std::string>& getSeatOrder() const;
    const std::optional<std::string>& getDealer() const;
    const PotLedger& getPotLedger() const;
    const std::vector<Card>& getCommunityCards() const;
    const Deck& getDeck() const;
    const std::optional<Winner>& getWinner() const;
    int getUndistributedChips() const;
    int getRetiredChips() const; // Carried away by players who left the table
    int getRoundsPlayed() const;
    int getSmallBlind() const;
    int getBigBlind() const;
    std::vector<PlayerInfo> getPlayerInfos() const;

private:
    Player& getMutablePlayer(const std::string& name);
    void broadcast(const GameEvent& event) const;
    void clearRound();
    GameStatus advanceStage();
    GameStatus dealCommunityCards(int numCards);

    void pay(Player& player, int amount);
    void goAllIn(Player& player);
    GameStatus applyBet(Player& player, const Bet& bet, int call, int& currentBet, int& cycle, std::vector<std::string>& pending);
    GameError buildProtocolViolation(const Player& player, const Bet& bet, int call) const;

    std::vector<std::string> getActiveNames() const;
    std::vector<std::string> getInHandNames() const;
    std::vector<std::string> getNamesAfter(const std::string& name) const;
    int countPlayers(bool (*predicate)(const Player&)) const;
    std::string getGameWinner() const;

    GameSettings m_settings;
    std::mt19937 m_rng;
    std::map<std::string, Player> m_players;
    std::vector<std::string> m_seatOrder;
    std::optional<std::string> m_dealer;
    std::vector<std::shared_ptr<IEventSink>> m_observers;

    Stage m_stage;
    Deck m_deck;
    std::vector<Card> m_communityCards;
    PotLedger m_ledger;
    std::vector<Contender> m_contenders;
    std::optional<Winner> m_winner;
    int m_undistributedChips;
    int m_retiredChips;
    int m_roundsPlayed;
};

#endif // GAME_HPP
