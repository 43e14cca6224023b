#include "game/holdem/game.hpp"

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_error.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/hand_comparison.hpp"
#include "game/holdem/player.hpp"
#include "game/holdem/pot_distribution.hpp"
#include "util/names.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {
bool isInHand(const Player& player) {
    return !player.folded;
}

bool isAbleToAct(const Player& player) {
    return player.canAct();
}

std::mt19937 buildRng(const std::optional<std::uint32_t>& seed) {
    if (seed) {
        return std::mt19937{ *seed };
    }

    std::random_device device;
    return std::mt19937{ device() };
}
} // namespace

Game::Game(const GameSettings& settings) :
    m_settings{ settings },
    m_rng{ buildRng(settings.seed) },
    m_stage{ Stage::Blinds },
    m_deck{ Deck::buildShuffled(m_rng) },
    m_undistributedChips{ 0 },
    m_retiredChips{ 0 },
    m_roundsPlayed{ 0 } {
    assert(m_settings.bigBlind > 1 && m_settings.bigBlind <= holdem::MaxBigBlind);
    assert(m_settings.maxPlayers >= holdem::MinPlayers && m_settings.maxPlayers <= holdem::MaxPlayers);
}

Result<std::string, GameError> Game::join(const std::string& name, std::shared_ptr<IDecisionProvider> provider, std::shared_ptr<IEventSink> sink) {
    assert(provider);

    if (static_cast<int>(m_seatOrder.size()) >= m_settings.maxPlayers) {
        return GameError{
            .kind = GameError::Kind::TableFull,
            .message = "Cannot seat " + name + ", the table already has " + std::to_string(m_seatOrder.size()) + " players."
        };
    }

    std::set<std::string> taken(m_seatOrder.begin(), m_seatOrder.end());
    std::string seatedName = disambiguateName(name, taken);
    int bankRoll = holdem::BuyInBigBlinds * m_settings.bigBlind;

    Player player = buildPlayer(seatedName, bankRoll, std::move(provider), std::move(sink));
    PlayerJoined event{ .name = seatedName, .bankRoll = bankRoll };
    player.notify(event);
    for (const std::shared_ptr<IEventSink>& observer : m_observers) {
        observer->notify(event);
    }

    m_players.emplace(seatedName, std::move(player));
    m_seatOrder.push_back(seatedName);
    return seatedName;
}

void Game::addObserver(std::shared_ptr<IEventSink> observer) {
    assert(observer);
    m_observers.push_back(std::move(observer));
}

Result<std::string, GameError> Game::play() {
    if (static_cast<int>(m_seatOrder.size()) < holdem::MinPlayers) {
        return GameError{
            .kind = GameError::Kind::NotEnoughPlayers,
            .message = "A game needs at least " + std::to_string(holdem::MinPlayers) + " players."
        };
    }

    while (static_cast<int>(m_seatOrder.size()) >= holdem::MinPlayers) {
        if (m_settings.maxRounds > 0 && m_roundsPlayed >= m_settings.maxRounds) {
            break;
        }

        GameStatus status = playRound();
        if (status.isError()) {
            return status.getError();
        }
    }

    if (m_seatOrder.empty()) {
        return GameError{ .kind = GameError::Kind::NotEnoughPlayers, .message = "Every player left the table." };
    }

    std::string winner = getGameWinner();
    broadcast(GameWinner{ .name = winner });
    return winner;
}

GameStatus Game::playRound() {
    if (static_cast<int>(m_seatOrder.size()) < holdem::MinPlayers) {
        return GameError{ .kind = GameError::Kind::NotEnoughPlayers, .message = "Not enough players for a round." };
    }

    m_stage = Stage::Blinds;
    orderPlayers();
    broadcast(PlayersInfo{ .players = getPlayerInfos(), .dealer = *m_dealer });
    broadcast(StageDeclared{ .stage = m_stage, .communityCards = {} });
    anteUp();

    while (m_stage != Stage::ShowDown) {
        GameStatus status = advanceStage();
        if (status.isError()) {
            std::cerr << "Error: Round aborted: " << status.getError().message << "\n";
            abortRound();
            return status;
        }
    }

    ++m_roundsPlayed;
    resetAfterRound();
    return std::monostate{};
}

void Game::orderPlayers() {
    if (m_seatOrder.empty()) {
        return;
    }

    // The first player to join deals the first round
    if (!m_dealer || !hasPlayer(*m_dealer)) {
        m_dealer = m_seatOrder.front();
    }

    auto dealerIt = std::find(m_seatOrder.begin(), m_seatOrder.end(), *m_dealer);
    std::rotate(m_seatOrder.begin(), dealerIt + 1, m_seatOrder.end());
}

void Game::anteUp() {
    for (std::size_t i = 0; i < m_seatOrder.size(); ++i) {
        Player& player = getMutablePlayer(m_seatOrder[i]);
        int blind = (i == 0) ? getSmallBlind() : getBigBlind();

        Bet bet{ .type = BetType::Fold };
        if (player.bankRoll > blind) {
            pay(player, blind);
            bet = Bet{ .type = BetType::Call, .amount = blind };
        }
        else if (player.bankRoll > 0) {
            bet = Bet{ .type = BetType::AllIn, .amount = player.bankRoll };
            goAllIn(player);
        }
        else {
            player.folded = true;
        }

        broadcast(BetPlaced{ .name = player.name, .bet = bet, .pot = m_ledger.getTotal() });
    }
}

GameStatus Game::dealHoleCards() {
    int numCards = holdem::NumHoleCards * countPlayers(isInHand);
    if (numCards > m_deck.size()) {
        return GameError{
            .kind = GameError::Kind::DeckExhausted,
            .message = "Cannot deal " + std::to_string(numCards) + " hole cards, only " + std::to_string(m_deck.size()) + " left."
        };
    }

    for (const std::string& name : m_seatOrder) {
        Player& player = getMutablePlayer(name);
        if (player.folded) {
            continue;
        }

        Result<std::vector<Card>, GameError> cardsResult = m_deck.takeCards(holdem::NumHoleCards);
        if (cardsResult.isError()) {
            return cardsResult.getError();
        }

        const std::vector<Card>& cards = cardsResult.getValue();
        player.holeCards = HoleCards{ cards[0], cards[1] };
        player.notify(HoleCardsDealt{ .name = name, .cards = *player.holeCards });
    }
    return std::monostate{};
}

GameStatus Game::dealFlop() {
    return dealCommunityCards(holdem::NumFlopCards);
}

GameStatus Game::dealTurn() {
    return dealCommunityCards(1);
}

GameStatus Game::dealRiver() {
    return dealCommunityCards(1);
}

GameStatus Game::placeBets() {
    if (countPlayers(isInHand) <= 1) {
        return std::monostate{};
    }

    std::vector<std::string> pending = getActiveNames();
    int currentBet = m_ledger.getHighestStageContribution();
    int cycle = 0;

    while (!pending.empty() && countPlayers(isInHand) > 1) {
        Player& player = getMutablePlayer(pending.front());
        pending.erase(pending.begin());
        if (!player.canAct()) {
            continue;
        }

        int call = currentBet - m_ledger.getStageContribution(player.name);

        // Nobody is left to bet against
        if (call == 0 && countPlayers(isAbleToAct) == 1) {
            continue;
        }

        assert(player.holeCards);
        BetArgs args{
            .call = call,
            .min = getBigBlind(),
            .stage = m_stage,
            .cycle = cycle,
            .communityCards = m_communityCards
        };

        std::optional<Bet> bet = player.provider->decide(args, *player.holeCards, player.bankRoll);
        if (!bet) {
            return GameError{
                .kind = GameError::Kind::NoDecision,
                .message = "No decision from " + player.name + " in " + getStageName(m_stage) + "."
            };
        }

        GameStatus status = applyBet(player, *bet, call, currentBet, cycle, pending);
        if (status.isError()) {
            return status;
        }
    }
    return std::monostate{};
}

std::optional<Winner> Game::showdown() {
    m_contenders.clear();
    for (const std::string& name : m_seatOrder) {
        const Player& player = getPlayer(name);
        if (player.folded) {
            continue;
        }

        std::vector<Card> cards = m_communityCards;
        if (player.holeCards) {
            cards.insert(cards.end(), player.holeCards->begin(), player.holeCards->end());
        }

        // A lone player can win before there are enough cards to evaluate
        PlayerHand hand = (static_cast<int>(cards.size()) >= holdem::HandSize) ?
            buildPlayerHand(name, cards) :
            PlayerHand{ .name = name, .bestHand = BestHand{ .hand = Hand{ .category = HandCategory::HighCard, .ranks = {} }, .cards = {} }, .cards = cards };

        m_contenders.push_back(Contender{ .hand = std::move(hand), .allIn = player.allIn });
    }

    if (m_contenders.size() == 1) {
        m_winner = Winner{ .hands = { m_contenders[0].hand } };
    }
    else {
        std::vector<PlayerHand> hands;
        for (const Contender& contender : m_contenders) {
            hands.push_back(contender.hand);
        }
        m_winner = determineWinner(hands);
    }
    return m_winner;
}

GameStatus Game::distributePots() {
    Result<DistributionResult, GameError> result = ::distributePots(
        m_ledger.getMainPot(),
        m_ledger.getSidePots(),
        m_contenders,
        m_winner,
        m_settings.awardRemainder
    );
    if (result.isError()) {
        return result.getError();
    }

    if (!m_winner) {
        return std::monostate{};
    }

    const DistributionResult& distribution = result.getValue();
    for (const auto& [name, amount] : distribution.winnings) {
        getMutablePlayer(name).bankRoll += amount;
    }
    m_undistributedChips += distribution.undistributed;
    m_ledger.clear();

    RoundWinner event;
    for (const PlayerHand& hand : m_winner->hands) {
        event.names.push_back(hand.name);
        event.handNames.push_back(hand.bestHand.cards.empty() ? "" : getHandName(hand.bestHand.hand));
        event.bankRolls.push_back(getPlayer(hand.name).bankRoll);
    }
    broadcast(event);
    return std::monostate{};
}

void Game::resetAfterRound() {
    clearRound();

    if (m_seatOrder.empty()) {
        m_dealer.reset();
        return;
    }

    // Seats clockwise from the old dealer, ending with the old dealer
    auto dealerIt = m_dealer ? std::find(m_seatOrder.begin(), m_seatOrder.end(), *m_dealer) : m_seatOrder.end();
    std::size_t dealerIndex = (dealerIt != m_seatOrder.end()) ? static_cast<std::size_t>(dealerIt - m_seatOrder.begin()) : m_seatOrder.size() - 1;
    std::vector<std::string> remaining;
    for (std::size_t i = 1; i <= m_seatOrder.size(); ++i) {
        remaining.push_back(m_seatOrder[(dealerIndex + i) % m_seatOrder.size()]);
    }

    // The first remaining seat deals next, so the seat after it pays the small blind.
    // Every removal can move the small blind, so check again until nobody else leaves.
    bool removedPlayer = true;
    while (removedPlayer && !remaining.empty()) {
        removedPlayer = false;
        for (std::size_t k = 0; k < remaining.size(); ++k) {
            std::size_t seat = (k + 1) % remaining.size();
            int blind = (k == 0) ? getSmallBlind() : getBigBlind();
            if (getPlayer(remaining[seat]).bankRoll < blind) {
                m_retiredChips += getPlayer(remaining[seat]).bankRoll;
                m_players.erase(remaining[seat]);
                remaining.erase(remaining.begin() + seat);
                removedPlayer = true;
                break;
            }
        }
    }

    if (remaining.empty()) {
        m_seatOrder.clear();
        m_dealer.reset();
        return;
    }

    m_dealer = remaining.front();
    std::rotate(remaining.begin(), remaining.begin() + 1, remaining.end());
    m_seatOrder = std::move(remaining);
}

void Game::abortRound() {
    // Nobody wins an aborted round, every chip goes back to where it came from
    for (const auto& [name, amount] : m_ledger.getRoundContributions()) {
        if (hasPlayer(name)) {
            getMutablePlayer(name).bankRoll += amount;
        }
    }
    clearRound();
}

GameStatus Game::setDeck(Deck deck) {
    CardSet inPlay = buildCardSet(m_communityCards);
    for (const auto& [name, player] : m_players) {
        if (player.holeCards) {
            inPlay |= buildCardSet(*player.holeCards);
        }
    }

    CardSet deckSet = buildCardSet(deck.getCards());
    if (getSetSize(deckSet) != deck.size()) {
        return GameError{ .kind = GameError::Kind::InvalidDeck, .message = "The deck contains duplicate cards." };
    }
    if ((deckSet & inPlay) != 0) {
        return GameError{ .kind = GameError::Kind::InvalidDeck, .message = "The deck contains cards that are already in play." };
    }

    m_deck = std::move(deck);
    return std::monostate{};
}

void Game::setBankRoll(const std::string& name, int bankRoll) {
    assert(bankRoll >= 0);
    getMutablePlayer(name).bankRoll = bankRoll;
}

Stage Game::getStage() const {
    return m_stage;
}

const Player& Game::getPlayer(const std::string& name) const {
    auto it = m_players.find(name);
    assert(it != m_players.end());
    return it->second;
}

bool Game::hasPlayer(const std::string& name) const {
    return m_players.find(name) != m_players.end();
}

const std::vector<std::string>& Game::getSeatOrder() const {
    return m_seatOrder;
}

const std::optional<std::string>& Game::getDealer() const {
    return m_dealer;
}

const PotLedger& Game::getPotLedger() const {
    return m_ledger;
}

const std::vector<Card>& Game::getCommunityCards() const {
    return m_communityCards;
}

const Deck& Game::getDeck() const {
    return m_deck;
}

const std::optional<Winner>& Game::getWinner() const {
    return m_winner;
}

int Game::getUndistributedChips() const {
    return m_undistributedChips;
}

int Game::getRetiredChips() const {
    return m_retiredChips;
}

int Game::getRoundsPlayed() const {
    return m_roundsPlayed;
}

int Game::getSmallBlind() const {
    return m_settings.bigBlind / 2;
}

int Game::getBigBlind() const {
    return m_settings.bigBlind;
}

std::vector<PlayerInfo> Game::getPlayerInfos() const {
    std::vector<PlayerInfo> infos;
    for (const std::string& name : m_seatOrder) {
        infos.push_back(PlayerInfo{ .name = name, .bankRoll = getPlayer(name).bankRoll });
    }
    return infos;
}

Player& Game::getMutablePlayer(const std::string& name) {
    auto it = m_players.find(name);
    assert(it != m_players.end());
    return it->second;
}

void Game::broadcast(const GameEvent& event) const {
    for (const std::string& name : m_seatOrder) {
        getPlayer(name).notify(event);
    }
    for (const std::shared_ptr<IEventSink>& observer : m_observers) {
        observer->notify(event);
    }
}

void Game::clearRound() {
    m_ledger.clear();
    m_communityCards.clear();
    m_deck = Deck::buildShuffled(m_rng);
    m_contenders.clear();
    m_winner.reset();
    m_stage = Stage::Blinds;
    for (auto& [name, player] : m_players) {
        player.resetForRound();
    }
}

GameStatus Game::advanceStage() {
    m_stage = nextStage(m_stage);
    m_ledger.startStage();

    GameStatus dealStatus = std::monostate{};
    switch (m_stage) {
        case Stage::Hole:
            dealStatus = dealHoleCards();
            break;
        case Stage::Flop:
            dealStatus = dealFlop();
            break;
        case Stage::Turn:
            dealStatus = dealTurn();
            break;
        case Stage::River:
            dealStatus = dealRiver();
            break;
        default:
            break;
    }
    if (dealStatus.isError()) {
        return dealStatus;
    }

    broadcast(StageDeclared{ .stage = m_stage, .communityCards = m_communityCards });

    switch (m_stage) {
        case Stage::PreFlop:
        case Stage::Flop:
        case Stage::Turn:
        case Stage::River:
            return placeBets();
        case Stage::ShowDown:
            showdown();
            return distributePots();
        default:
            return std::monostate{};
    }
}

GameStatus Game::dealCommunityCards(int numCards) {
    GameStatus burnStatus = m_deck.burnCard();
    if (burnStatus.isError()) {
        return burnStatus;
    }

    Result<std::vector<Card>, GameError> cardsResult = m_deck.takeCards(numCards);
    if (cardsResult.isError()) {
        return cardsResult.getError();
    }

    const std::vector<Card>& cards = cardsResult.getValue();
    m_communityCards.insert(m_communityCards.end(), cards.begin(), cards.end());
    return std::monostate{};
}

void Game::pay(Player& player, int amount) {
    assert(amount >= 0 && amount <= player.bankRoll);
    player.bankRoll -= amount;
    m_ledger.addContribution(player.name, amount);
}

void Game::goAllIn(Player& player) {
    assert(player.bankRoll > 0);
    pay(player, player.bankRoll);
    player.allIn = true;
    m_ledger.registerAllIn(player.name, getInHandNames());
}

GameStatus Game::applyBet(Player& player, const Bet& bet, int call, int& currentBet, int& cycle, std::vector<std::string>& pending) {
    Bet placed = bet;
    switch (bet.type) {
        case BetType::Fold:
            player.folded = true;
            break;
        case BetType::Check:
            if (call > 0) {
                return buildProtocolViolation(player, bet, call);
            }
            break;
        case BetType::Call:
            if (player.bankRoll <= call) {
                placed = Bet{ .type = BetType::AllIn, .amount = player.bankRoll };
                goAllIn(player);
            }
            else {
                placed = Bet{ .type = BetType::Call, .amount = call };
                pay(player, call);
            }
            break;
        case BetType::Raise:
            if (bet.amount <= call || bet.amount > player.bankRoll) {
                return buildProtocolViolation(player, bet, call);
            }
            if (bet.amount == player.bankRoll) {
                placed = Bet{ .type = BetType::AllIn, .amount = player.bankRoll };
                goAllIn(player);
            }
            else {
                pay(player, bet.amount);
            }
            break;
        case BetType::AllIn:
            placed = Bet{ .type = BetType::AllIn, .amount = player.bankRoll };
            goAllIn(player);
            break;
        default:
            assert(false);
            break;
    }

    // Anything above the current bet reopens the action for everyone else
    int contribution = m_ledger.getStageContribution(player.name);
    if (contribution > currentBet) {
        currentBet = contribution;
        ++cycle;
        pending = getNamesAfter(player.name);
    }

    broadcast(BetPlaced{ .name = player.name, .bet = placed, .pot = m_ledger.getTotal() });
    return std::monostate{};
}

GameError Game::buildProtocolViolation(const Player& player, const Bet& bet, int call) const {
    return GameError{
        .kind = GameError::Kind::ProtocolViolation,
        .message = "Protocol violation by " + player.name + " in " + getStageName(m_stage) + ": attempted " + getBetName(bet) +
            " facing a call of " + std::to_string(call) + " with a bank roll of " + std::to_string(player.bankRoll) + "."
    };
}

std::vector<std::string> Game::getActiveNames() const {
    std::vector<std::string> names;
    for (const std::string& name : m_seatOrder) {
        if (getPlayer(name).canAct()) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> Game::getInHandNames() const {
    std::vector<std::string> names;
    for (const std::string& name : m_seatOrder) {
        if (!getPlayer(name).folded) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> Game::getNamesAfter(const std::string& name) const {
    auto it = std::find(m_seatOrder.begin(), m_seatOrder.end(), name);
    assert(it != m_seatOrder.end());
    std::size_t index = static_cast<std::size_t>(it - m_seatOrder.begin());

    std::vector<std::string> names;
    for (std::size_t i = 1; i < m_seatOrder.size(); ++i) {
        const std::string& other = m_seatOrder[(index + i) % m_seatOrder.size()];
        if (getPlayer(other).canAct()) {
            names.push_back(other);
        }
    }
    return names;
}

int Game::countPlayers(bool (*predicate)(const Player&)) const {
    return static_cast<int>(std::count_if(m_players.begin(), m_players.end(), [predicate](const auto& entry) {
        return predicate(entry.second);
    }));
}

std::string Game::getGameWinner() const {
    assert(!m_seatOrder.empty());

    // Largest bank roll, earliest seat on ties
    std::string winner = m_seatOrder.front();
    for (const std::string& name : m_seatOrder) {
        if (getPlayer(name).bankRoll > getPlayer(winner).bankRoll) {
            winner = name;
        }
    }
    return winner;
}
