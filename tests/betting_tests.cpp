#include <gtest/gtest.h>

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_error.hpp"
#include "game/game_types.hpp"
#include "game/holdem/game.hpp"
#include "game/holdem/pot_ledger.hpp"

#include "test_helpers.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {
constexpr int BigBlind = 20;
constexpr int BuyIn = 100 * BigBlind;

class BettingTest : public ::testing::Test {
protected:
    // Seats A, B and C in that betting order, with C dealing
    void seatPlayers(const std::map<std::string, std::vector<Bet>>& scripts) {
        game = std::make_unique<Game>(GameSettings{ .bigBlind = BigBlind, .seed = 7 });
        observer = std::make_shared<test::RecordingSink>();
        game->addObserver(observer);

        for (const std::string& name : { "C", "A", "B" }) {
            auto it = scripts.find(name);
            auto provider = std::make_shared<test::ScriptedDecisionProvider>(it != scripts.end() ? it->second : std::vector<Bet>{});
            providers[name] = provider;
            ASSERT_TRUE(game->join(name, provider, nullptr).isValue());
        }
    }

    void startRound() {
        game->orderPlayers();
        ASSERT_EQ(game->getSeatOrder(), (std::vector<std::string>{ "A", "B", "C" }));
        ASSERT_TRUE(game->dealHoleCards().isValue());
    }

    const std::vector<BetArgs>& getRequests(const std::string& name) const {
        return providers.at(name)->getRequests();
    }

    std::unique_ptr<Game> game;
    std::shared_ptr<test::RecordingSink> observer;
    std::map<std::string, std::shared_ptr<test::ScriptedDecisionProvider>> providers;
};
} // namespace

TEST_F(BettingTest, EveryoneChecksAround) {
    seatPlayers({ { "A", { test::check() } }, { "B", { test::check() } }, { "C", { test::check() } } });
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_EQ(game->getPotLedger().getTotal(), 0);
    for (const std::string& name : { "A", "B", "C" }) {
        ASSERT_EQ(getRequests(name).size(), 1);
        EXPECT_EQ(getRequests(name)[0].call, 0);
        EXPECT_EQ(getRequests(name)[0].min, BigBlind);
        EXPECT_EQ(getRequests(name)[0].cycle, 0);
    }
}

TEST_F(BettingTest, RaiseReopensTheAction) {
    seatPlayers({
        { "A", { test::check(), test::call() } },
        { "B", { test::raiseBy(30) } },
        { "C", { test::call() } }
    });
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    ASSERT_EQ(getRequests("A").size(), 2);
    EXPECT_EQ(getRequests("A")[1].call, 30);
    EXPECT_EQ(getRequests("A")[1].cycle, 1);
    EXPECT_EQ(getRequests("C")[0].call, 30);
    EXPECT_EQ(getRequests("B").size(), 1);
    EXPECT_EQ(game->getPotLedger().getTotal(), 90);
    EXPECT_EQ(game->getPlayer("A").bankRoll, BuyIn - 30);
}

TEST_F(BettingTest, CallsAreReportedWithTheirAmount) {
    seatPlayers({ { "A", { test::raiseBy(40) } }, { "B", { test::call() } }, { "C", { test::fold() } } });
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    std::vector<BetPlaced> bets = observer->getEvents<BetPlaced>();
    ASSERT_EQ(bets.size(), 3);
    EXPECT_EQ(bets[0].bet, test::raiseBy(40));
    EXPECT_EQ(bets[1].bet, (Bet{ .type = BetType::Call, .amount = 40 }));
    EXPECT_EQ(bets[1].pot, 80);
    EXPECT_EQ(bets[2].bet, test::fold());
    EXPECT_TRUE(game->getPlayer("C").folded);
}

TEST_F(BettingTest, BettingStopsWhenOnePlayerIsLeft) {
    seatPlayers({ { "A", { test::raiseBy(40) } }, { "B", { test::fold() } }, { "C", { test::fold() } } });
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_EQ(getRequests("A").size(), 1);
    EXPECT_EQ(game->getPotLedger().getTotal(), 40);
}

TEST_F(BettingTest, ShortCallBecomesAllInWithSidePot) {
    seatPlayers({ { "A", { test::raiseBy(40) } }, { "B", { test::call() } }, { "C", { test::call() } } });
    game->setBankRoll("B", 30);
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    const PotLedger& ledger = game->getPotLedger();
    EXPECT_EQ(ledger.getMainPot(), 90);
    ASSERT_EQ(ledger.getSidePots().size(), 1);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "A", "C" }, .amount = 20 }));

    EXPECT_TRUE(game->getPlayer("B").allIn);
    EXPECT_EQ(game->getPlayer("B").bankRoll, 0);
    std::vector<BetPlaced> bets = observer->getEvents<BetPlaced>();
    ASSERT_EQ(bets.size(), 3);
    EXPECT_EQ(bets[1].bet, (Bet{ .type = BetType::AllIn, .amount = 30 }));
}

TEST_F(BettingTest, RaiseOfTheWholeBankRollIsAnAllIn) {
    seatPlayers({ { "A", { test::check(), test::call() } }, { "B", { test::raiseBy(60) } }, { "C", { test::call() } } });
    game->setBankRoll("B", 60);
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_TRUE(game->getPlayer("B").allIn);
    ASSERT_EQ(getRequests("A").size(), 2);
    EXPECT_EQ(getRequests("A")[1].call, 60);
    EXPECT_EQ(game->getPotLedger().getMainPot(), 180);
    EXPECT_EQ(game->getPotLedger().getTotal(), 180);
}

TEST_F(BettingTest, AllInAboveTheCurrentBetReopensTheAction) {
    seatPlayers({ { "A", { test::raiseBy(20), test::call() } }, { "B", { test::allIn() } }, { "C", { test::call() } } });
    game->setBankRoll("B", 50);
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    ASSERT_EQ(getRequests("A").size(), 2);
    EXPECT_EQ(getRequests("A")[1].call, 30);
    EXPECT_EQ(getRequests("C")[0].call, 50);
    EXPECT_EQ(getRequests("C")[0].cycle, 2);
    EXPECT_EQ(game->getPotLedger().getTotal(), 150);
}

TEST_F(BettingTest, LonePlayerWithNothingToCallIsNotAsked) {
    seatPlayers({ { "A", { test::check(), test::call() } }, { "B", { test::allIn() } }, { "C", { test::allIn() } } });
    game->setBankRoll("B", 30);
    game->setBankRoll("C", 30);
    startRound();

    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_EQ(getRequests("A").size(), 2);

    // Nobody is left to bet against A, so A's exhausted script is never consulted
    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_EQ(getRequests("A").size(), 2);
}

TEST_F(BettingTest, CheckFacingABetIsAProtocolViolation) {
    seatPlayers({ { "A", { test::raiseBy(40) } }, { "B", { test::check() } } });
    startRound();

    GameStatus status = game->placeBets();
    ASSERT_TRUE(status.isError());
    EXPECT_EQ(status.getError().kind, GameError::Kind::ProtocolViolation);
    EXPECT_NE(status.getError().message.find("Protocol violation by B"), std::string::npos);
    EXPECT_NE(status.getError().message.find("facing a call of 40"), std::string::npos);
}

TEST_F(BettingTest, RaiseMustExceedTheCall) {
    seatPlayers({ { "A", { test::raiseBy(40) } }, { "B", { test::raiseBy(40) } } });
    startRound();

    GameStatus status = game->placeBets();
    ASSERT_TRUE(status.isError());
    EXPECT_EQ(status.getError().kind, GameError::Kind::ProtocolViolation);
}

TEST_F(BettingTest, RaiseMustFitTheBankRoll) {
    seatPlayers({ { "A", { test::raiseBy(BuyIn + 1) } } });
    startRound();

    GameStatus status = game->placeBets();
    ASSERT_TRUE(status.isError());
    EXPECT_EQ(status.getError().kind, GameError::Kind::ProtocolViolation);
    EXPECT_EQ(game->getPlayer("A").bankRoll, BuyIn);
}

TEST_F(BettingTest, MissingDecisionAbortsTheStage) {
    seatPlayers({ { "A", { test::check() } } });
    startRound();

    GameStatus status = game->placeBets();
    ASSERT_TRUE(status.isError());
    EXPECT_EQ(status.getError().kind, GameError::Kind::NoDecision);
}

TEST_F(BettingTest, FoldOnNoDecisionTurnsSilenceIntoAFold) {
    game = std::make_unique<Game>(GameSettings{ .bigBlind = BigBlind, .seed = 7 });
    auto silent = std::make_shared<test::ScriptedDecisionProvider>(std::vector<Bet>{});
    ASSERT_TRUE(game->join("C", std::make_shared<test::ScriptedDecisionProvider>(std::vector<Bet>{ test::check() }), nullptr).isValue());
    ASSERT_TRUE(game->join("A", std::make_shared<FoldOnNoDecision>(silent), nullptr).isValue());
    game->orderPlayers();
    ASSERT_TRUE(game->dealHoleCards().isValue());

    ASSERT_TRUE(game->placeBets().isValue());
    EXPECT_TRUE(game->getPlayer("A").folded);
    EXPECT_EQ(silent->getRequests().size(), 1);
}
