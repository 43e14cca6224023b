#include <gtest/gtest.h>

#include "game/holdem/pot_ledger.hpp"

#include <map>
#include <string>
#include <vector>

TEST(PotLedgerTest, ContributionsGoToMainPot) {
    PotLedger ledger;
    ledger.addContribution("A", 10);
    ledger.addContribution("B", 20);
    ledger.addContribution("A", 10);

    EXPECT_EQ(ledger.getMainPot(), 40);
    EXPECT_TRUE(ledger.getSidePots().empty());
    EXPECT_EQ(ledger.getStageContribution("A"), 20);
    EXPECT_EQ(ledger.getHighestStageContribution(), 20);
}

TEST(PotLedgerTest, ShortAllInOpensSidePotForTheExcess) {
    // A raises to 40, B goes all in for 30, C calls 40
    PotLedger ledger;
    ledger.addContribution("A", 40);
    ledger.addContribution("B", 30);
    ledger.registerAllIn("B", { "A", "B", "C" });
    ledger.addContribution("C", 40);

    EXPECT_EQ(ledger.getMainPot(), 90);
    ASSERT_EQ(ledger.getSidePots().size(), 1);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "A", "C" }, .amount = 20 }));
    EXPECT_EQ(ledger.getTotal(), 110);
}

TEST(PotLedgerTest, EachAllInLevelGetsItsOwnPot) {
    PotLedger ledger;
    ledger.addContribution("A", 10);
    ledger.registerAllIn("A", { "A", "B", "C", "D" });
    ledger.addContribution("B", 25);
    ledger.registerAllIn("B", { "A", "B", "C", "D" });
    ledger.addContribution("C", 60);
    ledger.addContribution("D", 60);

    // Main: 4 x 10, first side pot: 3 x 15, second side pot: 2 x 35
    EXPECT_EQ(ledger.getMainPot(), 40);
    ASSERT_EQ(ledger.getSidePots().size(), 2);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "B", "C", "D" }, .amount = 45 }));
    EXPECT_EQ(ledger.getSidePots()[1], (SidePot{ .players = { "C", "D" }, .amount = 70 }));
}

TEST(PotLedgerTest, LowerAllInSplitsAnExistingSidePot) {
    PotLedger ledger;
    ledger.addContribution("A", 50);
    ledger.registerAllIn("A", { "A", "B", "C" });
    ledger.addContribution("B", 100);
    ledger.addContribution("C", 20);
    ledger.registerAllIn("C", { "A", "B", "C" });

    // C is capped at 20, A at 50
    EXPECT_EQ(ledger.getMainPot(), 60);
    ASSERT_EQ(ledger.getSidePots().size(), 2);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "B" }, .amount = 50 }));
    EXPECT_EQ(ledger.getSidePots()[1], (SidePot{ .players = { "A", "B" }, .amount = 60 }));
    EXPECT_EQ(ledger.getTotal(), 170);
}

TEST(PotLedgerTest, AllInAtExistingLevelOnlyDropsEligibility) {
    PotLedger ledger;
    ledger.addContribution("A", 30);
    ledger.registerAllIn("A", { "A", "B", "C" });
    ledger.addContribution("B", 30);
    ledger.registerAllIn("B", { "A", "B", "C" });
    ledger.addContribution("C", 50);

    EXPECT_EQ(ledger.getMainPot(), 90);
    ASSERT_EQ(ledger.getSidePots().size(), 1);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "C" }, .amount = 20 }));
}

TEST(PotLedgerTest, LaterStagesFillTheTopPot) {
    PotLedger ledger;
    ledger.addContribution("A", 10);
    ledger.registerAllIn("A", { "A", "B", "C" });
    ledger.addContribution("B", 20);
    ledger.addContribution("C", 20);

    ledger.startStage();
    EXPECT_EQ(ledger.getStageContribution("B"), 0);
    EXPECT_EQ(ledger.getHighestStageContribution(), 0);

    ledger.addContribution("B", 40);
    ledger.addContribution("C", 40);

    EXPECT_EQ(ledger.getMainPot(), 30);
    ASSERT_EQ(ledger.getSidePots().size(), 1);
    EXPECT_EQ(ledger.getSidePots()[0].amount, 100);
}

TEST(PotLedgerTest, AllInInLaterStageOnlySplitsThatStage) {
    PotLedger ledger;
    ledger.addContribution("A", 20);
    ledger.addContribution("B", 20);
    ledger.addContribution("C", 20);

    ledger.startStage();
    ledger.addContribution("A", 50);
    ledger.addContribution("B", 30);
    ledger.registerAllIn("B", { "A", "B", "C" });
    ledger.addContribution("C", 50);

    EXPECT_EQ(ledger.getMainPot(), 60 + 90);
    ASSERT_EQ(ledger.getSidePots().size(), 1);
    EXPECT_EQ(ledger.getSidePots()[0], (SidePot{ .players = { "A", "C" }, .amount = 40 }));
}

TEST(PotLedgerTest, RoundContributionsSpanEveryStage) {
    PotLedger ledger;
    ledger.addContribution("A", 10);
    ledger.addContribution("B", 20);
    ledger.startStage();
    ledger.addContribution("A", 30);
    ledger.registerAllIn("A", { "A", "B" });
    ledger.addContribution("B", 50);

    EXPECT_EQ(ledger.getRoundContributions(), (std::map<std::string, int>{ { "A", 40 }, { "B", 70 } }));
    EXPECT_EQ(ledger.getTotal(), 110);
}

TEST(PotLedgerTest, ClearEmptiesEverything) {
    PotLedger ledger;
    ledger.addContribution("A", 10);
    ledger.registerAllIn("A", { "A", "B" });
    ledger.addContribution("B", 30);
    ledger.clear();

    EXPECT_EQ(ledger.getTotal(), 0);
    EXPECT_TRUE(ledger.getSidePots().empty());
    EXPECT_EQ(ledger.getStageContribution("B"), 0);
    EXPECT_TRUE(ledger.getRoundContributions().empty());

    ledger.addContribution("B", 10);
    EXPECT_EQ(ledger.getMainPot(), 10);
}
