#include <gtest/gtest.h>

#include "game/game_error.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/deck.hpp"
#include "util/names.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include "test_helpers.hpp"

#include <random>
#include <set>
#include <string>
#include <vector>

TEST(CardNameParsingTest, CorrectCardNameParsing) {
    const std::string CardRankNames = "23456789TJQKA";
    const std::string CardSuitNames = "cdhs";

    for (int i = 0; i < 52; ++i) {
        std::string cardName = { CardRankNames[i / 4], CardSuitNames[i % 4] };
        Result<Card> cardResult = getCardFromName(cardName);
        ASSERT_TRUE(cardResult.isValue());
        EXPECT_EQ(static_cast<int>(getCardID(cardResult.getValue())), i);
        EXPECT_EQ(getCardName(cardResult.getValue()), cardName);
    }
}

TEST(CardNameParsingTest, ErrorFromInvalidCardNames) {
    EXPECT_TRUE(getCardFromName("").isError());
    EXPECT_TRUE(getCardFromName("A").isError());
    EXPECT_TRUE(getCardFromName("1s").isError());
    EXPECT_TRUE(getCardFromName("Ax").isError());
    EXPECT_TRUE(getCardFromName("Ass").isError());
}

TEST(CardNameParsingTest, ErrorFromDuplicateCards) {
    EXPECT_TRUE(getCardsFromString("As, Kd, As").isError());
}

TEST(CardNameParsingTest, CardListParsing) {
    Result<std::vector<Card>> cardsResult = getCardsFromString("As, Td,2c");
    ASSERT_TRUE(cardsResult.isValue());

    std::vector<Card> expected = {
        Card{ .rank = Rank::Ace, .suit = Suit::Spades },
        Card{ .rank = Rank::Ten, .suit = Suit::Diamonds },
        Card{ .rank = Rank::Two, .suit = Suit::Clubs }
    };
    EXPECT_EQ(cardsResult.getValue(), expected);
    EXPECT_EQ(getCardListName(cardsResult.getValue()), "As Td 2c");
}

TEST(CardOrderTest, RankDecidesBeforeSuit) {
    EXPECT_LT(test::card("Ks"), test::card("Ac"));
    EXPECT_LT(test::card("2c"), test::card("2s"));
    EXPECT_LT(Rank::Two, Rank::Ace);
}

TEST(CardNameTest, RankNames) {
    EXPECT_EQ(getRankName(Rank::Ten), "10");
    EXPECT_EQ(getRankName(Rank::Two), "2");
    EXPECT_EQ(getRankName(Rank::Queen), "Queen");
}

TEST(StageTest, StagesProceedInOrder) {
    std::vector<Stage> expected = { Stage::Blinds, Stage::Hole, Stage::PreFlop, Stage::Flop, Stage::Turn, Stage::River, Stage::ShowDown };

    std::vector<Stage> stages = { Stage::Blinds };
    while (stages.back() != Stage::ShowDown) {
        stages.push_back(nextStage(stages.back()));
    }
    EXPECT_EQ(stages, expected);
}

TEST(BetNameTest, AmountsShownWhereRelevant) {
    EXPECT_EQ(getBetName(Bet{ .type = BetType::Fold }), "Fold");
    EXPECT_EQ(getBetName(Bet{ .type = BetType::Call }), "Call");
    EXPECT_EQ(getBetName(Bet{ .type = BetType::Call, .amount = 20 }), "Call (20)");
    EXPECT_EQ(getBetName(Bet{ .type = BetType::Raise, .amount = 40 }), "Raise (40)");
    EXPECT_EQ(getBetName(Bet{ .type = BetType::AllIn, .amount = 15 }), "All in (15)");
}

TEST(DeckTest, ShuffledDeckHasEveryCardOnce) {
    std::mt19937 rng(7);
    Deck deck = Deck::buildShuffled(rng);

    EXPECT_EQ(deck.size(), 52);
    EXPECT_EQ(getSetSize(buildCardSet(deck.getCards())), 52);
}

TEST(DeckTest, CardsAreDealtFromTheFront) {
    Deck deck = test::buildDeck("As,Kd,Qh");

    GameStatus burnStatus = deck.burnCard();
    ASSERT_TRUE(burnStatus.isValue());
    EXPECT_EQ(deck.getBurnedCards(), std::vector<Card>{ test::card("As") });

    Result<std::vector<Card>, GameError> taken = deck.takeCards(2);
    ASSERT_TRUE(taken.isValue());
    EXPECT_EQ(taken.getValue(), test::cards("Kd,Qh"));
    EXPECT_EQ(deck.size(), 49);
}

TEST(DeckTest, ExhaustedDeckIsRecoverableError) {
    Deck deck{ test::cards("As,Kd") };

    Result<std::vector<Card>, GameError> taken = deck.takeCards(3);
    ASSERT_TRUE(taken.isError());
    EXPECT_EQ(taken.getError().kind, GameError::Kind::DeckExhausted);
    EXPECT_TRUE(isRecoverable(taken.getError()));

    // Nothing was consumed by the failed deal
    EXPECT_EQ(deck.size(), 2);

    ASSERT_TRUE(deck.takeCards(2).isValue());
    GameStatus burnStatus = deck.burnCard();
    ASSERT_TRUE(burnStatus.isError());
    EXPECT_EQ(burnStatus.getError().kind, GameError::Kind::DeckExhausted);
}

TEST(NameTest, FreeNameIsKept) {
    EXPECT_EQ(disambiguateName("Bob", { "Alice" }), "Bob");
}

TEST(NameTest, TakenNameGetsSmallestFreeSuffix) {
    EXPECT_EQ(disambiguateName("Bob", { "Bob" }), "Bob2");
    EXPECT_EQ(disambiguateName("Bob", { "Bob", "Bob2", "Bob3" }), "Bob4");
    EXPECT_EQ(disambiguateName("Bob", { "Bob", "Bob3" }), "Bob2");
}

TEST(NameTest, DefaultNamesAreDistinct) {
    std::vector<std::string> names = getDefaultNames(12);
    EXPECT_EQ(names.size(), 12);
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), 12);

    EXPECT_EQ(getDefaultNames(3).size(), 3);
    EXPECT_EQ(getDefaultNames(20).size(), 12);
    EXPECT_TRUE(getDefaultNames(0).empty());
}

TEST(StringUtilsTest, ParseIntRejectsGarbage) {
    ASSERT_TRUE(parseInt("42").has_value());
    EXPECT_EQ(*parseInt("42"), 42);
    ASSERT_TRUE(parseInt("-3").has_value());
    EXPECT_EQ(*parseInt("-3"), -3);
    EXPECT_FALSE(parseInt("12abc").has_value());
    EXPECT_FALSE(parseInt("").has_value());
}

TEST(StringUtilsTest, TokensAreTrimmed) {
    std::vector<std::string> expected = { "a", "b c", "d" };
    EXPECT_EQ(parseTokens(" a, b c ,,d ", ','), expected);
    EXPECT_EQ(trim("  x y  "), "x y");
    EXPECT_EQ(toLower("ChEcK"), "check");
}
