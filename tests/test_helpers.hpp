#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "game/decision_provider.hpp"
#include "game/events.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/hand_comparison.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace test {
inline Card card(const std::string& name) {
    return getCardFromName(name).getValue();
}

inline std::vector<Card> cards(const std::string& names) {
    return getCardsFromString(names).getValue();
}

inline PlayerHand hand(const std::string& name, const std::string& cardNames) {
    return buildPlayerHand(name, cards(cardNames));
}

// The given cards first, then the rest of an ordered deck
inline Deck buildDeck(const std::string& frontCardNames) {
    std::vector<Card> deckCards = cards(frontCardNames);
    for (Card card : buildOrderedDeck()) {
        if (std::find(deckCards.begin(), deckCards.end(), card) == deckCards.end()) {
            deckCards.push_back(card);
        }
    }
    return Deck{ std::move(deckCards) };
}

// Replays a fixed list of bets, then gives no decision
class ScriptedDecisionProvider : public IDecisionProvider {
public:
    explicit ScriptedDecisionProvider(std::vector<Bet> bets) : m_bets{ std::move(bets) }, m_nextBet{ 0 } {}

    std::optional<Bet> decide(const BetArgs& args, const HoleCards& /*holeCards*/, int bankRoll) override {
        m_requests.push_back(args);
        m_bankRolls.push_back(bankRoll);
        if (m_nextBet >= m_bets.size()) {
            return std::nullopt;
        }
        return m_bets[m_nextBet++];
    }

    const std::vector<BetArgs>& getRequests() const {
        return m_requests;
    }

    const std::vector<int>& getBankRolls() const {
        return m_bankRolls;
    }

private:
    std::vector<Bet> m_bets;
    std::size_t m_nextBet;
    std::vector<BetArgs> m_requests;
    std::vector<int> m_bankRolls;
};

class RecordingSink : public IEventSink {
public:
    void notify(const GameEvent& event) override {
        m_events.push_back(event);
    }

    template <typename T>
    std::vector<T> getEvents() const {
        std::vector<T> events;
        for (const GameEvent& event : m_events) {
            if (const T* typed = std::get_if<T>(&event)) {
                events.push_back(*typed);
            }
        }
        return events;
    }

    const std::vector<GameEvent>& getAllEvents() const {
        return m_events;
    }

private:
    std::vector<GameEvent> m_events;
};

inline Bet fold() {
    return Bet{ .type = BetType::Fold };
}

inline Bet check() {
    return Bet{ .type = BetType::Check };
}

inline Bet call() {
    return Bet{ .type = BetType::Call };
}

inline Bet raiseBy(int amount) {
    return Bet{ .type = BetType::Raise, .amount = amount };
}

inline Bet allIn() {
    return Bet{ .type = BetType::AllIn };
}
} // namespace test

#endif // TEST_HELPERS_HPP
