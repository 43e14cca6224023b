#ifndef DECISION_PROVIDER_HPP
#define DECISION_PROVIDER_HPP

#include "game/events.hpp"
#include "game/game_types.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

struct BetArgs {
    int call;   // Chips needed to match the current bet
    int min;    // Minimum raise, the big blind
    Stage stage;
    int cycle;  // Number of raises so far in this stage
    std::vector<Card> communityCards;
};

class IDecisionProvider {
public:
    virtual ~IDecisionProvider() = default;

    // Returns nothing when no decision could be obtained, e.g. the provider disconnected
    virtual std::optional<Bet> decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) = 0;
};

class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void notify(const GameEvent& event) = 0;
};

// Maps a missing decision from the wrapped provider to a fold
class FoldOnNoDecision : public IDecisionProvider {
public:
    explicit FoldOnNoDecision(std::shared_ptr<IDecisionProvider> provider) : m_provider{ std::move(provider) } {}

    std::optional<Bet> decide(const BetArgs& args, const HoleCards& holeCards, int bankRoll) override {
        std::optional<Bet> bet = m_provider->decide(args, holeCards, bankRoll);
        return bet ? bet : Bet{ .type = BetType::Fold };
    }

private:
    std::shared_ptr<IDecisionProvider> m_provider;
};

#endif // DECISION_PROVIDER_HPP
