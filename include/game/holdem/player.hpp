#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "game/decision_provider.hpp"
#include "game/game_types.hpp"

#include <memory>
#include <optional>
#include <string>

struct Player {
    std::string name;
    std::optional<HoleCards> holeCards;
    int bankRoll;
    bool allIn;
    bool folded;
    std::shared_ptr<IDecisionProvider> provider;
    std::shared_ptr<IEventSink> sink; // May be null

    bool canAct() const;
    void notify(const GameEvent& event) const;
    void resetForRound();
};

Player buildPlayer(const std::string& name, int bankRoll, std::shared_ptr<IDecisionProvider> provider, std::shared_ptr<IEventSink> sink);

#endif // PLAYER_HPP
