#include "game/holdem/player.hpp"

#include <memory>
#include <string>
#include <utility>

bool Player::canAct() const {
    return !allIn && !folded;
}

void Player::notify(const GameEvent& event) const {
    if (sink) {
        sink->notify(event);
    }
}

void Player::resetForRound() {
    holeCards.reset();
    allIn = false;
    folded = false;
}

Player buildPlayer(const std::string& name, int bankRoll, std::shared_ptr<IDecisionProvider> provider, std::shared_ptr<IEventSink> sink) {
    return Player{
        .name = name,
        .holeCards = std::nullopt,
        .bankRoll = bankRoll,
        .allIn = false,
        .folded = false,
        .provider = std::move(provider),
        .sink = std::move(sink)
    };
}
