#ifndef HAND_EVALUATION_HPP
#define HAND_EVALUATION_HPP

#include "game/game_types.hpp"
#include "game/holdem/hand.hpp"

#include <span>

// Picks the best five card hand out of five to seven distinct cards.
BestHand getBestHand(std::span<const Card> cards);

#endif // HAND_EVALUATION_HPP
