#include "player.hpp"

#include <algorithm>

void PlayerState::applyEffect(const PotionEffect& effect) {
    strength = std::max(1, strength + effect.strengthDelta);
    movesRemaining = std::max(0, movesRemaining + effect.movesDelta);
}
