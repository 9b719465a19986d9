#pragma once
#include "common.hpp"
#include "entities.hpp"

struct PlayerState {
    GridPos pos{};
    int strength = 1;
    int movesRemaining = 0;
    int money = STARTING_MONEY;

    // Applies a potion's stat deltas. Strength never drops below 1 and
    // the move budget never below 0.
    void applyEffect(const PotionEffect& effect);
};

inline bool operator==(const PlayerState& a, const PlayerState& b) {
    return a.pos == b.pos && a.strength == b.strength &&
           a.movesRemaining == b.movesRemaining && a.money == b.money;
}
