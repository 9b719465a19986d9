#pragma once
#include "common.hpp"
#include <cstdint>
#include <map>
#include <optional>

enum class EntityKind : uint8_t {
    Crate = 0,
    Coin,
    StrengthPotion,
    MovePotion,
    FancyPotion,
};

// Keep in sync with the last enum value.
inline constexpr int ENTITY_KIND_COUNT = static_cast<int>(EntityKind::FancyPotion) + 1;

// Rule constants (fixed for a session).
inline constexpr int COIN_VALUE = 5;
inline constexpr int STRENGTH_POTION_BONUS = 2;
inline constexpr int MOVE_POTION_BONUS = 5;
inline constexpr int STARTING_MONEY = 0;

// Crate strength is stored as one digit in both text formats.
inline constexpr int MIN_CRATE_STRENGTH = 1;
inline constexpr int MAX_CRATE_STRENGTH = 9;

// Stat deltas a potion applies to the player, whether bought or picked up.
struct PotionEffect {
    int strengthDelta = 0;
    int movesDelta = 0;
};

struct EntityDef {
    EntityKind kind;
    const char* name;

    // Marker in level/save text. Crates use their strength digit instead.
    char marker = ' ';

    // Picked up (and removed) when the player steps onto it.
    bool collectible = false;
    bool potion = false;

    PotionEffect effect;
};

const EntityDef& entityDef(EntityKind k);

inline bool isPotionKind(EntityKind k) {
    switch (k) {
        case EntityKind::StrengthPotion:
        case EntityKind::MovePotion:
        case EntityKind::FancyPotion:
            return true;
        case EntityKind::Crate:
        case EntityKind::Coin:
            return false;
    }
    return false;
}

inline PotionEffect potionEffect(EntityKind k) {
    return entityDef(k).effect;
}

// Maps a level/save marker back to a potion or coin kind (not crates; see crateStrengthFromMarker).
std::optional<EntityKind> entityKindFromMarker(char c);

// '1'..'9' -> 1..9, anything else -> 0.
int crateStrengthFromMarker(char c);

struct Entity {
    EntityKind kind = EntityKind::Crate;
    // Minimum player strength needed to push. Only meaningful for crates.
    int strength = 0;

    bool isCrate() const { return kind == EntityKind::Crate; }
    bool isCollectible() const { return entityDef(kind).collectible; }

    char marker() const;
};

inline Entity makeCrate(int strength) {
    return {EntityKind::Crate, strength};
}

inline Entity makeEntity(EntityKind k) {
    return {k, 0};
}

inline bool operator==(const Entity& a, const Entity& b) {
    return a.kind == b.kind && a.strength == b.strength;
}

// Sparse registry: at most one entity per cell.
using EntityMap = std::map<GridPos, Entity>;
