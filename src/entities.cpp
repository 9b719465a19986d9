#include "entities.hpp"

const EntityDef& entityDef(EntityKind k) {
    // Keep in sync with enum ordering.
    static const EntityDef defs[] = {
        { EntityKind::Crate,          "CRATE",           ' ', false, false, {0, 0} },
        { EntityKind::Coin,           "COIN",            '$', true,  false, {0, 0} },
        { EntityKind::StrengthPotion, "STRENGTH POTION", 'S', true,  true,  {STRENGTH_POTION_BONUS, 0} },
        { EntityKind::MovePotion,     "MOVE POTION",     'M', true,  true,  {0, MOVE_POTION_BONUS} },
        { EntityKind::FancyPotion,    "FANCY POTION",    'F', true,  true,  {STRENGTH_POTION_BONUS, MOVE_POTION_BONUS} },
    };
    static_assert(sizeof(defs) / sizeof(defs[0]) == static_cast<size_t>(ENTITY_KIND_COUNT),
                  "entity def table out of sync with EntityKind");

    const int idx = static_cast<int>(k);
    if (idx < 0 || idx >= ENTITY_KIND_COUNT) return defs[0];
    return defs[idx];
}

std::optional<EntityKind> entityKindFromMarker(char c) {
    for (int k = 0; k < ENTITY_KIND_COUNT; ++k) {
        const EntityKind kind = static_cast<EntityKind>(k);
        if (kind == EntityKind::Crate) continue;
        if (entityDef(kind).marker == c) return kind;
    }
    return std::nullopt;
}

int crateStrengthFromMarker(char c) {
    if (c < '0' + MIN_CRATE_STRENGTH || c > '0' + MAX_CRATE_STRENGTH) return 0;
    return c - '0';
}

char Entity::marker() const {
    switch (kind) {
        case EntityKind::Crate:
            return static_cast<char>('0' + clampi(strength, MIN_CRATE_STRENGTH, MAX_CRATE_STRENGTH));
        case EntityKind::Coin:
        case EntityKind::StrengthPotion:
        case EntityKind::MovePotion:
        case EntityKind::FancyPotion:
            return entityDef(kind).marker;
    }
    return ' ';
}
