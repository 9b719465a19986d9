#include "sokoban.hpp"

#include <utility>

bool Sokoban::loadLevel(const std::string& levelText, CorruptSaveError* err) {
    EngineState st;
    if (!decodeBoard(levelText, st, err)) return false;

    // Levels always start with an empty purse.
    st.player.money = STARTING_MONEY;

    level_ = std::move(st);
    state_ = level_;
    return true;
}

bool Sokoban::cellBlocksCrate(GridPos p) const {
    if (state_.maze.isWall(p)) return true;
    return state_.entities.count(p) != 0;
}

void Sokoban::pickupAt(GridPos p) {
    auto it = state_.entities.find(p);
    if (it == state_.entities.end()) return;

    const Entity e = it->second;
    switch (e.kind) {
        case EntityKind::Crate:
            return;
        case EntityKind::Coin:
            state_.player.money += COIN_VALUE;
            break;
        case EntityKind::StrengthPotion:
        case EntityKind::MovePotion:
        case EntityKind::FancyPotion:
            state_.player.applyEffect(potionEffect(e.kind));
            break;
    }
    state_.entities.erase(it);
}

bool Sokoban::attemptMove(Direction d) {
    PlayerState& pl = state_.player;
    if (pl.movesRemaining <= 0) return false;

    const GridPos delta = dirDelta(d);
    const GridPos target = pl.pos + delta;
    if (state_.maze.isWall(target)) return false;

    auto it = state_.entities.find(target);
    if (it != state_.entities.end() && it->second.isCrate()) {
        const GridPos beyond = target + delta;
        if (cellBlocksCrate(beyond)) return false;
        if (pl.strength < it->second.strength) return false;

        const Entity crate = it->second;
        state_.entities.erase(it);
        state_.entities[beyond] = crate;
    }

    pl.pos = target;
    --pl.movesRemaining;
    pickupAt(target);
    return true;
}

bool Sokoban::attemptPurchase(const std::string& itemId) {
    const ShopItem* item = findShopItem(itemId);
    if (!item) return false;

    PlayerState& pl = state_.player;
    if (pl.money < item->price) return false;

    pl.money -= item->price;
    pl.applyEffect(potionEffect(item->kind));
    return true;
}

void Sokoban::reset() {
    state_ = level_;
}

bool Sokoban::hasWon() const {
    for (const GridPos& g : state_.maze.goalPositions()) {
        const Entity* e = state_.entityAt(g);
        if (!e || !e->isCrate()) return false;
    }
    return true;
}

std::string Sokoban::serialize() const {
    return encodeBoard(state_);
}

void Sokoban::adoptLevelGoals(Maze& maze) const {
    if (!maze.goalPositions().empty()) return;
    if (maze.rows != level_.maze.rows || maze.cols != level_.maze.cols) return;

    for (int r = 0; r < maze.rows; ++r) {
        for (int c = 0; c < maze.cols; ++c) {
            if (maze.isWall({r, c}) != level_.maze.isWall({r, c})) return;
        }
    }

    for (int r = 0; r < maze.rows; ++r) {
        for (int c = 0; c < maze.cols; ++c) {
            if (level_.maze.isGoal({r, c})) maze.at(r, c) = TileType::Goal;
        }
    }
}

bool Sokoban::loadSerialized(const std::string& text, CorruptSaveError* err) {
    EngineState st;
    if (!decodeBoard(text, st, err)) return false;
    adoptLevelGoals(st.maze);
    replaceState(std::move(st));
    return true;
}

void Sokoban::replaceState(EngineState st) {
    state_ = std::move(st);
}
