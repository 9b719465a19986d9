#pragma once
#include "board_codec.hpp"
#include "common.hpp"
#include "engine_state.hpp"
#include "shop.hpp"

#include <string>
#include <vector>

// Turn-based puzzle engine.
//
// All mutation goes through attemptMove / attemptPurchase / reset /
// replaceState. Illegal moves and purchases are not errors: they return
// false and leave the state untouched.
class Sokoban {
public:
    Sokoban() = default;

    // Parses a level file's text and starts it. On failure the engine keeps
    // whatever it held before.
    bool loadLevel(const std::string& levelText, CorruptSaveError* err);

    // One step in a direction, pushing a crate if one is in the way.
    // Returns true if the player moved (and one move was spent).
    bool attemptMove(Direction d);

    // Buys and immediately drinks a potion from the shop.
    // Returns true if the purchase went through.
    bool attemptPurchase(const std::string& itemId);

    // Back to the level as it was first loaded (not the last save).
    void reset();

    // Every goal tile has a crate on it.
    bool hasWon() const;

    // Queries
    int rows() const { return state_.maze.rows; }
    int cols() const { return state_.maze.cols; }
    const Maze& maze() const { return state_.maze; }
    const EntityMap& entities() const { return state_.entities; }
    const PlayerState& player() const { return state_.player; }
    const EngineState& state() const { return state_; }

    GridPos playerPosition() const { return state_.player.pos; }
    int playerStrength() const { return state_.player.strength; }
    int movesRemaining() const { return state_.player.movesRemaining; }
    int money() const { return state_.player.money; }

    const std::vector<ShopItem>& shopItems() const { return shopCatalogue(); }

    // Persistence
    std::string serialize() const;
    // Decodes a save and swaps it in. The running game is untouched on failure.
    // A save that lists no goals but has the level's size and walls takes
    // its goal tiles from the level.
    bool loadSerialized(const std::string& text, CorruptSaveError* err);
    // Swaps in a complete state. The level used by reset() is unchanged.
    void replaceState(EngineState st);

private:
    EngineState level_;
    EngineState state_;

    bool cellBlocksCrate(GridPos p) const;
    void adoptLevelGoals(Maze& maze) const;
    void pickupAt(GridPos p);
};
