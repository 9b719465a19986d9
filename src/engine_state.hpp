#pragma once
#include "entities.hpp"
#include "maze.hpp"
#include "player.hpp"

// Everything a running game can change, plus the terrain it changes on.
// Produced by the board codec and swapped into the engine in one piece.
struct EngineState {
    Maze maze;
    EntityMap entities;
    PlayerState player;

    const Entity* entityAt(GridPos p) const {
        auto it = entities.find(p);
        return it == entities.end() ? nullptr : &it->second;
    }
};
