#pragma once
#include "common.hpp"
#include <cstdint>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    Goal,
};

// Level-file marker for a tile with nothing on it.
inline char tileMarker(TileType t) {
    switch (t) {
        case TileType::Wall:  return 'W';
        case TileType::Floor: return ' ';
        case TileType::Goal:  return 'G';
    }
    return ' ';
}

// Terrain layer. Dimensions and tiles are fixed once a level is loaded;
// crates, pickups and the player live in the engine state on top of it.
class Maze {
public:
    int rows = 0;
    int cols = 0;
    std::vector<TileType> tiles;

    Maze() = default;
    Maze(int rowCount, int colCount, TileType fill = TileType::Floor);

    bool inBounds(int row, int col) const {
        return row >= 0 && col >= 0 && row < rows && col < cols;
    }
    bool inBounds(GridPos p) const { return inBounds(p.row, p.col); }

    TileType& at(int row, int col) { return tiles[static_cast<size_t>(row * cols + col)]; }
    TileType at(int row, int col) const { return tiles[static_cast<size_t>(row * cols + col)]; }
    TileType at(GridPos p) const { return at(p.row, p.col); }

    // Out-of-bounds cells count as walls so movement code needs one check.
    bool isWall(GridPos p) const;
    bool isGoal(GridPos p) const;

    std::vector<GridPos> goalPositions() const;
};
