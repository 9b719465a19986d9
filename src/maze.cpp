#include "maze.hpp"

Maze::Maze(int rowCount, int colCount, TileType fill)
    : rows(rowCount), cols(colCount), tiles(static_cast<size_t>(rowCount * colCount), fill) {}

bool Maze::isWall(GridPos p) const {
    if (!inBounds(p)) return true;
    return at(p) == TileType::Wall;
}

bool Maze::isGoal(GridPos p) const {
    return inBounds(p) && at(p) == TileType::Goal;
}

std::vector<GridPos> Maze::goalPositions() const {
    std::vector<GridPos> out;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (at(r, c) == TileType::Goal) out.push_back({r, c});
        }
    }
    return out;
}
