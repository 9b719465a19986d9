#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

// Grid coordinates are (row, col) with row 0 at the top.
struct GridPos {
    int row = 0;
    int col = 0;
};

inline bool operator==(const GridPos& a, const GridPos& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const GridPos& a, const GridPos& b) {
    return !(a == b);
}

// Row-major ordering so entity maps iterate in reading order.
inline bool operator<(const GridPos& a, const GridPos& b) {
    if (a.row != b.row) return a.row < b.row;
    return a.col < b.col;
}

inline GridPos operator+(const GridPos& a, const GridPos& b) {
    return {a.row + b.row, a.col + b.col};
}

enum class Direction : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
};

inline GridPos dirDelta(Direction d) {
    switch (d) {
        case Direction::Up:    return {-1, 0};
        case Direction::Down:  return {1, 0};
        case Direction::Left:  return {0, -1};
        case Direction::Right: return {0, 1};
    }
    return {0, 0};
}

inline const char* dirName(Direction d) {
    switch (d) {
        case Direction::Up:    return "UP";
        case Direction::Down:  return "DOWN";
        case Direction::Left:  return "LEFT";
        case Direction::Right: return "RIGHT";
    }
    return "?";
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

inline std::vector<std::string> splitWS(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(static_cast<char>(c));
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}
