#include "board_codec.hpp"

#include <sstream>
#include <vector>

namespace {

constexpr char PLAYER_MARKER = 'P';

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : text) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) {
        if (cur.back() == '\r') cur.pop_back();
        lines.push_back(cur);
    }
    return lines;
}

bool parseNonNegative(const std::string& s, int& out) {
    if (s.empty()) return false;
    int64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
        if (v > 1000000000) return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool parsePosToken(const std::string& tok, GridPos& out) {
    const size_t comma = tok.find(',');
    if (comma == std::string::npos) return false;
    int r = 0;
    int c = 0;
    if (!parseNonNegative(tok.substr(0, comma), r)) return false;
    if (!parseNonNegative(tok.substr(comma + 1), c)) return false;
    out = {r, c};
    return true;
}

char cellMarker(const EngineState& st, int r, int c, GridMarkers markers) {
    const GridPos p{r, c};
    if (p == st.player.pos) return PLAYER_MARKER;

    const TileType t = st.maze.at(r, c);
    if (t == TileType::Wall) return tileMarker(TileType::Wall);

    if (const Entity* e = st.entityAt(p)) {
        switch (e->kind) {
            case EntityKind::Crate:
            case EntityKind::StrengthPotion:
            case EntityKind::MovePotion:
            case EntityKind::FancyPotion:
                return e->marker();
            case EntityKind::Coin:
                if (markers == GridMarkers::Level) return e->marker();
                break;
        }
    }

    if (markers == GridMarkers::Level) return tileMarker(t);
    return ' ';
}

} // namespace

const char* saveErrorKindName(SaveErrorKind k) {
    switch (k) {
        case SaveErrorKind::MissingHeader:   return "MISSING HEADER";
        case SaveErrorKind::BadHeader:       return "BAD HEADER";
        case SaveErrorKind::EmptyMaze:       return "EMPTY MAZE";
        case SaveErrorKind::RowLength:       return "ROW LENGTH";
        case SaveErrorKind::UnknownMarker:   return "UNKNOWN MARKER";
        case SaveErrorKind::MissingPlayer:   return "MISSING PLAYER";
        case SaveErrorKind::DuplicatePlayer: return "DUPLICATE PLAYER";
        case SaveErrorKind::BadTrailer:      return "BAD TRAILER";
    }
    return "UNKNOWN";
}

std::string CorruptSaveError::describe() const {
    std::string s;
    if (line > 0) s = "LINE " + std::to_string(line) + ": ";
    s += message.empty() ? std::string(saveErrorKindName(kind)) : message;
    return s;
}

bool decodeBoard(const std::string& text, EngineState& out, CorruptSaveError* err) {
    auto fail = [&](SaveErrorKind kind, int line, std::string msg) -> bool {
        if (err) {
            err->kind = kind;
            err->line = line;
            err->message = std::move(msg);
        }
        return false;
    };

    const std::vector<std::string> lines = splitLines(text);
    if (lines.empty() || trim(lines[0]).empty()) {
        return fail(SaveErrorKind::MissingHeader, 1, "MISSING STRENGTH/MOVES HEADER");
    }

    EngineState st;

    // Header: strength and move budget.
    {
        const std::vector<std::string> toks = splitWS(lines[0]);
        if (toks.size() != 2) {
            return fail(SaveErrorKind::BadHeader, 1, "HEADER NEEDS 2 NUMBERS, GOT " + std::to_string(toks.size()));
        }
        int strength = 0;
        int moves = 0;
        if (!parseNonNegative(toks[0], strength) || !parseNonNegative(toks[1], moves)) {
            return fail(SaveErrorKind::BadHeader, 1, "HEADER IS NOT NUMERIC");
        }
        if (strength < 1) {
            return fail(SaveErrorKind::BadHeader, 1, "STRENGTH MUST BE AT LEAST 1");
        }
        st.player.strength = strength;
        st.player.movesRemaining = moves;
        st.player.money = STARTING_MONEY;
    }

    // Grid rows run until the first empty line.
    size_t gridEnd = 1;
    while (gridEnd < lines.size() && !lines[gridEnd].empty()) ++gridEnd;

    const int rowCount = static_cast<int>(gridEnd - 1);
    if (rowCount <= 0) {
        return fail(SaveErrorKind::EmptyMaze, 2, "NO MAZE ROWS");
    }
    const int colCount = static_cast<int>(lines[1].size());

    st.maze = Maze(rowCount, colCount, TileType::Floor);

    bool havePlayer = false;
    for (int r = 0; r < rowCount; ++r) {
        const std::string& row = lines[static_cast<size_t>(r + 1)];
        const int lineNo = r + 2;
        if (static_cast<int>(row.size()) != colCount) {
            return fail(SaveErrorKind::RowLength, lineNo,
                        "ROW IS " + std::to_string(row.size()) + " WIDE, EXPECTED " + std::to_string(colCount));
        }

        for (int c = 0; c < colCount; ++c) {
            const char ch = row[static_cast<size_t>(c)];
            const GridPos p{r, c};

            if (ch == PLAYER_MARKER) {
                if (havePlayer) {
                    return fail(SaveErrorKind::DuplicatePlayer, lineNo, "MORE THAN ONE PLAYER");
                }
                havePlayer = true;
                st.player.pos = p;
                continue;
            }
            if (ch == tileMarker(TileType::Wall)) {
                st.maze.at(r, c) = TileType::Wall;
                continue;
            }
            if (ch == tileMarker(TileType::Floor)) continue;
            if (ch == tileMarker(TileType::Goal)) {
                st.maze.at(r, c) = TileType::Goal;
                continue;
            }
            if (const int s = crateStrengthFromMarker(ch); s > 0) {
                st.entities[p] = makeCrate(s);
                continue;
            }
            if (auto kind = entityKindFromMarker(ch)) {
                st.entities[p] = makeEntity(*kind);
                continue;
            }

            return fail(SaveErrorKind::UnknownMarker, lineNo,
                        std::string("UNKNOWN MARKER '") + ch + "' AT COLUMN " + std::to_string(c + 1));
        }
    }

    if (!havePlayer) {
        return fail(SaveErrorKind::MissingPlayer, 0, "NO PLAYER MARKER");
    }

    // Optional trailer.
    for (size_t i = gridEnd; i < lines.size(); ++i) {
        const std::vector<std::string> toks = splitWS(lines[i]);
        if (toks.empty()) continue;

        const int lineNo = static_cast<int>(i) + 1;
        const std::string key = toLower(toks[0]);

        if (key == "money") {
            int money = 0;
            if (toks.size() != 2 || !parseNonNegative(toks[1], money)) {
                return fail(SaveErrorKind::BadTrailer, lineNo, "MONEY NEEDS ONE NUMBER");
            }
            st.player.money = money;
        } else if (key == "goals" || key == "coins") {
            for (size_t t = 1; t < toks.size(); ++t) {
                GridPos p;
                if (!parsePosToken(toks[t], p) || !st.maze.inBounds(p)) {
                    return fail(SaveErrorKind::BadTrailer, lineNo, "BAD POSITION '" + toks[t] + "'");
                }
                if (st.maze.at(p) == TileType::Wall) {
                    return fail(SaveErrorKind::BadTrailer, lineNo, "POSITION " + toks[t] + " IS A WALL");
                }
                if (key == "goals") {
                    st.maze.at(p.row, p.col) = TileType::Goal;
                } else {
                    if (p == st.player.pos || st.entities.count(p) != 0) {
                        return fail(SaveErrorKind::BadTrailer, lineNo, "COIN AT " + toks[t] + " IS ON AN OCCUPIED CELL");
                    }
                    st.entities[p] = makeEntity(EntityKind::Coin);
                }
            }
        } else {
            return fail(SaveErrorKind::BadTrailer, lineNo, "UNKNOWN TRAILER KEY '" + toks[0] + "'");
        }
    }

    out = std::move(st);
    return true;
}

std::string encodeGrid(const EngineState& state, GridMarkers markers) {
    std::string s;
    s.reserve(static_cast<size_t>((state.maze.cols + 1) * state.maze.rows));
    for (int r = 0; r < state.maze.rows; ++r) {
        for (int c = 0; c < state.maze.cols; ++c) {
            s.push_back(cellMarker(state, r, c, markers));
        }
        s.push_back('\n');
    }
    return s;
}

std::string encodeBoard(const EngineState& state) {
    std::ostringstream ss;
    ss << state.player.strength << ' ' << state.player.movesRemaining << '\n';
    ss << encodeGrid(state, GridMarkers::Save);

    ss << '\n';
    ss << "money " << state.player.money << '\n';

    const std::vector<GridPos> goals = state.maze.goalPositions();
    if (!goals.empty()) {
        ss << "goals";
        for (const auto& g : goals) ss << ' ' << g.row << ',' << g.col;
        ss << '\n';
    }

    bool anyCoin = false;
    for (const auto& kv : state.entities) {
        if (kv.second.kind != EntityKind::Coin) continue;
        if (!anyCoin) {
            ss << "coins";
            anyCoin = true;
        }
        ss << ' ' << kv.first.row << ',' << kv.first.col;
    }
    if (anyCoin) ss << '\n';

    return ss.str();
}
