#pragma once

#include "engine_state.hpp"

#include <cstdint>
#include <string>

// Text encoding shared by level files and save files.
//
//   <strength> <moves_remaining>
//   <one line per maze row, one character per column>
//   <empty line>                      (optional trailer follows)
//   money <n>
//   goals <row>,<col> <row>,<col> ...
//   coins <row>,<col> ...
//
// Grid markers:
//   P player    W wall    1..9 crate (its strength)    S M F potions
//   G goal      $ coin    ' ' floor
//
// Save files never contain G or $: goal and coin cells are written as spaces
// and listed in the trailer instead. Level files usually use G and $ directly
// and carry no trailer. A save without a trailer loads with no goals, no
// coins and the starting money.

enum class SaveErrorKind : uint8_t {
    MissingHeader = 0,
    BadHeader,
    EmptyMaze,
    RowLength,
    UnknownMarker,
    MissingPlayer,
    DuplicatePlayer,
    BadTrailer,
};

const char* saveErrorKindName(SaveErrorKind k);

struct CorruptSaveError {
    SaveErrorKind kind = SaveErrorKind::MissingHeader;
    int line = 0; // 1-based; 0 when not tied to a line
    std::string message;

    // "LINE 3: ROW IS 6 WIDE, EXPECTED 7"
    std::string describe() const;
};

// Parses a level or save. On failure returns false, fills err (if given) and
// leaves out untouched.
bool decodeBoard(const std::string& text, EngineState& out, CorruptSaveError* err);

// Save-file encoding (grid as described above, plus the trailer).
std::string encodeBoard(const EngineState& state);

enum class GridMarkers : uint8_t {
    Save = 0, // goals/coins as spaces
    Level,    // goals as G, coins as $
};

// Grid rows only, newline-terminated. Level markers are what the console prints.
std::string encodeGrid(const EngineState& state, GridMarkers markers);
