#include "settings.hpp"

#include "common.hpp"
#include "save_files.hpp"
#include "slot_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        const int n = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// '#' or ';' starts a comment at the beginning of a line or after whitespace,
// so values such as paths may contain either character.
std::string stripComment(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] != '#' && line[i] != ';') continue;
        if (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1]))) {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(stripComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key == "level_file") {
            if (!val.empty()) s.levelFile = val;
        } else if (key == "save_backups") {
            int v = 0;
            if (parseInt(val, v)) s.saveBackups = std::clamp(v, 0, MAX_SAVE_BACKUPS);
        } else if (key == "default_slot") {
            s.defaultSlot = normalizeSlotName(val);
        } else if (key == "confirm_quit") {
            bool b = true;
            if (parseBool(val, b)) s.confirmQuit = b;
        } else if (key == "show_shop") {
            bool b = true;
            if (parseBool(val, b)) s.showShop = b;
        } else if (key == "message_lines") {
            int v = 0;
            if (parseInt(val, v)) s.messageLines = std::clamp(v, 1, 20);
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# FancySokoban settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Level loaded when no --level flag is given
level_file = maze_files/coin_maze.txt

# Saves
# save_backups: 0 disables; otherwise keeps <save>.bak1 .. .bakN (max 10)
save_backups = 3
# default_slot: empty = fancysoko_save.txt, otherwise fancysoko_save_<slot>.txt
default_slot =

# Console
confirm_quit = true
show_shop = true
# message_lines: 1..20
message_lines = 4

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<action> = key[, key, ...]
#
# Modifiers: shift, ctrl, alt. Example: shift+s
# Set a binding to "none" to disable it.
# -----------------------------------------------------------------------------

# Movement
bind_up = w, up
bind_down = s, down
bind_left = a, left
bind_right = d, right

# Shop
bind_buy_strength = 1
bind_buy_move = 2
bind_buy_fancy = 3

# Game
bind_restart = r
bind_save = k
bind_load = l
bind_help = h, ?
bind_quit = q, escape
bind_confirm = y, enter
bind_cancel = n
)INI";

    return static_cast<bool>(f);
}
