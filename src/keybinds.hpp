#pragma once

#include "sdl.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "action_info.hpp"

// Configurable keybindings loaded from fancysoko_settings.ini.
//
// The binding format is:
//   bind_<action> = key[, key, ...]
//
// Each key can be:
//   - a single character: w, 1, ?
//   - a named key: up, down, left, right, enter, escape, space, f1, ...
// Modifiers can be prefixed with: shift+, ctrl+, alt+  (example: shift+r)
//
// Bindings are (keycode + required modifiers). Extra modifiers do NOT match.

struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // only SHIFT/CTRL/ALT bits are used
};

struct ActionHash {
    size_t operator()(Action a) const noexcept { return static_cast<size_t>(a); }
};

class KeyBinds {
public:
    static KeyBinds defaults();

    // Replaces the chords of every action that has a bind_<action> line.
    void loadOverridesFromIni(const std::string& settingsPath);

    Action mapKey(SDL_Keycode key, Uint16 mods) const;

    // Maps one typed console character: letters are case-folded, with
    // uppercase reported as shift+letter.
    Action mapChar(char c) const;

    // "w, up" style list for help text.
    std::string describeAction(Action a) const;

    static std::string chordToString(SDL_Keycode key, Uint16 mods);

private:
    std::unordered_map<Action, std::vector<KeyChord>, ActionHash> binds;

    static Uint16 normalizeMods(Uint16 mods);
    static bool chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods);

    static std::vector<KeyChord> parseChordList(const std::string& value);
    static std::vector<std::string> split(const std::string& s, char delim);

    static std::optional<KeyChord> parseChord(const std::string& token);
    static SDL_Keycode parseKeycode(const std::string& keyName);
};
