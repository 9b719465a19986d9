#include "keybinds.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    Uint16 out = KMOD_NONE;
    if (mods & KMOD_SHIFT) out |= KMOD_SHIFT;
    if (mods & KMOD_CTRL) out |= KMOD_CTRL;
    if (mods & KMOD_ALT) out |= KMOD_ALT;
    return out;
}

bool KeyBinds::chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods) {
    return chord.key == key && chord.mods == normalizeMods(mods);
}

std::vector<std::string> KeyBinds::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = toLower(trim(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;

    if (keyName == "enter" || keyName == "return") return SDLK_RETURN;
    if (keyName == "escape" || keyName == "esc") return SDLK_ESCAPE;
    if (keyName == "tab") return SDLK_TAB;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "backspace") return SDLK_BACKSPACE;

    if (keyName == "comma") return SDLK_COMMA;
    if (keyName == "period" || keyName == "dot") return SDLK_PERIOD;
    if (keyName == "slash") return SDLK_SLASH;
    if (keyName == "question") return SDLK_QUESTION;
    if (keyName == "minus" || keyName == "dash") return SDLK_MINUS;
    if (keyName == "equals" || keyName == "equal") return SDLK_EQUALS;

    // Function keys
    if (keyName.size() >= 2 && keyName[0] == 'f' && std::isdigit(static_cast<unsigned char>(keyName[1]))) {
        int n = 0;
        for (size_t i = 1; i < keyName.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(keyName[i]);
            if (!std::isdigit(c)) {
                n = 0;
                break;
            }
            n = n * 10 + (c - '0');
            if (n > 24) break;
        }
        if (n >= 1 && n <= 12) {
            return static_cast<SDL_Keycode>(SDLK_F1 + (n - 1));
        }
    }

    // Fallback: SDL's own key name parsing ("Keypad 8", "Left Shift", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    const std::string token = trim(tokenIn);
    if (token.empty()) return std::nullopt;

    // A lone '+' is the plus key, not an empty modifier list.
    if (token == "+") return KeyChord{static_cast<SDL_Keycode>('+'), KMOD_NONE};

    std::vector<std::string> parts = split(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;
    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string m = toLower(trim(parts[i]));
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    const SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    KeyChord chord;
    chord.key = key;
    chord.mods = normalizeMods(mods);
    return chord;
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    const std::string value = trim(valueIn);
    if (value.empty()) return {};
    const std::string vLow = toLower(value);
    if (vLow == "none" || vLow == "unbound" || vLow == "disabled") return {};

    std::vector<KeyChord> out;
    for (const auto& part : split(value, ',')) {
        auto chord = parseChord(part);
        if (chord.has_value()) out.push_back(*chord);
    }
    return out;
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&](Action a, SDL_Keycode key, Uint16 mods = KMOD_NONE) {
        kb.binds[a].push_back({key, normalizeMods(mods)});
    };

    // Movement
    add(Action::Up, SDLK_w);
    add(Action::Up, SDLK_UP);
    add(Action::Down, SDLK_s);
    add(Action::Down, SDLK_DOWN);
    add(Action::Left, SDLK_a);
    add(Action::Left, SDLK_LEFT);
    add(Action::Right, SDLK_d);
    add(Action::Right, SDLK_RIGHT);

    // Shop
    add(Action::BuyStrength, SDLK_1);
    add(Action::BuyMove, SDLK_2);
    add(Action::BuyFancy, SDLK_3);

    // Game
    add(Action::Restart, SDLK_r);
    add(Action::Save, SDLK_k);
    add(Action::Load, SDLK_l);
    add(Action::Help, SDLK_h);
    add(Action::Help, SDLK_QUESTION);
    add(Action::Quit, SDLK_q);
    add(Action::Quit, SDLK_ESCAPE);

    // Prompts
    add(Action::Confirm, SDLK_y);
    add(Action::Confirm, SDLK_RETURN);
    add(Action::Cancel, SDLK_n);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream f(settingsPath);
    if (!f) return;

    std::string line;
    while (std::getline(f, line)) {
        // '#' starts a comment only at the beginning of a line here, so
        // punctuation keys stay bindable.
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;

        const auto eq = t.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(t.substr(0, eq)));
        if (key.rfind("bind_", 0) != 0) continue;

        const std::optional<Action> action = actioninfo::parseActionToken(key);
        if (!action.has_value()) continue;

        binds[*action] = parseChordList(t.substr(eq + 1));
    }
}

Action KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    // Table order decides ties when one key is bound to several actions.
    for (const auto& info : actioninfo::kActionInfoTable) {
        auto it = binds.find(info.action);
        if (it == binds.end()) continue;
        for (const auto& chord : it->second) {
            if (chordMatches(chord, key, mods)) return info.action;
        }
    }
    return Action::None;
}

Action KeyBinds::mapChar(char c) const {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isupper(uc)) {
        return mapKey(static_cast<SDL_Keycode>(std::tolower(uc)), KMOD_SHIFT);
    }
    return mapKey(static_cast<SDL_Keycode>(uc), KMOD_NONE);
}

std::string KeyBinds::chordToString(SDL_Keycode key, Uint16 mods) {
    std::string s;
    const Uint16 m = normalizeMods(mods);
    if (m & KMOD_CTRL) s += "ctrl+";
    if (m & KMOD_ALT) s += "alt+";
    if (m & KMOD_SHIFT) s += "shift+";

    switch (key) {
        case SDLK_UP:        return s + "up";
        case SDLK_DOWN:      return s + "down";
        case SDLK_LEFT:      return s + "left";
        case SDLK_RIGHT:     return s + "right";
        case SDLK_RETURN:    return s + "enter";
        case SDLK_ESCAPE:    return s + "escape";
        case SDLK_TAB:       return s + "tab";
        case SDLK_SPACE:     return s + "space";
        case SDLK_BACKSPACE: return s + "backspace";
        default:
            break;
    }

    if (key > 32 && key < 127) {
        s.push_back(static_cast<char>(key));
        return s;
    }

    const char* name = SDL_GetKeyName(key);
    return s + toLower(name ? std::string(name) : std::string("?"));
}

std::string KeyBinds::describeAction(Action a) const {
    auto it = binds.find(a);
    if (it == binds.end() || it->second.empty()) return std::string();

    std::string out;
    for (size_t i = 0; i < it->second.size(); ++i) {
        if (i > 0) out += ", ";
        out += chordToString(it->second[i].key, it->second[i].mods);
    }
    return out;
}
