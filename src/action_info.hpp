#pragma once

// SDL-free action metadata shared by the console shell (help text, dispatch)
// and the SDL layer (keybind parsing).
//
// The canonical action token is the part after `bind_` in fancysoko_settings.ini.
// Example: `bind_buy_fancy = 3`  -> token is `buy_fancy`.

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class Action : uint8_t {
    None = 0,

    // Movement
    Up,
    Down,
    Left,
    Right,

    // Shop
    BuyStrength,
    BuyMove,
    BuyFancy,

    // Game
    Restart,
    Save,
    Load,
    Help,
    Quit,

    // Prompt answers (play again? / really quit?)
    Confirm,
    Cancel,
};

namespace actioninfo {

struct ActionInfo {
    Action action;
    const char* token; // canonical token used in bind_<token>
    const char* desc;  // short, user-facing description
};

// Order is the order of the help listing.
inline constexpr ActionInfo kActionInfoTable[] = {
    {Action::Up,          "up",           "Move up"},
    {Action::Down,        "down",         "Move down"},
    {Action::Left,        "left",         "Move left"},
    {Action::Right,       "right",        "Move right"},

    {Action::BuyStrength, "buy_strength", "Buy a strength potion"},
    {Action::BuyMove,     "buy_move",     "Buy a move potion"},
    {Action::BuyFancy,    "buy_fancy",    "Buy a fancy potion"},

    {Action::Restart,     "restart",      "Restart the level"},
    {Action::Save,        "save",         "Save to the current slot"},
    {Action::Load,        "load",         "Load the current slot"},
    {Action::Help,        "help",         "Show controls"},
    {Action::Quit,        "quit",         "Quit"},

    {Action::Confirm,     "confirm",      "Answer yes"},
    {Action::Cancel,      "cancel",       "Answer no"},
};

// Accepts the token, or the full `bind_<token>` settings key. '-' works as '_'.
inline std::optional<Action> parseActionToken(const std::string& raw) {
    std::string s = toLower(trim(raw));
    if (s.rfind("bind_", 0) == 0) s = s.substr(5);
    for (char& c : s) {
        if (c == '-') c = '_';
    }
    for (const auto& info : kActionInfoTable) {
        if (s == info.token) return info.action;
    }
    return std::nullopt;
}

// Direction for the four move actions, nullopt for everything else.
inline std::optional<Direction> moveDirection(Action a) {
    switch (a) {
        case Action::Up:    return Direction::Up;
        case Action::Down:  return Direction::Down;
        case Action::Left:  return Direction::Left;
        case Action::Right: return Direction::Right;
        case Action::None:
        case Action::BuyStrength:
        case Action::BuyMove:
        case Action::BuyFancy:
        case Action::Restart:
        case Action::Save:
        case Action::Load:
        case Action::Help:
        case Action::Quit:
        case Action::Confirm:
        case Action::Cancel:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace actioninfo
