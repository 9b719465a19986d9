#include "keybinds.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

KeyBinds bindsFromIni(const std::string& text) {
    const fs::path dir = fs::temp_directory_path() / "fancysoko_keybinds_test";
    std::error_code ec;
    fs::create_directories(dir, ec);
    const fs::path path = dir / "settings.ini";
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }

    KeyBinds kb = KeyBinds::defaults();
    kb.loadOverridesFromIni(path.string());
    fs::remove_all(dir, ec);
    return kb;
}

void test_default_bindings() {
    const KeyBinds kb = KeyBinds::defaults();

    expect(kb.mapChar('w') == Action::Up, "w moves up");
    expect(kb.mapChar('a') == Action::Left, "a moves left");
    expect(kb.mapChar('s') == Action::Down, "s moves down");
    expect(kb.mapChar('d') == Action::Right, "d moves right");
    expect(kb.mapChar('1') == Action::BuyStrength, "1 buys strength");
    expect(kb.mapChar('3') == Action::BuyFancy, "3 buys fancy");
    expect(kb.mapChar('?') == Action::Help, "? is help");
    expect(kb.mapChar('y') == Action::Confirm, "y confirms");
    expect(kb.mapChar('n') == Action::Cancel, "n cancels");
    expect(kb.mapChar('x') == Action::None, "x is unbound");

    expect(kb.mapChar('W') == Action::None, "uppercase is shift+w, which is unbound");
    expect(kb.mapKey(SDLK_UP, KMOD_NONE) == Action::Up, "arrow key");
    expect(kb.mapKey(SDLK_UP, KMOD_LSHIFT) == Action::None, "extra modifiers do not match");
    expect(kb.mapKey(SDLK_ESCAPE, KMOD_NONE) == Action::Quit, "escape quits");

    expect(kb.describeAction(Action::Up) == "w, up", "help text lists every key: " + kb.describeAction(Action::Up));
}

void test_ini_overrides() {
    const KeyBinds kb = bindsFromIni(
        "# comment line\n"
        "bind_up = shift+w, ctrl+up\n"
        "bind_buy_fancy = none\n"
        "bind_restart = f5\n"
        "bind_save = bogus+k, k\n"
        "bind_help = +\n"
        "bind_teleport = t\n"
        "level_file = levels/other.txt\n");

    expect(kb.mapChar('W') == Action::Up, "shift+w bound to up");
    expect(kb.mapChar('w') == Action::None, "plain w no longer bound");
    expect(kb.mapKey(SDLK_UP, KMOD_LCTRL) == Action::Up, "ctrl+up bound to up");
    expect(kb.mapKey(SDLK_UP, KMOD_NONE) == Action::None, "plain up replaced");

    expect(kb.mapChar('3') == Action::None, "none unbinds");
    expect(kb.describeAction(Action::BuyFancy).empty(), "unbound action has no keys");

    expect(kb.mapKey(SDLK_F5, KMOD_NONE) == Action::Restart, "function key parsed");
    expect(kb.mapChar('k') == Action::Save, "bad chord dropped, good one kept");
    expect(kb.mapChar('+') == Action::Help, "lone plus is the plus key");

    expect(kb.mapChar('d') == Action::Right, "untouched bindings keep their defaults");
    expect(kb.describeAction(Action::Up) == "shift+w, ctrl+up", "chords described: " + kb.describeAction(Action::Up));
}

void test_chord_to_string() {
    expect(KeyBinds::chordToString(SDLK_a, KMOD_NONE) == "a", "plain letter");
    expect(KeyBinds::chordToString(SDLK_a, KMOD_LSHIFT) == "shift+a", "left shift normalized");
    expect(KeyBinds::chordToString(SDLK_RETURN, KMOD_RCTRL | KMOD_LALT) == "ctrl+alt+enter", "modifier order");
}

} // namespace

int main() {
    std::cout << "Running FancySokoban keybind tests...\n";

    test_default_bindings();
    test_ini_overrides();
    test_chord_to_string();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
