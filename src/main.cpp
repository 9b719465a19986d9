#include "sdl.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "board_codec.hpp"
#include "console.hpp"
#include "keybinds.hpp"
#include "save_files.hpp"
#include "settings.hpp"
#include "slot_utils.hpp"
#include "sokoban.hpp"
#include "version.hpp"

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << FANCYSOKO_APPNAME << " " << FANCYSOKO_VERSION << "\n"
        << "Usage: " << (exe ? exe : "fancysoko") << " [options]\n\n"
        << "Options:\n"
        << "  --level <path>       Level file to play (default: level_file from settings)\n"
        << "  --load <path>        Load a save file after the level starts\n"
        << "  --data-dir <path>    Override the save/config directory\n"
        << "  --slot <name>        Use a named save slot (fancysoko_save_<name>.txt)\n"
        << "  --portable           Store saves/config next to the executable\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n"
        << "\n"
        << "In game, type keys and press enter (e.g. \"ddw\"). Lines starting with ':'\n"
        << "are commands: :help, :buy <item>, :save [path], :load [path], :slot <name>,\n"
        << ":reset, :quit.\n";
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "fancysoko");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << FANCYSOKO_APPNAME << " " << FANCYSOKO_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(0) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Where settings and saves live: --data-dir, next to the executable
    // (--portable), or the per-user SDL pref path.
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");
    const std::optional<std::string> slotArg = parseStringArg(argc, argv, "--slot");
    const std::optional<std::string> levelArg = parseStringArg(argc, argv, "--level");
    const std::optional<std::string> loadArg = parseStringArg(argc, argv, "--load");
    const bool portable = hasFlag(argc, argv, "--portable");
    const bool resetSettings = hasFlag(argc, argv, "--reset-settings");

    std::filesystem::path baseDir;
    if (dataDirArg && !dataDirArg->empty()) {
        baseDir = std::filesystem::path(*dataDirArg);
    } else if (portable) {
        if (char* p = SDL_GetBasePath()) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    } else {
        if (char* p = SDL_GetPrefPath("fancysoko", FANCYSOKO_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    }

    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) {
            std::cerr << "Cannot create data directory " << baseDir.string() << ": " << ec.message() << "\n";
        }
    }

    const std::filesystem::path settingsPathFs = baseDir / "fancysoko_settings.ini";
    const std::string settingsPath = settingsPathFs.string();

    if (resetSettings) {
        std::error_code ec;
        const std::filesystem::path bak = settingsPath + ".bak";
        std::filesystem::remove(bak, ec);
        if (std::filesystem::exists(settingsPathFs, ec)) {
            std::filesystem::rename(settingsPathFs, bak, ec);
        }
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Cannot write settings file " << settingsPath << "\n";
        }
    } else if (!std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Cannot write settings file " << settingsPath << "\n";
        }
    }

    const Settings settings = loadSettings(settingsPath);

    KeyBinds keybinds = KeyBinds::defaults();
    keybinds.loadOverridesFromIni(settingsPath);

    // Level: CLI > settings.
    const std::string levelPath = (levelArg && !levelArg->empty()) ? *levelArg : settings.levelFile;
    std::string levelText;
    std::string ioErr;
    if (!readTextFile(levelPath, levelText, &ioErr)) {
        std::cerr << "Cannot read level: " << ioErr << "\n";
        SDL_Quit();
        return 1;
    }

    Sokoban game;
    CorruptSaveError levelErr;
    if (!game.loadLevel(levelText, &levelErr)) {
        std::cerr << "Level " << levelPath << " is invalid: " << levelErr.describe() << "\n";
        SDL_Quit();
        return 1;
    }

    Console console(game, settings, baseDir);
    console.setKeyDescriber([&keybinds](Action a) { return keybinds.describeAction(a); });
    if (slotArg && !slotArg->empty()) {
        console.setActiveSlot(*slotArg);
    }
    if (loadArg && !loadArg->empty() && !console.loadGame(*loadArg)) {
        std::cerr << "Cannot load " << *loadArg << ": " << console.recentMessages(1);
    }

    std::cout << FANCYSOKO_APPNAME << " " << FANCYSOKO_VERSION << " - " << levelPath << "\n";
    std::cout << "Data directory: " << baseDir.string() << "\n";
    std::cout << "Type " << keybinds.describeAction(Action::Help) << " for controls, :help for commands.\n";

    std::string line;
    while (!console.quitRequested()) {
        std::cout << "\n" << console.drawBoard();
        std::cout << console.recentMessages(settings.messageLines);
        std::cout << "> " << std::flush;

        if (!std::getline(std::cin, line)) break;

        const std::string t = trim(line);
        if (!t.empty() && (t[0] == ':' || t[0] == '#')) {
            console.runCommand(t);
            continue;
        }

        for (char c : line) {
            if (std::isspace(static_cast<unsigned char>(c))) continue;

            const Action a = keybinds.mapChar(c);
            if (a == Action::None) {
                console.pushMsg(std::string("UNKNOWN KEY: ") + c, MessageKind::Warning);
                continue;
            }
            console.handleAction(a);
            if (console.quitRequested()) break;
        }
    }

    std::cout << "\n" << console.recentMessages(1);
    SDL_Quit();
    return 0;
}
