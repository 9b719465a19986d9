#pragma once

#include <string>

// User-editable settings file (INI-ish: key = value).
// Created with commented defaults in the data directory on first run.
struct Settings {
    // Level started when no --level flag is given. Relative paths resolve
    // against the working directory.
    std::string levelFile = "maze_files/coin_maze.txt";

    // Rotated backups kept for each save file (0 disables, max 10).
    int saveBackups = 3;

    // Default save slot name. Empty means the unnamed slot (fancysoko_save.txt).
    // Overridden by --slot.
    std::string defaultSlot;

    // Ask before quitting with the quit key.
    bool confirmQuit = true;

    // Print the shop price list under the board.
    bool showShop = true;

    // How many recent log messages are printed after each command (1..20).
    int messageLines = 4;
};

// Loads settings from disk. Missing file or bad values fall back to defaults.
// Unknown keys (including bind_* entries, which KeyBinds reads) are ignored.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
