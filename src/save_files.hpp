#pragma once

#include <filesystem>
#include <string>

// File helpers for saves. The engine never touches the filesystem; the
// console shell goes through these.

inline constexpr const char* SAVE_BASENAME = "fancysoko_save.txt";
inline constexpr int MAX_SAVE_BACKUPS = 10;

// Whole-file read. Returns false (and sets err) if the file is missing or unreadable.
bool readTextFile(const std::string& path, std::string& out, std::string* err);

// Writes <path>.tmp, rotates existing backups (<path>.bak1 .. .bakN), then
// renames the temp file over <path>. The old file survives if anything fails
// before the final rename.
bool writeTextFileAtomic(const std::string& path, const std::string& text, int keepBackups, std::string* err);

// <path>.bak(N-1) -> .bakN ... <path> -> .bak1. Best-effort.
void rotateFileBackups(const std::filesystem::path& path, int keepBackups);

// dir/fancysoko_save.txt for the default slot, dir/fancysoko_save_<slot>.txt otherwise.
std::filesystem::path savePathForSlot(const std::filesystem::path& dir, const std::string& slot);
