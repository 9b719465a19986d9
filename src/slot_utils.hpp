#pragma once

#include "common.hpp"

#include <string>

// Save-slot naming shared by main.cpp (--slot), settings (default_slot) and
// the console's :slot command.
//
// A slot name ends up as a filename suffix (fancysoko_save_<slot>.txt), so it
// is reduced to lowercase letters, digits, '_' and '-'.

namespace fancysoko_slot_detail {

inline bool isWindowsReservedBasename(const std::string& lower) {
    static const char* reserved[] = {
        "con", "prn", "aux", "nul",
        "com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
        "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"
    };
    for (const char* r : reserved) {
        if (lower == r) return true;
    }
    return false;
}

} // namespace fancysoko_slot_detail

// "default", "none", "off" and the empty string all mean the unnamed slot.
inline bool isDefaultSlotName(const std::string& raw) {
    const std::string s = toLower(trim(raw));
    return s.empty() || s == "default" || s == "none" || s == "off";
}

inline std::string sanitizeSlotName(const std::string& raw) {
    const std::string in = toLower(trim(raw));

    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        const bool keep = std::isalnum(c) || c == '_' || c == '-';
        const char ch = keep ? static_cast<char>(c) : '_';
        // Collapse runs of '_'.
        if (ch == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(ch);
    }

    while (!out.empty() && (out.front() == '_' || out.front() == '-')) out.erase(out.begin());
    while (!out.empty() && (out.back() == '_' || out.back() == '-')) out.pop_back();

    if (out.empty()) out = "slot";
    if (out.size() > 32) out.resize(32);

    if (fancysoko_slot_detail::isWindowsReservedBasename(out)) {
        out = "_" + out;
    }
    return out;
}

// Normalized slot for storage: empty for the default slot.
inline std::string normalizeSlotName(const std::string& raw) {
    if (isDefaultSlotName(raw)) return std::string();
    return sanitizeSlotName(raw);
}
