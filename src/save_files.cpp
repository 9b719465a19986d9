#include "save_files.hpp"

#include "slot_utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace {

void moveFileWithFallback(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) return;

    // rename can fail across devices or onto an existing file on Windows.
    std::error_code ec2;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec2);
    if (ec2) return;
    std::filesystem::remove(from, ec2);
}

} // namespace

bool readTextFile(const std::string& path, std::string& out, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "CANNOT OPEN " + path;
        return false;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        if (err) *err = "READ ERROR IN " + path;
        return false;
    }
    out = ss.str();
    return true;
}

void rotateFileBackups(const std::filesystem::path& path, int keepBackups) {
    if (keepBackups <= 0) return;

    std::error_code ec;
    const std::filesystem::path oldest = path.string() + ".bak" + std::to_string(keepBackups);
    std::filesystem::remove(oldest, ec);

    for (int i = keepBackups - 1; i >= 1; --i) {
        const std::filesystem::path src = path.string() + ".bak" + std::to_string(i);
        const std::filesystem::path dst = path.string() + ".bak" + std::to_string(i + 1);
        if (!std::filesystem::exists(src, ec)) continue;
        moveFileWithFallback(src, dst);
    }

    if (std::filesystem::exists(path, ec)) {
        moveFileWithFallback(path, path.string() + ".bak1");
    }
}

bool writeTextFileAtomic(const std::string& path, const std::string& text, int keepBackups, std::string* err) {
    const std::filesystem::path p(path);
    const std::filesystem::path dir = p.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    const std::filesystem::path tmp = p.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "CANNOT OPEN " + tmp.string();
            return false;
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out.good()) {
            if (err) *err = "WRITE ERROR";
            out.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    rotateFileBackups(p, keepBackups < MAX_SAVE_BACKUPS ? keepBackups : MAX_SAVE_BACKUPS);

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(p, ec2);
        ec.clear();
        std::filesystem::rename(tmp, p, ec);
    }
    if (ec) {
        std::error_code copyEc;
        std::filesystem::copy_file(tmp, p, std::filesystem::copy_options::overwrite_existing, copyEc);
        std::error_code rmEc;
        std::filesystem::remove(tmp, rmEc);
        if (copyEc) {
            if (err) *err = "CANNOT REPLACE " + p.string();
            return false;
        }
    }
    return true;
}

std::filesystem::path savePathForSlot(const std::filesystem::path& dir, const std::string& slot) {
    const std::filesystem::path base = dir.empty() ? std::filesystem::path(".") : dir;
    const std::string s = normalizeSlotName(slot);
    if (s.empty()) return base / SAVE_BASENAME;

    const std::filesystem::path bp(SAVE_BASENAME);
    return base / (bp.stem().string() + "_" + s + bp.extension().string());
}
