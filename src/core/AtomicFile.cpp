/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/AtomicFile.h"
#include <fstream>

namespace LanConnect {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath) {
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg) {
    errorMsg.clear();
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    std::error_code ec;
    if (paths.finalPath.has_parent_path()) {
        std::filesystem::create_directories(paths.finalPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Failed to create directory: " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Failed to open temp file: " + paths.tempPath.string();
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            errorMsg = "Failed to write temp file: " + paths.tempPath.string();
            return false;
        }
    }

    // rename(2) replaces an existing destination atomically
    std::filesystem::rename(paths.tempPath, paths.finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code removeEc;
        std::filesystem::remove(paths.tempPath, removeEc);
        return false;
    }

    return true;
}

} // namespace LanConnect
