/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <string>

namespace LanConnect {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute the temp path (finalPath + ".part") used for atomic writes.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Replace finalPath with content in one rename.
 *
 * Writes content to the temp path, flushes it and renames it over finalPath.
 * Readers see either the old file or the new one, never a partial write.
 * The temp file is removed on failure.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg);

} // namespace LanConnect
