/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe trace file logging
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace LanConnect {

/**
 * @brief Thread-safe logging to the daemon's trace file
 *
 * Used by ChannelService, Channel and Transfer to record lifecycle events
 * (service start/stop, dropped connections, transfer outcomes) in a file that
 * survives the console. All writers share one static mutex.
 *
 * Note: initialize() must be called before any worker threads start.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the trace file path
     * @param logPath Path to the log file (appended to)
     *
     * Calling log() before initialize() silently does nothing.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Disable file logging again
     */
    static void shutdown();

    /**
     * @brief Check whether a trace file is configured
     */
    static bool isEnabled();

    /**
     * @brief Log a std::string message
     * @param message Message to log
     *
     * Safe to call from any thread.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     * @param message Message to log
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (empty when disabled)
    static std::filesystem::path s_logPath;
};

} // namespace LanConnect
