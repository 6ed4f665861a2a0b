/**
 * @file AppConfig.h
 * @brief Persistent JSON configuration of the local device
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace LanConnect {

/**
 * @brief Local device settings, stored as a JSON object
 *
 * @code
 * {
 *   "device_id": "4c2a6d0e_...",
 *   "device_name": "workstation",
 *   "device_type": "desktop",
 *   "discoverable": true,
 *   "cert_dir": "/home/me/.config/lanconnect/certs",
 *   "log_file": ""
 * }
 * @endcode
 *
 * Unknown keys are ignored; missing keys keep their defaults.
 */
struct AppConfig {
    std::string deviceId;
    std::string deviceName;
    std::string deviceType;
    bool discoverable = true;
    std::string certDir;
    std::string logFile;

    /**
     * @brief Defaults: hostname as name, DEFAULT_DEVICE_TYPE, certs next to configPath
     */
    static AppConfig defaults(const std::string& configPath);

    /**
     * @brief Load configPath, creating and saving it on first run
     * @param configPath Path of the JSON file
     * @param config Output configuration
     * @param errorMsg Output error message
     * @return false if the file exists but is unreadable or invalid, or if
     *         a freshly generated deviceId could not be saved
     *
     * A missing device_id is generated and written back so the device keeps
     * its identity across restarts.
     */
    static bool loadOrCreate(const std::string& configPath,
                             AppConfig& config,
                             std::string& errorMsg);

    /**
     * @brief Write the configuration atomically
     */
    bool save(const std::string& configPath, std::string& errorMsg) const;

    nlohmann::json toJson() const;

    /**
     * @brief Apply the keys present in j on top of the current values
     * @return false if a present key has the wrong type
     */
    bool applyJson(const nlohmann::json& j, std::string& errorMsg);

    /**
     * @brief Default configuration file ($XDG_CONFIG_HOME/lanconnect/config.json)
     */
    static std::string defaultConfigPath();
};

} // namespace LanConnect
