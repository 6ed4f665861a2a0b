/**
 * @file AppConfig.cpp
 * @brief Persistent JSON configuration of the local device
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/AppConfig.h"
#include "lanconnect/AtomicFile.h"
#include "lanconnect/Debug.h"
#include "lanconnect/UuidGenerator.h"
#include "lanconnect/config.h"
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace LanConnect {

using json = nlohmann::json;

namespace {

std::string localHostname() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return hostname;
    }
    return "LanConnect";
}

bool readString(const json& j, const char* key, std::string& out, std::string& errorMsg) {
    auto it = j.find(key);
    if (it == j.end()) {
        return true;
    }
    if (!it->is_string()) {
        errorMsg = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // anonymous namespace

std::string AppConfig::defaultConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0] != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return (base / "lanconnect" / "config.json").string();
}

AppConfig AppConfig::defaults(const std::string& configPath) {
    AppConfig config;
    config.deviceName = localHostname();
    config.deviceType = DEFAULT_DEVICE_TYPE;
    config.discoverable = true;

    std::filesystem::path parent = std::filesystem::path(configPath).parent_path();
    config.certDir = (parent.empty() ? std::filesystem::path("certs") : parent / "certs").string();
    return config;
}

json AppConfig::toJson() const {
    json j;
    j["device_id"] = deviceId;
    j["device_name"] = deviceName;
    j["device_type"] = deviceType;
    j["discoverable"] = discoverable;
    j["cert_dir"] = certDir;
    j["log_file"] = logFile;
    return j;
}

bool AppConfig::applyJson(const json& j, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "Configuration root must be an object";
        return false;
    }

    if (!readString(j, "device_id", deviceId, errorMsg) ||
        !readString(j, "device_name", deviceName, errorMsg) ||
        !readString(j, "device_type", deviceType, errorMsg) ||
        !readString(j, "cert_dir", certDir, errorMsg) ||
        !readString(j, "log_file", logFile, errorMsg)) {
        return false;
    }

    auto it = j.find("discoverable");
    if (it != j.end()) {
        if (!it->is_boolean()) {
            errorMsg = "'discoverable' must be a boolean";
            return false;
        }
        discoverable = it->get<bool>();
    }

    return true;
}

bool AppConfig::loadOrCreate(const std::string& configPath,
                             AppConfig& config,
                             std::string& errorMsg) {
    AppConfig loaded = defaults(configPath);
    bool dirty = false;

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        std::ifstream in(configPath);
        if (!in) {
            errorMsg = "Cannot open configuration file: " + configPath;
            return false;
        }

        std::stringstream buffer;
        buffer << in.rdbuf();

        try {
            json j = json::parse(buffer.str());
            if (!loaded.applyJson(j, errorMsg)) {
                errorMsg = configPath + ": " + errorMsg;
                return false;
            }
        } catch (const json::parse_error& e) {
            errorMsg = configPath + ": " + e.what();
            return false;
        }
    } else {
        dirty = true;
    }

    if (loaded.deviceId.empty()) {
        loaded.deviceId = UuidGenerator::generateDeviceId();
        if (loaded.deviceId.empty()) {
            errorMsg = "Failed to generate a device id";
            return false;
        }
        LOG_INFO("[Config] Generated device id " << loaded.deviceId);
        dirty = true;
    }

    if (loaded.deviceType.empty()) {
        loaded.deviceType = DEFAULT_DEVICE_TYPE;
    }

    if (dirty && !loaded.save(configPath, errorMsg)) {
        return false;
    }

    config = loaded;
    return true;
}

bool AppConfig::save(const std::string& configPath, std::string& errorMsg) const {
    return writeFileAtomically(configPath, toJson().dump(4) + "\n", errorMsg);
}

} // namespace LanConnect
