/**
 * @file lanconnectd.cpp
 * @brief LanConnect daemon: announce, accept channels, log packets
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 *
 * Usage:
 *   lanconnectd [--config FILE] [--broadcast ADDRESS]... [--discoverable | --hidden]
 *               [--download-dir DIR] [--log FILE]
 */

#include "lanconnect/AppConfig.h"
#include "lanconnect/CertificateManager.h"
#include "lanconnect/ChannelService.h"
#include "lanconnect/Debug.h"
#include "lanconnect/DeviceManager.h"
#include "lanconnect/TaskRunner.h"
#include "lanconnect/ThreadSafeLog.h"
#include "lanconnect/Transfer.h"
#include "lanconnect/config.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace LanConnect;

//=============================================================================
// Signal Handling
//=============================================================================

static std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

//=============================================================================
// Helper Functions
//=============================================================================

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config FILE        Configuration file (default: "
              << AppConfig::defaultConfigPath() << ")\n"
              << "  --broadcast ADDRESS  Announce to ADDRESS and allow it to connect (repeatable)\n"
              << "  --discoverable       Accept unknown devices\n"
              << "  --hidden             Only accept known devices and allowed hosts\n"
              << "  --download-dir DIR   Save incoming payloads to DIR\n"
              << "  --log FILE           Trace log file\n"
              << "  --help               Show this help\n";
}

/**
 * @brief Keep only the last path component of a peer-supplied filename
 */
static std::string safeFilename(const std::string& name) {
    std::string base = std::filesystem::path(name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return "payload.bin";
    }
    return base;
}

//=============================================================================
// Main
//=============================================================================

int main(int argc, char* argv[]) {
    std::string configPath = AppConfig::defaultConfigPath();
    std::vector<std::string> broadcastTargets;
    std::string downloadDir;
    std::string logPath;
    int discoverableOverride = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--broadcast" && i + 1 < argc) {
            broadcastTargets.push_back(argv[++i]);
        } else if (arg == "--discoverable") {
            discoverableOverride = 1;
        } else if (arg == "--hidden") {
            discoverableOverride = 0;
        } else if (arg == "--download-dir" && i + 1 < argc) {
            downloadDir = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            logPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Configuration
    AppConfig config;
    std::string errorMsg;
    if (!AppConfig::loadOrCreate(configPath, config, errorMsg)) {
        LOG_ERROR("Failed to load configuration: " << errorMsg);
        return 1;
    }
    if (discoverableOverride >= 0) {
        config.discoverable = (discoverableOverride == 1);
    }
    if (logPath.empty()) {
        logPath = config.logFile;
    }
    if (!logPath.empty()) {
        ThreadSafeLog::initialize(logPath);
    }

    // Certificate (CN = deviceId)
    LocalIdentity local;
    local.deviceId = config.deviceId;
    local.deviceName = config.deviceName;
    local.deviceType = config.deviceType;
    if (!CertificateManager::ensureCertificateExists(config.certDir, config.deviceId,
                                                     local.credentials, errorMsg)) {
        LOG_ERROR("Certificate setup failed: " << errorMsg);
        ThreadSafeLog::shutdown();
        return 1;
    }

    LOG_INFO("Device " << local.deviceName << " (" << local.deviceId << "), "
             << (config.discoverable ? "discoverable" : "hidden"));

    // Services
    TaskRunner downloads("Download");
    DeviceManager devices(config.discoverable);

    devices.setPacketHandler([&](Device& device, const Packet& packet) {
        LOG_INFO("[" << device.name() << "] " << packet.type() << " " << packet.body().dump());

        const uint16_t port = packet.payloadTransferPort();
        if (port == 0 || downloadDir.empty()) {
            return;
        }

        std::shared_ptr<Device> sender = devices.getDevice(device.id());
        if (!sender) {
            return;
        }

        const std::filesystem::path target =
            std::filesystem::path(downloadDir) / safeFilename(packet.bodyString("filename", "payload.bin"));
        const int64_t size = packet.payloadSize();
        const std::string checksum = packet.payloadHash();

        downloads.launch([sender, local, target, size, checksum, port]() {
            auto sink = std::make_unique<std::ofstream>(target, std::ios::binary | std::ios::trunc);
            if (!*sink) {
                LOG_ERROR("Cannot create " << target.string());
                return;
            }

            Transfer transfer(sender, local, size, checksum, std::move(sink));
            if (transfer.download(port)) {
                LOG_INFO("Saved " << target.string());
            } else {
                std::error_code ec;
                std::filesystem::remove(target, ec);
            }
        });
    });

    ChannelService service(devices, local);
    if (!service.start()) {
        LOG_ERROR("Failed to start: no UDP or TCP transport could be bound");
        ThreadSafeLog::shutdown();
        return 1;
    }

    for (const auto& target : broadcastTargets) {
        service.broadcast(target);
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    LOG_INFO("Shutting down...");
    service.stop();
    for (auto& device : devices.devices()) {
        device->disconnect();
    }
    downloads.joinAll();
    ThreadSafeLog::shutdown();
    return 0;
}
