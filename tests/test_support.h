/**
 * @file test_support.h
 * @brief Shared fixtures for tests that need certificates and loopback channels
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "lanconnect/CertificateManager.h"
#include "lanconnect/Channel.h"
#include "lanconnect/LocalIdentity.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/UuidGenerator.h"
#include "lanconnect/config.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace LanConnect {
namespace TestSupport {

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        m_path = std::filesystem::temp_directory_path() /
                 (prefix + "_" + UuidGenerator::generateDeviceId());
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * @brief Local identity with a freshly generated certificate in certDir
 */
inline LocalIdentity makeLocalIdentity(const std::string& deviceId,
                                       const std::filesystem::path& certDir,
                                       uint16_t tcpPort = 0) {
    LocalIdentity identity;
    identity.deviceId = deviceId;
    identity.deviceName = deviceId + " name";
    identity.deviceType = DEFAULT_DEVICE_TYPE;
    identity.tcpPort = tcpPort;

    std::string errorMsg;
    CertificateManager::ensureCertificateExists(certDir.string(), deviceId,
                                                identity.credentials, errorMsg);
    return identity;
}

/**
 * @brief Poll pred every 10 ms until it holds or timeoutMs elapses
 */
inline bool waitUntil(const std::function<bool()>& pred, uint32_t timeoutMs = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

/**
 * @brief Two ends of one established loopback channel
 */
struct ChannelPair {
    std::shared_ptr<Channel> client;   ///< Opened by clientIdentity
    std::shared_ptr<Channel> server;   ///< Accepted by serverIdentity
    uint16_t port = 0;
};

/**
 * @brief Listen on the first free port in [minPort, maxPort] and connect to it
 * @return true if both handshakes succeeded
 */
inline bool connectChannelPair(const LocalIdentity& clientIdentity,
                               const LocalIdentity& serverIdentity,
                               uint16_t minPort, uint16_t maxPort,
                               ChannelPair& pair, std::string& errorMsg) {
    int listenSocket = bindTcpListenerInRange(minPort, maxPort, pair.port, errorMsg);
    if (listenSocket == INVALID_SOCKET_FD) {
        return false;
    }

    pair.client = std::make_shared<Channel>(clientIdentity, ChannelRole::CLIENT);
    pair.server = std::make_shared<Channel>(serverIdentity, ChannelRole::SERVER);

    bool serverOk = false;
    std::string serverError;
    std::shared_ptr<Channel> server = pair.server;
    std::thread acceptor([&serverOk, &serverError, server, listenSocket]() {
        int clientSocket = INVALID_SOCKET_FD;
        std::string peerHost;
        if (acceptWithTimeout(listenSocket, 5000, clientSocket, peerHost, serverError)) {
            serverOk = server->accept(clientSocket, peerHost, serverError);
        }
    });

    bool clientOk = pair.client->open(LOCALHOST_IP, pair.port, errorMsg);
    acceptor.join();
    closeSocket(listenSocket);

    if (clientOk && !serverOk) {
        errorMsg = serverError;
    }
    return clientOk && serverOk;
}

}  // namespace TestSupport
}  // namespace LanConnect
