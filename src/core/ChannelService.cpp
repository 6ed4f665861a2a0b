/**
 * @file ChannelService.cpp
 * @brief UDP discovery, TCP listener and admission of control channels
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/ChannelService.h"
#include "lanconnect/Debug.h"
#include "lanconnect/ErrorCodes.h"
#include "lanconnect/IpValidator.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/ThreadSafeLog.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace LanConnect {

//=============================================================================
// Constructor / Destructor
//=============================================================================

ChannelService::ChannelService(DeviceRegistry& registry,
                               const LocalIdentity& local,
                               const ChannelServiceOptions& options)
    : m_registry(registry)
    , m_options(options)
    , m_local(local)
    , m_running(false)
    , m_stopRequested(false)
    , m_listenSocket(INVALID_SOCKET_FD)
    , m_udpSocket(INVALID_SOCKET_FD)
    , m_tcpPort(0)
    , m_nextWorkerId(1)
    , m_activeWorkers(0)
{
}

ChannelService::~ChannelService() {
    stop();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool ChannelService::start() {
    if (m_running.load()) {
        return false;
    }

    m_stopRequested = false;

    std::string tcpError;
    uint16_t boundPort = 0;
    int listenSocket = bindTcpListenerInRange(m_options.tcpMinPort, m_options.tcpMaxPort,
                                              boundPort, tcpError);

    std::string udpError;
    bool udpBound = bindUdpSocket(udpError);

    if (listenSocket == INVALID_SOCKET_FD && !udpBound) {
        LOG_ERROR("[ChannelService] " << ErrorCodes::BIND_EXHAUSTED
                  << " No transport available. TCP: " << tcpError << "; UDP: " << udpError);
        ThreadSafeLog::log("[ChannelService] start failed: no transport");
        return false;
    }

    if (listenSocket == INVALID_SOCKET_FD) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::BIND_EXHAUSTED
                    << " TCP listener unavailable, inbound channels disabled: " << tcpError);
    }
    if (!udpBound) {
        LOG_WARNING("[ChannelService] UDP socket unavailable, discovery disabled: " << udpError);
    }

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_listenSocket = listenSocket;
        m_tcpPort = (listenSocket != INVALID_SOCKET_FD) ? boundPort : 0;
    }
    {
        std::lock_guard<std::mutex> lock(m_localMutex);
        m_local.tcpPort = m_tcpPort;
    }

    m_running = true;

    if (listenSocket != INVALID_SOCKET_FD) {
        m_acceptThread = std::thread(&ChannelService::acceptThreadFunc, this);
    }
    if (udpBound) {
        m_udpThread = std::thread(&ChannelService::udpThreadFunc, this);
    }

    if (m_options.monitorNetwork) {
        m_monitor.start([this]() {
            LOG_INFO("[ChannelService] Network changed, announcing identity");
            broadcast();
        });
    }

    LOG_INFO("[ChannelService] Started (TCP " << m_tcpPort << ", UDP "
             << (udpBound ? std::to_string(m_options.udpPort) : std::string("off")) << ")");
    ThreadSafeLog::log("[ChannelService] started, TCP port " + std::to_string(m_tcpPort));

    if (udpBound) {
        broadcast();
    }

    return true;
}

void ChannelService::stop() {
    m_stopRequested = true;

    if (m_running.load()) {
        ThreadSafeLog::log("=== ChannelService::stop START ===");

        m_monitor.stop();

        // Both loops poll with POLL_INTERVAL_MS, so the joins are prompt
        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }
        if (m_udpThread.joinable()) {
            m_udpThread.join();
        }

        std::lock_guard<std::mutex> lock(m_socketMutex);
        closeSocket(m_listenSocket);
        closeSocket(m_udpSocket);
        m_tcpPort = 0;
    }

    // Abort in-flight handshakes, then wait for their workers
    std::unordered_map<uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_workerMutex);
        for (auto& entry : m_inflight) {
            entry.second->close();
        }
        workers.swap(m_workers);
        m_finishedWorkers.clear();
    }

    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    if (m_running.exchange(false)) {
        ThreadSafeLog::log("=== ChannelService::stop END ===");
    }
}

uint16_t ChannelService::tcpPort() const {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    return m_tcpPort;
}

bool ChannelService::hasTcpListener() const {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    return m_listenSocket != INVALID_SOCKET_FD;
}

bool ChannelService::hasUdpSocket() const {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    return m_udpSocket != INVALID_SOCKET_FD;
}

LocalIdentity ChannelService::localIdentity() const {
    std::lock_guard<std::mutex> lock(m_localMutex);
    return m_local;
}

//=============================================================================
// Discovery
//=============================================================================

bool ChannelService::broadcast() {
    std::string errorMsg;
    if (!sendIdentityTo(m_options.broadcastAddress, m_options.broadcastPort, errorMsg)) {
        LOG_WARNING("[ChannelService] Broadcast failed: " << errorMsg);
        return false;
    }
    return true;
}

bool ChannelService::broadcast(const std::string& address) {
    if (!isValidAddress(address)) {
        LOG_WARNING("[ChannelService] Refusing to announce to invalid address '" << address << "'");
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(address.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        LOG_WARNING("[ChannelService] Cannot resolve '" << address << "': " << gai_strerror(rc));
        return false;
    }
    const std::string host = addressToString(result->ai_addr);
    freeaddrinfo(result);

    // Recorded before sending: the reply may arrive before sendto returns
    {
        std::lock_guard<std::mutex> lock(m_allowedMutex);
        m_allowed.insert(host);
    }
    LOG_INFO("[ChannelService] Allowing " << host << " (" << address << ")");

    std::string errorMsg;
    if (!sendIdentityTo(host, m_options.broadcastPort, errorMsg)) {
        LOG_WARNING("[ChannelService] Announcing to " << host << " failed: " << errorMsg);
        return false;
    }
    return true;
}

bool ChannelService::isAllowedHost(const std::string& host) const {
    std::lock_guard<std::mutex> lock(m_allowedMutex);
    return m_allowed.count(host) != 0;
}

bool ChannelService::sendIdentityTo(const std::string& host, uint16_t port, std::string& errorMsg) {
    const std::string data = localIdentity().toPacket().serialize();

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &target.sin_addr) != 1) {
        errorMsg = "Not an IPv4 address: " + host;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_udpSocket == INVALID_SOCKET_FD) {
        errorMsg = "No UDP socket";
        return false;
    }

    ssize_t sent = sendto(m_udpSocket, data.data(), data.size(), MSG_NOSIGNAL,
                          reinterpret_cast<const sockaddr*>(&target), sizeof(target));
    if (sent < 0 || static_cast<size_t>(sent) != data.size()) {
        errorMsg = std::string("sendto failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool ChannelService::bindUdpSocket(std::string& errorMsg) {
    int sock = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        errorMsg = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }

    // No SO_REUSEADDR: the discovery port belongs to one process, and a
    // second instance must see the bind fail
    int enable = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
        errorMsg = std::string("setsockopt failed: ") + std::strerror(errno);
        closeSocket(sock);
        return false;
    }

    int recvBuf = UDP_RECV_BUF_SIZE;
    setsockopt(sock, SOL_SOCKET, SO_RCVBUF, &recvBuf, sizeof(recvBuf));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(m_options.udpPort);

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        errorMsg = "bind to UDP port " + std::to_string(m_options.udpPort) + " failed: " +
                   std::strerror(errno);
        closeSocket(sock);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_socketMutex);
    m_udpSocket = sock;
    return true;
}

//=============================================================================
// Thread Functions
//=============================================================================

void ChannelService::udpThreadFunc() {
    std::vector<char> buffer(MAX_PACKET_SIZE + 1);

    while (!m_stopRequested.load()) {
        int ready = waitReadable(m_udpSocket, POLL_INTERVAL_MS);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            LOG_ERROR("[ChannelService] UDP poll failed, discovery stopped");
            break;
        }

        sockaddr_storage sender{};
        socklen_t senderLen = sizeof(sender);
        ssize_t received = recvfrom(m_udpSocket, buffer.data(), buffer.size(), 0,
                                    reinterpret_cast<sockaddr*>(&sender), &senderLen);
        if (received <= 0) {
            continue;
        }

        try {
            handleDatagram(std::string(buffer.data(), static_cast<size_t>(received)),
                           addressToString(reinterpret_cast<const sockaddr*>(&sender)));
        } catch (const std::exception& e) {
            LOG_ERROR("[ChannelService] Datagram handling failed: " << e.what());
        }
    }
}

void ChannelService::acceptThreadFunc() {
    while (!m_stopRequested.load()) {
        int clientSocket = INVALID_SOCKET_FD;
        std::string peerHost;
        std::string errorMsg;

        int ready = waitReadable(m_listenSocket, POLL_INTERVAL_MS);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            LOG_ERROR("[ChannelService] TCP poll failed, inbound channels stopped");
            break;
        }

        if (!acceptWithTimeout(m_listenSocket, 0, clientSocket, peerHost, errorMsg)) {
            LOG_WARNING("[ChannelService] accept failed: " << errorMsg);
            continue;
        }

        handleIncomingConnection(clientSocket, peerHost);
    }
}

//=============================================================================
// Channel Production
//=============================================================================

void ChannelService::handleIncomingConnection(int socket, const std::string& peerHost) {
    auto channel = std::make_shared<Channel>(localIdentity(), ChannelRole::SERVER);

    if (!launchWorker(channel, [this, channel, socket, peerHost]() {
            runInbound(channel, socket, peerHost);
        })) {
        LOG_WARNING("[ChannelService] Dropping connection from " << peerHost
                    << ": too many handshakes in progress");
        int fd = socket;
        closeSocket(fd);
    }
}

void ChannelService::runInbound(std::shared_ptr<Channel> channel, int socket,
                                const std::string& peerHost) {
    std::string errorMsg;
    if (!channel->accept(socket, peerHost, errorMsg)) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::HANDSHAKE_FAILURE
                    << " Inbound channel from " << peerHost << ": " << errorMsg);
        ThreadSafeLog::log("[ChannelService] inbound handshake failed: " + peerHost);
        return;
    }

    const Packet identity = channel->identity();
    const std::string deviceId = identity.deviceId();

    if (deviceId.empty()) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::MALFORMED_PACKET
                    << " Identity from " << peerHost << " without deviceId");
        channel->close();
        return;
    }

    if (deviceId == localIdentity().deviceId) {
        LOG_DEBUG("[ChannelService] Ignoring connection from ourselves");
        channel->close();
        return;
    }

    std::shared_ptr<Device> device;
    {
        std::lock_guard<std::mutex> lock(m_admissionMutex);
        device = m_registry.getDevice(deviceId);

        AdmissionRequest request;
        request.deviceKnown = (device != nullptr);
        request.hostAllowed = isAllowedHost(peerHost);
        request.discoverable = m_registry.isDiscoverable();

        const AdmissionOutcome outcome = decideAdmission(request);
        if (!isAdmitted(outcome)) {
            LOG_WARNING("[ChannelService] " << ErrorCodes::UNAUTHORIZED << " Device "
                        << identity.bodyString("deviceName", deviceId) << " at " << peerHost
                        << " not allowed");
            ThreadSafeLog::log("[ChannelService] rejected inbound " + deviceId);
            channel->close();
            return;
        }

        if (!device) {
            device = m_registry.ensureDevice(identity);
        }
    }

    if (!device || !m_registry.onChannelEstablished(device, channel)) {
        channel->close();
    }
}

void ChannelService::handleDatagram(const std::string& data, const std::string& senderHost) {
    Packet packet;
    std::string errorMsg;
    if (!Packet::parse(data, packet, errorMsg)) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::MALFORMED_PACKET
                    << " Datagram from " << senderHost << ": " << errorMsg);
        return;
    }

    const std::string deviceId = packet.deviceId();
    if (deviceId.empty()) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::MALFORMED_PACKET
                    << " Identity from " << senderHost << " without deviceId ("
                    << packet.bodyString("deviceName", "unnamed") << ")");
        return;
    }

    // Our own broadcast looping back
    if (deviceId == localIdentity().deviceId) {
        return;
    }

    packet.body()["tcpHost"] = senderHost;

    std::shared_ptr<Device> device;
    {
        std::lock_guard<std::mutex> lock(m_admissionMutex);
        device = m_registry.getDevice(deviceId);

        AdmissionRequest request;
        request.deviceKnown = (device != nullptr);
        request.hostAllowed = isAllowedHost(senderHost);
        request.discoverable = m_registry.isDiscoverable();

        const AdmissionOutcome outcome = decideAdmission(request);
        if (!isAdmitted(outcome)) {
            LOG_WARNING("[ChannelService] " << ErrorCodes::UNAUTHORIZED << " Device "
                        << packet.bodyString("deviceName", deviceId) << " at " << senderHost
                        << " not allowed");
            return;
        }

        if (!device) {
            device = m_registry.ensureDevice(packet);
            if (!device) {
                return;
            }
        }

        device->handleIdentity(packet);

        if (!device->tryReserveChannel()) {
            return;
        }
    }

    int64_t port = packet.bodyInt("tcpPort", DEFAULT_TCP_PORT);
    if (port <= 0 || port > 65535) {
        port = DEFAULT_TCP_PORT;
    }

    const std::string host = packet.bodyString("tcpHost");
    if (!isValidAddress(host)) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::MALFORMED_PACKET
                    << " Invalid tcpHost '" << host << "' for " << deviceId);
        device->clearPendingChannel();
        return;
    }

    auto channel = std::make_shared<Channel>(localIdentity(), ChannelRole::CLIENT);
    channel->setExpectedIdentity(packet);

    const uint16_t tcpPort = static_cast<uint16_t>(port);
    if (!launchWorker(channel, [this, channel, device, host, tcpPort]() {
            runOutbound(channel, device, host, tcpPort);
        })) {
        LOG_WARNING("[ChannelService] Not connecting to " << deviceId
                    << ": too many handshakes in progress");
        device->clearPendingChannel();
    }
}

void ChannelService::runOutbound(std::shared_ptr<Channel> channel, std::shared_ptr<Device> device,
                                 const std::string& host, uint16_t port) {
    ConnectFunction connect;
    {
        std::lock_guard<std::mutex> lock(m_connectMutex);
        connect = m_connect;
    }

    std::string errorMsg;
    bool connected = connect ? connect(*channel, host, port, errorMsg)
                             : channel->open(host, port, errorMsg);

    if (!connected) {
        LOG_WARNING("[ChannelService] " << ErrorCodes::HANDSHAKE_FAILURE << " Connecting to "
                    << device->id() << " at " << host << ":" << port << ": " << errorMsg);
        ThreadSafeLog::log("[ChannelService] outbound handshake failed: " + host);
        channel->close();
        device->clearPendingChannel();
        return;
    }

    if (!m_registry.onChannelEstablished(device, channel)) {
        channel->close();
        device->clearPendingChannel();
    }
}

//=============================================================================
// Worker Management
//=============================================================================

bool ChannelService::launchWorker(const std::shared_ptr<Channel>& channel, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_workerMutex);
    reapFinishedWorkers();

    if (m_stopRequested.load() || m_activeWorkers >= MAX_CONCURRENT_HANDSHAKES) {
        return false;
    }

    const uint64_t workerId = m_nextWorkerId++;
    m_inflight.emplace(workerId, channel);
    ++m_activeWorkers;

    m_workers.emplace(workerId, std::thread([this, workerId, task]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[ChannelService] Handshake worker failed: " << e.what());
        }

        std::lock_guard<std::mutex> workerLock(m_workerMutex);
        m_inflight.erase(workerId);
        m_finishedWorkers.push_back(workerId);
        --m_activeWorkers;
        m_workerCv.notify_all();
    }));
    return true;
}

void ChannelService::reapFinishedWorkers() {
    for (uint64_t workerId : m_finishedWorkers) {
        auto it = m_workers.find(workerId);
        if (it != m_workers.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            m_workers.erase(it);
        }
    }
    m_finishedWorkers.clear();
}

void ChannelService::setConnectFunctionForTesting(ConnectFunction connect) {
    std::lock_guard<std::mutex> lock(m_connectMutex);
    m_connect = std::move(connect);
}

bool ChannelService::waitForIdle(uint32_t timeoutMs) {
    std::unique_lock<std::mutex> lock(m_workerMutex);
    return m_workerCv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                               [this]() { return m_activeWorkers == 0; });
}

} // namespace LanConnect
