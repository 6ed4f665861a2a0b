/**
 * @file ChannelService.h
 * @brief UDP discovery, TCP listener and admission of control channels
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "AdmissionPolicy.h"
#include "Channel.h"
#include "DeviceManager.h"
#include "LocalIdentity.h"
#include "NetworkMonitor.h"
#include "config.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace LanConnect {

/**
 * @brief Ports and addresses used by ChannelService
 *
 * The defaults are the protocol's well-known values; tests substitute
 * unprivileged ranges.
 */
struct ChannelServiceOptions {
    uint16_t udpPort = UDP_PORT;                        ///< Discovery receive port
    uint16_t tcpMinPort = TCP_MIN_PORT;                 ///< First control port probed
    uint16_t tcpMaxPort = TCP_MAX_PORT;                 ///< Last control port probed
    std::string broadcastAddress = BROADCAST_ADDRESS;   ///< Target of broadcast()
    uint16_t broadcastPort = UDP_PORT;                  ///< Port announcements are sent to
    bool monitorNetwork = true;                         ///< Rebroadcast on interface changes
};

//=============================================================================
// ChannelService Class
//=============================================================================

/**
 * @class ChannelService
 * @brief Produces authenticated control channels and hands them to the registry
 *
 * Two ways a channel comes to exist:
 *
 * 1. Inbound: a peer connects to our TCP listener. The channel runs the
 *    server handshake; the peer is admitted by its socket address.
 * 2. Discovery: a peer's identity arrives over UDP. If it is admitted by the
 *    datagram source address we connect to the tcpHost/tcpPort it declared
 *    and run the client handshake.
 *
 * Admission (first match wins): known device, host in the allowed set,
 * discoverable registry, otherwise reject. The allowed set is filled by
 * broadcast(address) and lives as long as the service.
 *
 * Threads:
 * - UDP receive thread (polls, so stop() is prompt)
 * - TCP accept thread (polls)
 * - one worker per handshake, at most MAX_CONCURRENT_HANDSHAKES, all joined
 *   by stop()
 * - the NetworkMonitor thread
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class ChannelService {
public:
    /**
     * @brief Outbound connect step used on the discovery path
     *
     * The default runs channel.open(host, port, errorMsg).
     */
    using ConnectFunction = std::function<bool(Channel& channel,
                                               const std::string& host,
                                               uint16_t port,
                                               std::string& errorMsg)>;

    /**
     * @brief Constructor
     * @param registry Device registry (must outlive the service)
     * @param local Local identity; tcpPort is filled in by start()
     * @param options Ports and broadcast target
     */
    ChannelService(DeviceRegistry& registry,
                   const LocalIdentity& local,
                   const ChannelServiceOptions& options = ChannelServiceOptions());

    /**
     * @brief Destructor - calls stop()
     */
    ~ChannelService();

    ChannelService(const ChannelService&) = delete;
    ChannelService& operator=(const ChannelService&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Bind both transports and start the service threads
     * @return false only if neither the TCP listener nor the UDP socket could
     *         be bound, or if already running
     *
     * Losing one transport is logged as a warning and leaves the other
     * running. Sends one identity broadcast when UDP is up.
     */
    bool start();

    /**
     * @brief Stop accepting and receiving, close both sockets, abort
     *        in-flight handshakes and join every thread
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /// Bound control port, 0 if no listener
    uint16_t tcpPort() const;

    bool hasTcpListener() const;
    bool hasUdpSocket() const;

    /// Copy of the local identity (tcpPort set once started)
    LocalIdentity localIdentity() const;

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Send our identity to the default broadcast target
     * @return false (logged) without a UDP socket or if the send failed
     *
     * Never grants trust.
     */
    bool broadcast();

    /**
     * @brief Send our identity to one address and allow it to connect
     * @param address IPv4 literal or hostname
     * @return false (logged) on an invalid address, no UDP socket or failed send
     *
     * The resolved address is added to the allowed set before sending, so a
     * reply from it is admitted even when we are not discoverable.
     */
    bool broadcast(const std::string& address);

    /// True if host was targeted by broadcast(address)
    bool isAllowedHost(const std::string& host) const;

    //=========================================================================
    // Channel Production
    //=========================================================================

    /**
     * @brief Take an accepted socket through the server handshake and admission
     * @param socket Accepted socket (always consumed)
     * @param peerHost Socket peer address
     *
     * Runs on a worker thread; returns immediately.
     */
    void handleIncomingConnection(int socket, const std::string& peerHost);

    /**
     * @brief Process one discovery datagram
     * @param data Datagram contents
     * @param senderHost Datagram source address
     *
     * Admitted peers without a channel get an outbound connect on a worker
     * thread; peers with one only have their identity refreshed.
     */
    void handleDatagram(const std::string& data, const std::string& senderHost);

    //=========================================================================
    // Testing Support
    //=========================================================================

    void setConnectFunctionForTesting(ConnectFunction connect);

    /**
     * @brief Block until no handshake worker is running
     * @return false on timeout
     */
    bool waitForIdle(uint32_t timeoutMs);

private:
    bool bindUdpSocket(std::string& errorMsg);
    bool sendIdentityTo(const std::string& host, uint16_t port, std::string& errorMsg);

    void udpThreadFunc();
    void acceptThreadFunc();

    /**
     * @brief Run task on a tracked worker thread
     * @return false if stopping or at the handshake limit
     */
    bool launchWorker(const std::shared_ptr<Channel>& channel, std::function<void()> task);
    void reapFinishedWorkers();

    void runInbound(std::shared_ptr<Channel> channel, int socket, const std::string& peerHost);
    void runOutbound(std::shared_ptr<Channel> channel, std::shared_ptr<Device> device,
                     const std::string& host, uint16_t port);

    DeviceRegistry& m_registry;
    ChannelServiceOptions m_options;

    mutable std::mutex m_localMutex;
    LocalIdentity m_local;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;

    mutable std::mutex m_socketMutex;
    int m_listenSocket;
    int m_udpSocket;
    uint16_t m_tcpPort;

    std::thread m_udpThread;
    std::thread m_acceptThread;
    NetworkMonitor m_monitor;

    // Held across lookup -> ensure -> reserve
    std::mutex m_admissionMutex;

    mutable std::mutex m_allowedMutex;
    std::set<std::string> m_allowed;

    std::mutex m_connectMutex;
    ConnectFunction m_connect;

    std::mutex m_workerMutex;
    std::condition_variable m_workerCv;
    uint64_t m_nextWorkerId;
    size_t m_activeWorkers;
    std::unordered_map<uint64_t, std::thread> m_workers;
    std::unordered_map<uint64_t, std::shared_ptr<Channel>> m_inflight;
    std::vector<uint64_t> m_finishedWorkers;
};

} // namespace LanConnect
