/**
 * @file Channel.h
 * @brief One TCP connection from connect/accept through TLS to attachment
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "LocalIdentity.h"
#include "Packet.h"
#include "TlsSocket.h"
#include "TransportStream.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace LanConnect {

/**
 * @brief Which end of the TCP connection this channel is
 *
 * CLIENT opened the connection (and runs TLS as client), SERVER accepted it.
 */
enum class ChannelRole {
    CLIENT,
    SERVER
};

/**
 * @brief Channel lifecycle
 *
 * UNCONNECTED -> CONNECTING / ACCEPTING -> IDENTIFIED -> ENCRYPTED -> ATTACHED -> CLOSED.
 * Any failure jumps straight to CLOSED; a closed channel never reopens.
 */
enum class ChannelState {
    UNCONNECTED,
    CONNECTING,
    ACCEPTING,
    IDENTIFIED,
    ENCRYPTED,
    ATTACHED,
    CLOSED
};

const char* channelStateName(ChannelState state);

//=============================================================================
// Channel Class
//=============================================================================

/**
 * @class Channel
 * @brief Identity exchange, TLS handshake and packet I/O over one socket
 *
 * Handshake, client role (open):
 * 1. connect to host:port (bounded by CONNECT_TIMEOUT_MS)
 * 2. send our identity line, read the remote identity line (plain TCP)
 * 3. TLS handshake as client
 *
 * Handshake, server role (accept):
 * 1. take ownership of the accepted socket
 * 2. read the remote identity line, send ours (plain TCP)
 * 3. TLS handshake as server
 *
 * Steps 2-3 are bounded by HANDSHAKE_TIMEOUT_MS. After the exchange,
 * identity().body() carries the resolved tcpHost/tcpPort of the remote.
 *
 * Thread Safety:
 * - open()/accept() run on one thread, before the channel is shared
 * - sendPacket() and readPacket() may be used from different threads
 * - close() may be called from any thread and unblocks pending reads
 */
class Channel {
public:
    Channel(const LocalIdentity& local, ChannelRole role);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    //=========================================================================
    // Establishment
    //=========================================================================

    /**
     * @brief Record the identity announced over UDP before connecting
     *
     * open() then refuses a peer whose identity carries another deviceId.
     */
    void setExpectedIdentity(const Packet& identity);

    /**
     * @brief Connect and run the client handshake
     * @param host Remote control host
     * @param port Remote control port
     * @param errorMsg Output error message
     * @return true once the channel is ENCRYPTED
     */
    bool open(const std::string& host, uint16_t port, std::string& errorMsg);

    /**
     * @brief Run the server handshake on an accepted socket
     * @param socket Accepted socket (ownership transfers to the channel)
     * @param peerHost Socket peer address
     * @param errorMsg Output error message
     * @return true once the channel is ENCRYPTED
     */
    bool accept(int socket, const std::string& peerHost, std::string& errorMsg);

    /**
     * @brief Bind the channel to a device
     * @param deviceId Device taking ownership
     * @param errorMsg Output error message
     * @return false if not ENCRYPTED, already attached to another device,
     *         or deviceId differs from the remote identity
     */
    bool attach(const std::string& deviceId, std::string& errorMsg);

    //=========================================================================
    // Packet I/O
    //=========================================================================

    /**
     * @brief Serialize and send one packet over TLS
     */
    bool sendPacket(const Packet& packet, std::string& errorMsg);

    /**
     * @brief Block until one packet arrives
     * @param packet Output packet
     * @param errorMsg Output error message (empty when the peer closed cleanly)
     * @return false when the channel closed or failed
     *
     * Malformed lines are logged and skipped.
     */
    bool readPacket(Packet& packet, std::string& errorMsg);

    /**
     * @brief Authenticated byte stream (null before ENCRYPTED)
     */
    TransportStream* stream();

    /**
     * @brief Apply SO_RCVTIMEO/SO_SNDTIMEO to the established connection
     */
    bool setIoTimeout(uint32_t timeoutMs);

    /**
     * @brief Shut the connection down (thread-safe, idempotent)
     *
     * Blocked reads and handshakes on this channel fail promptly.
     */
    void close();

    //=========================================================================
    // State
    //=========================================================================

    ChannelState state() const { return m_state.load(); }
    ChannelRole role() const { return m_role; }
    bool isClosed() const { return m_state.load() == ChannelState::CLOSED; }

    /// Remote identity (valid from IDENTIFIED on)
    const Packet& identity() const { return m_identity; }

    /// body.deviceId of the remote identity
    std::string remoteDeviceId() const { return m_identity.deviceId(); }

    /// Address the channel is connected to
    const std::string& peerHost() const { return m_peerHost; }

    /// SHA-256 fingerprint of the peer certificate (valid from ENCRYPTED on)
    const std::string& peerCertificateFingerprint() const { return m_peerFingerprint; }

    /// Device this channel is attached to, empty before attach()
    std::string attachedDeviceId() const;

private:
    bool exchangeIdentity(std::string& errorMsg);
    bool readIdentity(std::string& errorMsg);
    bool writeIdentity(std::string& errorMsg);
    bool encrypt(std::string& errorMsg);
    bool fail(const std::string& reason, std::string& errorMsg);
    bool transition(ChannelState next);

    LocalIdentity m_local;
    ChannelRole m_role;
    std::atomic<ChannelState> m_state;

    int m_socket;
    mutable std::mutex m_socketMutex;       ///< Guards m_socket against close()
    std::atomic<bool> m_closeRequested;

    std::string m_peerHost;
    uint16_t m_peerPort;
    Packet m_identity;
    Packet m_expectedIdentity;
    bool m_hasExpectedIdentity;
    std::string m_peerFingerprint;

    std::unique_ptr<TlsSocket> m_tls;
    std::unique_ptr<TlsTransportStream> m_stream;

    std::mutex m_readMutex;                 ///< Serializes readers
    std::mutex m_sslMutex;                  ///< One SSL_read or SSL_write at a time
    std::string m_readBuffer;

    mutable std::mutex m_attachMutex;
    std::string m_attachedDeviceId;
};

} // namespace LanConnect
