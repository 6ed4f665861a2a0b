/**
 * @file Channel.cpp
 * @brief One TCP connection from connect/accept through TLS to attachment
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Channel.h"
#include "lanconnect/Debug.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/config.h"
#include <sys/socket.h>
#include <unistd.h>

namespace LanConnect {

const char* channelStateName(ChannelState state) {
    switch (state) {
        case ChannelState::UNCONNECTED: return "unconnected";
        case ChannelState::CONNECTING:  return "connecting";
        case ChannelState::ACCEPTING:   return "accepting";
        case ChannelState::IDENTIFIED:  return "identified";
        case ChannelState::ENCRYPTED:   return "encrypted";
        case ChannelState::ATTACHED:    return "attached";
        case ChannelState::CLOSED:      return "closed";
    }
    return "unknown";
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

Channel::Channel(const LocalIdentity& local, ChannelRole role)
    : m_local(local)
    , m_role(role)
    , m_state(ChannelState::UNCONNECTED)
    , m_socket(INVALID_SOCKET_FD)
    , m_closeRequested(false)
    , m_peerPort(0)
    , m_hasExpectedIdentity(false)
{
}

Channel::~Channel() {
    close();

    // TLS objects reference the descriptor, release them first
    m_stream.reset();
    m_tls.reset();

    std::lock_guard<std::mutex> lock(m_socketMutex);
    closeSocket(m_socket);
}

//=============================================================================
// Establishment
//=============================================================================

void Channel::setExpectedIdentity(const Packet& identity) {
    m_expectedIdentity = identity;
    m_hasExpectedIdentity = true;
}

bool Channel::open(const std::string& host, uint16_t port, std::string& errorMsg) {
    if (m_role != ChannelRole::CLIENT || !transition(ChannelState::CONNECTING)) {
        errorMsg = "Channel cannot be opened in state " + std::string(channelStateName(state()));
        return false;
    }

    m_peerHost = host;
    m_peerPort = port;

    std::string connectError;
    int sock = connectWithTimeout(host, port, CONNECT_TIMEOUT_MS, connectError);
    if (sock == INVALID_SOCKET_FD) {
        return fail(connectError, errorMsg);
    }

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_socket = sock;
    }

    if (m_closeRequested.load()) {
        return fail("Channel closed while connecting", errorMsg);
    }

    setSocketTimeouts(m_socket, HANDSHAKE_TIMEOUT_MS);

    if (!exchangeIdentity(errorMsg) || !encrypt(errorMsg)) {
        return false;
    }

    setSocketTimeouts(m_socket, 0);
    return true;
}

bool Channel::accept(int socket, const std::string& peerHost, std::string& errorMsg) {
    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_socket = socket;
    }

    if (m_role != ChannelRole::SERVER || !transition(ChannelState::ACCEPTING)) {
        return fail("Channel cannot accept in state " + std::string(channelStateName(state())),
                    errorMsg);
    }

    m_peerHost = peerHost;

    setSocketTimeouts(m_socket, HANDSHAKE_TIMEOUT_MS);

    if (!exchangeIdentity(errorMsg) || !encrypt(errorMsg)) {
        return false;
    }

    setSocketTimeouts(m_socket, 0);
    return true;
}

bool Channel::exchangeIdentity(std::string& errorMsg) {
    // The opener speaks first
    bool ok = (m_role == ChannelRole::CLIENT)
        ? (writeIdentity(errorMsg) && readIdentity(errorMsg))
        : (readIdentity(errorMsg) && writeIdentity(errorMsg));

    if (!ok) {
        return false;
    }

    if (!transition(ChannelState::IDENTIFIED)) {
        return fail("Channel closed during identity exchange", errorMsg);
    }
    return true;
}

bool Channel::readIdentity(std::string& errorMsg) {
    std::string line;
    std::string readError;
    if (!recvLine(m_socket, MAX_PACKET_SIZE, line, readError)) {
        return fail("Reading identity from " + m_peerHost + " failed: " + readError, errorMsg);
    }

    Packet packet;
    std::string parseError;
    if (!Packet::parse(line, packet, parseError)) {
        return fail("Malformed identity from " + m_peerHost + ": " + parseError, errorMsg);
    }

    if (!packet.isIdentity()) {
        return fail("Expected identity from " + m_peerHost + ", got '" + packet.type() + "'",
                    errorMsg);
    }

    const std::string deviceId = packet.deviceId();
    if (deviceId.empty()) {
        return fail("Identity from " + m_peerHost + " has no deviceId", errorMsg);
    }

    if (deviceId.size() > MAX_DEVICE_ID_LENGTH) {
        return fail("Identity from " + m_peerHost + " has an oversized deviceId", errorMsg);
    }

    if (m_hasExpectedIdentity && deviceId != m_expectedIdentity.deviceId()) {
        return fail("Peer at " + m_peerHost + " identified as " + deviceId +
                    ", expected " + m_expectedIdentity.deviceId(), errorMsg);
    }

    // Record where the remote actually is
    packet.body()["tcpHost"] = m_peerHost;
    if (m_role == ChannelRole::CLIENT) {
        packet.body()["tcpPort"] = m_peerPort;
    } else {
        const int64_t announced = packet.bodyInt("tcpPort", 0);
        if (announced <= 0 || announced > 65535) {
            packet.body()["tcpPort"] = DEFAULT_TCP_PORT;
        }
    }

    m_identity = packet;
    return true;
}

bool Channel::writeIdentity(std::string& errorMsg) {
    const std::string data = m_local.toPacket().serialize();

    PlainSocketStream plain(m_socket);
    std::string sendError;
    if (!plain.sendExact(reinterpret_cast<const uint8_t*>(data.data()), data.size(), sendError)) {
        return fail("Sending identity to " + m_peerHost + " failed: " + sendError, errorMsg);
    }
    return true;
}

bool Channel::encrypt(std::string& errorMsg) {
    const TlsRole tlsRole = (m_role == ChannelRole::CLIENT) ? TlsRole::CLIENT : TlsRole::SERVER;
    m_tls = std::make_unique<TlsSocket>(m_socket, tlsRole, m_local.credentials);

    std::string tlsError;
    if (!m_tls->handshake(tlsError)) {
        return fail("TLS handshake with " + m_peerHost + " failed: " + tlsError, errorMsg);
    }

    std::string fpError;
    m_peerFingerprint = m_tls->getPeerFingerprint(fpError);
    m_stream = std::make_unique<TlsTransportStream>(*m_tls);

    if (!transition(ChannelState::ENCRYPTED)) {
        return fail("Channel closed during TLS handshake", errorMsg);
    }

    LOG_DEBUG("[Channel] Encrypted channel with " << remoteDeviceId() << " at " << m_peerHost
              << " (" << m_tls->getProtocolVersion() << ")");
    return true;
}

bool Channel::attach(const std::string& deviceId, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_attachMutex);

    if (!m_attachedDeviceId.empty()) {
        if (m_attachedDeviceId == deviceId) {
            return true;
        }
        errorMsg = "Channel already attached to " + m_attachedDeviceId;
        return false;
    }

    if (deviceId.empty() || deviceId != remoteDeviceId()) {
        errorMsg = "Channel belongs to " + remoteDeviceId() + ", not " + deviceId;
        return false;
    }

    ChannelState expected = ChannelState::ENCRYPTED;
    if (!m_state.compare_exchange_strong(expected, ChannelState::ATTACHED)) {
        errorMsg = "Channel cannot attach in state " + std::string(channelStateName(expected));
        return false;
    }

    m_attachedDeviceId = deviceId;
    return true;
}

std::string Channel::attachedDeviceId() const {
    std::lock_guard<std::mutex> lock(m_attachMutex);
    return m_attachedDeviceId;
}

//=============================================================================
// Packet I/O
//=============================================================================

bool Channel::sendPacket(const Packet& packet, std::string& errorMsg) {
    if (!m_stream || isClosed()) {
        errorMsg = "Channel is not open";
        return false;
    }

    const std::string data = packet.serialize();

    std::lock_guard<std::mutex> lock(m_sslMutex);
    return m_stream->sendExact(reinterpret_cast<const uint8_t*>(data.data()), data.size(), errorMsg);
}

bool Channel::readPacket(Packet& packet, std::string& errorMsg) {
    std::lock_guard<std::mutex> readLock(m_readMutex);
    errorMsg.clear();

    if (!m_stream) {
        errorMsg = "Channel is not open";
        return false;
    }

    uint8_t buffer[4096];
    while (true) {
        size_t newline = m_readBuffer.find('\n');
        if (newline != std::string::npos) {
            std::string line = m_readBuffer.substr(0, newline);
            m_readBuffer.erase(0, newline + 1);
            if (line.empty() || line == "\r") {
                continue;
            }

            std::string parseError;
            if (!Packet::parse(line, packet, parseError)) {
                LOG_WARNING("[Channel] Dropping malformed packet from " << m_peerHost
                            << ": " << parseError);
                continue;
            }
            return true;
        }

        if (m_readBuffer.size() > MAX_PACKET_SIZE) {
            errorMsg = "Packet from " + m_peerHost + " exceeds " + std::to_string(MAX_PACKET_SIZE) + " bytes";
            close();
            return false;
        }

        if (isClosed()) {
            errorMsg = "Channel closed";
            return false;
        }

        bool pending;
        {
            std::lock_guard<std::mutex> lock(m_sslMutex);
            pending = m_tls->hasPendingData();
        }

        // Wait without holding the SSL lock so writers are never blocked
        if (!pending) {
            int ready = waitReadable(m_socket, POLL_INTERVAL_MS);
            if (ready == 0) {
                continue;
            }
            if (ready < 0) {
                errorMsg = "poll failed on channel socket";
                close();
                return false;
            }
        }

        size_t received;
        std::string recvError;
        {
            std::lock_guard<std::mutex> lock(m_sslMutex);
            received = m_stream->recvSome(buffer, sizeof(buffer), recvError);
        }

        if (received == 0) {
            errorMsg = recvError;  // Empty on orderly close
            close();
            return false;
        }

        m_readBuffer.append(reinterpret_cast<const char*>(buffer), received);
    }
}

TransportStream* Channel::stream() {
    return m_stream.get();
}

bool Channel::setIoTimeout(uint32_t timeoutMs) {
    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_socket == INVALID_SOCKET_FD) {
        return false;
    }
    return setSocketTimeouts(m_socket, timeoutMs);
}

void Channel::close() {
    m_closeRequested.store(true);

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        if (m_socket != INVALID_SOCKET_FD) {
            // Wakes any thread blocked on this socket; the descriptor itself
            // stays valid until the destructor
            ::shutdown(m_socket, SHUT_RDWR);
        }
    }

    m_state.store(ChannelState::CLOSED);
}

//=============================================================================
// Helpers
//=============================================================================

bool Channel::fail(const std::string& reason, std::string& errorMsg) {
    errorMsg = reason;
    close();
    return false;
}

bool Channel::transition(ChannelState next) {
    ChannelState current = m_state.load();
    while (current != ChannelState::CLOSED) {
        if (m_state.compare_exchange_weak(current, next)) {
            return true;
        }
    }
    return false;
}

} // namespace LanConnect
