/**
 * @file Transfer.cpp
 * @brief Single payload upload or download over a dedicated TLS channel
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Transfer.h"
#include "lanconnect/Debug.h"
#include "lanconnect/ErrorCodes.h"
#include "lanconnect/HashUtils.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/ThreadSafeLog.h"
#include <algorithm>
#include <chrono>
#include <vector>

namespace LanConnect {

//=============================================================================
// Constructors / Destructor
//=============================================================================

Transfer::Transfer(std::shared_ptr<Device> device,
                   const LocalIdentity& local,
                   int64_t size,
                   std::unique_ptr<std::istream> source)
    : m_device(std::move(device))
    , m_local(local)
    , m_direction(TransferDirection::UPLOAD)
    , m_size(size)
    , m_source(std::move(source))
    , m_minPort(TRANSFER_MIN_PORT)
    , m_maxPort(TRANSFER_MAX_PORT)
    , m_acceptTimeoutMs(TRANSFER_ACCEPT_TIMEOUT_MS)
    , m_port(0)
    , m_bytesTransferred(0)
    , m_used(false)
    , m_cancelled(false)
{
}

Transfer::Transfer(std::shared_ptr<Device> device,
                   const LocalIdentity& local,
                   int64_t size,
                   const std::string& checksum,
                   std::unique_ptr<std::ostream> sink)
    : m_device(std::move(device))
    , m_local(local)
    , m_direction(TransferDirection::DOWNLOAD)
    , m_size(size)
    , m_checksum(checksum)
    , m_sink(std::move(sink))
    , m_minPort(TRANSFER_MIN_PORT)
    , m_maxPort(TRANSFER_MAX_PORT)
    , m_acceptTimeoutMs(TRANSFER_ACCEPT_TIMEOUT_MS)
    , m_port(0)
    , m_bytesTransferred(0)
    , m_used(false)
    , m_cancelled(false)
{
}

Transfer::~Transfer() {
    cancel();
}

void Transfer::setPortRange(uint16_t minPort, uint16_t maxPort) {
    m_minPort = minPort;
    m_maxPort = maxPort;
}

void Transfer::cancel() {
    m_cancelled = true;

    std::lock_guard<std::mutex> lock(m_channelMutex);
    if (m_channel) {
        m_channel->close();
    }
}

//=============================================================================
// Download
//=============================================================================

bool Transfer::download(uint16_t port) {
    if (m_direction != TransferDirection::DOWNLOAD) {
        return fail("Not a download");
    }
    if (!claim()) {
        return false;
    }

    m_port = port;
    bool success = false;

    try {
        const std::string host = m_device ? m_device->settings().tcpHost : std::string();
        if (!m_sink) {
            fail("No destination stream");
        } else if (host.empty()) {
            fail("Device has no known host");
        } else if (port == 0) {
            fail("No transfer port");
        } else {
            auto channel = std::make_shared<Channel>(m_local, ChannelRole::CLIENT);
            channel->setExpectedIdentity(expectedIdentity());
            {
                std::lock_guard<std::mutex> lock(m_channelMutex);
                m_channel = channel;
            }

            std::string errorMsg;
            if (m_cancelled.load()) {
                fail("Transfer cancelled");
            } else if (!channel->open(host, port, errorMsg)) {
                fail("Connecting to " + host + ":" + std::to_string(port) + " failed: " + errorMsg);
            } else {
                channel->setIoTimeout(IO_TIMEOUT_MS);
                success = receivePayload(*channel->stream());
            }
        }
    } catch (const std::exception& e) {
        success = fail(std::string("Unexpected error: ") + e.what());
    }

    finish();
    return success;
}

bool Transfer::receivePayload(TransportStream& stream) {
    HashUtils::IncrementalHash hash;
    std::vector<uint8_t> buffer(BUFFER_SIZE);

    while (m_size < 0 || m_bytesTransferred < static_cast<uint64_t>(m_size)) {
        size_t want = buffer.size();
        if (m_size >= 0) {
            want = static_cast<size_t>(std::min<uint64_t>(want,
                static_cast<uint64_t>(m_size) - m_bytesTransferred));
        }

        std::string errorMsg;
        size_t received = stream.recvSome(buffer.data(), want, errorMsg);
        if (received == 0) {
            if (!errorMsg.empty()) {
                return fail("Reading payload failed: " + errorMsg);
            }
            break;  // End of stream
        }

        m_sink->write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(received));
        if (!*m_sink) {
            return fail("Writing payload to the destination failed");
        }

        if (!hash.update(buffer.data(), received)) {
            return fail("Failed to update SHA256 hash");
        }

        m_bytesTransferred += received;
        if (m_progress) {
            m_progress(m_bytesTransferred, m_size);
        }
    }

    m_sink->flush();
    if (!*m_sink) {
        return fail("Flushing the destination failed");
    }

    if (m_size >= 0 && m_bytesTransferred != static_cast<uint64_t>(m_size)) {
        return fail("Payload incomplete: received " + std::to_string(m_bytesTransferred) +
                    " of " + std::to_string(m_size) + " bytes");
    }

    if (!m_checksum.empty()) {
        const std::string actual = hash.finalizeHex();
        if (!HashUtils::digestsEqual(actual, m_checksum)) {
            return fail("Checksum mismatch: expected " + m_checksum + ", got " + actual);
        }
    }

    LOG_INFO("[Transfer] Received " << m_bytesTransferred << " bytes from "
             << m_device->id() << " on port " << m_port);
    return true;
}

//=============================================================================
// Upload
//=============================================================================

bool Transfer::upload(Packet& packet) {
    if (m_direction != TransferDirection::UPLOAD) {
        return fail("Not an upload");
    }
    if (!claim()) {
        return false;
    }

    if (!m_source || !m_device) {
        fail("Nothing to upload");
        finish();
        return false;
    }

    int listenSocket = INVALID_SOCKET_FD;
    bool success = false;

    try {
        std::string errorMsg;
        uint16_t boundPort = 0;
        listenSocket = bindTcpListenerInRange(m_minPort, m_maxPort, boundPort, errorMsg);
        if (listenSocket == INVALID_SOCKET_FD) {
            LOG_WARNING("[Transfer] " << ErrorCodes::BIND_EXHAUSTED << " " << errorMsg);
            fail(errorMsg);
            finish();
            return false;
        }
        m_port = boundPort;

        // Only a seekable source can be hashed ahead of the transfer
        if (m_source->tellg() != std::istream::pos_type(-1)) {
            if (!HashUtils::computeStreamHash(*m_source, m_checksum, errorMsg)) {
                closeSocket(listenSocket);
                fail("Hashing payload failed: " + errorMsg);
                finish();
                return false;
            }
            packet.setPayloadHash(m_checksum);
        }

        packet.setPayloadSize(m_size);
        packet.setPayloadTransferInfo(nlohmann::json{{"port", m_port}});

        // Announce before blocking in accept so the remote can connect
        if (!m_device->sendPacket(packet)) {
            closeSocket(listenSocket);
            fail("Announcing payload to " + m_device->id() + " failed");
            finish();
            return false;
        }

        int clientSocket = INVALID_SOCKET_FD;
        std::string peerHost;
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(m_acceptTimeoutMs);

        while (!m_cancelled.load() && std::chrono::steady_clock::now() < deadline) {
            int ready = waitReadable(listenSocket, POLL_INTERVAL_MS);
            if (ready < 0) {
                errorMsg = "poll failed on transfer listener";
                break;
            }
            if (ready > 0) {
                if (!acceptWithTimeout(listenSocket, 0, clientSocket, peerHost, errorMsg)) {
                    clientSocket = INVALID_SOCKET_FD;
                }
                break;
            }
        }
        closeSocket(listenSocket);

        if (clientSocket == INVALID_SOCKET_FD) {
            if (m_cancelled.load()) {
                errorMsg = "Transfer cancelled";
            } else if (errorMsg.empty()) {
                errorMsg = "Timed out waiting for " + m_device->id() + " to connect";
            }
            fail(errorMsg);
        } else {
            auto channel = std::make_shared<Channel>(m_local, ChannelRole::SERVER);
            channel->setExpectedIdentity(expectedIdentity());
            {
                std::lock_guard<std::mutex> lock(m_channelMutex);
                m_channel = channel;
            }

            if (!channel->accept(clientSocket, peerHost, errorMsg)) {
                fail("Handshake with " + peerHost + " failed: " + errorMsg);
            } else {
                channel->setIoTimeout(IO_TIMEOUT_MS);
                success = sendPayload(*channel->stream());
            }
        }
    } catch (const std::exception& e) {
        closeSocket(listenSocket);
        success = fail(std::string("Unexpected error: ") + e.what());
    }

    finish();
    return success;
}

bool Transfer::sendPayload(TransportStream& stream) {
    std::vector<uint8_t> buffer(BUFFER_SIZE);

    while (m_size < 0 || m_bytesTransferred < static_cast<uint64_t>(m_size)) {
        size_t want = buffer.size();
        if (m_size >= 0) {
            want = static_cast<size_t>(std::min<uint64_t>(want,
                static_cast<uint64_t>(m_size) - m_bytesTransferred));
        }

        m_source->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const std::streamsize bytesRead = m_source->gcount();
        if (m_source->bad()) {
            return fail("Reading payload source failed");
        }
        if (bytesRead <= 0) {
            break;  // Source exhausted
        }

        std::string errorMsg;
        if (!stream.sendExact(buffer.data(), static_cast<size_t>(bytesRead), errorMsg)) {
            return fail("Sending payload failed: " + errorMsg);
        }

        m_bytesTransferred += static_cast<uint64_t>(bytesRead);
        if (m_progress) {
            m_progress(m_bytesTransferred, m_size);
        }
    }

    if (m_size >= 0 && m_bytesTransferred != static_cast<uint64_t>(m_size)) {
        return fail("Payload source ended after " + std::to_string(m_bytesTransferred) +
                    " of " + std::to_string(m_size) + " bytes");
    }

    stream.shutdown();

    LOG_INFO("[Transfer] Sent " << m_bytesTransferred << " bytes to "
             << m_device->id() << " on port " << m_port);
    return true;
}

//=============================================================================
// Helpers
//=============================================================================

bool Transfer::claim() {
    if (m_used.exchange(true)) {
        m_errorMsg = "Transfer already used";
        return false;
    }
    return true;
}

bool Transfer::fail(const std::string& message) {
    m_errorMsg = message;
    LOG_WARNING("[Transfer] " << ErrorCodes::TRANSFER_IO << " "
                << (m_device ? m_device->id() : std::string("?")) << ": " << message);
    ThreadSafeLog::log("[Transfer] failed: " + message);
    return false;
}

Packet Transfer::expectedIdentity() const {
    return Packet::makeIdentity(m_device->id(), m_device->name(), m_device->type(), 0);
}

void Transfer::finish() {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        channel.swap(m_channel);
    }
    if (channel) {
        channel->close();
    }

    // Destroying the streams closes the underlying files
    m_source.reset();
    m_sink.reset();
}

} // namespace LanConnect
