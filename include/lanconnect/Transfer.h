/**
 * @file Transfer.h
 * @brief Single payload upload or download over a dedicated TLS channel
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "Channel.h"
#include "Device.h"
#include "LocalIdentity.h"
#include "Packet.h"
#include "config.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace LanConnect {

/**
 * @brief Progress callback
 *
 * @param bytesTransferred Bytes moved so far
 * @param totalBytes Expected total (negative if unknown)
 */
using TransferProgressCallback = std::function<void(uint64_t bytesTransferred,
                                                    int64_t totalBytes)>;

enum class TransferDirection {
    UPLOAD,
    DOWNLOAD
};

//=============================================================================
// Transfer Class
//=============================================================================

/**
 * @class Transfer
 * @brief Moves one payload between this node and a device
 *
 * Upload:
 * 1. bind a listener on the first free port in [TRANSFER_MIN_PORT, TRANSFER_MAX_PORT]
 * 2. fill payloadSize, payloadTransferInfo.port and body.payloadHash, then send
 *    the packet over the device's control channel
 * 3. accept one connection, run the server handshake, stream the source
 *
 * Download:
 * 1. connect to device.settings().tcpHost on the announced port
 * 2. run the client handshake, read up to size bytes into the sink
 * 3. verify the byte count and the SHA-256 checksum
 *
 * The remote must identify as the transfer's device. Every path closes the
 * channel and the local stream. A Transfer is single-use.
 *
 * Usage:
 * @code
 * auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
 * Transfer transfer(device, local, size, std::move(file));
 * Packet packet("kdeconnect.share.request", {{"filename", "photo.jpg"}});
 * if (!transfer.upload(packet)) {
 *     LOG_ERROR(transfer.errorMessage());
 * }
 * @endcode
 */
class Transfer {
public:
    /**
     * @brief Prepare an upload
     * @param device Receiving device (must have an attached channel)
     * @param local Local identity and TLS credentials
     * @param size Payload size in bytes (negative: send until end of source)
     * @param source Payload source
     */
    Transfer(std::shared_ptr<Device> device,
             const LocalIdentity& local,
             int64_t size,
             std::unique_ptr<std::istream> source);

    /**
     * @brief Prepare a download
     * @param device Sending device
     * @param local Local identity and TLS credentials
     * @param size Expected size (packet.payloadSize(); negative: read until end of stream)
     * @param checksum Expected SHA-256 hex, or empty to skip verification
     * @param sink Destination stream
     */
    Transfer(std::shared_ptr<Device> device,
             const LocalIdentity& local,
             int64_t size,
             const std::string& checksum,
             std::unique_ptr<std::ostream> sink);

    ~Transfer();

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    /**
     * @brief Receive the payload announced on port
     * @param port payloadTransferInfo.port of the announcing packet
     * @return true if all bytes arrived and the checksum matched
     */
    bool download(uint16_t port);

    /**
     * @brief Announce packet and send the payload to whoever connects
     * @param packet Packet to announce (payload fields are filled in)
     * @return true if the whole payload was sent
     *
     * Returns false without sending anything if no transfer port is free.
     */
    bool upload(Packet& packet);

    /**
     * @brief Abort a running transfer from another thread
     */
    void cancel();

    //=========================================================================
    // Configuration
    //=========================================================================

    void setPortRange(uint16_t minPort, uint16_t maxPort);
    void setAcceptTimeout(uint32_t timeoutMs) { m_acceptTimeoutMs = timeoutMs; }
    void setProgressCallback(TransferProgressCallback callback) { m_progress = std::move(callback); }

    //=========================================================================
    // State
    //=========================================================================

    TransferDirection direction() const { return m_direction; }
    int64_t size() const { return m_size; }

    /// Expected checksum (download) or announced checksum (upload)
    const std::string& checksum() const { return m_checksum; }

    /// Negotiated transfer port, 0 before negotiation
    uint16_t port() const { return m_port; }

    uint64_t bytesTransferred() const { return m_bytesTransferred; }
    const std::string& errorMessage() const { return m_errorMsg; }

private:
    bool claim();
    bool fail(const std::string& message);
    bool receivePayload(TransportStream& stream);
    bool sendPayload(TransportStream& stream);
    Packet expectedIdentity() const;
    void finish();

    std::shared_ptr<Device> m_device;
    LocalIdentity m_local;
    TransferDirection m_direction;
    int64_t m_size;
    std::string m_checksum;

    std::unique_ptr<std::istream> m_source;
    std::unique_ptr<std::ostream> m_sink;

    uint16_t m_minPort;
    uint16_t m_maxPort;
    uint32_t m_acceptTimeoutMs;
    uint16_t m_port;
    uint64_t m_bytesTransferred;
    std::string m_errorMsg;
    TransferProgressCallback m_progress;

    std::atomic<bool> m_used;
    std::atomic<bool> m_cancelled;
    std::mutex m_channelMutex;
    std::shared_ptr<Channel> m_channel;
};

} // namespace LanConnect
