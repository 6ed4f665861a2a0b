/**
 * @file Device.h
 * @brief A remote peer and the control channel attached to it
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "Channel.h"
#include "Packet.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace LanConnect {

class Device;

/**
 * @brief Callback for packets arriving on an attached channel
 *
 * Invoked on the device's reader thread.
 */
using PacketHandler = std::function<void(Device& device, const Packet& packet)>;

/**
 * @brief Persisted connection settings of a device
 */
struct DeviceSettings {
    std::string tcpHost;    ///< Control host, also the host downloads connect to
    uint16_t tcpPort = 0;   ///< Control port announced by the peer
};

//=============================================================================
// Device Class
//=============================================================================

/**
 * @class Device
 * @brief One remote peer, keyed by deviceId
 *
 * A device holds at most one channel. While an outbound connect is in flight
 * the slot is "pending" (tryReserveChannel) so discovery does not start a
 * second one. Once a channel is attached, a reader thread dispatches its
 * packets to the PacketHandler; when the peer disconnects the channel is
 * dropped and a later discovery may reconnect.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class Device {
public:
    /**
     * @brief Create a device from its identity packet
     * @param identity Identity with body.deviceId (tcpHost/tcpPort optional)
     */
    explicit Device(const Packet& identity);

    /**
     * @brief Destructor - closes the channel and joins the reader
     */
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    //=========================================================================
    // Identity
    //=========================================================================

    const std::string& id() const { return m_id; }
    std::string name() const;
    std::string type() const;
    DeviceSettings settings() const;

    /**
     * @brief Refresh name, type, tcpHost and tcpPort from a newer identity
     *
     * Never touches the channel. Packets for another deviceId are ignored.
     */
    void handleIdentity(const Packet& identity);

    //=========================================================================
    // Channel
    //=========================================================================

    /**
     * @brief True if a live channel is attached or an outbound connect is pending
     */
    bool hasChannel() const;

    /**
     * @brief True if a live channel is attached
     */
    bool isConnected() const;

    /**
     * @brief Claim the channel slot for an outbound connect
     * @return false if a channel is already attached or pending
     */
    bool tryReserveChannel();

    /**
     * @brief Release a reservation after a failed connect
     */
    void clearPendingChannel();

    /**
     * @brief Attach an encrypted channel to this device
     * @param channel Channel whose remote identity is this device
     * @param errorMsg Output error message
     * @return false if a different live channel is already attached or the
     *         channel refuses the attachment
     *
     * Clears the pending reservation, adopts the channel's identity and starts
     * the reader thread.
     */
    bool attachChannel(const std::shared_ptr<Channel>& channel, std::string& errorMsg);

    /**
     * @brief Close and drop the attached channel, if any
     */
    void disconnect();

    /**
     * @brief Send a packet over the attached channel
     * @return false (logged) if there is no channel or the write failed
     */
    bool sendPacket(const Packet& packet);

    /**
     * @brief Set the callback for incoming packets
     */
    void setPacketHandler(PacketHandler handler);

    /**
     * @brief Peer certificate fingerprint of the attached channel, or empty
     */
    std::string certificateFingerprint() const;

private:
    void readerThreadFunc(std::shared_ptr<Channel> channel);
    void joinReader();

    const std::string m_id;

    mutable std::mutex m_mutex;
    std::string m_name;
    std::string m_type;
    DeviceSettings m_settings;
    std::shared_ptr<Channel> m_channel;
    bool m_pending;
    PacketHandler m_handler;

    std::mutex m_readerMutex;           ///< Guards m_readerThread
    std::thread m_readerThread;
};

} // namespace LanConnect
