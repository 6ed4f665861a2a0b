/**
 * @file DeviceManager.h
 * @brief Device registry contract and its in-memory implementation
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "Device.h"
#include "Packet.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace LanConnect {

class Channel;

//=============================================================================
// DeviceRegistry Interface
//=============================================================================

/**
 * @class DeviceRegistry
 * @brief What ChannelService needs from the owner of the devices
 *
 * ChannelService never owns devices. It looks them up, asks for them to be
 * created on admission, and reports every established channel here.
 */
class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    /**
     * @brief Known device for deviceId, or null
     */
    virtual std::shared_ptr<Device> getDevice(const std::string& deviceId) = 0;

    /**
     * @brief Get or create the device described by identity (idempotent)
     */
    virtual std::shared_ptr<Device> ensureDevice(const Packet& identity) = 0;

    /**
     * @brief Whether unknown devices may connect
     */
    virtual bool isDiscoverable() const = 0;

    /**
     * @brief Take ownership of an encrypted channel for device
     * @return false if the channel was refused (the caller closes it)
     */
    virtual bool onChannelEstablished(const std::shared_ptr<Device>& device,
                                      const std::shared_ptr<Channel>& channel) = 0;
};

//=============================================================================
// DeviceManager Class
//=============================================================================

/**
 * @class DeviceManager
 * @brief In-memory DeviceRegistry used by the daemon and the tests
 *
 * Devices live until the manager is destroyed. Every device created here
 * forwards its packets to the manager's packet handler.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class DeviceManager : public DeviceRegistry {
public:
    explicit DeviceManager(bool discoverable = true);
    ~DeviceManager() override;

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    std::shared_ptr<Device> getDevice(const std::string& deviceId) override;
    std::shared_ptr<Device> ensureDevice(const Packet& identity) override;
    bool isDiscoverable() const override { return m_discoverable.load(); }
    bool onChannelEstablished(const std::shared_ptr<Device>& device,
                              const std::shared_ptr<Channel>& channel) override;

    void setDiscoverable(bool discoverable) { m_discoverable.store(discoverable); }

    /**
     * @brief Handler applied to current and future devices
     */
    void setPacketHandler(PacketHandler handler);

    /**
     * @brief Snapshot of all known devices
     */
    std::vector<std::shared_ptr<Device>> devices() const;

    size_t deviceCount() const;

private:
    std::atomic<bool> m_discoverable;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Device>> m_devices;
    PacketHandler m_handler;
};

} // namespace LanConnect
