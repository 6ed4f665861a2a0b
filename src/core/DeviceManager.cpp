/**
 * @file DeviceManager.cpp
 * @brief In-memory device registry
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/DeviceManager.h"
#include "lanconnect/Channel.h"
#include "lanconnect/Debug.h"
#include "lanconnect/ThreadSafeLog.h"

namespace LanConnect {

DeviceManager::DeviceManager(bool discoverable)
    : m_discoverable(discoverable)
{
}

DeviceManager::~DeviceManager() {
    std::unordered_map<std::string, std::shared_ptr<Device>> devices;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        devices.swap(m_devices);
    }

    for (auto& entry : devices) {
        entry.second->disconnect();
    }
}

std::shared_ptr<Device> DeviceManager::getDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    return it != m_devices.end() ? it->second : nullptr;
}

std::shared_ptr<Device> DeviceManager::ensureDevice(const Packet& identity) {
    const std::string deviceId = identity.deviceId();
    if (deviceId.empty()) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it != m_devices.end()) {
        return it->second;
    }

    auto device = std::make_shared<Device>(identity);
    device->setPacketHandler(m_handler);
    m_devices.emplace(deviceId, device);

    LOG_INFO("[DeviceManager] New device " << deviceId << " ("
             << identity.bodyString("deviceName", "unnamed") << ")");
    ThreadSafeLog::log("[DeviceManager] New device " + deviceId);
    return device;
}

bool DeviceManager::onChannelEstablished(const std::shared_ptr<Device>& device,
                                         const std::shared_ptr<Channel>& channel) {
    if (!device || !channel) {
        return false;
    }

    std::string errorMsg;
    if (!device->attachChannel(channel, errorMsg)) {
        LOG_WARNING("[DeviceManager] Dropping channel from " << channel->peerHost()
                    << ": " << errorMsg);
        return false;
    }
    return true;
}

void DeviceManager::setPacketHandler(PacketHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
    for (auto& entry : m_devices) {
        entry.second->setPacketHandler(m_handler);
    }
}

std::vector<std::shared_ptr<Device>> DeviceManager::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<Device>> result;
    result.reserve(m_devices.size());
    for (const auto& entry : m_devices) {
        result.push_back(entry.second);
    }
    return result;
}

size_t DeviceManager::deviceCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices.size();
}

} // namespace LanConnect
