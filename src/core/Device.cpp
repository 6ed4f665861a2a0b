/**
 * @file Device.cpp
 * @brief A remote peer and the control channel attached to it
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Device.h"
#include "lanconnect/Debug.h"
#include "lanconnect/ThreadSafeLog.h"
#include "lanconnect/config.h"

namespace LanConnect {

//=============================================================================
// Constructor / Destructor
//=============================================================================

Device::Device(const Packet& identity)
    : m_id(identity.deviceId())
    , m_pending(false)
{
    handleIdentity(identity);
}

Device::~Device() {
    disconnect();
    joinReader();
}

//=============================================================================
// Identity
//=============================================================================

std::string Device::name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

std::string Device::type() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_type;
}

DeviceSettings Device::settings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

void Device::handleIdentity(const Packet& identity) {
    if (identity.deviceId() != m_id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_name = identity.bodyString("deviceName", m_name);
    m_type = identity.bodyString("deviceType", m_type);
    m_settings.tcpHost = identity.bodyString("tcpHost", m_settings.tcpHost);

    const int64_t port = identity.bodyInt("tcpPort", 0);
    if (port > 0 && port <= 65535) {
        m_settings.tcpPort = static_cast<uint16_t>(port);
    }
}

//=============================================================================
// Channel
//=============================================================================

bool Device::hasChannel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending || (m_channel && !m_channel->isClosed());
}

bool Device::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel && !m_channel->isClosed();
}

bool Device::tryReserveChannel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending || (m_channel && !m_channel->isClosed())) {
        return false;
    }
    m_pending = true;
    return true;
}

void Device::clearPendingChannel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending = false;
}

bool Device::attachChannel(const std::shared_ptr<Channel>& channel, std::string& errorMsg) {
    if (!channel) {
        errorMsg = "No channel";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_channel == channel) {
            return true;
        }

        if (m_channel && !m_channel->isClosed()) {
            errorMsg = "Device " + m_id + " already has a live channel";
            return false;
        }

        if (!channel->attach(m_id, errorMsg)) {
            return false;
        }

        m_channel = channel;
        m_pending = false;
    }

    handleIdentity(channel->identity());

    // The previous reader (if any) owns a closed channel and exits promptly
    std::lock_guard<std::mutex> readerLock(m_readerMutex);
    if (m_readerThread.joinable()) {
        if (m_readerThread.get_id() == std::this_thread::get_id()) {
            m_readerThread.detach();
        } else {
            m_readerThread.join();
        }
    }
    m_readerThread = std::thread(&Device::readerThreadFunc, this, channel);

    LOG_INFO("[Device] " << m_id << " connected via " << channel->peerHost());
    ThreadSafeLog::log("[Device] " + m_id + " connected via " + channel->peerHost());
    return true;
}

void Device::disconnect() {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel.swap(m_channel);
    }

    if (channel) {
        channel->close();
    }
}

bool Device::sendPacket(const Packet& packet) {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
    }

    if (!channel || channel->isClosed()) {
        LOG_WARNING("[Device] Cannot send '" << packet.type() << "' to " << m_id
                    << ": not connected");
        return false;
    }

    std::string errorMsg;
    if (!channel->sendPacket(packet, errorMsg)) {
        LOG_WARNING("[Device] Sending '" << packet.type() << "' to " << m_id
                    << " failed: " << errorMsg);
        return false;
    }
    return true;
}

void Device::setPacketHandler(PacketHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

std::string Device::certificateFingerprint() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel ? m_channel->peerCertificateFingerprint() : std::string();
}

//=============================================================================
// Reader Thread
//=============================================================================

void Device::readerThreadFunc(std::shared_ptr<Channel> channel) {
    Packet packet;
    std::string errorMsg;

    while (channel->readPacket(packet, errorMsg)) {
        PacketHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_handler;
        }

        if (!handler) {
            LOG_DEBUG("[Device] " << m_id << " unhandled packet '" << packet.type() << "'");
            continue;
        }

        try {
            handler(*this, packet);
        } catch (const std::exception& e) {
            LOG_ERROR("[Device] Handler for '" << packet.type() << "' from " << m_id
                      << " threw: " << e.what());
        }
    }

    if (errorMsg.empty()) {
        LOG_INFO("[Device] " << m_id << " disconnected");
    } else {
        LOG_WARNING("[Device] " << m_id << " channel lost: " << errorMsg);
    }
    ThreadSafeLog::log("[Device] " + m_id + " channel closed");

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_channel == channel) {
        m_channel.reset();
    }
}

void Device::joinReader() {
    std::lock_guard<std::mutex> lock(m_readerMutex);
    if (!m_readerThread.joinable()) {
        return;
    }

    if (m_readerThread.get_id() == std::this_thread::get_id()) {
        m_readerThread.detach();
    } else {
        m_readerThread.join();
    }
}

} // namespace LanConnect
