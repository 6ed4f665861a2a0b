/**
 * @file LocalIdentity.h
 * @brief Identity this node announces and the TLS credentials backing it
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "Packet.h"
#include "TlsSocket.h"
#include <cstdint>
#include <string>

namespace LanConnect {

/**
 * @brief The local device as seen by peers
 *
 * Copied into every Channel and Transfer, so it must stay a plain value.
 * tcpPort is filled in by ChannelService once the control listener is bound.
 */
struct LocalIdentity {
    std::string deviceId;
    std::string deviceName;
    std::string deviceType;
    uint16_t tcpPort = 0;
    TlsCredentials credentials;

    /**
     * @brief Identity packet announcing this node
     */
    Packet toPacket() const {
        return Packet::makeIdentity(deviceId, deviceName, deviceType, tcpPort);
    }
};

} // namespace LanConnect
