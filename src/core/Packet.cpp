/**
 * @file Packet.cpp
 * @brief Line-delimited JSON packet envelope
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Packet.h"
#include "lanconnect/config.h"
#include <chrono>

namespace LanConnect {

using json = nlohmann::json;

//=============================================================================
// Construction
//=============================================================================

Packet::Packet()
    : m_id(currentTimeMs())
    , m_type()
    , m_body(json::object())
    , m_payloadSize(-1)
    , m_payloadTransferInfo(nullptr)
{
}

Packet::Packet(const std::string& type, const json& body)
    : m_id(currentTimeMs())
    , m_type(type)
    , m_body(body.is_object() ? body : json::object())
    , m_payloadSize(-1)
    , m_payloadTransferInfo(nullptr)
{
}

int64_t Packet::currentTimeMs() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

//=============================================================================
// Codec
//=============================================================================

bool Packet::parse(const std::string& line, Packet& out, std::string& errorMsg) {
    std::string text = line;
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
    }

    if (text.empty()) {
        errorMsg = "Empty packet";
        return false;
    }

    if (text.size() > MAX_PACKET_SIZE) {
        errorMsg = "Packet exceeds " + std::to_string(MAX_PACKET_SIZE) + " bytes";
        return false;
    }

    if (text.find('\n') != std::string::npos) {
        errorMsg = "Packet contains more than one line";
        return false;
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        errorMsg = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        errorMsg = "Packet root is not an object";
        return false;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        errorMsg = "Packet has no string 'type'";
        return false;
    }

    auto bodyIt = j.find("body");
    if (bodyIt == j.end() || !bodyIt->is_object()) {
        errorMsg = "Packet has no object 'body'";
        return false;
    }

    Packet packet;
    packet.m_type = typeIt->get<std::string>();
    packet.m_body = *bodyIt;
    packet.m_id = 0;

    auto idIt = j.find("id");
    if (idIt != j.end()) {
        if (!idIt->is_number_integer()) {
            errorMsg = "Packet 'id' is not an integer";
            return false;
        }
        packet.m_id = idIt->get<int64_t>();
    }

    auto sizeIt = j.find("payloadSize");
    if (sizeIt != j.end() && !sizeIt->is_null()) {
        if (!sizeIt->is_number_integer() || sizeIt->get<int64_t>() < 0) {
            errorMsg = "Packet 'payloadSize' is not a non-negative integer";
            return false;
        }
        packet.m_payloadSize = sizeIt->get<int64_t>();
    }

    auto infoIt = j.find("payloadTransferInfo");
    if (infoIt != j.end() && !infoIt->is_null()) {
        if (!infoIt->is_object()) {
            errorMsg = "Packet 'payloadTransferInfo' is not an object";
            return false;
        }
        packet.m_payloadTransferInfo = *infoIt;
    }

    out = std::move(packet);
    return true;
}

json Packet::toJson() const {
    json j;
    j["id"] = m_id;
    j["type"] = m_type;
    j["body"] = m_body;

    if (hasPayloadSize()) {
        j["payloadSize"] = m_payloadSize;
    }

    if (hasPayloadTransferInfo()) {
        j["payloadTransferInfo"] = m_payloadTransferInfo;
    }

    return j;
}

std::string Packet::serialize() const {
    return toJson().dump() + "\n";
}

//=============================================================================
// Accessors
//=============================================================================

uint16_t Packet::payloadTransferPort() const {
    if (!m_payloadTransferInfo.is_object()) {
        return 0;
    }

    auto it = m_payloadTransferInfo.find("port");
    if (it == m_payloadTransferInfo.end() || !it->is_number_integer()) {
        return 0;
    }

    const int64_t port = it->get<int64_t>();
    if (port <= 0 || port > 65535) {
        return 0;
    }
    return static_cast<uint16_t>(port);
}

std::string Packet::deviceId() const {
    return bodyString("deviceId");
}

std::string Packet::payloadHash() const {
    return bodyString("payloadHash");
}

void Packet::setPayloadHash(const std::string& hash) {
    m_body["payloadHash"] = hash;
}

std::string Packet::bodyString(const std::string& key, const std::string& fallback) const {
    auto it = m_body.find(key);
    if (it == m_body.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

int64_t Packet::bodyInt(const std::string& key, int64_t fallback) const {
    auto it = m_body.find(key);
    if (it == m_body.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int64_t>();
}

//=============================================================================
// Identity Packets
//=============================================================================

Packet Packet::makeIdentity(const std::string& deviceId,
                            const std::string& deviceName,
                            const std::string& deviceType,
                            uint16_t tcpPort) {
    json body;
    body["deviceId"] = deviceId;
    body["deviceName"] = deviceName;
    body["deviceType"] = deviceType;
    body["protocolVersion"] = PROTOCOL_VERSION;
    body["incomingCapabilities"] = json::array();
    body["outgoingCapabilities"] = json::array();
    if (tcpPort != 0) {
        body["tcpPort"] = tcpPort;
    }

    return Packet(PACKET_TYPE_IDENTITY, body);
}

bool Packet::isIdentity() const {
    return m_type == PACKET_TYPE_IDENTITY;
}

bool Packet::operator==(const Packet& other) const {
    return m_id == other.m_id &&
           m_type == other.m_type &&
           m_body == other.m_body &&
           m_payloadSize == other.m_payloadSize &&
           m_payloadTransferInfo == other.m_payloadTransferInfo;
}

} // namespace LanConnect
