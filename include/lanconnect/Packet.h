/**
 * @file Packet.h
 * @brief Line-delimited JSON packet envelope
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace LanConnect {

//=============================================================================
// Packet Class
//=============================================================================

/**
 * @class Packet
 * @brief One protocol message: {id, type, body[, payloadSize, payloadTransferInfo]}
 *
 * Packets travel as one JSON object per line, terminated by '\n', both inside
 * UDP datagrams and on TCP/TLS channels.
 *
 * Wire form:
 * @code
 * {"body":{"deviceId":"abc","tcpPort":1716},"id":1700000000000,"type":"kdeconnect.identity"}
 * @endcode
 *
 * The payload checksum is carried as body.payloadHash. When a payload is
 * announced, payloadTransferInfo holds {"port": N}.
 *
 * Thread Safety:
 * - Value type, no internal synchronization
 */
class Packet {
public:
    /**
     * @brief Create an empty packet (type "", body {}, id now)
     */
    Packet();

    /**
     * @brief Create a packet of the given type
     * @param type Packet type (e.g. "kdeconnect.identity")
     * @param body JSON object body
     */
    explicit Packet(const std::string& type,
                    const nlohmann::json& body = nlohmann::json::object());

    //=========================================================================
    // Codec
    //=========================================================================

    /**
     * @brief Parse one serialized packet
     * @param line Serialized packet, with or without the trailing newline
     * @param out Receives the packet on success (untouched on failure)
     * @param errorMsg Output error message
     * @return true if line is a well-formed packet
     *
     * Rejects: empty input, input above MAX_PACKET_SIZE, embedded newlines,
     * invalid JSON, non-object root, missing or non-string type, missing or
     * non-object body, negative or non-integer payloadSize, non-object
     * payloadTransferInfo. A missing id is accepted as 0.
     */
    static bool parse(const std::string& line, Packet& out, std::string& errorMsg);

    /**
     * @brief Serialize as compact JSON followed by '\n'
     */
    std::string serialize() const;

    /**
     * @brief JSON object form of the envelope
     */
    nlohmann::json toJson() const;

    //=========================================================================
    // Envelope
    //=========================================================================

    int64_t id() const { return m_id; }
    void setId(int64_t id) { m_id = id; }

    const std::string& type() const { return m_type; }
    void setType(const std::string& type) { m_type = type; }

    nlohmann::json& body() { return m_body; }
    const nlohmann::json& body() const { return m_body; }

    /// True if payloadSize is present
    bool hasPayloadSize() const { return m_payloadSize >= 0; }

    /// Payload size in bytes, -1 if absent
    int64_t payloadSize() const { return m_payloadSize; }
    void setPayloadSize(int64_t size) { m_payloadSize = size < 0 ? -1 : size; }

    /// True if payloadTransferInfo is present
    bool hasPayloadTransferInfo() const { return !m_payloadTransferInfo.is_null(); }

    const nlohmann::json& payloadTransferInfo() const { return m_payloadTransferInfo; }
    void setPayloadTransferInfo(const nlohmann::json& info) { m_payloadTransferInfo = info; }

    /**
     * @brief Port announced in payloadTransferInfo
     * @return Port number, or 0 if absent or out of range
     */
    uint16_t payloadTransferPort() const;

    //=========================================================================
    // Body Accessors
    //=========================================================================

    /**
     * @brief body.deviceId as a string
     * @return deviceId, or empty string if missing or not a string
     */
    std::string deviceId() const;

    /// True if body.deviceId is a non-empty string
    bool hasDeviceId() const { return !deviceId().empty(); }

    /**
     * @brief body.payloadHash (SHA-256 hex) or empty string
     */
    std::string payloadHash() const;
    void setPayloadHash(const std::string& hash);

    /**
     * @brief Read a string field of the body
     * @return Value, or fallback if missing or not a string
     */
    std::string bodyString(const std::string& key, const std::string& fallback = {}) const;

    /**
     * @brief Read an integer field of the body
     * @return Value, or fallback if missing or not an integer
     */
    int64_t bodyInt(const std::string& key, int64_t fallback = 0) const;

    //=========================================================================
    // Identity Packets
    //=========================================================================

    /**
     * @brief Build an identity packet
     * @param deviceId Stable device identifier
     * @param deviceName Human-readable name
     * @param deviceType Device type ("desktop", "laptop", "phone", ...)
     * @param tcpPort Control port to announce (omitted when 0)
     */
    static Packet makeIdentity(const std::string& deviceId,
                               const std::string& deviceName,
                               const std::string& deviceType,
                               uint16_t tcpPort);

    /// True if type is kdeconnect.identity
    bool isIdentity() const;

    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const { return !(*this == other); }

    /// Milliseconds since the epoch, used for fresh packet ids
    static int64_t currentTimeMs();

private:
    int64_t m_id;
    std::string m_type;
    nlohmann::json m_body;
    int64_t m_payloadSize;
    nlohmann::json m_payloadTransferInfo;
};

} // namespace LanConnect
