/**
 * @file config.h
 * @brief Configuration constants for LanConnect
 *
 * This file contains the compile-time configuration constants used throughout
 * LanConnect: network ports, timeouts, buffer sizes, protocol identifiers and
 * TLS configuration.
 *
 * @note The port numbers and packet types are fixed by the KDE Connect wire
 *       protocol. Changing them breaks interoperability with other peers.
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace LanConnect
 * @brief LanConnect namespace containing all public APIs
 */
namespace LanConnect {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief UDP discovery port and TCP port ranges
 *
 * Discovery uses a single well-known UDP port. The control channel listener
 * binds the first free TCP port in [TCP_MIN_PORT, TCP_MAX_PORT]. Payload
 * transfers bind the first free port in [TRANSFER_MIN_PORT, TRANSFER_MAX_PORT].
 * @{
 */

/// UDP port for identity broadcasts (bound locally and used as destination)
constexpr uint16_t UDP_PORT = 1716;

/// First TCP port probed for the control channel listener
constexpr uint16_t TCP_MIN_PORT = 1716;

/// Last TCP port probed for the control channel listener
constexpr uint16_t TCP_MAX_PORT = 1764;

/// First TCP port probed for a payload transfer listener
constexpr uint16_t TRANSFER_MIN_PORT = 1739;

/// Last TCP port probed for a payload transfer listener
constexpr uint16_t TRANSFER_MAX_PORT = 1764;

/**
 * @brief Control port assumed for inbound peers that announce none
 *
 * Peers connecting to us are recorded with this port unless their identity
 * carries a valid tcpPort of its own.
 */
constexpr uint16_t DEFAULT_TCP_PORT = 1716;

/** @} */ // end of NetworkPorts

//=========================================================================
// Socket Configuration
//=========================================================================

/** @defgroup SocketConfig Socket Configuration
 * @{
 */

/// Limited broadcast address used when no target is given
constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

/// Loopback address (tests and local tools)
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/// listen() backlog for the control listener
constexpr int LISTEN_BACKLOG = 16;

/// Requested UDP receive buffer, clamped by the kernel
constexpr int UDP_RECV_BUF_SIZE = 262144;  // 256 KB

/** @} */ // end of SocketConfig

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Outbound TCP connect timeout
 *
 * An unreachable peer fails the connect attempt after 5 seconds instead of
 * waiting for the kernel's SYN retry budget.
 */
constexpr uint32_t CONNECT_TIMEOUT_MS = 5000;

/**
 * @brief Identity exchange and TLS handshake timeout
 *
 * Applied as SO_RCVTIMEO/SO_SNDTIMEO while a channel is being established.
 * A peer that stops responding mid-handshake cannot hold a worker forever.
 */
constexpr uint32_t HANDSHAKE_TIMEOUT_MS = 10000;

/**
 * @brief Upload accept timeout
 *
 * After announcing a payload port the uploader waits this long for the
 * receiving peer to connect.
 */
constexpr uint32_t TRANSFER_ACCEPT_TIMEOUT_MS = 30000;

/**
 * @brief Payload I/O stall timeout
 *
 * A transfer that makes no progress for this long fails.
 */
constexpr uint32_t IO_TIMEOUT_MS = 30000;

/// Poll interval used by reader loops to re-check their stop flag
constexpr uint32_t POLL_INTERVAL_MS = 200;

/// Interval between local interface address scans
constexpr uint32_t NETWORK_MONITOR_INTERVAL_MS = 3000;

/** @} */ // end of Timing

//=========================================================================
// Buffer Sizes
//=========================================================================

/** @defgroup BufferSizes Buffer Size Configuration
 * @{
 */

/**
 * @brief Maximum serialized packet size
 *
 * Packets are single JSON lines. Anything longer is rejected by the codec and
 * by the line readers before it is buffered.
 */
constexpr size_t MAX_PACKET_SIZE = 65536;  // 64 KB

/// Payload streaming chunk size
constexpr size_t BUFFER_SIZE = 65536;  // 64 KB

/// SHA-256 digest size in bytes
constexpr size_t HASH_SIZE = 32;

/// Maximum deviceId length accepted from the network
constexpr size_t MAX_DEVICE_ID_LENGTH = 128;

/** @} */ // end of BufferSizes

//=========================================================================
// Protocol Identifiers
//=========================================================================

/** @defgroup Protocol Protocol Identifiers
 * @{
 */

/// Packet type of the identity packet
constexpr const char* PACKET_TYPE_IDENTITY = "kdeconnect.identity";

/// Protocol version announced in identity packets
constexpr int PROTOCOL_VERSION = 7;

/// Device type announced when the configuration does not name one
constexpr const char* DEFAULT_DEVICE_TYPE = "desktop";

/** @} */ // end of Protocol

//=========================================================================
// Threading
//=========================================================================

/** @defgroup Threading Multi-threading Configuration
 * @{
 */

/**
 * @brief Maximum concurrent channel handshakes
 *
 * ChannelService spawns a worker per inbound accept and per outbound connect.
 * Further attempts are dropped while the limit is reached.
 */
constexpr size_t MAX_CONCURRENT_HANDSHAKES = 16;

/** @} */ // end of Threading

//=========================================================================
// TLS/SSL Configuration
//=========================================================================

/** @defgroup TLS TLS/SSL Configuration
 * @{
 */

/**
 * @brief TLS 1.2 cipher list
 *
 * TLS 1.2 stays enabled because older KDE Connect peers do not negotiate 1.3.
 */
constexpr const char* TLS_CIPHER_SUITE = "HIGH:!aNULL:!MD5:!3DES:!RC4:!EXPORT";

/// TLS 1.3 cipher suites
constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:"
    "TLS_CHACHA20_POLY1305_SHA256:"
    "TLS_AES_128_GCM_SHA256";

/// Supported key exchange groups (ECDHE)
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

/// Maximum plaintext bytes per SSL_write
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/// Certificate file name inside the certificate directory
constexpr const char* CERT_FILE = "certificate.pem";

/// Private key file name inside the certificate directory
constexpr const char* KEY_FILE = "private.pem";

/**
 * @brief Certificate validity period
 *
 * Self-signed identity certificates are regenerated on startup once expired.
 */
constexpr int CERT_VALIDITY_DAYS = 3650;

/// Organization written into generated certificates
constexpr const char* CERT_ORGANIZATION = "LanConnect";

/** @} */ // end of TLS

}  // namespace LanConnect
