/**
 * @file ErrorCodes.h
 * @brief Stable error categories written into log lines.
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 *
 * Every contained failure is logged as "<code> <message>" so operators can
 * grep for one category. Codes are stable across versions.
 */

#pragma once

namespace LanConnect {
namespace ErrorCodes {

// No free port in a scanned range (control listener or transfer)
inline constexpr const char* BIND_EXHAUSTED = "LC-BIND-1000";
// Undecodable datagram or channel line, or identity without deviceId
inline constexpr const char* MALFORMED_PACKET = "LC-PKT-1100";
// Peer refused by admission
inline constexpr const char* UNAUTHORIZED = "LC-AUTH-1200";
// Connect, identity exchange or TLS failure
inline constexpr const char* HANDSHAKE_FAILURE = "LC-CHAN-1300";
// Payload transfer I/O error, short read or checksum mismatch
inline constexpr const char* TRANSFER_IO = "LC-XFER-1400";

}  // namespace ErrorCodes
}  // namespace LanConnect
