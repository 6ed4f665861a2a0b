/**
 * @file IpValidator.h
 * @brief Syntactic validation of peer addresses
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <string>

namespace LanConnect {

/**
 * @brief Check whether text is an IPv4 address, an IPv6 address or a hostname
 * @param text Candidate address
 * @return true if text matches one of the three grammars
 *
 * Accepted forms:
 * - IPv4 dotted quad, each octet 0-255 without leading zeros ("192.168.1.5")
 * - IPv6 in full, compressed or IPv4-embedded notation, with an optional
 *   "%zone" suffix ("fe80::1%eth0"); surrounding whitespace is tolerated
 * - DNS hostname made of letter-led labels ("my-laptop.local")
 *
 * Pure function: no resolution, no I/O. Never throws.
 */
bool isValidAddress(const std::string& text) noexcept;

} // namespace LanConnect
