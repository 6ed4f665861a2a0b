/**
 * @file UuidGenerator.h
 * @brief UUID version 4 generation for device identifiers
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <openssl/rand.h>
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace LanConnect {

/**
 * @class UuidGenerator
 * @brief RFC 4122 version 4 UUIDs from the OpenSSL CSPRNG
 *
 * A fresh installation uses one as its deviceId. The dashes are replaced by
 * underscores in that role because KDE Connect peers expect deviceIds made of
 * [A-Za-z0-9_] only.
 */
class UuidGenerator {
public:
    /**
     * @brief Generate a random UUID v4
     * @return "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx", or empty if the RNG failed
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return {};
        }

        // RFC 4122 version 4
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        // RFC 4122 variant (10xx)
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return oss.str();
    }

    /**
     * @brief Generate a deviceId (UUID v4 with '_' separators)
     */
    static std::string generateDeviceId() {
        std::string id = generate();
        for (char& c : id) {
            if (c == '-') {
                c = '_';
            }
        }
        return id;
    }

private:
    UuidGenerator() = delete;
};

} // namespace LanConnect
