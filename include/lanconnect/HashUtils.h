/**
 * @file HashUtils.h
 * @brief SHA-256 checksums for payload transfers
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <istream>
#include <string>

namespace LanConnect {

/**
 * @class HashUtils
 * @brief SHA-256 helpers (OpenSSL EVP) for payload integrity
 *
 * Payload checksums travel as 64 lowercase hex characters in
 * body.payloadHash.
 *
 * Thread Safety:
 * - Static methods keep no shared state
 */
class HashUtils {
public:
    /**
     * @brief Hash a stream from its current position to the end
     * @param in Input stream
     * @param hexDigest Output: lowercase hex digest
     * @param errorMsg Output error message
     * @return true on success
     *
     * The stream is rewound to where it started when it is seekable.
     */
    static bool computeStreamHash(std::istream& in,
                                  std::string& hexDigest,
                                  std::string& errorMsg);

    /**
     * @brief Hash a memory buffer
     * @return Lowercase hex digest
     */
    static std::string computeBufferHash(const uint8_t* data, size_t size);

    /**
     * @brief Binary digest (HASH_SIZE bytes) to lowercase hex
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Hex (either case) to binary digest
     * @return false if hexString is not 64 hex characters
     */
    static bool stringToHash(const std::string& hexString, unsigned char* hash);

    /**
     * @brief Constant-time comparison of two hex digests
     * @return true if both parse and are equal
     */
    static bool digestsEqual(const std::string& hexA, const std::string& hexB);

    /**
     * @brief SHA-256 computed incrementally while a payload streams
     */
    class IncrementalHash {
    public:
        IncrementalHash();
        ~IncrementalHash();

        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finish and return the lowercase hex digest
         * @return Digest, or empty string on failure or if already finalized
         */
        std::string finalizeHex();

        bool reset();

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

} // namespace LanConnect
