/**
 * @file HashUtils.cpp
 * @brief SHA-256 checksums using the OpenSSL EVP API
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/HashUtils.h"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace LanConnect {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

//=============================================================================
// Static Methods
//=============================================================================

bool HashUtils::computeStreamHash(std::istream& in,
                                  std::string& hexDigest,
                                  std::string& errorMsg) {
    const std::istream::pos_type start = in.tellg();

    IncrementalHash hash;
    std::vector<uint8_t> buffer(BUFFER_SIZE);
    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytesRead = in.gcount();
        if (bytesRead > 0 && !hash.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            errorMsg = "Failed to update SHA256 hash";
            return false;
        }
    }

    if (in.bad()) {
        errorMsg = "Error reading payload stream";
        return false;
    }

    hexDigest = hash.finalizeHex();
    if (hexDigest.empty()) {
        errorMsg = "Failed to finalize SHA256 hash";
        return false;
    }

    // Rewind for the actual transfer
    in.clear();
    if (start != std::istream::pos_type(-1)) {
        in.seekg(start);
    }
    return true;
}

std::string HashUtils::computeBufferHash(const uint8_t* data, size_t size) {
    IncrementalHash hash;
    hash.update(data, size);
    return hash.finalizeHex();
}

std::string HashUtils::hashToString(const unsigned char* hash) {
    if (!hash) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool HashUtils::stringToHash(const std::string& hexString, unsigned char* hash) {
    if (!hash || hexString.length() != HASH_SIZE * 2) {
        return false;
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hexValue(hexString[i * 2]);
        int lo = hexValue(hexString[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        hash[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return true;
}

bool HashUtils::digestsEqual(const std::string& hexA, const std::string& hexB) {
    unsigned char a[HASH_SIZE];
    unsigned char b[HASH_SIZE];
    if (!stringToHash(hexA, a) || !stringToHash(hexB, b)) {
        return false;
    }

    // Constant-time comparison
    int result = 0;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result |= a[i] ^ b[i];
    }
    return result == 0;
}

//=============================================================================
// IncrementalHash Class
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(nullptr), m_finalized(false)
{
    m_ctx = EVP_MD_CTX_new();
    reset();
}

HashUtils::IncrementalHash::~IncrementalHash() {
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_finalized(other.m_finalized)
{
    other.m_ctx = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }

        m_ctx = other.m_ctx;
        m_finalized = other.m_finalized;

        other.m_ctx = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size) {
    if (m_finalized || !m_ctx) {
        return false;
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    return EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(m_ctx), data, size) == 1;
}

std::string HashUtils::IncrementalHash::finalizeHex() {
    if (m_finalized || !m_ctx) {
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    const bool success =
        EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(m_ctx), digest, &digestLen) == 1;
    m_finalized = true;

    if (!success || digestLen != HASH_SIZE) {
        return "";
    }
    return hashToString(digest);
}

bool HashUtils::IncrementalHash::reset() {
    if (!m_ctx) {
        return false;
    }
    bool success = EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(m_ctx), EVP_sha256(), nullptr) == 1;
    m_finalized = false;
    return success;
}

} // namespace LanConnect
