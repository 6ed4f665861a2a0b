/**
 * @file TlsSocket.h
 * @brief OpenSSL TLS wrapper over a connected TCP socket
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include <cstddef>
#include <cstdint>
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct ssl_st;
typedef struct ssl_st SSL;
struct x509_store_ctx_st;
typedef struct x509_store_ctx_st X509_STORE_CTX;

namespace LanConnect {

/**
 * @brief Side of the TLS handshake
 *
 * The peer that opened the TCP connection is the TLS client, the peer that
 * accepted it is the TLS server.
 */
enum class TlsRole {
    CLIENT,
    SERVER
};

/**
 * @brief Paths of the local certificate and private key (PEM)
 */
struct TlsCredentials {
    std::string certPath;
    std::string keyPath;
};

//=============================================================================
// TlsSocket Class
//=============================================================================

/**
 * @class TlsSocket
 * @brief TLS session over a socket the caller owns
 *
 * Both roles present a certificate and require one from the peer. Self-signed
 * certificates are accepted; the peer fingerprint is exposed so callers can
 * record or pin it.
 *
 * The socket descriptor is not closed by TlsSocket.
 *
 * Thread Safety:
 * - Not thread-safe; callers serialize send/recv on one instance
 */
class TlsSocket {
public:
    TlsSocket(int socket, TlsRole role, const TlsCredentials& credentials);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Run the TLS handshake in the configured role
     * @param errorMsg Output error message
     * @return true if the handshake completed and the peer sent a certificate
     */
    bool handshake(std::string& errorMsg);

    /**
     * @brief Write all bytes, split into TLS_MAX_PACKET_SIZE records
     */
    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Read whatever is available, up to size bytes
     * @return Bytes read; 0 with empty errorMsg on clean close, 0 with
     *         errorMsg set on error
     */
    size_t recv(uint8_t* buffer, size_t size, std::string& errorMsg);

    /**
     * @brief Decrypted bytes already buffered inside OpenSSL
     */
    bool hasPendingData() const;

    /**
     * @brief Send close_notify (does not close the socket)
     */
    void shutdown();

    bool isConnected() const { return m_connected; }
    TlsRole role() const { return m_role; }
    int socket() const { return m_socket; }

    /**
     * @brief SHA-256 fingerprint of the peer certificate
     * @return 64 uppercase hex characters, or empty on error
     */
    std::string getPeerFingerprint(std::string& errorMsg) const;

    /// Negotiated protocol ("TLSv1.3"), empty before the handshake
    std::string getProtocolVersion() const;

    /// Pop the most recent OpenSSL error as text
    static std::string getLastError();

    /// Name of an SSL_get_error() code
    static std::string getErrorDescription(int sslErrorCode);

private:
    bool createContext(std::string& errorMsg);
    bool configureVerification(std::string& errorMsg);
    bool loadCertificates(std::string& errorMsg);
    bool createSsl(std::string& errorMsg);
    std::string describeFailure(int result, const char* operation);
    void release();

    int m_socket;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    TlsCredentials m_credentials;
    bool m_connected;
};

/**
 * @brief Certificate verification callback (self-signed allowed)
 *
 * Accepts X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT and
 * X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN, rejects every other error.
 */
int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx);

} // namespace LanConnect
