/**
 * @file TlsSocket.cpp
 * @brief OpenSSL TLS wrapper over a connected TCP socket
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/TlsSocket.h"
#include "lanconnect/CertificateManager.h"
#include <openssl/err.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace LanConnect {

namespace {

std::once_flag g_openSslInitFlag;

// OpenSSL writes through write(2), so a peer that vanished mid-write would
// raise SIGPIPE and kill the process.
void initOpenSsl() {
    std::call_once(g_openSslInitFlag, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        std::signal(SIGPIPE, SIG_IGN);
    });
}

std::string fingerprintOf(X509* cert, std::string& errorMsg) {
    unsigned char* der = nullptr;
    int derLen = i2d_X509(cert, &der);
    if (derLen < 0) {
        errorMsg = "Failed to encode certificate";
        return "";
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(der, static_cast<size_t>(derLen), hash);
    OPENSSL_free(der);

    // 64 uppercase hex, no separators
    std::string fingerprint;
    fingerprint.reserve(SHA256_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02X", hash[i]);
        fingerprint += buf;
    }
    return fingerprint;
}

} // anonymous namespace

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int socket, TlsRole role, const TlsCredentials& credentials)
    : m_socket(socket)
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_role(role)
    , m_credentials(credentials)
    , m_connected(false)
{
    initOpenSsl();
}

TlsSocket::~TlsSocket() {
    release();
}

void TlsSocket::release() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

bool TlsSocket::createContext(std::string& errorMsg) {
    const SSL_METHOD* method = (m_role == TlsRole::SERVER) ? TLS_server_method()
                                                           : TLS_client_method();

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION) != 1) {
        errorMsg = "Failed to set minimum TLS version: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_ciphersuites(m_ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_cipher_list(m_ctx, TLS_CIPHER_SUITE) != 1) {
        errorMsg = "Failed to set cipher list: " + getLastError();
        return false;
    }

    if (SSL_CTX_set1_groups_list(m_ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return false;
    }

    SSL_CTX_set_options(m_ctx,
        SSL_OP_NO_SSLv2 |
        SSL_OP_NO_SSLv3 |
        SSL_OP_NO_TLSv1 |
        SSL_OP_NO_TLSv1_1 |
        SSL_OP_NO_COMPRESSION |
        SSL_OP_IGNORE_UNEXPECTED_EOF);   // TCP FIN without close_notify reads as EOF

    // No resumption: every channel does a full mutual handshake. Without
    // tickets no post-handshake records can stall a reader holding the SSL.
    SSL_CTX_set_session_cache_mode(m_ctx, SSL_SESS_CACHE_OFF);
    if (m_role == TlsRole::SERVER) {
        SSL_CTX_set_num_tickets(m_ctx, 0);
    }

    return configureVerification(errorMsg);
}

bool TlsSocket::configureVerification(std::string& errorMsg) {
    (void)errorMsg;

    // Mutual authentication: both roles require a peer certificate
    int mode = SSL_VERIFY_PEER;
    if (m_role == TlsRole::SERVER) {
        mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    SSL_CTX_set_verify(m_ctx, mode, tlsVerifyCallback);
    SSL_CTX_set_verify_depth(m_ctx, 0);

    return true;
}

bool TlsSocket::loadCertificates(std::string& errorMsg) {
    if (m_credentials.certPath.empty() || m_credentials.keyPath.empty()) {
        errorMsg = "No TLS certificate configured";
        return false;
    }

    return CertificateManager::loadCertificate(m_ctx,
                                               m_credentials.certPath,
                                               m_credentials.keyPath,
                                               errorMsg);
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    if (SSL_set_fd(m_ssl, m_socket) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    return true;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    if (m_connected) {
        return true;
    }

    ERR_clear_error();

    // Step 1: Create SSL context
    if (!createContext(errorMsg)) {
        return false;
    }

    // Step 2: Load our certificate (both roles present one)
    if (!loadCertificates(errorMsg)) {
        return false;
    }

    // Step 3: Create SSL object
    if (!createSsl(errorMsg)) {
        return false;
    }

    // Step 4: Perform handshake
    int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        errorMsg = describeFailure(result, "TLS handshake");
        return false;
    }

    X509* peerCert = SSL_get_peer_certificate(m_ssl);
    if (!peerCert) {
        errorMsg = "TLS handshake succeeded but peer did not present a certificate";
        return false;
    }
    X509_free(peerCert);

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    if (!data || size == 0) {
        return true;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);
        int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));

        if (sent <= 0) {
            int err = SSL_get_error(m_ssl, sent);
            if (err == SSL_ERROR_WANT_WRITE) {
                continue;  // Retry
            }
            errorMsg = describeFailure(sent, "TLS send");
            return false;
        }

        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

size_t TlsSocket::recv(uint8_t* buffer, size_t size, std::string& errorMsg) {
    errorMsg.clear();

    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return 0;
    }

    if (!buffer || size == 0) {
        return 0;
    }

    while (true) {
        int received = SSL_read(m_ssl, buffer, static_cast<int>(std::min<size_t>(size, INT32_MAX)));
        if (received > 0) {
            return static_cast<size_t>(received);
        }

        int err = SSL_get_error(m_ssl, received);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;  // Clean close_notify
        }
        if (err == SSL_ERROR_WANT_READ) {
            continue;
        }

        errorMsg = describeFailure(received, "TLS recv");
        return 0;
    }
}

bool TlsSocket::hasPendingData() const {
    return m_ssl && SSL_pending(m_ssl) > 0;
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        // Unidirectional close_notify; the peer may already be gone
        SSL_shutdown(m_ssl);
        m_connected = false;
    }
}

//=============================================================================
// TlsSocket: Certificate Information
//=============================================================================

std::string TlsSocket::getPeerFingerprint(std::string& errorMsg) const {
    if (!m_ssl) {
        errorMsg = "TLS not connected";
        return "";
    }

    X509* cert = SSL_get_peer_certificate(m_ssl);
    if (!cert) {
        errorMsg = "No peer certificate";
        return "";
    }

    std::string fingerprint = fingerprintOf(cert, errorMsg);
    X509_free(cert);
    return fingerprint;
}

std::string TlsSocket::getProtocolVersion() const {
    if (!m_ssl || !m_connected) {
        return "";
    }
    return SSL_get_version(m_ssl);
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::describeFailure(int result, const char* operation) {
    const int savedErrno = errno;
    const int err = SSL_get_error(m_ssl, result);

    std::string details;
    const unsigned long opensslErr = ERR_get_error();
    if (opensslErr != 0) {
        char buf[256];
        ERR_error_string_n(opensslErr, buf, sizeof(buf));
        details = buf;
    } else if (err == SSL_ERROR_SYSCALL) {
        // Socket-level failure (or EOF) that OpenSSL did not queue
        details = savedErrno != 0 ? std::string(std::strerror(savedErrno))
                                  : std::string("peer closed the connection");
    } else {
        details = "no further details";
    }

    return std::string(operation) + " failed (" + getErrorDescription(err) + "): " + details;
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

//=============================================================================
// Certificate Verification Callback
//=============================================================================

int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx) {
    if (preverifyOk) {
        return 1;
    }

    // Peers use self-signed identity certificates; anything else is a real failure
    int err = X509_STORE_CTX_get_error(ctx);
    if (err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN ||
        err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT) {
        return 1;
    }
    return 0;
}

} // namespace LanConnect
