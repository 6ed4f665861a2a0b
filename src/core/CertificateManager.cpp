/**
 * @file CertificateManager.cpp
 * @brief Identity certificate generation and loading
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/CertificateManager.h"
#include "lanconnect/Debug.h"
#include "lanconnect/ThreadSafeLog.h"
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace LanConnect {

namespace {

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
struct X509Deleter { void operator()(X509* x) const { X509_free(x); } };
struct PkeyDeleter { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

X509Ptr readCertificate(const std::string& certPath, std::string& errorMsg) {
    BioPtr bio(BIO_new_file(certPath.c_str(), "r"));
    if (!bio) {
        errorMsg = "Failed to open certificate file: " + certPath;
        return nullptr;
    }

    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        errorMsg = "Failed to read certificate: " + certPath;
    }
    return cert;
}

bool addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    return X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                      reinterpret_cast<const unsigned char*>(value.c_str()),
                                      static_cast<int>(value.length()), -1, 0) == 1;
}

} // anonymous namespace

//=============================================================================
// Paths
//=============================================================================

std::string CertificateManager::getCertFilePath(const std::string& certDir) {
    return (std::filesystem::path(certDir) / CERT_FILE).string();
}

std::string CertificateManager::getKeyFilePath(const std::string& certDir) {
    return (std::filesystem::path(certDir) / KEY_FILE).string();
}

bool CertificateManager::ensureCertDir(const std::string& certDir, std::string& errorMsg) {
    std::error_code ec;
    std::filesystem::path dir(certDir.empty() ? "." : certDir);

    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            errorMsg = "Certificate path exists but is not a directory: " + dir.string();
            return false;
        }
        return true;
    }

    if (!std::filesystem::create_directories(dir, ec) || ec) {
        errorMsg = "Failed to create certificate directory " + dir.string() + ": " + ec.message();
        return false;
    }

    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    return true;
}

bool CertificateManager::certificateExists(const std::string& certPath) {
    std::error_code ec;
    return std::filesystem::is_regular_file(certPath, ec);
}

bool CertificateManager::ensureCertificateExists(const std::string& certDir,
                                                 const std::string& commonName,
                                                 TlsCredentials& credentials,
                                                 std::string& errorMsg) {
    credentials.certPath = getCertFilePath(certDir);
    credentials.keyPath = getKeyFilePath(certDir);

    if (certificateExists(credentials.certPath) && certificateExists(credentials.keyPath)) {
        std::string checkError;
        const bool expired = isCertificateExpired(credentials.certPath, checkError);
        const std::string cn = getCertificateCommonName(credentials.certPath, checkError);

        if (!expired && cn == commonName) {
            return true;
        }

        LOG_INFO("[Certificate] Regenerating certificate ("
                 << (expired ? "expired" : "common name changed") << ")");
    }

    if (!generateSelfSignedCert(credentials.certPath, credentials.keyPath, commonName, errorMsg)) {
        return false;
    }

    ThreadSafeLog::log("CERT: generated identity certificate for " + commonName);
    return true;
}

//=============================================================================
// Certificate Generation
//=============================================================================

bool CertificateManager::generateSelfSignedCert(const std::string& certPath,
                                                const std::string& keyPath,
                                                const std::string& commonName,
                                                std::string& errorMsg) {
    if (commonName.empty()) {
        errorMsg = "Certificate common name is empty";
        return false;
    }

    if (!ensureCertDir(std::filesystem::path(certPath).parent_path().string(), errorMsg)) {
        return false;
    }

    // RSA 2048-bit key pair
    PkeyCtxPtr pkeyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!pkeyCtx || EVP_PKEY_keygen_init(pkeyCtx.get()) <= 0) {
        errorMsg = "Failed to initialize key generation";
        return false;
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pkeyCtx.get(), 2048) <= 0) {
        errorMsg = "Failed to set RSA key size";
        return false;
    }

    EVP_PKEY* rawKey = nullptr;
    if (EVP_PKEY_keygen(pkeyCtx.get(), &rawKey) <= 0) {
        errorMsg = "Failed to generate RSA key";
        return false;
    }
    PkeyPtr pkey(rawKey);

    X509Ptr cert(X509_new());
    if (!cert || X509_set_version(cert.get(), 2) != 1) {
        errorMsg = "Failed to create X.509 v3 certificate";
        return false;
    }

    // Random positive 63-bit serial
    uint64_t serial = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
        errorMsg = "Failed to generate certificate serial";
        return false;
    }
    serial &= 0x7FFFFFFFFFFFFFFFULL;
    ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial == 0 ? 1 : serial);

    // Backdate a day so peers with skewed clocks accept it immediately
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -24L * 60 * 60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                    static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60);

    if (X509_set_pubkey(cert.get(), pkey.get()) != 1) {
        errorMsg = "Failed to set public key";
        return false;
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (!name ||
        !addNameEntry(name, "CN", commonName) ||
        !addNameEntry(name, "O", CERT_ORGANIZATION) ||
        !addNameEntry(name, "OU", CERT_ORGANIZATION)) {
        errorMsg = "Failed to set certificate subject";
        return false;
    }

    // Self-signed: issuer = subject
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        errorMsg = "Failed to set issuer name";
        return false;
    }

    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
        errorMsg = "Failed to sign certificate";
        return false;
    }

    BioPtr keyBio(BIO_new_file(keyPath.c_str(), "w"));
    if (!keyBio) {
        errorMsg = "Failed to create key file: " + keyPath;
        return false;
    }

    // Restrict before the key material is written
    std::error_code ec;
    std::filesystem::permissions(keyPath,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);

    if (PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        errorMsg = "Failed to write private key";
        return false;
    }

    BioPtr certBio(BIO_new_file(certPath.c_str(), "w"));
    if (!certBio) {
        errorMsg = "Failed to create certificate file: " + certPath;
        return false;
    }

    if (PEM_write_bio_X509(certBio.get(), cert.get()) != 1) {
        errorMsg = "Failed to write certificate";
        return false;
    }

    return true;
}

//=============================================================================
// Certificate Loading
//=============================================================================

bool CertificateManager::loadCertificate(SSL_CTX* ctx,
                                         const std::string& certPath,
                                         const std::string& keyPath,
                                         std::string& errorMsg) {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }

    if (SSL_CTX_use_certificate_file(ctx, certPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load certificate: " + certPath;
        return false;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load private key: " + keyPath;
        return false;
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        return false;
    }

    return true;
}

//=============================================================================
// Certificate Information
//=============================================================================

std::string CertificateManager::getCertificateFingerprint(const std::string& certPath,
                                                          std::string& errorMsg) {
    X509Ptr cert = readCertificate(certPath, errorMsg);
    if (!cert) {
        return "";
    }

    unsigned char* der = nullptr;
    int derLen = i2d_X509(cert.get(), &der);
    if (derLen < 0) {
        errorMsg = "Failed to encode certificate";
        return "";
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(der, static_cast<size_t>(derLen), hash);
    OPENSSL_free(der);

    std::string fingerprint;
    fingerprint.reserve(SHA256_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02X", hash[i]);
        fingerprint += buf;
    }
    return fingerprint;
}

std::string CertificateManager::getCertificateCommonName(const std::string& certPath,
                                                         std::string& errorMsg) {
    X509Ptr cert = readCertificate(certPath, errorMsg);
    if (!cert) {
        return "";
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    char cnBuffer[256];
    int cnLen = name ? X509_NAME_get_text_by_NID(name, NID_commonName,
                                                 cnBuffer, sizeof(cnBuffer))
                     : -1;
    if (cnLen <= 0) {
        errorMsg = "No common name in certificate";
        return "";
    }

    return std::string(cnBuffer, static_cast<size_t>(cnLen));
}

bool CertificateManager::isCertificateExpired(const std::string& certPath,
                                              std::string& errorMsg) {
    X509Ptr cert = readCertificate(certPath, errorMsg);
    if (!cert) {
        return true;  // Treat unreadable as expired
    }

    return X509_cmp_current_time(X509_get0_notAfter(cert.get())) < 0;
}

} // namespace LanConnect
