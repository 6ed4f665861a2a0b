/**
 * @file CertificateManager.h
 * @brief Identity certificate generation and loading
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "TlsSocket.h"
#include <string>

namespace LanConnect {

//=============================================================================
// CertificateManager Class
//=============================================================================

/**
 * @class CertificateManager
 * @brief Manages the self-signed certificate that identifies this device
 *
 * Every device presents a self-signed certificate whose common name is its
 * deviceId. The certificate and private key live as PEM files in the
 * configured certificate directory (CERT_FILE and KEY_FILE).
 *
 * Usage:
 * @code
 * TlsCredentials creds;
 * std::string error;
 * if (!CertificateManager::ensureCertificateExists(certDir, deviceId, creds, error)) {
 *     LOG_ERROR("Certificate unavailable: " << error);
 *     return 1;
 * }
 * @endcode
 */
class CertificateManager {
public:
    //=========================================================================
    // Certificate Generation
    //=========================================================================

    /**
     * @brief Generate a self-signed certificate
     * @param certPath Output path for the certificate (PEM)
     * @param keyPath Output path for the private key (PEM, mode 0600)
     * @param commonName Subject and issuer CN
     * @param errorMsg Output error message on failure
     * @return true if both files were written
     *
     * RSA 2048 key, X.509 v3, SHA-256 signature, random serial,
     * valid for CERT_VALIDITY_DAYS.
     */
    static bool generateSelfSignedCert(const std::string& certPath,
                                       const std::string& keyPath,
                                       const std::string& commonName,
                                       std::string& errorMsg);

    /**
     * @brief Make sure a valid certificate for commonName exists in certDir
     * @param certDir Certificate directory (created if missing)
     * @param commonName Expected CN (the local deviceId)
     * @param credentials Output: paths of the certificate and key
     * @param errorMsg Output error message
     * @return true if the certificate exists or was (re)generated
     *
     * Regenerates when either file is missing, the certificate has expired
     * or its CN no longer matches commonName.
     */
    static bool ensureCertificateExists(const std::string& certDir,
                                        const std::string& commonName,
                                        TlsCredentials& credentials,
                                        std::string& errorMsg);

    //=========================================================================
    // Certificate Loading
    //=========================================================================

    /**
     * @brief Load certificate and private key into an SSL context
     * @return true if both loaded and the key matches the certificate
     */
    static bool loadCertificate(SSL_CTX* ctx,
                                const std::string& certPath,
                                const std::string& keyPath,
                                std::string& errorMsg);

    /**
     * @brief Check if a regular file exists at certPath
     */
    static bool certificateExists(const std::string& certPath);

    //=========================================================================
    // Paths
    //=========================================================================

    static std::string getCertFilePath(const std::string& certDir);
    static std::string getKeyFilePath(const std::string& certDir);

    //=========================================================================
    // Certificate Information
    //=========================================================================

    /**
     * @brief SHA-256 fingerprint of the certificate's DER encoding
     * @return 64 uppercase hex characters, or empty on error
     */
    static std::string getCertificateFingerprint(const std::string& certPath,
                                                 std::string& errorMsg);

    /**
     * @brief Subject common name, or empty on error
     */
    static std::string getCertificateCommonName(const std::string& certPath,
                                                std::string& errorMsg);

    /**
     * @brief Check whether notAfter has passed
     * @return true if expired or unreadable
     */
    static bool isCertificateExpired(const std::string& certPath,
                                     std::string& errorMsg);

private:
    static bool ensureCertDir(const std::string& certDir, std::string& errorMsg);
};

} // namespace LanConnect
