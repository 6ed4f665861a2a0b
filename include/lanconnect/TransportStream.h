/**
 * @file TransportStream.h
 * @brief Byte stream abstraction over plain sockets and TLS sessions
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace LanConnect {

class TlsSocket;

/**
 * @brief Stream interface used by channels and transfers.
 *
 * A channel speaks plain TCP during the identity exchange and TLS afterwards;
 * payload transfers only ever see the TLS stream. This interface hides which
 * one is underneath.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    /**
     * @brief Read at most size bytes
     * @return Bytes read; 0 with empty errorMsg means end of stream
     */
    virtual size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    virtual void shutdown() {}
};

class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socket) : m_socket(socket) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void shutdown() override;

private:
    int m_socket;
};

class TlsTransportStream final : public TransportStream {
public:
    explicit TlsTransportStream(TlsSocket& tls) : m_tls(tls) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    size_t recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void shutdown() override;

private:
    TlsSocket& m_tls;
};

} // namespace LanConnect
