/**
 * @file TransportStream.cpp
 * @brief Plain and TLS stream implementations
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/TransportStream.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/TlsSocket.h"
#include <sys/socket.h>
#include <cerrno>
#include <cstring>

namespace LanConnect {

//=============================================================================
// PlainSocketStream
//=============================================================================

bool PlainSocketStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return LanConnect::sendExact(m_socket, data, size, errorMsg);
}

size_t PlainSocketStream::recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) {
    errorMsg.clear();
    if (!buffer || size == 0) {
        return 0;
    }

    while (true) {
        ssize_t received = ::recv(m_socket, buffer, size, 0);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        errorMsg = std::string("recv failed: ") + std::strerror(errno);
        return 0;
    }
}

void PlainSocketStream::shutdown() {
    ::shutdown(m_socket, SHUT_WR);
}

//=============================================================================
// TlsTransportStream
//=============================================================================

bool TlsTransportStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return m_tls.sendExact(data, size, errorMsg);
}

size_t TlsTransportStream::recvSome(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return m_tls.recv(buffer, size, errorMsg);
}

void TlsTransportStream::shutdown() {
    m_tls.shutdown();
}

} // namespace LanConnect
