/**
 * @file NetUtils.cpp
 * @brief POSIX socket helpers shared by channels, discovery and transfers
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/NetUtils.h"
#include "lanconnect/config.h"
#include "lanconnect/Debug.h"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace LanConnect {

namespace {

std::string errnoString(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

bool setBlocking(int socket, bool blocking) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) == 0;
}

} // anonymous namespace

//=============================================================================
// Exact I/O
//=============================================================================

bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!data || size == 0) {
        return true;  // Nothing to send
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        ssize_t sent = ::send(socket, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "send failed: " + errnoString(errno);
            return false;
        }
        if (sent == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

bool recvExact(int socket, uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!buffer || size == 0) {
        return true;  // Nothing to receive
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        ssize_t received = ::recv(socket, buffer + totalReceived, size - totalReceived, 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "recv failed: " + errnoString(errno);
            return false;
        }
        if (received == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        totalReceived += static_cast<size_t>(received);
    }

    return true;
}

bool recvLine(int socket, size_t maxLength, std::string& line, std::string& errorMsg) {
    line.clear();
    std::vector<char> buffer(4096);

    while (true) {
        ssize_t peeked = ::recv(socket, buffer.data(), buffer.size(), MSG_PEEK);
        if (peeked < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = "recv failed: " + errnoString(errno);
            return false;
        }
        if (peeked == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }

        // Consume up to and including the newline, or everything peeked when
        // there is none yet (those bytes all belong to the line).
        const char* begin = buffer.data();
        const char* end = begin + peeked;
        const char* newline = std::find(begin, end, '\n');
        const bool complete = newline != end;
        const size_t take = complete ? static_cast<size_t>(newline - begin) + 1
                                     : static_cast<size_t>(peeked);

        std::string consumedError;
        if (!recvExact(socket, reinterpret_cast<uint8_t*>(buffer.data()), take, consumedError)) {
            errorMsg = consumedError;
            return false;
        }

        line.append(buffer.data(), complete ? take - 1 : take);
        if (line.size() > maxLength) {
            errorMsg = "Line exceeds " + std::to_string(maxLength) + " bytes";
            return false;
        }

        if (complete) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
    }
}

//=============================================================================
// Socket Options
//=============================================================================

bool setSocketTimeouts(int socket, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);

    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        return false;
    }
    if (setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return false;
    }
    return true;
}

int waitReadable(int socket, uint32_t timeoutMs) {
    pollfd pfd{};
    pfd.fd = socket;
    pfd.events = POLLIN;

    while (true) {
        int result = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        if (result == 0) {
            return 0;
        }
        if (pfd.revents & POLLNVAL) {
            return -1;
        }
        return 1;  // POLLIN, POLLHUP and POLLERR all make the next read return
    }
}

void closeSocket(int& socket) {
    if (socket != INVALID_SOCKET_FD) {
        ::close(socket);
        socket = INVALID_SOCKET_FD;
    }
}

//=============================================================================
// Connection Helpers
//=============================================================================

int connectWithTimeout(const std::string& host, uint16_t port,
                       uint32_t timeoutMs, std::string& errorMsg) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || !results) {
        errorMsg = "Cannot resolve " + host + ": " + gai_strerror(rc);
        return INVALID_SOCKET_FD;
    }

    int connected = INVALID_SOCKET_FD;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int sock = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock < 0) {
            errorMsg = "socket() failed: " + errnoString(errno);
            continue;
        }

        if (!setBlocking(sock, false)) {
            errorMsg = "Failed to set non-blocking mode";
            ::close(sock);
            continue;
        }

        rc = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            errorMsg = "connect to " + host + ":" + service + " failed: " + errnoString(errno);
            ::close(sock);
            continue;
        }

        if (rc != 0) {
            pollfd pfd{};
            pfd.fd = sock;
            pfd.events = POLLOUT;

            int ready;
            do {
                ready = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
            } while (ready < 0 && errno == EINTR);

            if (ready <= 0) {
                errorMsg = "connect to " + host + ":" + service + " timed out";
                ::close(sock);
                continue;
            }

            int soError = 0;
            socklen_t len = sizeof(soError);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                errorMsg = "connect to " + host + ":" + service + " failed: " + errnoString(soError);
                ::close(sock);
                continue;
            }
        }

        if (!setBlocking(sock, true)) {
            errorMsg = "Failed to restore blocking mode";
            ::close(sock);
            continue;
        }

        connected = sock;
        break;
    }

    freeaddrinfo(results);
    return connected;
}

int bindTcpListenerInRange(uint16_t minPort, uint16_t maxPort,
                           uint16_t& boundPort, std::string& errorMsg) {
    boundPort = 0;

    for (uint32_t port = minPort; port <= maxPort; ++port) {
        int sock = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
        if (sock < 0) {
            errorMsg = "socket() failed: " + errnoString(errno);
            return INVALID_SOCKET_FD;
        }

        int reuse = 1;
        (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in localAddr{};
        localAddr.sin_family = AF_INET;
        localAddr.sin_addr.s_addr = htonl(INADDR_ANY);
        localAddr.sin_port = htons(static_cast<uint16_t>(port));

        if (::bind(sock, reinterpret_cast<sockaddr*>(&localAddr), sizeof(localAddr)) == 0 &&
            ::listen(sock, LISTEN_BACKLOG) == 0) {
            boundPort = static_cast<uint16_t>(port);
            return sock;
        }

        const int err = errno;
        ::close(sock);
        LOG_DEBUG("[NetUtils] TCP port " << port << " unavailable (" << errnoString(err)
                  << "), trying next");
    }

    errorMsg = "No free TCP port in range " + std::to_string(minPort) + "-" +
               std::to_string(maxPort);
    return INVALID_SOCKET_FD;
}

bool acceptWithTimeout(int listenSocket, uint32_t timeoutMs,
                       int& clientSocket, std::string& peerHost,
                       std::string& errorMsg) {
    clientSocket = INVALID_SOCKET_FD;

    if (timeoutMs > 0) {
        int ready = waitReadable(listenSocket, timeoutMs);
        if (ready == 0) {
            errorMsg = "Timed out waiting for connection";
            return false;
        }
        if (ready < 0) {
            errorMsg = "poll failed on listening socket";
            return false;
        }
    }

    sockaddr_storage clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);

    int sock;
    do {
        sock = ::accept4(listenSocket, reinterpret_cast<sockaddr*>(&clientAddr),
                         &addrLen, SOCK_CLOEXEC);
    } while (sock < 0 && errno == EINTR);

    if (sock < 0) {
        errorMsg = "accept failed: " + errnoString(errno);
        return false;
    }

    clientSocket = sock;
    peerHost = addressToString(reinterpret_cast<sockaddr*>(&clientAddr));
    return true;
}

std::string addressToString(const sockaddr* addr) {
    if (!addr) {
        return {};
    }

    char buffer[INET6_ADDRSTRLEN] = {0};

    if (addr->sa_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in4->sin_addr, buffer, sizeof(buffer));
        return buffer;
    }

    if (addr->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
            in_addr v4{};
            std::memcpy(&v4, &in6->sin6_addr.s6_addr[12], sizeof(v4));
            inet_ntop(AF_INET, &v4, buffer, sizeof(buffer));
            return buffer;
        }
        inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer));
        return buffer;
    }

    return {};
}

uint16_t getLocalPort(int socket) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }

    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace LanConnect
