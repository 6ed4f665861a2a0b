/**
 * @file NetUtils.h
 * @brief POSIX socket helpers shared by channels, discovery and transfers
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct sockaddr;

namespace LanConnect {

/// Value of a socket descriptor that is not open
constexpr int INVALID_SOCKET_FD = -1;

//=============================================================================
// Exact I/O
//=============================================================================

/**
 * @brief Send all bytes or fail
 * @param socket Connected socket
 * @param data Data to send
 * @param size Number of bytes
 * @param errorMsg Output error message
 * @return true if every byte was written
 *
 * Retries on EINTR and partial writes. Never raises SIGPIPE.
 */
bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Receive exactly size bytes or fail
 * @param socket Connected socket
 * @param buffer Output buffer
 * @param size Number of bytes
 * @param errorMsg Output error message ("Connection closed by peer" on EOF)
 * @return true if size bytes were read
 */
bool recvExact(int socket, uint8_t* buffer, size_t size, std::string& errorMsg);

/**
 * @brief Read one '\n'-terminated line without consuming bytes after it
 * @param socket Connected socket
 * @param maxLength Maximum line length (excluding the newline)
 * @param line Output line (newline stripped)
 * @param errorMsg Output error message
 * @return true if a complete line was read
 *
 * Peeks at the socket before consuming, so whatever follows the newline
 * (typically a TLS ClientHello) stays in the kernel buffer.
 */
bool recvLine(int socket, size_t maxLength, std::string& line, std::string& errorMsg);

//=============================================================================
// Socket Options
//=============================================================================

/**
 * @brief Set SO_RCVTIMEO and SO_SNDTIMEO
 * @param socket Socket
 * @param timeoutMs Timeout in milliseconds (0 = block forever)
 * @return true on success
 */
bool setSocketTimeouts(int socket, uint32_t timeoutMs);

/**
 * @brief Wait until the socket is readable
 * @return 1 when readable (or hung up), 0 on timeout, -1 on error
 */
int waitReadable(int socket, uint32_t timeoutMs);

/**
 * @brief Close a descriptor and reset it to INVALID_SOCKET_FD
 */
void closeSocket(int& socket);

//=============================================================================
// Connection Helpers
//=============================================================================

/**
 * @brief Resolve and connect with a bounded wait
 * @param host IPv4/IPv6 literal or hostname
 * @param port TCP port
 * @param timeoutMs Connect timeout
 * @param errorMsg Output error message
 * @return Connected blocking socket, or INVALID_SOCKET_FD
 */
int connectWithTimeout(const std::string& host, uint16_t port,
                       uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Bind and listen on the first free TCP port in [minPort, maxPort]
 * @param minPort First port to probe
 * @param maxPort Last port to probe (inclusive)
 * @param boundPort Output: the port that was bound
 * @param errorMsg Output error message
 * @return Listening socket, or INVALID_SOCKET_FD if every port is taken
 *
 * Ports are probed in ascending order and the first success wins.
 */
int bindTcpListenerInRange(uint16_t minPort, uint16_t maxPort,
                           uint16_t& boundPort, std::string& errorMsg);

/**
 * @brief Accept one connection, waiting at most timeoutMs
 * @param listenSocket Listening socket
 * @param timeoutMs Timeout (0 = wait forever)
 * @param clientSocket Output: accepted socket
 * @param peerHost Output: peer address as text
 * @param errorMsg Output error message
 * @return true if a connection was accepted
 */
bool acceptWithTimeout(int listenSocket, uint32_t timeoutMs,
                       int& clientSocket, std::string& peerHost,
                       std::string& errorMsg);

/**
 * @brief Format a socket address as text (IPv4-mapped IPv6 is unwrapped)
 */
std::string addressToString(const sockaddr* addr);

/**
 * @brief Local port of a bound socket, or 0
 */
uint16_t getLocalPort(int socket);

} // namespace LanConnect
