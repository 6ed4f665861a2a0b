/**
 * @file net_utils_test.cpp
 * @brief Unit tests for socket helpers: port range binding and line reads
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/NetUtils.h"
#include "lanconnect/config.h"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace LanConnect;

namespace {

constexpr uint16_t kRangeStart = 47100;
constexpr uint16_t kRangeEnd = 47120;

// Connected loopback pair built through a real listener
struct SocketPair {
    int client = INVALID_SOCKET_FD;
    int server = INVALID_SOCKET_FD;

    ~SocketPair() {
        closeSocket(client);
        closeSocket(server);
    }
};

bool makeSocketPair(SocketPair& pair, std::string& error) {
    uint16_t port = 0;
    int listener = bindTcpListenerInRange(kRangeStart + 15, kRangeEnd, port, error);
    if (listener == INVALID_SOCKET_FD) {
        return false;
    }

    pair.client = connectWithTimeout(LOCALHOST_IP, port, 2000, error);
    std::string peerHost;
    bool accepted = pair.client != INVALID_SOCKET_FD &&
                    acceptWithTimeout(listener, 2000, pair.server, peerHost, error);
    closeSocket(listener);
    return accepted;
}

} // namespace

//=============================================================================
// Port Range Binding
//=============================================================================

/**
 * @test With the first five ports taken the listener lands on the sixth
 */
TEST(NetUtilsTest, BindSkipsOccupiedPorts) {
    std::vector<int> occupied;
    std::string error;
    for (uint16_t port = kRangeStart; port < kRangeStart + 5; ++port) {
        uint16_t bound = 0;
        int sock = bindTcpListenerInRange(port, port, bound, error);
        ASSERT_NE(sock, INVALID_SOCKET_FD) << error;
        ASSERT_EQ(bound, port);
        occupied.push_back(sock);
    }

    uint16_t bound = 0;
    int sock = bindTcpListenerInRange(kRangeStart, kRangeStart + 10, bound, error);
    ASSERT_NE(sock, INVALID_SOCKET_FD) << error;
    EXPECT_EQ(bound, kRangeStart + 5);
    EXPECT_EQ(getLocalPort(sock), kRangeStart + 5);

    closeSocket(sock);
    for (int& s : occupied) {
        closeSocket(s);
    }
}

TEST(NetUtilsTest, BindFailsWhenRangeExhausted) {
    std::string error;
    uint16_t first = 0;
    uint16_t second = 0;
    int a = bindTcpListenerInRange(kRangeStart + 11, kRangeStart + 11, first, error);
    int b = bindTcpListenerInRange(kRangeStart + 12, kRangeStart + 12, second, error);
    ASSERT_NE(a, INVALID_SOCKET_FD);
    ASSERT_NE(b, INVALID_SOCKET_FD);

    uint16_t bound = 1234;
    error.clear();
    EXPECT_EQ(bindTcpListenerInRange(kRangeStart + 11, kRangeStart + 12, bound, error),
              INVALID_SOCKET_FD);
    EXPECT_EQ(bound, 0);
    EXPECT_NE(error.find("No free TCP port"), std::string::npos);

    closeSocket(a);
    closeSocket(b);
}

TEST(NetUtilsTest, AcceptTimesOut) {
    std::string error;
    uint16_t port = 0;
    int listener = bindTcpListenerInRange(kRangeStart + 13, kRangeStart + 13, port, error);
    ASSERT_NE(listener, INVALID_SOCKET_FD) << error;

    int client = INVALID_SOCKET_FD;
    std::string peerHost;
    EXPECT_FALSE(acceptWithTimeout(listener, 50, client, peerHost, error));
    EXPECT_EQ(error, "Timed out waiting for connection");
    EXPECT_EQ(client, INVALID_SOCKET_FD);

    closeSocket(listener);
}

TEST(NetUtilsTest, ConnectToClosedPortFails) {
    std::string error;
    uint16_t port = 0;
    int listener = bindTcpListenerInRange(kRangeStart + 14, kRangeStart + 14, port, error);
    ASSERT_NE(listener, INVALID_SOCKET_FD) << error;
    closeSocket(listener);

    EXPECT_EQ(connectWithTimeout(LOCALHOST_IP, port, 1000, error), INVALID_SOCKET_FD);
    EXPECT_FALSE(error.empty());
}

//=============================================================================
// Line Reads
//=============================================================================

/**
 * @test recvLine stops at the newline and leaves the rest unread
 */
TEST(NetUtilsTest, RecvLineLeavesTrailingBytes) {
    SocketPair pair;
    std::string error;
    ASSERT_TRUE(makeSocketPair(pair, error)) << error;

    const std::string wire = "{\"type\":\"x\"}\r\nTLS-BYTES";
    ASSERT_TRUE(sendExact(pair.client, reinterpret_cast<const uint8_t*>(wire.data()), wire.size(), error));

    std::string line;
    ASSERT_TRUE(recvLine(pair.server, MAX_PACKET_SIZE, line, error)) << error;
    EXPECT_EQ(line, "{\"type\":\"x\"}");

    uint8_t rest[9] = {};
    ASSERT_TRUE(recvExact(pair.server, rest, sizeof(rest), error)) << error;
    EXPECT_EQ(std::string(reinterpret_cast<char*>(rest), sizeof(rest)), "TLS-BYTES");
}

TEST(NetUtilsTest, RecvLineAssemblesSplitWrites) {
    SocketPair pair;
    std::string error;
    ASSERT_TRUE(makeSocketPair(pair, error)) << error;

    std::thread writer([&pair]() {
        std::string err;
        const std::string first = "hello ";
        const std::string second = "world\n";
        sendExact(pair.client, reinterpret_cast<const uint8_t*>(first.data()), first.size(), err);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sendExact(pair.client, reinterpret_cast<const uint8_t*>(second.data()), second.size(), err);
    });

    std::string line;
    EXPECT_TRUE(recvLine(pair.server, MAX_PACKET_SIZE, line, error)) << error;
    EXPECT_EQ(line, "hello world");
    writer.join();
}

TEST(NetUtilsTest, RecvLineRejectsOverlongLine) {
    SocketPair pair;
    std::string error;
    ASSERT_TRUE(makeSocketPair(pair, error)) << error;

    const std::string wire(64, 'a');
    ASSERT_TRUE(sendExact(pair.client, reinterpret_cast<const uint8_t*>(wire.data()), wire.size(), error));

    std::string line;
    EXPECT_FALSE(recvLine(pair.server, 16, line, error));
    EXPECT_NE(error.find("exceeds"), std::string::npos);
}

TEST(NetUtilsTest, RecvLineReportsPeerClose) {
    SocketPair pair;
    std::string error;
    ASSERT_TRUE(makeSocketPair(pair, error)) << error;

    const std::string partial = "no newline";
    ASSERT_TRUE(sendExact(pair.client, reinterpret_cast<const uint8_t*>(partial.data()), partial.size(), error));
    closeSocket(pair.client);

    std::string line;
    EXPECT_FALSE(recvLine(pair.server, MAX_PACKET_SIZE, line, error));
    EXPECT_EQ(error, "Connection closed by peer");
}

//=============================================================================
// Addresses
//=============================================================================

TEST(NetUtilsTest, AddressToStringUnwrapsMappedIpv4) {
    sockaddr_in6 mapped{};
    mapped.sin6_family = AF_INET6;
    ASSERT_EQ(inet_pton(AF_INET6, "::ffff:192.168.1.20", &mapped.sin6_addr), 1);
    EXPECT_EQ(addressToString(reinterpret_cast<sockaddr*>(&mapped)), "192.168.1.20");

    sockaddr_in v4{};
    v4.sin_family = AF_INET;
    ASSERT_EQ(inet_pton(AF_INET, "10.0.0.9", &v4.sin_addr), 1);
    EXPECT_EQ(addressToString(reinterpret_cast<sockaddr*>(&v4)), "10.0.0.9");

    EXPECT_EQ(addressToString(nullptr), "");
}
