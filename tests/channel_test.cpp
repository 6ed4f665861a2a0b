/**
 * @file channel_test.cpp
 * @brief Loopback tests for the identity exchange, TLS upgrade and packet I/O
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Channel.h"
#include "lanconnect/CertificateManager.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/config.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>

using namespace LanConnect;
using namespace LanConnect::TestSupport;

namespace {

constexpr uint16_t kMinPort = 47200;
constexpr uint16_t kMaxPort = 47220;

} // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

class ChannelTest : public ::testing::Test {
protected:
    TempDir clientDir{"lanconnect_channel_client"};
    TempDir serverDir{"lanconnect_channel_server"};
    LocalIdentity clientIdentity;
    LocalIdentity serverIdentity;

    void SetUp() override {
        clientIdentity = makeLocalIdentity("client_dev", clientDir.path());
        serverIdentity = makeLocalIdentity("server_dev", serverDir.path(), 1750);
    }

    /**
     * @brief Connect a raw socket to a server channel and send one line
     * @return Result of the server-side accept()
     */
    bool acceptRawLine(const std::string& line, std::string& serverError) {
        uint16_t port = 0;
        std::string error;
        int listener = bindTcpListenerInRange(kMinPort, kMaxPort, port, error);
        EXPECT_NE(listener, INVALID_SOCKET_FD) << error;
        if (listener == INVALID_SOCKET_FD) {
            return false;
        }

        Channel server(serverIdentity, ChannelRole::SERVER);
        bool accepted = false;
        std::thread acceptor([&]() {
            int sock = INVALID_SOCKET_FD;
            std::string peerHost;
            if (acceptWithTimeout(listener, 5000, sock, peerHost, serverError)) {
                accepted = server.accept(sock, peerHost, serverError);
            }
        });

        int raw = connectWithTimeout(LOCALHOST_IP, port, 2000, error);
        if (raw != INVALID_SOCKET_FD) {
            sendExact(raw, reinterpret_cast<const uint8_t*>(line.data()), line.size(), error);
        }
        acceptor.join();

        EXPECT_TRUE(server.isClosed() || accepted);
        closeSocket(raw);
        closeSocket(listener);
        return accepted;
    }
};

//=============================================================================
// Handshake
//=============================================================================

/**
 * @test Both ends learn the other's identity and where it can be reached
 */
TEST_F(ChannelTest, HandshakeExchangesIdentities) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    EXPECT_EQ(pair.client->state(), ChannelState::ENCRYPTED);
    EXPECT_EQ(pair.server->state(), ChannelState::ENCRYPTED);

    // The client records the address it dialled
    EXPECT_EQ(pair.client->remoteDeviceId(), "server_dev");
    EXPECT_EQ(pair.client->identity().bodyString("tcpHost"), LOCALHOST_IP);
    EXPECT_EQ(pair.client->identity().bodyInt("tcpPort"), pair.port);

    // The server falls back to the default port when none was announced
    EXPECT_EQ(pair.server->remoteDeviceId(), "client_dev");
    EXPECT_EQ(pair.server->identity().bodyString("tcpHost"), LOCALHOST_IP);
    EXPECT_EQ(pair.server->identity().bodyInt("tcpPort"), DEFAULT_TCP_PORT);
    EXPECT_EQ(pair.server->identity().bodyString("deviceName"), "client_dev name");
}

TEST_F(ChannelTest, ServerKeepsAnnouncedPort) {
    clientIdentity.tcpPort = 1725;

    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    EXPECT_EQ(pair.server->identity().bodyInt("tcpPort"), 1725);
}

TEST_F(ChannelTest, PeerFingerprintMatchesCertificate) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    EXPECT_EQ(pair.client->peerCertificateFingerprint(),
              CertificateManager::getCertificateFingerprint(serverIdentity.credentials.certPath, error));
    EXPECT_EQ(pair.server->peerCertificateFingerprint(),
              CertificateManager::getCertificateFingerprint(clientIdentity.credentials.certPath, error));
}

/**
 * @test A peer answering with another deviceId than announced is refused
 */
TEST_F(ChannelTest, ExpectedIdentityMismatchFails) {
    uint16_t port = 0;
    std::string error;
    int listener = bindTcpListenerInRange(kMinPort, kMaxPort, port, error);
    ASSERT_NE(listener, INVALID_SOCKET_FD) << error;

    Channel server(serverIdentity, ChannelRole::SERVER);
    std::thread acceptor([&]() {
        int sock = INVALID_SOCKET_FD;
        std::string peerHost;
        std::string serverError;
        if (acceptWithTimeout(listener, 5000, sock, peerHost, serverError)) {
            server.accept(sock, peerHost, serverError);
        }
    });

    Channel client(clientIdentity, ChannelRole::CLIENT);
    client.setExpectedIdentity(Packet::makeIdentity("someone_else", "x", "phone", 1716));
    EXPECT_FALSE(client.open(LOCALHOST_IP, port, error));
    EXPECT_NE(error.find("expected someone_else"), std::string::npos) << error;
    EXPECT_TRUE(client.isClosed());

    acceptor.join();
    EXPECT_TRUE(server.isClosed());
    closeSocket(listener);
}

TEST_F(ChannelTest, RejectsNonIdentityFirstLine) {
    std::string serverError;
    EXPECT_FALSE(acceptRawLine(R"({"body":{},"id":1,"type":"kdeconnect.ping"})" "\n", serverError));
    EXPECT_NE(serverError.find("Expected identity"), std::string::npos) << serverError;
}

TEST_F(ChannelTest, RejectsIdentityWithoutDeviceId) {
    std::string serverError;
    EXPECT_FALSE(acceptRawLine(R"({"body":{"deviceName":"x"},"id":1,"type":"kdeconnect.identity"})" "\n",
                               serverError));
    EXPECT_NE(serverError.find("no deviceId"), std::string::npos) << serverError;
}

TEST_F(ChannelTest, RejectsMalformedIdentity) {
    std::string serverError;
    EXPECT_FALSE(acceptRawLine("definitely not json\n", serverError));
    EXPECT_NE(serverError.find("Malformed identity"), std::string::npos) << serverError;
}

TEST_F(ChannelTest, OpenToClosedPortFails) {
    uint16_t port = 0;
    std::string error;
    int listener = bindTcpListenerInRange(kMinPort, kMaxPort, port, error);
    ASSERT_NE(listener, INVALID_SOCKET_FD) << error;
    closeSocket(listener);

    Channel client(clientIdentity, ChannelRole::CLIENT);
    EXPECT_FALSE(client.open(LOCALHOST_IP, port, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(client.state(), ChannelState::CLOSED);

    // A closed channel never reopens
    EXPECT_FALSE(client.open(LOCALHOST_IP, port, error));
}

TEST_F(ChannelTest, ServerRoleCannotOpen) {
    Channel server(serverIdentity, ChannelRole::SERVER);
    std::string error;
    EXPECT_FALSE(server.open(LOCALHOST_IP, kMinPort, error));
    EXPECT_EQ(server.state(), ChannelState::UNCONNECTED);
}

//=============================================================================
// Attachment
//=============================================================================

TEST_F(ChannelTest, AttachRequiresEncryptedChannel) {
    Channel fresh(clientIdentity, ChannelRole::CLIENT);
    std::string error;
    EXPECT_FALSE(fresh.attach("server_dev", error));
    EXPECT_TRUE(fresh.attachedDeviceId().empty());
}

TEST_F(ChannelTest, AttachBindsToRemoteDeviceOnly) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    EXPECT_FALSE(pair.client->attach("client_dev", error));
    EXPECT_EQ(pair.client->state(), ChannelState::ENCRYPTED);

    ASSERT_TRUE(pair.client->attach("server_dev", error)) << error;
    EXPECT_EQ(pair.client->state(), ChannelState::ATTACHED);
    EXPECT_EQ(pair.client->attachedDeviceId(), "server_dev");

    // Same device again is a no-op, a different one is refused
    EXPECT_TRUE(pair.client->attach("server_dev", error));
    EXPECT_FALSE(pair.client->attach("other_dev", error));
    EXPECT_EQ(pair.client->attachedDeviceId(), "server_dev");
}

TEST_F(ChannelTest, ClosedChannelCannotAttach) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    pair.client->close();
    EXPECT_FALSE(pair.client->attach("server_dev", error));
    EXPECT_EQ(pair.client->state(), ChannelState::CLOSED);
}

//=============================================================================
// Packet I/O
//=============================================================================

TEST_F(ChannelTest, PacketsFlowBothWays) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    Packet ping("kdeconnect.ping", {{"message", "hello"}});
    ASSERT_TRUE(pair.client->sendPacket(ping, error)) << error;

    Packet received;
    ASSERT_TRUE(pair.server->readPacket(received, error)) << error;
    EXPECT_EQ(received, ping);

    Packet reply("kdeconnect.ping", {{"message", "back"}});
    ASSERT_TRUE(pair.server->sendPacket(reply, error)) << error;
    ASSERT_TRUE(pair.client->readPacket(received, error)) << error;
    EXPECT_EQ(received.bodyString("message"), "back");
}

TEST_F(ChannelTest, ReadsBackToBackPackets) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pair.client->sendPacket(Packet("kdeconnect.ping", {{"n", i}}), error));
    }

    for (int i = 0; i < 5; ++i) {
        Packet received;
        ASSERT_TRUE(pair.server->readPacket(received, error)) << error;
        EXPECT_EQ(received.bodyInt("n", -1), i);
    }
}

TEST_F(ChannelTest, MalformedLinesAreSkipped) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    const std::string garbage = "not a packet\n{\"type\":1}\n\n";
    ASSERT_TRUE(pair.client->stream()->sendExact(
        reinterpret_cast<const uint8_t*>(garbage.data()), garbage.size(), error)) << error;
    ASSERT_TRUE(pair.client->sendPacket(Packet("kdeconnect.ping"), error)) << error;

    Packet received;
    ASSERT_TRUE(pair.server->readPacket(received, error)) << error;
    EXPECT_EQ(received.type(), "kdeconnect.ping");
}

TEST_F(ChannelTest, PeerCloseEndsReadCleanly) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    pair.client->close();

    Packet received;
    EXPECT_FALSE(pair.server->readPacket(received, error));
    EXPECT_TRUE(error.empty()) << error;
    EXPECT_TRUE(pair.server->isClosed());
}

TEST_F(ChannelTest, CloseUnblocksReader) {
    ChannelPair pair;
    std::string error;
    ASSERT_TRUE(connectChannelPair(clientIdentity, serverIdentity, kMinPort, kMaxPort, pair, error))
        << error;

    std::atomic<bool> finished{false};
    std::thread reader([&]() {
        Packet received;
        std::string readError;
        pair.server->readPacket(received, readError);
        finished = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(finished.load());

    pair.server->close();
    EXPECT_TRUE(waitUntil([&]() { return finished.load(); }, 3000));
    reader.join();

    EXPECT_FALSE(pair.server->sendPacket(Packet("kdeconnect.ping"), error));
}
