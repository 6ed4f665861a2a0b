/**
 * @file device_manager_test.cpp
 * @brief Tests for the device registry and per-device channel ownership
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Device.h"
#include "lanconnect/DeviceManager.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

using namespace LanConnect;
using namespace LanConnect::TestSupport;

namespace {

constexpr uint16_t kMinPort = 47250;
constexpr uint16_t kMaxPort = 47270;

Packet identityFor(const std::string& deviceId, const std::string& host = "10.0.0.9",
                   int64_t port = 1716) {
    Packet identity = Packet::makeIdentity(deviceId, deviceId + " name", "phone", 0);
    identity.body()["tcpHost"] = host;
    identity.body()["tcpPort"] = port;
    return identity;
}

} // namespace

//=============================================================================
// Registry
//=============================================================================

TEST(DeviceManagerTest, EnsureDeviceIsIdempotent) {
    DeviceManager manager;

    auto first = manager.ensureDevice(identityFor("phone_1"));
    auto second = manager.ensureDevice(identityFor("phone_1", "10.0.0.10"));

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(manager.deviceCount(), 1u);
    EXPECT_EQ(manager.getDevice("phone_1"), first);

    // ensureDevice does not refresh an existing device
    EXPECT_EQ(first->settings().tcpHost, "10.0.0.9");
}

TEST(DeviceManagerTest, EnsureDeviceNeedsDeviceId) {
    DeviceManager manager;
    EXPECT_EQ(manager.ensureDevice(Packet::makeIdentity("", "x", "phone", 0)), nullptr);
    EXPECT_EQ(manager.deviceCount(), 0u);
    EXPECT_EQ(manager.getDevice("missing"), nullptr);
}

TEST(DeviceManagerTest, DiscoverableFlag) {
    DeviceManager hidden(false);
    EXPECT_FALSE(hidden.isDiscoverable());
    hidden.setDiscoverable(true);
    EXPECT_TRUE(hidden.isDiscoverable());
}

TEST(DeviceManagerTest, DevicesSnapshot) {
    DeviceManager manager;
    manager.ensureDevice(identityFor("a"));
    manager.ensureDevice(identityFor("b"));

    std::vector<std::string> ids;
    for (const auto& device : manager.devices()) {
        ids.push_back(device->id());
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));
}

//=============================================================================
// Device Identity
//=============================================================================

TEST(DeviceTest, ConstructedFromIdentity) {
    Device device(identityFor("phone_1", "192.168.1.7", 1739));

    EXPECT_EQ(device.id(), "phone_1");
    EXPECT_EQ(device.name(), "phone_1 name");
    EXPECT_EQ(device.type(), "phone");
    EXPECT_EQ(device.settings().tcpHost, "192.168.1.7");
    EXPECT_EQ(device.settings().tcpPort, 1739);
    EXPECT_FALSE(device.hasChannel());
    EXPECT_FALSE(device.isConnected());
}

TEST(DeviceTest, HandleIdentityRefreshesSettings) {
    Device device(identityFor("phone_1"));

    Packet newer = identityFor("phone_1", "10.0.0.20", 1745);
    newer.body()["deviceName"] = "renamed";
    device.handleIdentity(newer);

    EXPECT_EQ(device.name(), "renamed");
    EXPECT_EQ(device.settings().tcpHost, "10.0.0.20");
    EXPECT_EQ(device.settings().tcpPort, 1745);
}

TEST(DeviceTest, HandleIdentityKeepsPortWhenInvalid) {
    Device device(identityFor("phone_1", "10.0.0.9", 1740));

    device.handleIdentity(identityFor("phone_1", "10.0.0.9", 70000));
    EXPECT_EQ(device.settings().tcpPort, 1740);

    device.handleIdentity(identityFor("phone_1", "10.0.0.9", 0));
    EXPECT_EQ(device.settings().tcpPort, 1740);
}

TEST(DeviceTest, HandleIdentityIgnoresOtherDevices) {
    Device device(identityFor("phone_1", "10.0.0.9"));
    device.handleIdentity(identityFor("phone_2", "10.0.0.99"));
    EXPECT_EQ(device.settings().tcpHost, "10.0.0.9");
}

TEST(DeviceTest, ReservationBlocksSecondConnect) {
    Device device(identityFor("phone_1"));

    EXPECT_TRUE(device.tryReserveChannel());
    EXPECT_TRUE(device.hasChannel());
    EXPECT_FALSE(device.isConnected());
    EXPECT_FALSE(device.tryReserveChannel());

    device.clearPendingChannel();
    EXPECT_FALSE(device.hasChannel());
    EXPECT_TRUE(device.tryReserveChannel());
}

TEST(DeviceTest, SendWithoutChannelFails) {
    Device device(identityFor("phone_1"));
    EXPECT_FALSE(device.sendPacket(Packet("kdeconnect.ping")));
}

//=============================================================================
// Device Channels
//=============================================================================

class DeviceChannelTest : public ::testing::Test {
protected:
    TempDir localDir{"lanconnect_device_local"};
    TempDir remoteDir{"lanconnect_device_remote"};
    LocalIdentity local;
    LocalIdentity remote;

    void SetUp() override {
        local = makeLocalIdentity("local_dev", localDir.path());
        remote = makeLocalIdentity("remote_dev", remoteDir.path(), 1716);
    }

    // Channel pair whose client end talks to remote_dev
    ChannelPair connect() {
        ChannelPair pair;
        std::string error;
        EXPECT_TRUE(connectChannelPair(local, remote, kMinPort, kMaxPort, pair, error)) << error;
        return pair;
    }
};

TEST_F(DeviceChannelTest, AttachAdoptsChannelIdentity) {
    ChannelPair pair = connect();
    ASSERT_TRUE(pair.client);

    Device device(identityFor("remote_dev", "10.9.9.9", 1716));
    ASSERT_TRUE(device.tryReserveChannel());

    std::string error;
    ASSERT_TRUE(device.attachChannel(pair.client, error)) << error;

    EXPECT_TRUE(device.isConnected());
    EXPECT_EQ(pair.client->state(), ChannelState::ATTACHED);
    EXPECT_EQ(device.settings().tcpHost, LOCALHOST_IP);
    EXPECT_EQ(device.settings().tcpPort, pair.port);
    EXPECT_EQ(device.certificateFingerprint(), pair.client->peerCertificateFingerprint());

    // Reservation is consumed by the attach
    EXPECT_FALSE(device.tryReserveChannel());

    // Attaching the same channel again is a no-op
    EXPECT_TRUE(device.attachChannel(pair.client, error));
}

TEST_F(DeviceChannelTest, RefusesChannelOfAnotherDevice) {
    ChannelPair pair = connect();
    ASSERT_TRUE(pair.client);

    Device device(identityFor("somebody_else"));
    std::string error;
    EXPECT_FALSE(device.attachChannel(pair.client, error));
    EXPECT_FALSE(device.isConnected());
}

TEST_F(DeviceChannelTest, SecondLiveChannelIsRefused) {
    ChannelPair first = connect();
    ChannelPair second = connect();
    ASSERT_TRUE(first.client);
    ASSERT_TRUE(second.client);

    Device device(identityFor("remote_dev"));
    std::string error;
    ASSERT_TRUE(device.attachChannel(first.client, error)) << error;

    EXPECT_FALSE(device.attachChannel(second.client, error));
    EXPECT_EQ(second.client->state(), ChannelState::ENCRYPTED);
    EXPECT_EQ(first.client->state(), ChannelState::ATTACHED);
}

TEST_F(DeviceChannelTest, HandlerReceivesPackets) {
    ChannelPair pair = connect();
    ASSERT_TRUE(pair.client);

    std::mutex mutex;
    std::vector<std::string> received;
    DeviceManager manager;
    manager.setPacketHandler([&](Device& device, const Packet& packet) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(device.id() + ":" + packet.bodyString("message"));
    });

    auto device = manager.ensureDevice(identityFor("remote_dev"));
    ASSERT_TRUE(manager.onChannelEstablished(device, pair.client));

    std::string error;
    ASSERT_TRUE(pair.server->sendPacket(Packet("kdeconnect.ping", {{"message", "one"}}), error));
    ASSERT_TRUE(pair.server->sendPacket(Packet("kdeconnect.ping", {{"message", "two"}}), error));

    EXPECT_TRUE(waitUntil([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == 2;
    }));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "remote_dev:one");
    EXPECT_EQ(received[1], "remote_dev:two");
}

TEST_F(DeviceChannelTest, DeviceSendsOverAttachedChannel) {
    ChannelPair pair = connect();
    ASSERT_TRUE(pair.client);

    Device device(identityFor("remote_dev"));
    std::string error;
    ASSERT_TRUE(device.attachChannel(pair.client, error)) << error;
    ASSERT_TRUE(device.sendPacket(Packet("kdeconnect.ping", {{"message", "out"}})));

    Packet received;
    ASSERT_TRUE(pair.server->readPacket(received, error)) << error;
    EXPECT_EQ(received.bodyString("message"), "out");
}

/**
 * @test A peer close drops the channel so a fresh one can attach
 */
TEST_F(DeviceChannelTest, PeerCloseFreesChannelSlot) {
    ChannelPair first = connect();
    ASSERT_TRUE(first.client);

    Device device(identityFor("remote_dev"));
    std::string error;
    ASSERT_TRUE(device.attachChannel(first.client, error)) << error;

    first.server->close();
    EXPECT_TRUE(waitUntil([&]() { return !device.isConnected(); }));
    EXPECT_FALSE(device.hasChannel());

    ChannelPair second = connect();
    ASSERT_TRUE(second.client);
    EXPECT_TRUE(device.attachChannel(second.client, error)) << error;
    EXPECT_TRUE(device.isConnected());
}

TEST_F(DeviceChannelTest, DisconnectClosesChannel) {
    ChannelPair pair = connect();
    ASSERT_TRUE(pair.client);

    Device device(identityFor("remote_dev"));
    std::string error;
    ASSERT_TRUE(device.attachChannel(pair.client, error)) << error;

    device.disconnect();
    EXPECT_FALSE(device.isConnected());
    EXPECT_TRUE(pair.client->isClosed());

    Packet received;
    EXPECT_FALSE(pair.server->readPacket(received, error));
}
