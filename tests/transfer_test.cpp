/**
 * @file transfer_test.cpp
 * @brief Loopback tests for payload upload and download
 *
 * The uploader announces over a real control channel; the test plays the
 * receiving peer by reading the announcement and running download().
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/Device.h"
#include "lanconnect/HashUtils.h"
#include "lanconnect/NetUtils.h"
#include "lanconnect/Transfer.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace LanConnect;
using namespace LanConnect::TestSupport;

namespace {

constexpr uint16_t kControlMinPort = 47400;
constexpr uint16_t kControlMaxPort = 47410;
constexpr uint16_t kTransferMinPort = 47420;
constexpr uint16_t kTransferMaxPort = 47440;

std::string makePayload(size_t size) {
    std::string payload(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>((i * 7 + i / 251) & 0xFF);
    }
    return payload;
}

std::string digestOf(const std::string& data) {
    return HashUtils::computeBufferHash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

class TransferTest : public ::testing::Test {
protected:
    TempDir senderDir{"lanconnect_transfer_sender"};
    TempDir receiverDir{"lanconnect_transfer_receiver"};
    TempDir workDir{"lanconnect_transfer_files"};

    LocalIdentity sender;
    LocalIdentity receiver;
    ChannelPair control;

    std::shared_ptr<Device> receiverDevice;   ///< Uploader's view of the receiver
    std::shared_ptr<Device> senderDevice;     ///< Receiver's view of the uploader

    void SetUp() override {
        sender = makeLocalIdentity("sender_dev", senderDir.path());
        receiver = makeLocalIdentity("receiver_dev", receiverDir.path());

        std::string error;
        ASSERT_TRUE(connectChannelPair(sender, receiver, kControlMinPort, kControlMaxPort,
                                       control, error)) << error;

        receiverDevice = std::make_shared<Device>(control.client->identity());
        ASSERT_TRUE(receiverDevice->attachChannel(control.client, error)) << error;

        senderDevice = std::make_shared<Device>(control.server->identity());
    }

    void TearDown() override {
        if (receiverDevice) {
            receiverDevice->disconnect();
        }
    }

    std::unique_ptr<Transfer> makeUpload(const std::string& data, int64_t size) {
        auto transfer = std::make_unique<Transfer>(
            receiverDevice, sender, size, std::make_unique<std::istringstream>(data));
        transfer->setPortRange(kTransferMinPort, kTransferMaxPort);
        transfer->setAcceptTimeout(5000);
        return transfer;
    }

    std::unique_ptr<Transfer> makeDownload(const Packet& announcement, const std::string& checksum,
                                           const std::filesystem::path& target) {
        return std::make_unique<Transfer>(
            senderDevice, receiver, announcement.payloadSize(), checksum,
            std::make_unique<std::ofstream>(target, std::ios::binary | std::ios::trunc));
    }

    bool readAnnouncement(Packet& packet) {
        std::string error;
        bool ok = control.server->readPacket(packet, error);
        EXPECT_TRUE(ok) << error;
        return ok;
    }
};

//=============================================================================
// Round Trips
//=============================================================================

/**
 * @test A payload announced on the control channel arrives intact
 */
TEST_F(TransferTest, UploadThenDownload) {
    const std::string payload = makePayload(300 * 1024 + 17);
    auto upload = makeUpload(payload, static_cast<int64_t>(payload.size()));

    Packet share("kdeconnect.share.request", {{"filename", "data.bin"}});
    bool uploaded = false;
    std::thread uploader([&]() { uploaded = upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    EXPECT_EQ(announcement.type(), "kdeconnect.share.request");
    EXPECT_EQ(announcement.bodyString("filename"), "data.bin");
    EXPECT_EQ(announcement.payloadSize(), static_cast<int64_t>(payload.size()));
    EXPECT_EQ(announcement.payloadHash(), digestOf(payload));

    const uint16_t port = announcement.payloadTransferPort();
    EXPECT_GE(port, kTransferMinPort);
    EXPECT_LE(port, kTransferMaxPort);

    const auto target = workDir.path() / "received.bin";
    auto download = makeDownload(announcement, announcement.payloadHash(), target);
    EXPECT_TRUE(download->download(port)) << download->errorMessage();
    uploader.join();

    EXPECT_TRUE(uploaded) << upload->errorMessage();
    EXPECT_EQ(upload->port(), port);
    EXPECT_EQ(upload->bytesTransferred(), payload.size());
    EXPECT_EQ(download->bytesTransferred(), payload.size());
    EXPECT_EQ(readFile(target), payload);
}

TEST_F(TransferTest, EmptyPayload) {
    auto upload = makeUpload("", 0);

    Packet share("kdeconnect.share.request");
    bool uploaded = false;
    std::thread uploader([&]() { uploaded = upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    EXPECT_EQ(announcement.payloadSize(), 0);

    const auto target = workDir.path() / "empty.bin";
    auto download = makeDownload(announcement, announcement.payloadHash(), target);
    EXPECT_TRUE(download->download(announcement.payloadTransferPort())) << download->errorMessage();
    uploader.join();

    EXPECT_TRUE(uploaded) << upload->errorMessage();
    EXPECT_TRUE(std::filesystem::exists(target));
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

/**
 * @test Without a size the receiver reads until the sender closes
 */
TEST_F(TransferTest, UnknownSizeStreamsUntilEnd) {
    const std::string payload = makePayload(70000);
    auto upload = makeUpload(payload, -1);

    Packet share("kdeconnect.share.request");
    std::thread uploader([&]() { upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    EXPECT_FALSE(announcement.hasPayloadSize());

    const auto target = workDir.path() / "stream.bin";
    auto download = makeDownload(announcement, "", target);
    EXPECT_TRUE(download->download(announcement.payloadTransferPort())) << download->errorMessage();
    uploader.join();

    EXPECT_EQ(readFile(target), payload);
}

TEST_F(TransferTest, ProgressReachesTotal) {
    const std::string payload = makePayload(BUFFER_SIZE * 3 + 5);
    auto upload = makeUpload(payload, static_cast<int64_t>(payload.size()));

    std::vector<uint64_t> uploadProgress;
    upload->setProgressCallback([&](uint64_t done, int64_t) { uploadProgress.push_back(done); });

    Packet share("kdeconnect.share.request");
    std::thread uploader([&]() { upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));

    std::vector<uint64_t> downloadProgress;
    auto download = makeDownload(announcement, "", workDir.path() / "progress.bin");
    download->setProgressCallback([&](uint64_t done, int64_t total) {
        EXPECT_EQ(total, static_cast<int64_t>(payload.size()));
        downloadProgress.push_back(done);
    });
    EXPECT_TRUE(download->download(announcement.payloadTransferPort()));
    uploader.join();

    ASSERT_FALSE(uploadProgress.empty());
    ASSERT_FALSE(downloadProgress.empty());
    EXPECT_EQ(uploadProgress.back(), payload.size());
    EXPECT_EQ(downloadProgress.back(), payload.size());
    EXPECT_TRUE(std::is_sorted(downloadProgress.begin(), downloadProgress.end()));
}

//=============================================================================
// Failures
//=============================================================================

/**
 * @test With every transfer port taken nothing is announced
 */
TEST_F(TransferTest, NoFreePortSendsNothing) {
    uint16_t occupiedPort = 0;
    std::string error;
    int occupied = bindTcpListenerInRange(47445, 47445, occupiedPort, error);
    ASSERT_NE(occupied, INVALID_SOCKET_FD) << error;

    auto upload = makeUpload("payload", 7);
    upload->setPortRange(47445, 47445);

    Packet share("kdeconnect.share.request");
    EXPECT_FALSE(upload->upload(share));
    EXPECT_EQ(upload->port(), 0);
    EXPECT_FALSE(upload->errorMessage().empty());
    EXPECT_FALSE(share.hasPayloadTransferInfo());

    // The next packet on the control channel is the marker, not an announcement
    ASSERT_TRUE(receiverDevice->sendPacket(Packet("test.marker")));
    Packet next;
    ASSERT_TRUE(readAnnouncement(next));
    EXPECT_EQ(next.type(), "test.marker");

    closeSocket(occupied);
}

TEST_F(TransferTest, ChecksumMismatchFailsDownload) {
    const std::string payload = makePayload(4096);
    auto upload = makeUpload(payload, static_cast<int64_t>(payload.size()));

    Packet share("kdeconnect.share.request");
    std::thread uploader([&]() { upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));

    auto download = makeDownload(announcement, digestOf("something else"), workDir.path() / "bad.bin");
    EXPECT_FALSE(download->download(announcement.payloadTransferPort()));
    EXPECT_NE(download->errorMessage().find("Checksum mismatch"), std::string::npos)
        << download->errorMessage();
    uploader.join();
}

TEST_F(TransferTest, ShortSourceFailsBothEnds) {
    const std::string payload = makePayload(50);
    auto upload = makeUpload(payload, 100);

    Packet share("kdeconnect.share.request");
    bool uploaded = true;
    std::thread uploader([&]() { uploaded = upload->upload(share); });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    EXPECT_EQ(announcement.payloadSize(), 100);

    auto download = makeDownload(announcement, "", workDir.path() / "short.bin");
    EXPECT_FALSE(download->download(announcement.payloadTransferPort()));
    uploader.join();

    EXPECT_FALSE(uploaded);
    EXPECT_NE(upload->errorMessage().find("ended after 50"), std::string::npos) << upload->errorMessage();
    EXPECT_NE(download->errorMessage().find("incomplete"), std::string::npos) << download->errorMessage();
}

TEST_F(TransferTest, AcceptTimeoutFailsUpload) {
    auto upload = makeUpload("payload", 7);
    upload->setAcceptTimeout(300);

    Packet share("kdeconnect.share.request");
    EXPECT_FALSE(upload->upload(share));
    EXPECT_NE(upload->errorMessage().find("Timed out"), std::string::npos) << upload->errorMessage();

    // The announcement went out before the wait
    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    EXPECT_EQ(announcement.payloadTransferPort(), upload->port());
}

TEST_F(TransferTest, CancelStopsWaitingUpload) {
    auto upload = makeUpload("payload", 7);
    upload->setAcceptTimeout(30000);

    Packet share("kdeconnect.share.request");
    std::atomic<bool> done{false};
    bool uploaded = true;
    std::thread uploader([&]() {
        uploaded = upload->upload(share);
        done = true;
    });

    Packet announcement;
    ASSERT_TRUE(readAnnouncement(announcement));
    upload->cancel();

    EXPECT_TRUE(waitUntil([&]() { return done.load(); }, 3000));
    uploader.join();
    EXPECT_FALSE(uploaded);
    EXPECT_EQ(upload->errorMessage(), "Transfer cancelled");
}

TEST_F(TransferTest, DownloadNeedsKnownHost) {
    auto hostless = std::make_shared<Device>(Packet::makeIdentity("sender_dev", "x", "phone", 0));
    Transfer download(hostless, receiver, 10, "",
                      std::make_unique<std::ofstream>(workDir.path() / "none.bin", std::ios::binary));

    EXPECT_FALSE(download.download(kTransferMinPort));
    EXPECT_EQ(download.errorMessage(), "Device has no known host");
}

TEST_F(TransferTest, DownloadFromClosedPortFails) {
    uint16_t port = 0;
    std::string error;
    int listener = bindTcpListenerInRange(kTransferMinPort, kTransferMaxPort, port, error);
    ASSERT_NE(listener, INVALID_SOCKET_FD) << error;
    closeSocket(listener);

    Transfer download(senderDevice, receiver, 10, "",
                      std::make_unique<std::ofstream>(workDir.path() / "closed.bin", std::ios::binary));
    EXPECT_FALSE(download.download(port));
    EXPECT_NE(download.errorMessage().find("Connecting to"), std::string::npos);
}

TEST_F(TransferTest, TransferIsSingleUse) {
    Transfer download(senderDevice, receiver, 10, "",
                      std::make_unique<std::ofstream>(workDir.path() / "once.bin", std::ios::binary));

    EXPECT_FALSE(download.download(0));
    EXPECT_EQ(download.errorMessage(), "No transfer port");

    EXPECT_FALSE(download.download(kTransferMinPort));
    EXPECT_EQ(download.errorMessage(), "Transfer already used");
}

TEST_F(TransferTest, DirectionIsEnforced) {
    Transfer download(senderDevice, receiver, 10, "",
                      std::make_unique<std::ofstream>(workDir.path() / "dir.bin", std::ios::binary));
    Packet share("kdeconnect.share.request");

    EXPECT_EQ(download.direction(), TransferDirection::DOWNLOAD);
    EXPECT_FALSE(download.upload(share));
    EXPECT_EQ(download.errorMessage(), "Not an upload");
}
