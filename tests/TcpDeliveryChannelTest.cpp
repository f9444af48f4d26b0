#include "core/network/PrinterEmulator.hpp"
#include "core/network/impl/TcpDeliveryChannel.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>

using namespace core;
using namespace std::chrono_literals;

class TcpDeliveryChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        emulator_ = std::make_unique<PrinterEmulator>("127.0.0.1", 0);
        emulator_->start();
        endpoint_ = {"127.0.0.1", emulator_->getPort()};
    }

    void TearDown() override {
        emulator_->stop();
    }

    std::unique_ptr<PrinterEmulator> emulator_;
    types::PrinterEndpoint endpoint_;
};

TEST_F(TcpDeliveryChannelTest, DeliversWholeBuffer) {
    TcpDeliveryChannel channel(2000ms, 200ms);
    auto payload = escpos::EscPosCommandBuilder::encode({"BILLET CLIENT", "Montant TTC: 15.450 TND"});

    auto result = channel.deliver(endpoint_, payload);

    EXPECT_TRUE(result.isSuccess()) << result.message << " " << result.detail;
    ASSERT_TRUE(emulator_->waitForJobs(1, 2000ms));
    EXPECT_EQ(emulator_->getJobs()[0].data, payload);
}

TEST_F(TcpDeliveryChannelTest, LargePayloadArrivesIntact) {
    TcpDeliveryChannel channel(3000ms, 200ms);
    escpos::Bytes payload(256 * 1024);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i % 251);
    }

    auto result = channel.deliver(endpoint_, payload);

    EXPECT_TRUE(result.isSuccess());
    ASSERT_TRUE(emulator_->waitForJobs(1, 3000ms));
    EXPECT_EQ(emulator_->getJobs()[0].data, payload);
}

TEST_F(TcpDeliveryChannelTest, PeerHoldingConnectionOpenStillSucceeds) {
    emulator_->setCloseDelay(1500ms);
    TcpDeliveryChannel channel(1000ms, 100ms);

    auto started = std::chrono::steady_clock::now();
    auto result = channel.deliver(endpoint_, escpos::EscPosCommandBuilder::encode({"OK"}));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.isSuccess()) << result.message;
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_TRUE(emulator_->waitForJobs(1, 2000ms));
}

TEST_F(TcpDeliveryChannelTest, ProbeSendsNothing) {
    TcpDeliveryChannel channel(2000ms, 200ms);

    auto result = channel.probe(endpoint_);

    EXPECT_TRUE(result.isSuccess());
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(emulator_->getJobCount(), 0u);
}

TEST(TcpDeliveryChannelFailureTest, UnreadPeerTimesOut) {
    testsupport::StalledPeer peer;
    TcpDeliveryChannel channel(200ms, 100ms);
    types::PrinterEndpoint endpoint{"127.0.0.1", peer.port()};

    auto started = std::chrono::steady_clock::now();
    auto result = channel.deliver(endpoint, testsupport::oversizedPayload());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.isTimeout()) << result.message << " " << result.detail;
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 1500ms);
}

TEST(TcpDeliveryChannelFailureTest, ClosedPortIsUnreachable) {
    TcpDeliveryChannel channel(2000ms, 200ms);
    types::PrinterEndpoint endpoint{"127.0.0.1", testsupport::closedLoopbackPort()};

    auto started = std::chrono::steady_clock::now();
    auto result = channel.deliver(endpoint, escpos::EscPosCommandBuilder::encode({"lost"}));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.isSuccess());
    EXPECT_TRUE(result.isUnreachable());
    EXPECT_EQ(result.message, "printer unreachable");
    EXPECT_FALSE(result.detail.empty());
    EXPECT_LT(elapsed, 2500ms);
}

TEST(TcpDeliveryChannelFailureTest, ProbeOfClosedPortFails) {
    TcpDeliveryChannel channel(2000ms, 200ms);
    types::PrinterEndpoint endpoint{"127.0.0.1", testsupport::closedLoopbackPort()};

    auto result = channel.probe(endpoint);

    EXPECT_FALSE(result.isSuccess());
}
