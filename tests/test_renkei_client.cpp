#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <vector>

#include "controller/RenkeiClient.h"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/DeviceError.h"
#include "protocol/exceptions/NotConnectedError.h"
#include "protocol/exceptions/ValidationError.h"
#include "support/FakeTcpClient.hpp"

using namespace renkei;
using namespace renkei::controller;
using renkei::protocol::MotorStatus;
using renkei::test::FakeDevice;
using renkei::test::eventually;
using namespace std::chrono_literals;

namespace {

class RenkeiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = FakeDevice::create();
        cfg = test::fastConfig();
    }

    void TearDown() override {
        if (client) client->disconnect();
    }

    void connect() {
        client = std::make_unique<RenkeiClient>(cfg, device->factory());
        client->connect();
        ASSERT_TRUE(client->waitUntilConnected(2s));
    }

    std::shared_ptr<FakeDevice> device;
    config::ClientConfig cfg;
    std::unique_ptr<RenkeiClient> client;
};

} // namespace

TEST_F(RenkeiClientTest, ConstructionValidatesConfig) {
    cfg.host.clear();
    EXPECT_THROW(RenkeiClient(cfg, device->factory()), ValidationError);
    EXPECT_EQ(device->connectAttempts(), 0u);
}

// Scenario A
TEST_F(RenkeiClientTest, GetStatusReturnsDeviceFields) {
    connect();
    MotorStatus st = client->getStatus();
    EXPECT_EQ(st.currentPos, 32768);
    EXPECT_EQ(st.limitPos, 65536);
    EXPECT_EQ(st.targetPos, 32768);
    EXPECT_EQ(st.runFlags, 0);
    EXPECT_EQ(st.errFlags, 0);

    auto sent = device->sentCommands();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].name, "GET_STATUS");
    EXPECT_TRUE(sent[0].params.empty());
}

// Scenario B
TEST_F(RenkeiClientTest, OutOfRangeAbsoluteMoveWritesNothing) {
    connect();
    EXPECT_THROW(client->absoluteMove(70000), ValidationError);
    EXPECT_THROW(client->absoluteMove(-1), ValidationError);
    EXPECT_THROW(client->absoluteMove(100, 10001), ValidationError);
    EXPECT_TRUE(device->sentLines().empty());
    EXPECT_TRUE(client->isConnected());
}

TEST_F(RenkeiClientTest, ValidationPrecedesConnectionCheck) {
    client = std::make_unique<RenkeiClient>(cfg, device->factory());
    EXPECT_THROW(client->move(101), ValidationError);
    EXPECT_THROW(client->jog(0), ValidationError);
    EXPECT_THROW(client->move(50), NotConnectedError);
    EXPECT_THROW(client->getStatus(), NotConnectedError);
}

TEST_F(RenkeiClientTest, MoveEncodesOneFramePerCall) {
    connect();
    const int positions[] = {0, 1, 50, 99, 100};
    const int delays[] = {0, 15, 30};
    std::size_t expected = 0;
    for (int p : positions) {
        for (int d : delays) {
            client->move(p, d);
            ++expected;
            auto sent = device->sentCommands();
            ASSERT_EQ(sent.size(), expected);
            EXPECT_EQ(sent.back().name, "MOVE");
            EXPECT_EQ(sent.back().params.at("pos").get<int>(), p);
            EXPECT_EQ(sent.back().params.at("delay").get<int>(), d);
        }
    }

    EXPECT_THROW(client->move(-1), ValidationError);
    EXPECT_THROW(client->move(101), ValidationError);
    EXPECT_THROW(client->move(50, 31), ValidationError);
    EXPECT_THROW(client->move(50, -1), ValidationError);
    EXPECT_EQ(device->sentLines().size(), expected);
}

TEST_F(RenkeiClientTest, AbsoluteMoveAcceptsFullEncoderRange) {
    connect();
    client->absoluteMove(0);
    client->absoluteMove(65536, 10000);
    auto sent = device->sentCommands();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].name, "A_MOVE");
    EXPECT_EQ(sent[1].params.at("pos").get<int>(), 65536);
    EXPECT_EQ(sent[1].params.at("delay").get<int>(), 10000);
}

TEST_F(RenkeiClientTest, JogAndStop) {
    connect();
    client->jog(3);
    client->stop();
    EXPECT_THROW(client->jog(11), ValidationError);

    auto sent = device->sentCommands();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].name, "JOG");
    EXPECT_EQ(sent[0].params.at("count").get<int>(), 3);
    EXPECT_EQ(sent[1].name, "STOP");
    EXPECT_TRUE(sent[1].params.empty());
}

TEST_F(RenkeiClientTest, GetInfo) {
    connect();
    auto info = client->getInfo();
    EXPECT_EQ(info.ip, "192.168.1.50");
    EXPECT_EQ(info.firmware, "1.2.3");
    EXPECT_EQ(info.deviceName(), "RENKEI PoE DDEEFF");
}

TEST_F(RenkeiClientTest, DeviceErrorCodePassesThrough) {
    device->setResponder([](const protocol::Command& cmd) -> std::optional<std::string> {
        if (cmd.name == protocol::CMD_MOVE) {
            return std::string("{\"response\":\"ERROR\",\"data\":{\"code\":102}}");
        }
        return FakeDevice::defaultReply(cmd);
    });
    connect();
    try {
        client->move(40);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.code(), 102);
        EXPECT_EQ(e.description(), "Motor busy");
    }
}

// Scenario E
TEST_F(RenkeiClientTest, UnsolicitedPositionReachesStatusCallback) {
    device->silence({protocol::CMD_MOVE});
    connect();
    std::mutex mtx;
    std::vector<MotorStatus> updates;
    client->registerStatusCallback([&](const MotorStatus& st) {
        std::lock_guard<std::mutex> lk(mtx);
        updates.push_back(st);
    });

    auto move = std::async(std::launch::async, [this]() { return client->move(30); });
    ASSERT_TRUE(device->waitForSent(protocol::CMD_MOVE, 1, 2s));

    device->push("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":20000}}");
    client->connection().drainNotifications();
    {
        std::lock_guard<std::mutex> lk(mtx);
        ASSERT_EQ(updates.size(), 1u);
        EXPECT_EQ(updates[0].currentPos, 20000);
        EXPECT_FALSE(updates[0].limitPos.has_value());
        EXPECT_FALSE(updates[0].targetPos.has_value());
        EXPECT_FALSE(updates[0].runFlags.has_value());
        EXPECT_FALSE(updates[0].errFlags.has_value());
    }
    EXPECT_EQ(move.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(client->connection().pendingCount(), 1u);

    device->push(FakeDevice::response(protocol::CMD_MOVE, nlohmann::json::object()));
    EXPECT_NO_THROW(move.get());
    client->registerStatusCallback(nullptr);
}

// Scenario D at the facade level
TEST_F(RenkeiClientTest, PeerCloseFailsCallerAndReconnects) {
    device->silence({protocol::CMD_ABSOLUTE_MOVE});
    connect();
    std::mutex mtx;
    std::vector<ConnectionState> states;
    client->registerConnectionCallback([&](ConnectionState s) {
        std::lock_guard<std::mutex> lk(mtx);
        states.push_back(s);
    });

    auto pending = std::async(std::launch::async, [this]() { return client->absoluteMove(40000, 0); });
    ASSERT_TRUE(device->waitForSent(protocol::CMD_ABSOLUTE_MOVE, 1, 2s));
    device->closeFromPeer();

    EXPECT_THROW(pending.get(), ConnectionLostError);
    ASSERT_TRUE(eventually([&]() { return device->connectAttempts() >= 2 && client->isConnected(); }));
    client->connection().drainNotifications();
    {
        std::lock_guard<std::mutex> lk(mtx);
        ASSERT_FALSE(states.empty());
        EXPECT_EQ(states.front(), ConnectionState::Reconnecting);
        EXPECT_EQ(states.back(), ConnectionState::Connected);
    }
    client->registerConnectionCallback(nullptr);
    EXPECT_EQ(client->getInfo().firmware, "1.2.3");
}

TEST_F(RenkeiClientTest, ConnectionCallbackIsSingleSlot) {
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    client = std::make_unique<RenkeiClient>(cfg, device->factory());
    client->registerConnectionCallback([&](ConnectionState) { ++first; });
    client->registerConnectionCallback([&](ConnectionState) { ++second; });
    client->connect();
    ASSERT_TRUE(client->waitUntilConnected(2s));
    client->connection().drainNotifications();
    EXPECT_EQ(first.load(), 0);
    EXPECT_GE(second.load(), 2);
    client->registerConnectionCallback(nullptr);
    client->disconnect();
    client->connection().drainNotifications();
}

TEST_F(RenkeiClientTest, LastSeenTracksInboundTraffic) {
    connect();
    EXPECT_FALSE(client->lastSeen().has_value());
    client->stop();
    auto first = client->lastSeen();
    ASSERT_TRUE(first.has_value());
    std::this_thread::sleep_for(5ms);
    device->push("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":1}}");
    ASSERT_TRUE(client->lastSeen().has_value());
    EXPECT_GT(*client->lastSeen(), *first);
}
