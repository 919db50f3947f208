#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "protocol/Dispatcher.hpp"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/DeviceError.h"

using namespace renkei;
using namespace renkei::protocol;
using namespace std::chrono_literals;

namespace {

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest()
        : table(std::make_shared<PendingCommandTable>()),
          dispatcher(table) {
        dispatcher.registerStatusHandler([this](const MotorStatus& st) {
            std::lock_guard<std::mutex> lk(mtx);
            statuses.push_back(st);
        });
    }

    void feed(const std::string& line) { dispatcher.onFrame(Codec::decode(line)); }

    std::vector<MotorStatus> received() {
        dispatcher.drain();
        std::lock_guard<std::mutex> lk(mtx);
        return statuses;
    }

    std::shared_ptr<PendingCommandTable> table;
    std::mutex mtx;
    std::vector<MotorStatus> statuses;
    Dispatcher dispatcher;
};

} // namespace

TEST_F(DispatcherTest, ResponseResolvesWaiter) {
    auto fut = table->registerCommand("MOVE", 1s);
    feed("{\"response\":\"MOVE\",\"data\":{\"ok\":true}}");
    EXPECT_TRUE(fut.get().at("ok").get<bool>());
    EXPECT_TRUE(received().empty());
}

TEST_F(DispatcherTest, GetStatusResponseIsAlsoPublished) {
    auto fut = table->registerCommand("GET_STATUS", 1s);
    feed("{\"response\":\"GET_STATUS\",\"data\":{\"current_pos\":32768,\"limit_pos\":65536,"
         "\"target_pos\":32768,\"run_flags\":0,\"err_flags\":0}}");
    EXPECT_EQ(fut.get().at("current_pos").get<int>(), 32768);

    auto got = received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].limitPos, 65536);
}

TEST_F(DispatcherTest, CurrentPosEventLeavesWaitersAlone) {
    auto fut = table->registerCommand("MOVE", 10s);
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":20000}}");

    auto got = received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].currentPos, 20000);
    EXPECT_FALSE(got[0].limitPos.has_value());
    EXPECT_FALSE(got[0].errFlags.has_value());
    EXPECT_TRUE(table->isPending("MOVE"));
    EXPECT_EQ(fut.wait_for(0ms), std::future_status::timeout);
}

TEST_F(DispatcherTest, UnknownEventsAndInvalidFramesAreDropped) {
    feed("{\"event\":\"FIRMWARE_UPDATE\",\"data\":{\"current_pos\":1}}");
    feed("garbage");
    feed("{\"event\":\"CURRENT_POS\",\"data\":{}}");
    EXPECT_TRUE(received().empty());
}

TEST_F(DispatcherTest, DeviceErrorFailsOldestPendingCommand) {
    auto move = table->registerCommand("MOVE", 10s);
    auto info = table->registerCommand("GET_INFO", 10s);
    feed("{\"response\":\"ERROR\",\"data\":{\"code\":102}}");

    try {
        move.get();
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.code(), 102);
        EXPECT_EQ(e.description(), "Motor busy");
    }
    EXPECT_TRUE(table->isPending("GET_INFO"));
    EXPECT_TRUE(received().empty());
    table->abandonAll("test done");
    EXPECT_THROW(info.get(), ConnectionLostError);
}

TEST_F(DispatcherTest, DeviceErrorWithNothingPendingIsPublished) {
    feed("{\"response\":\"ERROR\",\"data\":{\"code\":300,\"description\":\"Limits not set\"}}");
    auto got = received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].errFlags, 300);
}

TEST_F(DispatcherTest, ErrorEventPublishesErrFlags) {
    feed("{\"event\":\"ERROR\",\"data\":{\"code\":301}}");
    auto got = received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].errFlags, 301);
    EXPECT_FALSE(got[0].currentPos.has_value());
}

TEST_F(DispatcherTest, NotificationsKeepArrivalOrder) {
    for (int i = 0; i < 50; ++i) {
        feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":" + std::to_string(i) + "}}");
    }
    auto got = received();
    ASSERT_EQ(got.size(), 50u);
    for (int i = 0; i < 50; ++i) EXPECT_EQ(got[i].currentPos, i);
}

TEST_F(DispatcherTest, HandlersRunOffTheCallingThread) {
    std::thread::id seen;
    dispatcher.registerStatusHandler([&seen](const MotorStatus&) { seen = std::this_thread::get_id(); });
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":5}}");
    dispatcher.drain();
    EXPECT_NE(seen, std::thread::id());
    EXPECT_NE(seen, std::this_thread::get_id());
}

TEST_F(DispatcherTest, RegistrationReplacesAndNullClears) {
    std::atomic<int> second{0};
    dispatcher.registerStatusHandler([&second](const MotorStatus&) { ++second; });
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":5}}");
    dispatcher.drain();
    EXPECT_EQ(second.load(), 1);
    EXPECT_TRUE(received().empty()); // first handler replaced

    dispatcher.registerStatusHandler(nullptr);
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":6}}");
    dispatcher.drain();
    EXPECT_EQ(second.load(), 1);
}

TEST_F(DispatcherTest, ThrowingHandlerDoesNotStopDelivery) {
    std::atomic<int> calls{0};
    dispatcher.registerStatusHandler([&calls](const MotorStatus&) {
        if (++calls == 1) throw std::runtime_error("listener bug");
    });
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":1}}");
    feed("{\"event\":\"CURRENT_POS\",\"data\":{\"current_pos\":2}}");
    dispatcher.drain();
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(DispatcherTest, ConnectionStatesDeliveredInOrder) {
    std::vector<ConnectionState> states;
    dispatcher.registerConnectionHandler([&states](ConnectionState s) { states.push_back(s); });
    dispatcher.notifyConnectionState(ConnectionState::Connecting);
    dispatcher.notifyConnectionState(ConnectionState::Connected);
    dispatcher.notifyConnectionState(ConnectionState::Reconnecting);
    dispatcher.drain();
    std::vector<ConnectionState> expected{ConnectionState::Connecting, ConnectionState::Connected,
                                          ConnectionState::Reconnecting};
    EXPECT_EQ(states, expected);
}
