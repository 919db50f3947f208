#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "controller/HealthMonitor.hpp"
#include "protocol/exceptions/CommandInFlightError.h"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/TimeoutError.h"
#include "support/FakeTcpClient.hpp"

using namespace renkei;
using namespace renkei::controller;
using renkei::test::eventually;
using namespace std::chrono_literals;

TEST(HealthMonitorTest, RejectsBadArguments) {
    auto probe = []() {};
    auto fail = [](const std::string&) {};
    EXPECT_THROW(HealthMonitor(probe, fail, 0ms), std::invalid_argument);
    EXPECT_THROW(HealthMonitor(nullptr, fail, 10ms), std::invalid_argument);
    EXPECT_THROW(HealthMonitor(probe, nullptr, 10ms), std::invalid_argument);
}

TEST(HealthMonitorTest, ProbesEveryInterval) {
    std::atomic<int> probes{0};
    std::atomic<int> failures{0};
    HealthMonitor monitor([&]() { ++probes; }, [&](const std::string&) { ++failures; }, 20ms);
    monitor.start();
    EXPECT_TRUE(monitor.isRunning());
    EXPECT_TRUE(eventually([&]() { return probes.load() >= 3; }));
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
    EXPECT_EQ(failures.load(), 0);
}

TEST(HealthMonitorTest, ProbeTimeoutReportsFailureOnceAndStops) {
    std::atomic<int> probes{0};
    std::mutex mtx;
    std::vector<std::string> reasons;
    HealthMonitor monitor(
        [&]() {
            ++probes;
            throw TimeoutError("no response to GET_INFO within 5000 ms");
        },
        [&](const std::string& reason) {
            std::lock_guard<std::mutex> lk(mtx);
            reasons.push_back(reason);
        },
        10ms);
    monitor.start();
    EXPECT_TRUE(eventually([&]() { return !monitor.isRunning(); }));
    std::this_thread::sleep_for(50ms);
    monitor.stop();

    EXPECT_EQ(probes.load(), 1);
    std::lock_guard<std::mutex> lk(mtx);
    ASSERT_EQ(reasons.size(), 1u);
    EXPECT_NE(reasons[0].find("health check failed"), std::string::npos);
    EXPECT_NE(reasons[0].find("GET_INFO"), std::string::npos);
}

TEST(HealthMonitorTest, InFlightProbeSkipsTheRound) {
    std::atomic<int> probes{0};
    std::atomic<int> failures{0};
    HealthMonitor monitor(
        [&]() {
            if (++probes <= 2) throw CommandInFlightError("GET_INFO");
        },
        [&](const std::string&) { ++failures; }, 10ms);
    monitor.start();
    EXPECT_TRUE(eventually([&]() { return probes.load() >= 4; }));
    EXPECT_TRUE(monitor.isRunning());
    monitor.stop();
    EXPECT_EQ(failures.load(), 0);
}

TEST(HealthMonitorTest, ConnectionLossStopsQuietly) {
    std::atomic<int> failures{0};
    HealthMonitor monitor([]() { throw ConnectionLostError("link dropped"); },
                          [&](const std::string&) { ++failures; }, 10ms);
    monitor.start();
    EXPECT_TRUE(eventually([&]() { return !monitor.isRunning(); }));
    monitor.stop();
    EXPECT_EQ(failures.load(), 0);
}

TEST(HealthMonitorTest, StopBeforeFirstProbe) {
    std::atomic<int> probes{0};
    HealthMonitor monitor([&]() { ++probes; }, [](const std::string&) {}, 10s);
    monitor.start();
    const auto begin = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
    EXPECT_EQ(probes.load(), 0);
}

TEST(HealthMonitorTest, RestartAfterFailure) {
    std::atomic<int> probes{0};
    std::atomic<int> failures{0};
    HealthMonitor monitor(
        [&]() {
            ++probes;
            throw std::runtime_error("write failed");
        },
        [&](const std::string&) { ++failures; }, 10ms);
    monitor.start();
    EXPECT_TRUE(eventually([&]() { return failures.load() == 1; }));
    monitor.start();
    EXPECT_TRUE(eventually([&]() { return failures.load() == 2; }));
    monitor.stop();
}
