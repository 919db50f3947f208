#pragma once
/**
 * HealthMonitor.hpp
 *
 * HealthMonitor: 연결된 세션에 주기적으로 liveness probe(GET_INFO)를 보낸다.
 *
 * 사용법:
 *   HealthMonitor monitor(probe, onFailure, std::chrono::seconds(60));
 *   monitor.start();
 *   ...
 *   monitor.stop();
 *
 * 주요 동작:
 *  - interval마다 probe()를 호출한다. probe는 실패 시 예외를 던진다.
 *  - TimeoutError / DeviceError / 그 외 전송 실패 -> onFailure(reason) 후 종료
 *  - CommandInFlightError (호출자의 GET_INFO가 이미 진행 중) -> 이번 회차 skip
 *  - NotConnectedError / ConnectionLostError -> 이미 상태 전이 중이므로 조용히 종료
 *  - interval == 0 이면 만들지 않는다 (ConnectionStateMachine 쪽에서 판단)
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace renkei::controller {

class HealthMonitor {
public:
    using ms = std::chrono::milliseconds;
    using Probe = std::function<void()>;
    using FailureHandler = std::function<void(const std::string& reason)>;

    HealthMonitor(Probe probe, FailureHandler onFailure, ms interval);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();

    bool isRunning() const;

private:
    void runLoop();

    Probe probe_;
    FailureHandler onFailure_;
    ms interval_;

    std::thread worker_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool running_{false};
    bool stopRequested_{false};
};

} // namespace renkei::controller
