#include "controller/HealthMonitor.hpp"
#include "protocol/exceptions/CommandInFlightError.h"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/NotConnectedError.h"

#include "spdlog/spdlog.h"

#include <stdexcept>

namespace renkei::controller {

HealthMonitor::HealthMonitor(Probe probe, FailureHandler onFailure, ms interval)
    : probe_(std::move(probe)),
      onFailure_(std::move(onFailure)),
      interval_(interval) {
    if (!probe_ || !onFailure_) {
        throw std::invalid_argument("HealthMonitor requires a probe and a failure handler.");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("HealthMonitor interval must be positive.");
    }
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own
    running_ = true;
    stopRequested_ = false;
    worker_ = std::thread(&HealthMonitor::runLoop, this);
    spdlog::debug("Health check started with {} ms interval", interval_.count());
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool HealthMonitor::isRunning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

void HealthMonitor::runLoop() {
    std::string failure;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            if (cv_.wait_for(lk, interval_, [this]() { return stopRequested_; })) break;
        }

        try {
            probe_();
            spdlog::debug("Health check passed");
            continue;
        } catch (const CommandInFlightError&) {
            spdlog::debug("Health check skipped: GET_INFO already in flight");
            continue;
        } catch (const NotConnectedError& e) {
            spdlog::debug("Health check stopping: {}", e.what());
        } catch (const ConnectionLostError& e) {
            spdlog::debug("Health check stopping: {}", e.what());
        } catch (const std::exception& e) {
            failure = e.what();
        }
        break;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
        if (stopRequested_) failure.clear();
    }

    if (!failure.empty()) {
        spdlog::info("Health check failed: {}", failure);
        try {
            onFailure_("health check failed: " + failure);
        } catch (const std::exception& e) {
            spdlog::error("Health check failure handler threw: {}", e.what());
        }
    }
}

} // namespace renkei::controller
