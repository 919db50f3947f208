#include "protocol/Dispatcher.hpp"
#include "protocol/exceptions/DeviceError.h"

#include "spdlog/spdlog.h"

#include <future>
#include <stdexcept>
#include <utility>

namespace renkei::protocol {

Dispatcher::Dispatcher(std::shared_ptr<PendingCommandTable> table)
    : table_(std::move(table)) {
    if (!table_) {
        throw std::invalid_argument("PendingCommandTable object is not valid.");
    }
    worker_ = std::thread(&Dispatcher::workerLoop, this);
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::shutdown() {
    if (stopped_.exchange(true)) return;
    tasks_.close();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            // destroyed from inside a handler; let the worker finish on its own
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void Dispatcher::workerLoop() {
    while (auto task = tasks_.pop()) {
        try {
            (*task)();
        } catch (const std::exception& ex) {
            spdlog::error("[Dispatcher] handler threw: {}", ex.what());
        }
    }
}

void Dispatcher::defer(std::function<void()> task) {
    if (!tasks_.push(std::move(task))) {
        spdlog::debug("[Dispatcher] dropped notification after shutdown");
    }
}

void Dispatcher::onFrame(const Frame& frame) {
    switch (frame.kind) {
        case FrameKind::Invalid:
            spdlog::warn("Invalid frame from motor ({}): {}", frame.error, frame.raw);
            return;

        case FrameKind::Response:
            spdlog::debug("Received response for command: {}", frame.name);
            table_->resolve(frame.name, frame.data);
            if (frame.name == CMD_GET_STATUS) {
                publishStatus(MotorStatus::fromJson(frame.data));
            }
            return;

        case FrameKind::DeviceError: {
            const std::string desc = frame.description.empty()
                                         ? describeDeviceError(frame.code)
                                         : frame.description;
            spdlog::error("Motor returned error {}: {}", frame.code, desc);
            std::string failed;
            if (table_->failOldest(std::make_exception_ptr(DeviceError(frame.code, desc)), &failed)) {
                spdlog::debug("Set error for pending command {}", failed);
            } else {
                spdlog::warn("Received ERROR response but no pending commands");
                MotorStatus st;
                st.errFlags = frame.code;
                publishStatus(st);
            }
            return;
        }

        case FrameKind::Event: {
            MotorStatus st;
            if (frame.name == EVT_CURRENT_POS || frame.name == EVT_STATUS ||
                frame.name == CMD_GET_STATUS) {
                st = MotorStatus::fromJson(frame.data);
            } else if (frame.name == EVT_ERROR) {
                st.errFlags = frame.code;
            } else {
                spdlog::info("Unhandled event type {}; dropping", frame.name);
                return;
            }
            if (st.empty()) {
                spdlog::debug("Event {} carried no status fields: {}", frame.name, frame.raw);
                return;
            }
            publishStatus(st);
            return;
        }
    }
}

void Dispatcher::publishStatus(const MotorStatus& status) {
    StatusHandler h;
    {
        std::lock_guard<std::mutex> lk(handlerMtx_);
        h = statusHandler_;
    }
    if (!h) return;
    defer([h, status]() { h(status); });
}

void Dispatcher::notifyConnectionState(ConnectionState state) {
    ConnectionHandler h;
    {
        std::lock_guard<std::mutex> lk(handlerMtx_);
        h = connectionHandler_;
    }
    if (!h) return;
    defer([h, state]() { h(state); });
}

void Dispatcher::registerStatusHandler(StatusHandler h) {
    std::lock_guard<std::mutex> lk(handlerMtx_);
    statusHandler_ = std::move(h);
}

void Dispatcher::registerConnectionHandler(ConnectionHandler h) {
    std::lock_guard<std::mutex> lk(handlerMtx_);
    connectionHandler_ = std::move(h);
}

void Dispatcher::drain() {
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!tasks_.push([done]() { done->set_value(); })) return;
    fut.wait();
}

} // namespace renkei::protocol
