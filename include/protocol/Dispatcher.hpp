#pragma once
/**
 * Dispatcher.hpp
 *
 * Routes decoded inbound frames:
 *  - Response    -> PendingCommandTable::resolve (GET_STATUS replies are also published)
 *  - DeviceError -> fails the oldest pending command with DeviceError
 *  - Event       -> status handler as a (partial) MotorStatus; unknown types are dropped
 *  - Invalid     -> logged and dropped
 *
 * Status and connection handlers never run on the caller of onFrame() (the socket
 * read loop). They are queued to one worker thread, which keeps them in order and
 * runs them under no client lock.
 *
 * 사용:
 *   dispatcher.registerStatusHandler([](const MotorStatus& st) { ... });
 *   dispatcher.onFrame(Codec::decode(line));
 */

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "Codec.hpp"
#include "MotorStatus.hpp"
#include "PendingCommandTable.hpp"
#include "common/ConnectionState.hpp"
#include "common/ThreadSafeQueue.h"

namespace renkei::protocol {

class Dispatcher {
public:
    using StatusHandler = std::function<void(const MotorStatus&)>;
    using ConnectionHandler = std::function<void(ConnectionState)>;

    explicit Dispatcher(std::shared_ptr<PendingCommandTable> table);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void onFrame(const Frame& frame);

    // single slot each: a new registration replaces the old one, nullptr clears it
    void registerStatusHandler(StatusHandler h);
    void registerConnectionHandler(ConnectionHandler h);

    // queue a connection-state notification behind everything already queued
    void notifyConnectionState(ConnectionState state);

    // Blocks until every notification queued before the call has been delivered.
    // Must not be called from inside a handler.
    void drain();

    // run `task` on the handler thread after everything already queued
    void defer(std::function<void()> task);

    // stop the worker after delivering what is already queued
    void shutdown();

private:
    void publishStatus(const MotorStatus& status);
    void workerLoop();

    std::shared_ptr<PendingCommandTable> table_;

    StatusHandler statusHandler_;
    ConnectionHandler connectionHandler_;
    std::mutex handlerMtx_;

    common::ThreadSafeQueue<std::function<void()>> tasks_;
    std::thread worker_;
    std::atomic<bool> stopped_{false};
};

} // namespace renkei::protocol
