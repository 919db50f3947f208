// src/controller/ConnectionStateMachine.cpp
#include "controller/ConnectionStateMachine.hpp"
#include "comm/AsioTcpClient.hpp"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/NotConnectedError.h"
#include "protocol/exceptions/ValidationError.h"

#include "spdlog/spdlog.h"

#include <stdexcept>
#include <utility>

namespace renkei::controller {

using protocol::Codec;
using protocol::Command;
using protocol::FrameKind;

ConnectionStateMachine::ConnectionStateMachine(config::ClientConfig config, ClientFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      table_(std::make_shared<protocol::PendingCommandTable>()),
      dispatcher_(std::make_unique<protocol::Dispatcher>(table_)) {
    config_.validate();
    if (!factory_) {
        factory_ = []() { return std::make_shared<comm::AsioTcpClient>(); };
    }
    spdlog::debug("ConnectionStateMachine initialised - host={}, port={}, health_check_interval={} ms",
                  config_.host, config_.port, config_.healthCheckInterval.count());
}

ConnectionStateMachine::~ConnectionStateMachine() {
    disconnect();
    dispatcher_->shutdown();
}

void ConnectionStateMachine::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != ConnectionState::Disconnected) return;
    }
    if (supervisor_.joinable()) supervisor_.join();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = false;
        linkLost_ = false;
        transitionLocked(ConnectionState::Connecting, "connect requested");
    }
    supervisor_ = std::thread(&ConnectionStateMachine::supervisorLoop, this);
}

void ConnectionStateMachine::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        wasRunning = state_ != ConnectionState::Disconnected || supervisor_.joinable();
        stopRequested_ = true;
        transitionLocked(ConnectionState::Disconnected, "client disconnected");
    }
    cv_.notify_all();
    table_->abandonAll("client disconnected");

    if (supervisor_.joinable()) {
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            spdlog::error("disconnect() called from the supervisor thread; detaching");
            supervisor_.detach();
        } else {
            supervisor_.join();
        }
    }
    // supervisor normally tears these down; this covers a supervisor that never ran
    stopHealthMonitor();
    teardownClient();
    if (wasRunning) spdlog::info("Disconnected cleanly.");
}

nlohmann::json ConnectionStateMachine::execute(const Command& cmd, std::optional<ms> timeout) {
    if (cmd.name.empty()) {
        throw ValidationError("command name must not be empty");
    }
    const ms effective = timeout.value_or(config_.commandTimeout);

    std::shared_ptr<comm::ITcpClient> client;
    std::future<nlohmann::json> fut;
    uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != ConnectionState::Connected) {
            if (state_ == ConnectionState::Connecting && client_) {
                throw NotConnectedError("connection not yet ready");
            }
            throw NotConnectedError(std::string("connection is ") + toString(state_));
        }
        client = client_;
        // registered under the state lock so a concurrent loss transition cannot miss it
        if (cmd.expectsResponse) {
            fut = table_->registerCommand(cmd.name, effective, &sequence);
        }
    }
    const auto deadline = Clock::now() + effective;

    const std::string line = Codec::encode(cmd);
    try {
        client->sendLine(line);
        spdlog::debug("Sent command: {}", line.substr(0, line.size() - 1));
    } catch (const std::exception& e) {
        spdlog::error("Failed to send command '{}': {}", cmd.name, e.what());
        ConnectionLostError err("failed to send command '" + cmd.name + "': " + e.what());
        if (!cmd.expectsResponse) throw err;
        // a stale write must not fail a newer waiter registered under the same name
        table_->fail(cmd.name, sequence, std::make_exception_ptr(err));
    }

    if (!cmd.expectsResponse) return nlohmann::json::object();

    spdlog::debug("Waiting for response to {}...", cmd.name);
    if (fut.wait_until(deadline) != std::future_status::ready) {
        table_->timeoutSweep(Clock::now());
    }
    return fut.get();
}

ConnectionState ConnectionStateMachine::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

bool ConnectionStateMachine::isConnected() const {
    return state() == ConnectionState::Connected;
}

bool ConnectionStateMachine::waitForState(ConnectionState target, ms timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this, target]() { return state_ == target; });
}

std::optional<ConnectionStateMachine::Clock::time_point> ConnectionStateMachine::lastSeen() const {
    if (!hasLastSeen_.load()) return std::nullopt;
    return Clock::time_point(Clock::duration(lastSeenTicks_.load()));
}

bool ConnectionStateMachine::justReconnected() const noexcept {
    return justReconnected_.load();
}

void ConnectionStateMachine::notifyLinkLost(const std::string& reason) {
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        gen = generation_;
    }
    onTransportLost(gen, reason);
}

void ConnectionStateMachine::registerStatusHandler(StatusHandler h) {
    dispatcher_->registerStatusHandler(std::move(h));
}

void ConnectionStateMachine::registerConnectionHandler(ConnectionHandler h) {
    dispatcher_->registerConnectionHandler(std::move(h));
}

void ConnectionStateMachine::drainNotifications() {
    dispatcher_->drain();
}

void ConnectionStateMachine::transitionLocked(ConnectionState next, const std::string& reason) {
    if (state_ == next) return;
    const ConnectionState prev = state_;
    state_ = next;
    spdlog::debug("Connection state changed from {} to {} ({})", toString(prev), toString(next), reason);

    if (prev == ConnectionState::Connected) {
        const auto n = table_->abandonAll(reason);
        if (n) spdlog::info("Failed {} pending command(s): {}", n, reason);
    }
    dispatcher_->notifyConnectionState(next);
    cv_.notify_all();
}

void ConnectionStateMachine::onTransportLost(uint64_t generation, const std::string& reason) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (generation != generation_ || stopRequested_ || linkLost_) return;
    linkLost_ = true;
    lossReason_ = reason;
    if (state_ == ConnectionState::Connected || state_ == ConnectionState::Connecting) {
        spdlog::info("Connection lost ({}), attempting to reconnect", reason);
        transitionLocked(ConnectionState::Reconnecting, "connection lost: " + reason);
    }
    cv_.notify_all();
}

void ConnectionStateMachine::onLine(const std::string& line) {
    const auto now = Clock::now();
    lastSeenTicks_.store(now.time_since_epoch().count());
    hasLastSeen_.store(true);
    spdlog::debug("Raw line received: {}", line);

    const auto frame = Codec::decode(line);
    table_->timeoutSweep(now);
    dispatcher_->onFrame(frame);

    if (frame.kind == FrameKind::Response && frame.name == protocol::CMD_GET_STATUS &&
        justReconnected_.load()) {
        // cleared behind the status notification for this response
        dispatcher_->defer([this]() { justReconnected_.store(false); });
    }
}

void ConnectionStateMachine::supervisorLoop() {
    while (true) {
        if (!attemptConnection()) {
            if (!waitBeforeRetry()) break;
            continue;
        }

        if (config_.stabiliseDelay.count() > 0) {
            spdlog::debug("Allowing {} ms for motor to stabilise...", config_.stabiliseDelay.count());
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, config_.stabiliseDelay, [this]() { return stopRequested_ || linkLost_; });
        }

        bool reconnected = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopRequested_) break;
            if (!linkLost_) {
                transitionLocked(ConnectionState::Connected, "connection established");
                reconnected = everConnected_;
                everConnected_ = true;
            }
        }

        if (isConnected()) {
            spdlog::info("Connected to {}:{}", config_.host, config_.port);
            if (reconnected) {
                justReconnected_.store(true);
                refreshAfterReconnect();
            }
            startHealthMonitor();

            std::unique_lock<std::mutex> lk(mtx_);
            while (!stopRequested_ && !linkLost_) {
                cv_.wait_for(lk, config::SUPERVISOR_TICK_MS);
                lk.unlock();
                table_->timeoutSweep(Clock::now());
                lk.lock();
            }
        }

        stopHealthMonitor();
        teardownClient();
        if (!waitBeforeRetry()) break;
    }

    stopHealthMonitor();
    teardownClient();
    spdlog::debug("Supervisor exiting");
}

bool ConnectionStateMachine::attemptConnection() {
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopRequested_) return false;
        transitionLocked(ConnectionState::Connecting, "connecting");
        gen = ++generation_;
        linkLost_ = false;
        lossReason_.clear();
    }

    std::shared_ptr<comm::ITcpClient> client;
    try {
        client = factory_();
        if (!client) throw std::runtime_error("transport factory returned null");
        client->registerRecvHandler([this](const std::string& line) { onLine(line); });
        client->setOnDisconnect([this, gen](const std::string& reason) { onTransportLost(gen, reason); });

        spdlog::info("Connecting to {}:{}", config_.host, config_.port);
        client->connect(config_.host, config_.port, config_.connectTimeout);
        client->start();
    } catch (const std::exception& ex) {
        spdlog::error("Failed to connect to {}:{}: {}", config_.host, config_.port, ex.what());
        if (client) shutdownClient(client);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!stopRequested_) {
            client_ = client;
            return true;
        }
    }
    shutdownClient(client);
    return false;
}

bool ConnectionStateMachine::waitBeforeRetry() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (stopRequested_) return false;
    transitionLocked(ConnectionState::Reconnecting,
                     lossReason_.empty() ? "connect attempt failed" : lossReason_);
    spdlog::info("Attempting to reconnect in {} ms...", config_.reconnectInterval.count());
    cv_.wait_for(lk, config_.reconnectInterval, [this]() { return stopRequested_; });
    return !stopRequested_;
}

void ConnectionStateMachine::refreshAfterReconnect() {
    try {
        Command cmd{protocol::CMD_GET_STATUS};
        execute(cmd, config_.probeTimeout);
        spdlog::debug("Motor status refreshed after reconnection");
    } catch (const std::exception& e) {
        spdlog::warn("Failed to refresh status after reconnection: {}", e.what());
    }
}

void ConnectionStateMachine::startHealthMonitor() {
    if (config_.healthCheckInterval.count() == 0) {
        spdlog::debug("Health check disabled (interval = 0)");
        return;
    }
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        gen = generation_;
    }
    monitor_ = std::make_unique<HealthMonitor>(
        [this]() {
            Command probe{protocol::CMD_GET_INFO};
            execute(probe, config_.probeTimeout);
        },
        [this, gen](const std::string& reason) { onTransportLost(gen, reason); },
        config_.healthCheckInterval);
    monitor_->start();
}

void ConnectionStateMachine::stopHealthMonitor() {
    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }
}

void ConnectionStateMachine::teardownClient() {
    std::shared_ptr<comm::ITcpClient> client;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        client = std::move(client_);
        client_.reset();
    }
    if (client) shutdownClient(client);
}

void ConnectionStateMachine::shutdownClient(const std::shared_ptr<comm::ITcpClient>& client) {
    client->registerRecvHandler(nullptr);
    client->setOnDisconnect(nullptr);
    try {
        client->stop();
        client->disconnect();
    } catch (const std::exception& e) {
        spdlog::debug("Exception during transport cleanup: {}", e.what());
    }
}

} // namespace renkei::controller
