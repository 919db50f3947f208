#pragma once
/**
 * ConnectionStateMachine.hpp
 *
 * Owns the single device connection:
 *  - ConnectionState (Disconnected -> Connecting -> Connected -> Reconnecting -> Connecting ...)
 *  - the transport (one ITcpClient per connection attempt, made by a factory)
 *  - the PendingCommandTable and the Dispatcher
 *  - the HealthMonitor while Connected
 *
 * Threading:
 *  - connect() starts a supervisor thread that runs the connect / stabilise / wait-for-loss /
 *    reconnect cycle. Retries are unbounded at a fixed reconnectInterval.
 *  - Inbound lines arrive on the transport's io thread (onLine) and never block there.
 *  - execute() blocks only the calling thread, until response, deadline or connection loss.
 *  - state_, client_ and the lifecycle flags are guarded by one mutex. Leaving Connected
 *    abandons every pending command exactly once under that mutex.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "HealthMonitor.hpp"
#include "../comm/ITcpClient.hpp"
#include "../common/ConnectionState.hpp"
#include "../config/Config.hpp"
#include "../protocol/Codec.hpp"
#include "../protocol/Dispatcher.hpp"
#include "../protocol/PendingCommandTable.hpp"

namespace renkei::controller {

class ConnectionStateMachine {
public:
    using ms = std::chrono::milliseconds;
    using Clock = std::chrono::steady_clock;
    using ClientFactory = std::function<std::shared_ptr<comm::ITcpClient>()>;
    using StatusHandler = protocol::Dispatcher::StatusHandler;
    using ConnectionHandler = protocol::Dispatcher::ConnectionHandler;

    // factory == nullptr -> AsioTcpClient
    explicit ConnectionStateMachine(config::ClientConfig config, ClientFactory factory = nullptr);
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    // Disconnected -> Connecting and start the supervisor. No-op in any other state.
    void connect();

    // Any state -> Disconnected. Fails pending commands with ConnectionLostError.
    void disconnect();

    /**
     * Send one command and wait for its correlated response data.
     * - NotConnectedError unless Connected
     * - CommandInFlightError if the same name is already pending
     * - TimeoutError after `timeout` (config commandTimeout when not given)
     * - DeviceError / ConnectionLostError as delivered by the dispatcher
     * expectsResponse == false: returns an empty object once the frame is queued.
     */
    nlohmann::json execute(const protocol::Command& cmd, std::optional<ms> timeout = std::nullopt);

    ConnectionState state() const;
    bool isConnected() const;
    bool waitForState(ConnectionState target, ms timeout) const;

    // steady-clock time of the last inbound frame
    std::optional<Clock::time_point> lastSeen() const;

    // true from a re-connection until the next GET_STATUS response has been delivered
    bool justReconnected() const noexcept;

    // report link loss for the current connection (health failure, external detection)
    void notifyLinkLost(const std::string& reason);

    void registerStatusHandler(StatusHandler h);
    void registerConnectionHandler(ConnectionHandler h);

    // wait until queued status/connection notifications have been delivered
    void drainNotifications();

    const config::ClientConfig& config() const noexcept { return config_; }
    std::size_t pendingCount() const { return table_->size(); }

private:
    void supervisorLoop();
    bool attemptConnection();
    bool waitBeforeRetry();
    void refreshAfterReconnect();
    void startHealthMonitor();
    void stopHealthMonitor();
    void teardownClient();
    static void shutdownClient(const std::shared_ptr<comm::ITcpClient>& client);

    void onLine(const std::string& line);
    void onTransportLost(uint64_t generation, const std::string& reason);

    // mtx_ must be held
    void transitionLocked(ConnectionState next, const std::string& reason);

    config::ClientConfig config_;
    ClientFactory factory_;

    std::shared_ptr<protocol::PendingCommandTable> table_;
    std::unique_ptr<protocol::Dispatcher> dispatcher_;
    std::shared_ptr<comm::ITcpClient> client_;
    std::unique_ptr<HealthMonitor> monitor_;

    ConnectionState state_{ConnectionState::Disconnected};
    bool stopRequested_{false};
    bool linkLost_{false};
    std::string lossReason_;
    uint64_t generation_{0};
    bool everConnected_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;

    std::atomic<bool> justReconnected_{false};
    std::atomic<Clock::rep> lastSeenTicks_{0};
    std::atomic<bool> hasLastSeen_{false};

    std::thread supervisor_;
    std::mutex lifecycleMtx_; // serializes connect()/disconnect()
};

} // namespace renkei::controller
