#ifndef RENKEI_CLIENT_H
#define RENKEI_CLIENT_H

#include "controller/ConnectionStateMachine.hpp"
#include "protocol/MotorStatus.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace renkei::controller {

/**
 * @class RenkeiClient
 * @brief Public operation surface for one RENKEI PoE motor.
 *
 * Each motion/query call validates its arguments, sends one command over the
 * shared connection and blocks the calling thread until the device answers.
 * Calls with different command names may run concurrently from different threads;
 * a second call with the same name while the first is outstanding fails with
 * CommandInFlightError.
 */
class RenkeiClient {
public:
    using StatusCallback = std::function<void(const protocol::MotorStatus&)>;
    using ConnectionCallback = std::function<void(ConnectionState)>;

    // Parameter ranges accepted by the device.
    static constexpr int MIN_PERCENT = 0;
    static constexpr int MAX_PERCENT = 100;
    static constexpr int MAX_MOVE_DELAY_SECONDS = 30;
    static constexpr int MAX_ENCODER_POSITION = 65536;
    static constexpr int MAX_ABSOLUTE_DELAY_MS = 10000;
    static constexpr int MIN_JOG_COUNT = 1;
    static constexpr int MAX_JOG_COUNT = 10;

    /**
     * @brief Constructs a client. Does not connect.
     * @param config Host settings; validated here (ValidationError).
     * @param factory Transport factory, AsioTcpClient when empty.
     */
    explicit RenkeiClient(config::ClientConfig config,
                          ConnectionStateMachine::ClientFactory factory = nullptr);

    ~RenkeiClient();

    RenkeiClient(const RenkeiClient&) = delete;
    RenkeiClient& operator=(const RenkeiClient&) = delete;

    /**
     * @brief Starts connecting in the background; returns immediately.
     */
    void connect();

    /**
     * @brief Closes the connection and stops reconnecting. Pending calls fail with ConnectionLostError.
     */
    void disconnect();

    /**
     * @brief Moves the motor to a percentage position.
     * @param position Percent open, 0-100.
     * @param delaySeconds Delay before moving, 0-30 s.
     * @return The response data of the MOVE command.
     */
    nlohmann::json move(int position, int delaySeconds = 0);

    /**
     * @brief Moves the motor to an absolute encoder position.
     * @param position Encoder value, 0-65536.
     * @param delayMs Delay before moving, 0-10000 ms.
     * @return The response data of the A_MOVE command.
     */
    nlohmann::json absoluteMove(int position, int delayMs = 0);

    /**
     * @brief Stops the motor immediately.
     */
    nlohmann::json stop();

    /**
     * @brief Jogs the motor for identification.
     * @param count Number of jogs, 1-10.
     */
    nlohmann::json jog(int count = 1);

    protocol::MotorStatus getStatus();
    protocol::MotorInfo getInfo();

    ConnectionState state() const;
    bool isConnected() const;
    bool waitUntilConnected(std::chrono::milliseconds timeout) const;
    std::optional<std::chrono::steady_clock::time_point> lastSeen() const;
    bool justReconnected() const noexcept;

    // Single slot each; a new registration replaces the previous, nullptr clears.
    void registerStatusCallback(StatusCallback cb);
    void registerConnectionCallback(ConnectionCallback cb);

    ConnectionStateMachine& connection() noexcept { return *connection_; }

private:
    std::unique_ptr<ConnectionStateMachine> connection_;
};

} // namespace renkei::controller

#endif // RENKEI_CLIENT_H
