#include "controller/RenkeiClient.h"
#include "protocol/Codec.hpp"
#include "protocol/exceptions/ValidationError.h"

#include "spdlog/spdlog.h"

#include <string>
#include <utility>

namespace renkei::controller {

namespace {
    void checkRange(const char* what, int value, int lo, int hi) {
        if (value < lo || value > hi) {
            throw ValidationError(std::string(what) + " must be in " + std::to_string(lo) + "-" +
                                  std::to_string(hi) + ", got " + std::to_string(value));
        }
    }
} // namespace

/**
 * @brief Constructor for the RenkeiClient class.
 * @param config Host settings.
 * @param factory Transport factory.
 */
RenkeiClient::RenkeiClient(config::ClientConfig config, ConnectionStateMachine::ClientFactory factory)
    : connection_(std::make_unique<ConnectionStateMachine>(std::move(config), std::move(factory))) {
    spdlog::info("RenkeiClient object created: {}:{}", connection_->config().host,
                 connection_->config().port);
}

RenkeiClient::~RenkeiClient() = default;

void RenkeiClient::connect() {
    connection_->connect();
}

void RenkeiClient::disconnect() {
    spdlog::info("Disconnecting from motor...");
    connection_->disconnect();
}

nlohmann::json RenkeiClient::move(int position, int delaySeconds) {
    checkRange("position", position, MIN_PERCENT, MAX_PERCENT);
    checkRange("delay", delaySeconds, 0, MAX_MOVE_DELAY_SECONDS);
    protocol::Command cmd{protocol::CMD_MOVE, {{"pos", position}, {"delay", delaySeconds}}};
    return connection_->execute(cmd);
}

nlohmann::json RenkeiClient::absoluteMove(int position, int delayMs) {
    checkRange("absolute position", position, 0, MAX_ENCODER_POSITION);
    checkRange("delay", delayMs, 0, MAX_ABSOLUTE_DELAY_MS);
    protocol::Command cmd{protocol::CMD_ABSOLUTE_MOVE, {{"pos", position}, {"delay", delayMs}}};
    return connection_->execute(cmd);
}

nlohmann::json RenkeiClient::stop() {
    // no priority lane: STOP shares the socket ordering with everything else
    protocol::Command cmd{protocol::CMD_STOP};
    return connection_->execute(cmd);
}

nlohmann::json RenkeiClient::jog(int count) {
    checkRange("jog count", count, MIN_JOG_COUNT, MAX_JOG_COUNT);
    protocol::Command cmd{protocol::CMD_JOG, {{"count", count}}};
    return connection_->execute(cmd);
}

protocol::MotorStatus RenkeiClient::getStatus() {
    protocol::Command cmd{protocol::CMD_GET_STATUS};
    return protocol::MotorStatus::fromJson(connection_->execute(cmd));
}

protocol::MotorInfo RenkeiClient::getInfo() {
    protocol::Command cmd{protocol::CMD_GET_INFO};
    return protocol::MotorInfo::fromJson(connection_->execute(cmd));
}

ConnectionState RenkeiClient::state() const {
    return connection_->state();
}

bool RenkeiClient::isConnected() const {
    return connection_->isConnected();
}

bool RenkeiClient::waitUntilConnected(std::chrono::milliseconds timeout) const {
    return connection_->waitForState(ConnectionState::Connected, timeout);
}

std::optional<std::chrono::steady_clock::time_point> RenkeiClient::lastSeen() const {
    return connection_->lastSeen();
}

bool RenkeiClient::justReconnected() const noexcept {
    return connection_->justReconnected();
}

void RenkeiClient::registerStatusCallback(StatusCallback cb) {
    connection_->registerStatusHandler(std::move(cb));
}

void RenkeiClient::registerConnectionCallback(ConnectionCallback cb) {
    connection_->registerConnectionHandler(std::move(cb));
}

} // namespace renkei::controller
