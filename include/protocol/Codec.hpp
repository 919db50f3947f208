#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace renkei::protocol {

// Command names the device understands.
constexpr const char* CMD_MOVE = "MOVE";
constexpr const char* CMD_ABSOLUTE_MOVE = "A_MOVE";
constexpr const char* CMD_STOP = "STOP";
constexpr const char* CMD_GET_STATUS = "GET_STATUS";
constexpr const char* CMD_GET_INFO = "GET_INFO";
constexpr const char* CMD_JOG = "JOG";

// Push / error discriminators.
constexpr const char* EVT_CURRENT_POS = "CURRENT_POS";
constexpr const char* EVT_ERROR = "ERROR";
constexpr const char* EVT_STATUS = "STATUS";

bool isCommandName(const std::string& name) noexcept;

/**
 * Command: one outbound request.
 * - name: command token (e.g., "MOVE", "GET_STATUS")
 * - params: JSON object of primitive values
 * - expectsResponse: whether the caller waits for a correlated reply
 */
struct Command {
    std::string name;
    nlohmann::json params = nlohmann::json::object();
    bool expectsResponse{true};
};

enum class FrameKind {
    Response,    // {"response": <command name>, "data": {...}}
    DeviceError, // {"response": "ERROR", "data": {"code": .., "description": ..}}
    Event,       // {"event": <type>, ...} or a "response" naming no command
    Invalid,     // malformed; reason in `error`
};

/**
 * Frame: one decoded inbound line.
 * - name: response name / event type (empty when Invalid)
 * - data: the "data" object (empty object when absent)
 * - code / description: populated for DeviceError (and ERROR events when present)
 * - raw: the received line without its trailing newline
 */
struct Frame {
    FrameKind kind{FrameKind::Invalid};
    std::string name;
    nlohmann::json data = nlohmann::json::object();
    int code{0};
    std::string description;
    std::string raw;
    std::string error;
};

struct Codec {
    // {"cmd":NAME,"params":{...}} terminated by '\n'
    static std::string encode(const Command& cmd);

    // Never throws. Malformed input yields FrameKind::Invalid.
    static Frame decode(const std::string& line);

    // Inverse of encode(); throws DecodeError. expectsResponse is not on the wire
    // and decodes as true.
    static Command decodeCommand(const std::string& line);
};

} // namespace renkei::protocol
