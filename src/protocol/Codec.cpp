#include "protocol/Codec.hpp"
#include "protocol/exceptions/DecodeError.h"

#include <array>
#include <cstdint>
#include <limits>

namespace renkei::protocol {

namespace {
    constexpr std::array<const char*, 6> kCommandNames = {
        CMD_MOVE, CMD_ABSOLUTE_MOVE, CMD_STOP, CMD_GET_STATUS, CMD_GET_INFO, CMD_JOG};

    std::string trimLineEnd(const std::string& line) {
        std::string s = line;
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }

    Frame invalid(Frame f, std::string reason) {
        f.kind = FrameKind::Invalid;
        f.name.clear();
        f.error = std::move(reason);
        return f;
    }

    // Device codes arrive either as numbers or numeric strings ("101").
    bool readCode(const nlohmann::json& data, int& out) {
        auto it = data.find("code");
        if (it == data.end()) return false;
        if (it->is_number_unsigned()) {
            const auto v = it->get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
            out = static_cast<int>(v);
            return true;
        }
        if (it->is_number_integer()) {
            const auto v = it->get<int64_t>();
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
            out = static_cast<int>(v);
            return true;
        }
        if (it->is_string()) {
            try {
                std::size_t idx = 0;
                const auto& s = it->get_ref<const std::string&>();
                int v = std::stoi(s, &idx);
                if (idx != s.size()) return false;
                out = v;
                return true;
            } catch (const std::exception&) {
                return false;
            }
        }
        return false;
    }
} // namespace

bool isCommandName(const std::string& name) noexcept {
    for (const char* n : kCommandNames) {
        if (name == n) return true;
    }
    return false;
}

std::string Codec::encode(const Command& cmd) {
    nlohmann::json j;
    j["cmd"] = cmd.name;
    j["params"] = cmd.params.is_object() ? cmd.params : nlohmann::json::object();
    return j.dump() + "\n";
}

Frame Codec::decode(const std::string& line) {
    Frame f;
    f.raw = trimLineEnd(line);
    if (f.raw.empty()) {
        return invalid(std::move(f), "empty frame");
    }

    nlohmann::json j = nlohmann::json::parse(f.raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return invalid(std::move(f), "malformed JSON");
    }
    if (!j.is_object()) {
        return invalid(std::move(f), "frame is not a JSON object");
    }

    auto dataIt = j.find("data");
    if (dataIt != j.end() && !dataIt->is_null()) {
        if (!dataIt->is_object()) {
            return invalid(std::move(f), "\"data\" is not an object");
        }
        f.data = *dataIt;
    }

    auto eventIt = j.find("event");
    auto respIt = j.find("response");

    if (eventIt != j.end()) {
        if (!eventIt->is_string()) return invalid(std::move(f), "\"event\" is not a string");
        f.kind = FrameKind::Event;
        f.name = eventIt->get<std::string>();
    } else if (respIt != j.end()) {
        if (!respIt->is_string()) return invalid(std::move(f), "\"response\" is not a string");
        f.name = respIt->get<std::string>();
        if (f.name == EVT_ERROR) {
            f.kind = FrameKind::DeviceError;
        } else if (isCommandName(f.name)) {
            f.kind = FrameKind::Response;
        } else {
            f.kind = FrameKind::Event;
        }
    } else {
        return invalid(std::move(f), "missing \"response\"/\"event\" discriminator");
    }

    if (f.name.empty()) {
        return invalid(std::move(f), "empty discriminator");
    }

    if (f.name == EVT_ERROR) {
        if (!readCode(f.data, f.code)) f.code = 0;
        auto descIt = f.data.find("description");
        if (descIt != f.data.end() && descIt->is_string()) {
            f.description = descIt->get<std::string>();
        }
    }
    return f;
}

Command Codec::decodeCommand(const std::string& line) {
    const std::string s = trimLineEnd(line);
    nlohmann::json j = nlohmann::json::parse(s, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw DecodeError("command frame is not a JSON object: " + s);
    }
    auto cmdIt = j.find("cmd");
    if (cmdIt == j.end() || !cmdIt->is_string()) {
        throw DecodeError("command frame has no \"cmd\" string: " + s);
    }
    Command cmd;
    cmd.name = cmdIt->get<std::string>();
    auto paramsIt = j.find("params");
    if (paramsIt != j.end()) {
        if (!paramsIt->is_object()) {
            throw DecodeError("\"params\" is not an object: " + s);
        }
        cmd.params = *paramsIt;
    }
    return cmd;
}

} // namespace renkei::protocol
