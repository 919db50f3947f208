#pragma once
/**
 * MotorStatus.hpp
 *
 * Immutable snapshots decoded from device frames.
 *
 *  - MotorStatus: GET_STATUS responses carry every field; CURRENT_POS / ERROR pushes
 *    carry only a subset, so each field is optional.
 *  - MotorInfo: GET_INFO responses only.
 *
 * The client keeps no history; callers retain the latest snapshot themselves
 * (merge() overlays a partial update onto a previous snapshot).
 */

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace renkei::protocol {

// Encoder range reported by the device (raw units, distinct from percent).
constexpr int64_t MAX_ENCODER_POSITION = 65536;

struct MotorStatus {
    std::optional<int64_t> currentPos;
    std::optional<int64_t> limitPos;
    std::optional<int64_t> targetPos;
    std::optional<int64_t> runFlags;
    std::optional<int64_t> errFlags;
    // percent open, carried by CURRENT_POS pushes
    std::optional<int> percent;

    // Reads whichever known keys are present and numeric; unknown keys are ignored.
    static MotorStatus fromJson(const nlohmann::json& data);

    // Returns a copy of this snapshot with every field present in `update` replaced.
    MotorStatus merge(const MotorStatus& update) const;

    bool empty() const noexcept;

    bool operator==(const MotorStatus& other) const noexcept;
    bool operator!=(const MotorStatus& other) const noexcept { return !(*this == other); }
};

struct MotorInfo {
    std::string ip;
    std::string mac;
    std::string firmware;

    static MotorInfo fromJson(const nlohmann::json& data);

    // "aa:bb:cc:dd:ee:ff" -> "aabbccddeeff"
    std::string normalizedMac() const;

    // "RENKEI PoE DDEEFF" (last three MAC bytes, upper-case)
    std::string deviceName() const;
};

} // namespace renkei::protocol
