#include "protocol/MotorStatus.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace renkei::protocol {

namespace {
    std::optional<int64_t> readInt(const nlohmann::json& data, const char* key) {
        auto it = data.find(key);
        if (it == data.end()) return std::nullopt;
        if (it->is_number_unsigned()) {
            const auto v = it->get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(v);
        }
        if (it->is_number_integer()) return it->get<int64_t>();
        if (it->is_number_float()) {
            // values outside int64 are treated as absent
            const double v = it->get<double>();
            if (!std::isfinite(v) || v < -9223372036854775808.0 || v >= 9223372036854775808.0) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        }
        return std::nullopt;
    }

    std::string readString(const nlohmann::json& data, const char* key) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }
} // namespace

MotorStatus MotorStatus::fromJson(const nlohmann::json& data) {
    MotorStatus st;
    if (!data.is_object()) return st;
    st.currentPos = readInt(data, "current_pos");
    st.limitPos = readInt(data, "limit_pos");
    st.targetPos = readInt(data, "target_pos");
    st.runFlags = readInt(data, "run_flags");
    st.errFlags = readInt(data, "err_flags");
    auto pct = readInt(data, "percent");
    if (pct && *pct >= std::numeric_limits<int>::min() && *pct <= std::numeric_limits<int>::max()) {
        st.percent = static_cast<int>(*pct);
    }
    return st;
}

MotorStatus MotorStatus::merge(const MotorStatus& update) const {
    MotorStatus out = *this;
    if (update.currentPos) out.currentPos = update.currentPos;
    if (update.limitPos) out.limitPos = update.limitPos;
    if (update.targetPos) out.targetPos = update.targetPos;
    if (update.runFlags) out.runFlags = update.runFlags;
    if (update.errFlags) out.errFlags = update.errFlags;
    if (update.percent) out.percent = update.percent;
    return out;
}

bool MotorStatus::empty() const noexcept {
    return !currentPos && !limitPos && !targetPos && !runFlags && !errFlags && !percent;
}

bool MotorStatus::operator==(const MotorStatus& other) const noexcept {
    return currentPos == other.currentPos && limitPos == other.limitPos &&
           targetPos == other.targetPos && runFlags == other.runFlags &&
           errFlags == other.errFlags && percent == other.percent;
}

MotorInfo MotorInfo::fromJson(const nlohmann::json& data) {
    MotorInfo info;
    if (!data.is_object()) return info;
    info.ip = readString(data, "ip");
    info.mac = readString(data, "mac");
    info.firmware = readString(data, "firmware");
    return info;
}

std::string MotorInfo::normalizedMac() const {
    std::string out;
    out.reserve(mac.size());
    for (char c : mac) {
        if (c == ':' || c == '-') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string MotorInfo::deviceName() const {
    std::string clean = normalizedMac();
    std::transform(clean.begin(), clean.end(), clean.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (clean.size() >= 6) clean = clean.substr(clean.size() - 6);
    return "RENKEI PoE " + clean;
}

} // namespace renkei::protocol
