#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace renkei::config {

using ms = std::chrono::milliseconds;

// Device TCP port
constexpr uint16_t DEFAULT_PORT = 17002;

// 재연결 간격 (고정 간격, backoff 없음)
constexpr ms DEFAULT_RECONNECT_INTERVAL_MS = ms(10000);

// Health probe 간격 (0 = disabled)
constexpr ms DEFAULT_HEALTH_CHECK_INTERVAL_MS = ms(60000);

// 연결 직후 장비 안정화 대기
constexpr ms DEFAULT_STABILISE_DELAY_MS = ms(500);

// 기본 응답 대기타임
constexpr ms DEFAULT_COMMAND_TIMEOUT_MS = ms(10000);
constexpr ms DEFAULT_PROBE_TIMEOUT_MS = ms(5000);
constexpr ms DEFAULT_CONNECT_TIMEOUT_MS = ms(5000);

// Supervisor tick (timeout sweep 주기)
constexpr ms SUPERVISOR_TICK_MS = ms(50);

/**
 * ClientConfig
 *
 * Host-supplied settings for one RenkeiClient. Defaults mirror the constants above.
 */
struct ClientConfig {
    std::string host;
    uint16_t port{DEFAULT_PORT};
    ms reconnectInterval{DEFAULT_RECONNECT_INTERVAL_MS};
    ms healthCheckInterval{DEFAULT_HEALTH_CHECK_INTERVAL_MS};
    ms stabiliseDelay{DEFAULT_STABILISE_DELAY_MS};
    ms commandTimeout{DEFAULT_COMMAND_TIMEOUT_MS};
    ms probeTimeout{DEFAULT_PROBE_TIMEOUT_MS};
    ms connectTimeout{DEFAULT_CONNECT_TIMEOUT_MS};

    // throws ValidationError describing the first bad field
    void validate() const;
};

// Converts host-facing seconds (possibly fractional, e.g. 0.5) into milliseconds.
ms fromSeconds(double seconds);

} // namespace renkei::config
