#include "config/Config.hpp"
#include "protocol/exceptions/ValidationError.h"

#include <cmath>

namespace renkei::config {

void ClientConfig::validate() const {
    if (host.empty()) {
        throw ValidationError("host must not be empty");
    }
    if (port == 0) {
        throw ValidationError("port must be in 1-65535");
    }
    if (reconnectInterval.count() < 0 || healthCheckInterval.count() < 0 ||
        stabiliseDelay.count() < 0) {
        throw ValidationError("intervals and delays must not be negative");
    }
    if (commandTimeout.count() <= 0 || probeTimeout.count() <= 0 || connectTimeout.count() <= 0) {
        throw ValidationError("command, probe and connect timeouts must be positive");
    }
}

ms fromSeconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw ValidationError("duration must be a non-negative number of seconds");
    }
    return ms(static_cast<ms::rep>(std::llround(seconds * 1000.0)));
}

} // namespace renkei::config
