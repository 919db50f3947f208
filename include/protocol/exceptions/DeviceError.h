#ifndef RENKEI_DEVICE_ERROR_H
#define RENKEI_DEVICE_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief The device answered with an error code.
 *
 * Codes 100-104 are parameter/command errors, 300-304 hardware errors. The code is
 * kept exactly as the device reported it.
 */
class DeviceError : public std::runtime_error {
public:
    DeviceError(int code, const std::string& description)
        : std::runtime_error("Device Error " + std::to_string(code) + ": " + description),
          code_(code),
          description_(description) {}

    int code() const noexcept { return code_; }
    const std::string& description() const noexcept { return description_; }

private:
    int code_;
    std::string description_;
};

// Documented meaning of a device error code, or "Unknown error" for anything else.
const char* describeDeviceError(int code) noexcept;

} // namespace renkei

#endif // RENKEI_DEVICE_ERROR_H
