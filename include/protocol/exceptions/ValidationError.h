#ifndef RENKEI_VALIDATION_ERROR_H
#define RENKEI_VALIDATION_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief A caller-supplied parameter is out of range.
 *
 * Raised before any network I/O; the command never reaches the device.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error("Validation Error: " + message) {}
};

} // namespace renkei

#endif // RENKEI_VALIDATION_ERROR_H
