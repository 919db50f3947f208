#ifndef RENKEI_TIMEOUT_ERROR_H
#define RENKEI_TIMEOUT_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief No correlated response arrived before the command's deadline.
 */
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& message)
        : std::runtime_error("Timeout Error: " + message) {}
};

} // namespace renkei

#endif // RENKEI_TIMEOUT_ERROR_H
