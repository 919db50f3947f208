#ifndef RENKEI_CONNECTION_LOST_ERROR_H
#define RENKEI_CONNECTION_LOST_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief Delivered to every outstanding command when the link drops or the client disconnects.
 */
class ConnectionLostError : public std::runtime_error {
public:
    explicit ConnectionLostError(const std::string& message)
        : std::runtime_error("Connection Lost: " + message) {}
};

} // namespace renkei

#endif // RENKEI_CONNECTION_LOST_ERROR_H
