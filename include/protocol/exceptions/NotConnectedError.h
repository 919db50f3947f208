#ifndef RENKEI_NOT_CONNECTED_ERROR_H
#define RENKEI_NOT_CONNECTED_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief A command was attempted while the connection is not in the Connected state.
 */
class NotConnectedError : public std::runtime_error {
public:
    explicit NotConnectedError(const std::string& message)
        : std::runtime_error("Not Connected: " + message) {}
};

} // namespace renkei

#endif // RENKEI_NOT_CONNECTED_ERROR_H
