#ifndef RENKEI_DECODE_ERROR_H
#define RENKEI_DECODE_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief A frame could not be decoded.
 *
 * Inbound frames never raise this to callers; it is only thrown by Codec::decodeCommand.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error("Decode Error: " + message) {}
};

} // namespace renkei

#endif // RENKEI_DECODE_ERROR_H
