#ifndef RENKEI_COMMAND_IN_FLIGHT_ERROR_H
#define RENKEI_COMMAND_IN_FLIGHT_ERROR_H

#include <stdexcept>
#include <string>

namespace renkei {

/**
 * @brief A command of the same name is already awaiting its response.
 *
 * Responses are correlated by name only, so a second same-name command is refused.
 */
class CommandInFlightError : public std::runtime_error {
public:
    explicit CommandInFlightError(const std::string& name)
        : std::runtime_error("Command In Flight: " + name + " is already pending"),
          name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace renkei

#endif // RENKEI_COMMAND_IN_FLIGHT_ERROR_H
