/**
 * Hoops Rotation Engine - Error Types
 *
 * Construction-time failures are exceptions; everything that can happen
 * during a match is reported through result structs instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hoops {

/**
 * ConfigurationError - Roster too small, malformed starting five,
 * invalid minutes allotment or unreadable match setup.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace hoops
