/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types shared by the directory bridge and the Crowd client.
 * Backend and host operations report failures as result values; exceptions
 * are reserved for configuration and programming errors.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace crowdldap::common {

/**
 * @brief Base exception for all bridge exceptions
 */
class BridgeException : public std::runtime_error {
public:
    explicit BridgeException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error (fatal to initialization)
 */
class ConfigException : public BridgeException {
public:
    explicit ConfigException(const std::string& message)
        : BridgeException("Configuration error: " + message) {}
};

/**
 * @brief Malformed LDAP search filter string (RFC 4515)
 */
class FilterSyntaxException : public BridgeException {
public:
    FilterSyntaxException(const std::string& message, size_t position)
        : BridgeException("Filter syntax error at position " + std::to_string(position) + ": " + message),
          position_(position) {}

    size_t position() const { return position_; }

private:
    size_t position_;
};

} // namespace crowdldap::common
