/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across the bridge. LDAP attribute names
 * and directory string values are ASCII case-insensitive, so most helpers
 * here deal with case folding.
 */

#pragma once

#include <optional>
#include <string>

namespace crowdldap {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief ASCII case-insensitive equality
 */
bool equalsIgnoreCase(const std::string& a, const std::string& b);

/**
 * @brief ASCII case-insensitive ordering (a < b)
 */
bool lessIgnoreCase(const std::string& a, const std::string& b);

/**
 * @brief Parse a boolean setting
 *
 * Accepts true/false, 1/0, yes/no, on/off (any case, surrounding blanks ignored).
 *
 * @param value Raw setting value
 * @return Parsed value, or std::nullopt if unrecognized
 */
std::optional<bool> parseBool(const std::string& value);

/**
 * @brief Check if string is safe to print as-is in LDIF (RFC 2849 SAFE-STRING)
 */
bool isLdifSafe(const std::string& str);

} // namespace utils
} // namespace crowdldap
