/**
 * @file error_codes.h
 * @brief Standardized error codes for the directory bridge
 *
 * Every outcome a host-visible operation can produce, with its LDAP
 * result code. Format: COMPONENT_ERROR_TYPE
 */

#pragma once

#include <string>
#include <json/json.h>

namespace crowdldap::common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Directory Errors (1000-1999)
    DIRECTORY_NO_SUCH_OBJECT = 1001,
    DIRECTORY_UNSUPPORTED_OPERATION = 1002,
    DIRECTORY_INVALID_DN = 1003,
    DIRECTORY_INVALID_FILTER = 1004,
    DIRECTORY_ABANDONED = 1005,

    // Backend Errors (2000-2999)
    BACKEND_UNAVAILABLE = 2001,
    BACKEND_SIZE_LIMIT_EXCEEDED = 2002,

    // Authentication Errors (3000-3999)
    AUTH_INVALID_CREDENTIALS = 3001,
    AUTH_UNAVAILABLE = 3002,

    // System Errors (9000-9999)
    CONFIG_INVALID = 9001,
    SYSTEM_INTERNAL_ERROR = 9002,
};

/**
 * @brief Convert error code to string
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Convert error code to the LDAP result code reported to clients
 *
 * Anything other than SUCCESS maps to a non-zero result code, so a failed
 * bind can never be mistaken for an accepted one.
 */
int errorCodeToLdapResult(ErrorCode code);

/**
 * @brief Human-readable text for an LDAP result code (ldap_err2string)
 */
std::string ldapResultToString(int resultCode);

/**
 * @brief Error response builder
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;
    std::string details_;

public:
    ErrorResponse(ErrorCode code, const std::string& message, const std::string& details = "")
        : code_(code), message_(message), details_(details) {}

    /**
     * @brief Convert to JSON
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["ldapResultCode"] = errorCodeToLdapResult(code_);
        json["error"]["ldapResult"] = ldapResultToString(errorCodeToLdapResult(code_));
        json["error"]["message"] = message_;

        if (!details_.empty()) {
            json["error"]["details"] = details_;
        }

        return json;
    }

    int getLdapResultCode() const {
        return errorCodeToLdapResult(code_);
    }
};

} // namespace crowdldap::common
