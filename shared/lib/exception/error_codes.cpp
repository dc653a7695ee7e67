/**
 * @file error_codes.cpp
 * @brief Error code names and LDAP result code mapping
 */

#include "error_codes.h"

#include <ldap.h>

namespace crowdldap::common {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        // Directory
        case ErrorCode::DIRECTORY_NO_SUCH_OBJECT: return "DIRECTORY_NO_SUCH_OBJECT";
        case ErrorCode::DIRECTORY_UNSUPPORTED_OPERATION: return "DIRECTORY_UNSUPPORTED_OPERATION";
        case ErrorCode::DIRECTORY_INVALID_DN: return "DIRECTORY_INVALID_DN";
        case ErrorCode::DIRECTORY_INVALID_FILTER: return "DIRECTORY_INVALID_FILTER";
        case ErrorCode::DIRECTORY_ABANDONED: return "DIRECTORY_ABANDONED";

        // Backend
        case ErrorCode::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorCode::BACKEND_SIZE_LIMIT_EXCEEDED: return "BACKEND_SIZE_LIMIT_EXCEEDED";

        // Authentication
        case ErrorCode::AUTH_INVALID_CREDENTIALS: return "AUTH_INVALID_CREDENTIALS";
        case ErrorCode::AUTH_UNAVAILABLE: return "AUTH_UNAVAILABLE";

        // System
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR";
}

int errorCodeToLdapResult(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return LDAP_SUCCESS;

        case ErrorCode::DIRECTORY_NO_SUCH_OBJECT: return LDAP_NO_SUCH_OBJECT;
        case ErrorCode::DIRECTORY_UNSUPPORTED_OPERATION: return LDAP_UNWILLING_TO_PERFORM;
        case ErrorCode::DIRECTORY_INVALID_DN: return LDAP_INVALID_DN_SYNTAX;
        case ErrorCode::DIRECTORY_INVALID_FILTER: return LDAP_PROTOCOL_ERROR;
        case ErrorCode::DIRECTORY_ABANDONED: return LDAP_CANCELLED;

        case ErrorCode::BACKEND_UNAVAILABLE: return LDAP_UNAVAILABLE;
        case ErrorCode::BACKEND_SIZE_LIMIT_EXCEEDED: return LDAP_SIZELIMIT_EXCEEDED;

        case ErrorCode::AUTH_INVALID_CREDENTIALS: return LDAP_INVALID_CREDENTIALS;
        case ErrorCode::AUTH_UNAVAILABLE: return LDAP_UNAVAILABLE;

        case ErrorCode::CONFIG_INVALID: return LDAP_OTHER;
        case ErrorCode::SYSTEM_INTERNAL_ERROR: return LDAP_OTHER;
    }
    return LDAP_OTHER;
}

std::string ldapResultToString(int resultCode) {
    const char* text = ldap_err2string(resultCode);
    return text ? std::string(text) : "Unknown error";
}

} // namespace crowdldap::common
