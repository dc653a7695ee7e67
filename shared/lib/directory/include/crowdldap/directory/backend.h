/**
 * @file backend.h
 * @brief Identity backend interface
 *
 * The request/response surface of the remote identity service. Every call
 * returns an explicit status value; implementations never throw across this
 * boundary, so callers must handle UNAVAILABLE separately from NOT_FOUND.
 *
 * Implementations must be safe for concurrent use: the bridge issues calls
 * from every directory session without external locking.
 */

#pragma once

#include "types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crowdldap::directory {

/// @brief Outcome of one backend call
enum class BackendStatus {
    OK,
    NOT_FOUND,    ///< Named record does not exist
    UNAVAILABLE   ///< Network, timeout or protocol failure
};

/// @brief Backend answer to an authenticate call
enum class CredentialStatus {
    VALID,
    INVALID_CREDENTIALS,
    UNKNOWN_USER,
    ACCOUNT_DISABLED,   ///< Inactive, locked or expired account
    UNAVAILABLE
};

/**
 * @brief Status plus value of one backend call
 */
template <typename T>
struct BackendResult {
    BackendStatus status = BackendStatus::UNAVAILABLE;
    std::optional<T> value;
    std::string message;

    bool ok() const { return status == BackendStatus::OK; }
    bool notFound() const { return status == BackendStatus::NOT_FOUND; }
    bool unavailable() const { return status == BackendStatus::UNAVAILABLE; }

    static BackendResult success(T v) {
        BackendResult r;
        r.status = BackendStatus::OK;
        r.value = std::move(v);
        return r;
    }

    static BackendResult missing(std::string msg = "") {
        BackendResult r;
        r.status = BackendStatus::NOT_FOUND;
        r.message = std::move(msg);
        return r;
    }

    static BackendResult failure(std::string msg) {
        BackendResult r;
        r.status = BackendStatus::UNAVAILABLE;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * @brief Identity service lookup/search/authenticate interface
 */
class IDirectoryBackend {
public:
    virtual ~IDirectoryBackend() = default;

    virtual BackendResult<Identity> findUser(const std::string& name) = 0;

    virtual BackendResult<Group> findGroup(const std::string& name) = 0;

    /**
     * @brief List users
     * @param maxCount Upper bound on the number of records returned
     */
    virtual BackendResult<std::vector<Identity>> listUsers(size_t maxCount) = 0;

    /**
     * @brief List groups (with their direct members)
     * @param maxCount Upper bound on the number of records returned
     */
    virtual BackendResult<std::vector<Group>> listGroups(size_t maxCount) = 0;

    /**
     * @brief Names of the groups principalName is a direct member of
     */
    virtual BackendResult<std::vector<std::string>> directGroupsOf(
        const std::string& principalName, PrincipalKind kind) = 0;

    virtual CredentialStatus authenticate(const std::string& username, const std::string& secret) = 0;

    /**
     * @brief Reachability check used at startup
     */
    virtual BackendStatus testConnection() = 0;
};

/// @brief Convert BackendStatus to string
inline std::string backendStatusToString(BackendStatus status) {
    switch (status) {
        case BackendStatus::OK:          return "OK";
        case BackendStatus::NOT_FOUND:   return "NOT_FOUND";
        case BackendStatus::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

/// @brief Convert CredentialStatus to string
inline std::string credentialStatusToString(CredentialStatus status) {
    switch (status) {
        case CredentialStatus::VALID:               return "VALID";
        case CredentialStatus::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
        case CredentialStatus::UNKNOWN_USER:        return "UNKNOWN_USER";
        case CredentialStatus::ACCOUNT_DISABLED:    return "ACCOUNT_DISABLED";
        case CredentialStatus::UNAVAILABLE:         return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace crowdldap::directory
