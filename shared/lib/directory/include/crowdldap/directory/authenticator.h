/**
 * @file authenticator.h
 * @brief Simple-bind credential check against the identity backend
 */

#pragma once

#include "backend.h"
#include "dn_mapper.h"
#include "types.h"

#include <string>

namespace crowdldap::directory {

/**
 * @brief Bind authenticator
 *
 * Fails closed: anything other than a VALID answer from the backend is
 * never ACCEPTED. No credential caching; every bind is a backend call.
 */
class Authenticator {
public:
    /**
     * @brief Constructor
     * @param mapper DN mapper (non-owning)
     * @param backend Identity backend (non-owning)
     * @throws std::invalid_argument if backend is nullptr
     */
    Authenticator(const DnMapper& mapper, IDirectoryBackend* backend);

    /**
     * @brief Check a username/secret pair
     *
     * Empty username or secret is REJECTED without a backend call.
     * INVALID_CREDENTIALS, UNKNOWN_USER and ACCOUNT_DISABLED fold to REJECTED;
     * backend UNAVAILABLE is reported as UNAVAILABLE.
     */
    AuthOutcome authenticate(const std::string& username, const std::string& secret) const;

    /**
     * @brief Check a bind DN/secret pair
     *
     * The bind DN must name an entry in the users branch; any other DN
     * (including unparsable ones) is REJECTED without a backend call.
     */
    AuthOutcome authenticate(const BindCredentials& credentials) const;

private:
    const DnMapper& mapper_;
    IDirectoryBackend* backend_;
};

} // namespace crowdldap::directory
