/**
 * @file authenticator.cpp
 * @brief Bind authenticator implementation
 */

#include "crowdldap/directory/authenticator.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crowdldap::directory {

Authenticator::Authenticator(const DnMapper& mapper, IDirectoryBackend* backend)
    : mapper_(mapper), backend_(backend)
{
    if (!backend_) {
        throw std::invalid_argument("Authenticator: backend cannot be nullptr");
    }
}

AuthOutcome Authenticator::authenticate(const std::string& username, const std::string& secret) const {
    if (username.empty() || secret.empty()) {
        spdlog::debug("bind: rejected empty username or secret");
        return AuthOutcome::REJECTED;
    }

    CredentialStatus status = backend_->authenticate(username, secret);
    switch (status) {
        case CredentialStatus::VALID:
            spdlog::info("bind: accepted user '{}'", username);
            return AuthOutcome::ACCEPTED;

        case CredentialStatus::INVALID_CREDENTIALS:
        case CredentialStatus::UNKNOWN_USER:
        case CredentialStatus::ACCOUNT_DISABLED:
            spdlog::info("bind: rejected user '{}' ({})", username, credentialStatusToString(status));
            return AuthOutcome::REJECTED;

        case CredentialStatus::UNAVAILABLE:
            break;
    }

    spdlog::warn("bind: backend unavailable for user '{}'", username);
    return AuthOutcome::UNAVAILABLE;
}

AuthOutcome Authenticator::authenticate(const BindCredentials& credentials) const {
    auto username = mapper_.dnToIdentity(credentials.bindDn);
    if (!username) {
        spdlog::debug("bind: DN '{}' is not a user entry", credentials.bindDn);
        return AuthOutcome::REJECTED;
    }
    return authenticate(*username, credentials.secret);
}

} // namespace crowdldap::directory
