/**
 * @file crowd_rest_backend.h
 * @brief IDirectoryBackend over the Crowd usermanagement REST API
 *
 * Status mapping:
 *   - transport failure, 401/403, 5xx, unparsable JSON -> UNAVAILABLE
 *   - 404 -> NOT_FOUND
 *   - 400 on /authentication -> credential status from the Crowd "reason"
 */

#pragma once

#include "crowdldap/crowd/http_client.h"
#include "crowdldap/directory/backend.h"

#include <json/json.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace crowdldap::crowd {

class CrowdRestBackend : public directory::IDirectoryBackend {
public:
    static constexpr const char* kApiPrefix = "/rest/usermanagement/1";

    /// Page size for membership listings
    static constexpr size_t kPageSize = 1000;

    /**
     * @brief Constructor
     * @param transport HTTP transport (non-owning)
     * @throws std::invalid_argument if transport is nullptr
     */
    explicit CrowdRestBackend(IHttpTransport* transport);

    directory::BackendResult<directory::Identity> findUser(const std::string& name) override;
    directory::BackendResult<directory::Group> findGroup(const std::string& name) override;
    directory::BackendResult<std::vector<directory::Identity>> listUsers(size_t maxCount) override;
    directory::BackendResult<std::vector<directory::Group>> listGroups(size_t maxCount) override;
    directory::BackendResult<std::vector<std::string>> directGroupsOf(
        const std::string& principalName, directory::PrincipalKind kind) override;
    directory::CredentialStatus authenticate(const std::string& username, const std::string& secret) override;
    directory::BackendStatus testConnection() override;

private:
    using Params = std::vector<std::pair<std::string, std::string>>;

    /// GET and decode; NOT_FOUND/UNAVAILABLE carry a message
    directory::BackendResult<Json::Value> getJson(const std::string& resource, const Params& params);

    /// All entity names of a paged list resource
    directory::BackendResult<std::vector<std::string>> getAllNames(const std::string& resource,
                                                                   Params params,
                                                                   const std::string& listKey);

    /// Direct member users and sub-groups of group
    directory::BackendStatus loadMembers(directory::Group& group, std::string& message);

    IHttpTransport* transport_;
};

} // namespace crowdldap::crowd
