/**
 * @file crowd_rest_backend.cpp
 * @brief Crowd REST backend implementation
 */

#include "crowdldap/crowd/crowd_rest_backend.h"
#include "crowdldap/crowd/crowd_json.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crowdldap::crowd {

using directory::BackendResult;
using directory::BackendStatus;
using directory::CredentialStatus;

namespace {

std::string describe(const HttpResponse& response) {
    if (!response.transportOk) return response.error;
    return "HTTP " + std::to_string(response.status);
}

} // anonymous namespace

CrowdRestBackend::CrowdRestBackend(IHttpTransport* transport)
    : transport_(transport)
{
    if (!transport_) {
        throw std::invalid_argument("CrowdRestBackend: transport cannot be nullptr");
    }
}

BackendResult<Json::Value> CrowdRestBackend::getJson(const std::string& resource, const Params& params) {
    HttpRequest request;
    request.path = std::string(kApiPrefix) + resource + buildQuery(params);

    HttpResponse response = transport_->send(request);
    if (response.transportOk && response.status == 404) {
        return BackendResult<Json::Value>::missing(resource + " not found");
    }
    if (!response.transportOk || response.status != 200) {
        spdlog::warn("Crowd GET {} failed: {}", resource, describe(response));
        return BackendResult<Json::Value>::failure(resource + ": " + describe(response));
    }

    auto json = parseJson(response.body);
    if (!json) {
        spdlog::warn("Crowd GET {} returned malformed JSON", resource);
        return BackendResult<Json::Value>::failure(resource + ": malformed JSON response");
    }
    return BackendResult<Json::Value>::success(std::move(*json));
}

BackendResult<std::vector<std::string>> CrowdRestBackend::getAllNames(const std::string& resource,
                                                                      Params params,
                                                                      const std::string& listKey) {
    std::vector<std::string> names;
    size_t start = 0;

    params.emplace_back("start-index", "0");
    params.emplace_back("max-results", std::to_string(kPageSize));
    const size_t startIdx = params.size() - 2;

    while (true) {
        params[startIdx].second = std::to_string(start);
        auto page = getJson(resource, params);
        if (!page.ok()) {
            return page.notFound() ? BackendResult<std::vector<std::string>>::missing(page.message)
                                   : BackendResult<std::vector<std::string>>::failure(page.message);
        }

        auto pageNames = namesFromJson(*page.value, listKey);
        names.insert(names.end(), pageNames.begin(), pageNames.end());
        if (pageNames.size() < kPageSize) break;
        start += pageNames.size();
    }
    return BackendResult<std::vector<std::string>>::success(std::move(names));
}

BackendStatus CrowdRestBackend::loadMembers(directory::Group& group, std::string& message) {
    auto users = getAllNames("/group/user/direct", {{"groupname", group.name}}, "users");
    if (!users.ok()) {
        message = users.message;
        return users.status;
    }
    auto children = getAllNames("/group/child-group/direct", {{"groupname", group.name}}, "groups");
    if (!children.ok()) {
        message = children.message;
        return children.status;
    }
    group.memberUsers = std::move(*users.value);
    group.memberGroups = std::move(*children.value);
    return BackendStatus::OK;
}

BackendResult<directory::Identity> CrowdRestBackend::findUser(const std::string& name) {
    auto json = getJson("/user", {{"username", name}, {"expand", "attributes"}});
    if (json.notFound()) return BackendResult<directory::Identity>::missing(json.message);
    if (!json.ok()) return BackendResult<directory::Identity>::failure(json.message);

    auto identity = userFromJson(*json.value);
    if (identity.name.empty()) {
        return BackendResult<directory::Identity>::failure("/user: response without a name");
    }
    return BackendResult<directory::Identity>::success(std::move(identity));
}

BackendResult<directory::Group> CrowdRestBackend::findGroup(const std::string& name) {
    auto json = getJson("/group", {{"groupname", name}, {"expand", "attributes"}});
    if (json.notFound()) return BackendResult<directory::Group>::missing(json.message);
    if (!json.ok()) return BackendResult<directory::Group>::failure(json.message);

    auto group = groupFromJson(*json.value);
    if (group.name.empty()) {
        return BackendResult<directory::Group>::failure("/group: response without a name");
    }

    std::string message;
    BackendStatus status = loadMembers(group, message);
    if (status == BackendStatus::NOT_FOUND) return BackendResult<directory::Group>::missing(message);
    if (status != BackendStatus::OK) return BackendResult<directory::Group>::failure(message);
    return BackendResult<directory::Group>::success(std::move(group));
}

BackendResult<std::vector<directory::Identity>> CrowdRestBackend::listUsers(size_t maxCount) {
    auto json = getJson("/search", {{"entity-type", "user"},
                                    {"expand", "user,attributes"},
                                    {"max-results", std::to_string(maxCount)}});
    if (!json.ok()) {
        return BackendResult<std::vector<directory::Identity>>::failure(json.message);
    }

    auto users = usersFromJson(*json.value);
    if (users.size() > maxCount) users.resize(maxCount);
    spdlog::debug("Crowd: listed {} user(s)", users.size());
    return BackendResult<std::vector<directory::Identity>>::success(std::move(users));
}

BackendResult<std::vector<directory::Group>> CrowdRestBackend::listGroups(size_t maxCount) {
    auto json = getJson("/search", {{"entity-type", "group"},
                                    {"expand", "group,attributes"},
                                    {"max-results", std::to_string(maxCount)}});
    if (!json.ok()) {
        return BackendResult<std::vector<directory::Group>>::failure(json.message);
    }

    auto listed = groupsFromJson(*json.value);
    if (listed.size() > maxCount) listed.resize(maxCount);

    std::vector<directory::Group> groups;
    groups.reserve(listed.size());
    for (auto& group : listed) {
        std::string message;
        BackendStatus status = loadMembers(group, message);
        if (status == BackendStatus::NOT_FOUND) {
            // Deleted between the search and the member calls
            continue;
        }
        if (status != BackendStatus::OK) {
            return BackendResult<std::vector<directory::Group>>::failure(message);
        }
        groups.push_back(std::move(group));
    }

    spdlog::debug("Crowd: listed {} group(s)", groups.size());
    return BackendResult<std::vector<directory::Group>>::success(std::move(groups));
}

BackendResult<std::vector<std::string>> CrowdRestBackend::directGroupsOf(const std::string& principalName,
                                                                         directory::PrincipalKind kind) {
    if (kind == directory::PrincipalKind::USER) {
        return getAllNames("/user/group/direct", {{"username", principalName}}, "groups");
    }
    return getAllNames("/group/parent-group/direct", {{"groupname", principalName}}, "groups");
}

CredentialStatus CrowdRestBackend::authenticate(const std::string& username, const std::string& secret) {
    HttpRequest request;
    request.method = "POST";
    request.path = std::string(kApiPrefix) + "/authentication" + buildQuery({{"username", username}});
    request.body = passwordBody(secret);

    HttpResponse response = transport_->send(request);
    if (!response.transportOk) {
        spdlog::warn("Crowd authentication for '{}' failed: {}", username, response.error);
        return CredentialStatus::UNAVAILABLE;
    }

    if (response.status == 200) {
        auto json = parseJson(response.body);
        if (!json) {
            spdlog::warn("Crowd authentication for '{}' returned malformed JSON", username);
            return CredentialStatus::UNAVAILABLE;
        }
        return isActive(*json) ? CredentialStatus::VALID : CredentialStatus::ACCOUNT_DISABLED;
    }

    if (response.status == 400 || response.status == 404) {
        auto json = parseJson(response.body);
        if (!json) {
            return response.status == 404 ? CredentialStatus::UNKNOWN_USER
                                          : CredentialStatus::INVALID_CREDENTIALS;
        }
        return credentialStatusFromError(*json);
    }

    spdlog::warn("Crowd authentication for '{}' failed: {}", username, describe(response));
    return CredentialStatus::UNAVAILABLE;
}

BackendStatus CrowdRestBackend::testConnection() {
    auto json = getJson("/config/cookie", {});
    if (json.ok()) {
        return BackendStatus::OK;
    }
    spdlog::warn("Crowd connection test failed: {}", json.message);
    return BackendStatus::UNAVAILABLE;
}

} // namespace crowdldap::crowd
