/**
 * @file crowd_json.h
 * @brief Crowd REST JSON <-> directory record conversion (jsoncpp)
 *
 * Entity shapes (usermanagement API v1):
 *   user:  {"name", "first-name", "last-name", "display-name", "email",
 *           "active", "attributes": {"attributes": [{"name", "values": []}]}}
 *   group: {"name", "description", "active", "attributes": {...}}
 *   lists: {"users": [...]}, {"groups": [...]}
 *   error: {"reason", "message"}
 */

#pragma once

#include "crowdldap/directory/backend.h"
#include "crowdldap/directory/types.h"

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace crowdldap::crowd {

/**
 * @brief Parse a response body
 * @return Parsed value, or std::nullopt on malformed JSON
 */
std::optional<Json::Value> parseJson(const std::string& body);

/**
 * @brief Crowd user -> Identity
 *
 * name -> cn, first-name -> givenName, last-name -> sn,
 * display-name -> displayName, email -> mail; custom attributes
 * pass through under their own names. Empty fields are dropped.
 */
directory::Identity userFromJson(const Json::Value& json);

/**
 * @brief Crowd group -> Group (attributes only; members are fetched separately)
 */
directory::Group groupFromJson(const Json::Value& json);

/// @brief Records of a {"users": [...]} list
std::vector<directory::Identity> usersFromJson(const Json::Value& json);

/// @brief Records of a {"groups": [...]} list
std::vector<directory::Group> groupsFromJson(const Json::Value& json);

/**
 * @brief Entity names of a list response
 * @param listKey "users" or "groups"
 */
std::vector<std::string> namesFromJson(const Json::Value& json, const std::string& listKey);

/**
 * @brief Credential status for a failed authentication response
 *
 * INVALID_USER_AUTHENTICATION -> INVALID_CREDENTIALS,
 * USER_NOT_FOUND -> UNKNOWN_USER,
 * INACTIVE_ACCOUNT / EXPIRED_CREDENTIAL -> ACCOUNT_DISABLED.
 * Unknown reasons are INVALID_CREDENTIALS.
 */
directory::CredentialStatus credentialStatusFromError(const Json::Value& json);

/// @brief True unless the entity carries "active": false
bool isActive(const Json::Value& json);

/// @brief {"value": secret} body for POST /authentication
std::string passwordBody(const std::string& secret);

} // namespace crowdldap::crowd
