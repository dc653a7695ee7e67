/**
 * @file types.h
 * @brief Common types for the directory bridge
 *
 * Backend record projections, search enums and result structs shared by
 * all bridge modules.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crowdldap::directory {

/// @brief ASCII case-insensitive ordering for LDAP attribute names
struct AttributeNameLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

/// @brief Attribute name -> ordered values (names compare case-insensitively)
using AttributeMap = std::map<std::string, std::vector<std::string>, AttributeNameLess>;

/// @brief Kind of principal whose group memberships are queried
enum class PrincipalKind {
    USER,
    GROUP
};

/// @brief LDAP search scope
enum class SearchScope {
    BASE,       ///< Only the base entry
    ONE_LEVEL,  ///< Direct children of the base
    SUBTREE     ///< Base and everything beneath it
};

/// @brief Bind outcome reported to the host
enum class AuthOutcome {
    ACCEPTED,
    REJECTED,
    UNAVAILABLE   ///< Backend unreachable; the host must treat it as a failed bind
};

/// @brief Backend user record
struct Identity {
    std::string name;
    AttributeMap attributes;
};

/// @brief Backend group record
struct Group {
    std::string name;
    std::vector<std::string> memberUsers;   ///< Direct member identity names
    std::vector<std::string> memberGroups;  ///< Direct member group names (sub-groups)
    AttributeMap attributes;
};

/// @brief Credentials presented by an LDAP simple bind
struct BindCredentials {
    std::string bindDn;
    std::string secret;
};

/// @brief Convert PrincipalKind to string
inline std::string principalKindToString(PrincipalKind kind) {
    switch (kind) {
        case PrincipalKind::USER:  return "user";
        case PrincipalKind::GROUP: return "group";
    }
    return "unknown";
}

/// @brief Convert SearchScope to string (RFC 4516 URL form)
inline std::string searchScopeToString(SearchScope scope) {
    switch (scope) {
        case SearchScope::BASE:      return "base";
        case SearchScope::ONE_LEVEL: return "one";
        case SearchScope::SUBTREE:   return "sub";
    }
    return "unknown";
}

/// @brief Parse "base", "one"/"onelevel", "sub"/"subtree"
std::optional<SearchScope> parseSearchScope(const std::string& text);

/// @brief Convert AuthOutcome to string
inline std::string authOutcomeToString(AuthOutcome outcome) {
    switch (outcome) {
        case AuthOutcome::ACCEPTED:    return "ACCEPTED";
        case AuthOutcome::REJECTED:    return "REJECTED";
        case AuthOutcome::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace crowdldap::directory
