/**
 * @file config.h
 * @brief Immutable bridge configuration
 *
 * Built once at startup by the bootstrap layer and passed by const
 * reference into every component. Nothing mutates it afterwards.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace crowdldap::directory {

/// Largest accepted searchSizeLimit (listings request one record more)
constexpr size_t kMaxSearchSizeLimit = 1000000000;

/**
 * @brief RDN components used to render memberOf group DNs
 *
 * When no component is set, memberOf values are the groups' own entry DNs.
 * When at least one is set, the DN is "cn=<cn>,ou=<ou>,dc=<dc>" and each
 * unset component takes the group name.
 */
struct MemberOfTemplate {
    std::optional<std::string> cn;
    std::optional<std::string> ou;
    std::optional<std::string> dc;

    bool isSet() const { return cn || ou || dc; }
};

/**
 * @brief Directory layout and emulation settings
 */
struct BridgeConfig {
    // Layout
    std::string baseDn = "dc=crowd";
    std::string usersRdn = "ou=users";
    std::string groupsRdn = "ou=groups";
    std::string userNamingAttribute = "uid";
    std::string groupNamingAttribute = "cn";

    // AD memberOf emulation
    bool emulateMemberOf = false;
    bool includeNestedGroups = false;
    MemberOfTemplate memberOfTemplate;
    std::optional<std::string> memberOfGroupSelector;  ///< Required gidNumber (decimal)

    // Upper bound on records fetched by one bulk listing
    size_t searchSizeLimit = 1000;

    /**
     * @brief Check the settings that do not depend on DN parsing
     * @throws common::ConfigException on empty naming attributes, a size limit
     *         outside [1, kMaxSearchSizeLimit], a template component that is present
     *         but empty, or a selector that is not a decimal gidNumber
     */
    void validate() const;
};

/**
 * @brief Parse a gidNumber value ("007" and "7" are the same group id)
 * @return The numeric id, or std::nullopt if the text is not a non-negative integer
 */
std::optional<long long> parseGidNumber(const std::string& text);

} // namespace crowdldap::directory
