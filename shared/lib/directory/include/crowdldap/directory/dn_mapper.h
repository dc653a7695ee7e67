/**
 * @file dn_mapper.h
 * @brief Bidirectional DN <-> backend name translation
 *
 * Fixed layout beneath a configured base:
 *   <base>                          ROOT
 *   <usersRdn>,<base>               USERS_BRANCH
 *   <userAttr>=<name>,<usersRdn>,<base>    USER_ENTRY
 *   <groupsRdn>,<base>              GROUPS_BRANCH
 *   <groupAttr>=<name>,<groupsRdn>,<base>  GROUP_ENTRY
 */

#pragma once

#include "config.h"
#include "dn.h"

#include <optional>
#include <string>

namespace crowdldap::directory {

/// @brief Where a DN falls in the bridge's layout
enum class DnLocation {
    ROOT,
    USERS_BRANCH,
    GROUPS_BRANCH,
    USER_ENTRY,
    GROUP_ENTRY,
    OUTSIDE       ///< Above the base, elsewhere, or deeper than an entry
};

class DnMapper {
public:
    /**
     * @brief Constructor
     * @param config Bridge configuration (copied layout values only)
     * @throws common::ConfigException if the base or branch RDNs do not parse,
     *         a branch RDN is multi-component, or both branches are the same
     */
    explicit DnMapper(const BridgeConfig& config);

    Dn identityToDn(const std::string& name) const;
    Dn groupToDn(const std::string& name) const;

    /**
     * @brief Identity name for an immediate child of the users branch
     * @return Name, or std::nullopt (NotFound) for any other DN
     */
    std::optional<std::string> dnToIdentity(const Dn& dn) const;
    std::optional<std::string> dnToIdentity(const std::string& dn) const;

    /**
     * @brief Group name for an immediate child of the groups branch
     * @return Name, or std::nullopt (NotFound) for any other DN
     */
    std::optional<std::string> dnToGroup(const Dn& dn) const;
    std::optional<std::string> dnToGroup(const std::string& dn) const;

    DnLocation classify(const Dn& dn) const;

    const Dn& baseDn() const { return baseDn_; }
    const Dn& usersDn() const { return usersDn_; }
    const Dn& groupsDn() const { return groupsDn_; }

    const std::string& userNamingAttribute() const { return userAttr_; }
    const std::string& groupNamingAttribute() const { return groupAttr_; }

private:
    Dn baseDn_;
    Dn usersDn_;
    Dn groupsDn_;
    std::string userAttr_;
    std::string groupAttr_;
};

std::string dnLocationToString(DnLocation location);

} // namespace crowdldap::directory
