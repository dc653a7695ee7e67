/**
 * @file dn_mapper.cpp
 * @brief DN <-> backend name translation
 */

#include "crowdldap/directory/dn_mapper.h"
#include "crowdldap/utils/string_utils.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

namespace crowdldap::directory {

namespace {

Rdn parseBranchRdn(const std::string& text, const char* what) {
    auto dn = Dn::parse(text);
    if (!dn || dn->size() != 1) {
        throw common::ConfigException(std::string(what) + " must be a single RDN: '" + text + "'");
    }
    return dn->leaf();
}

} // anonymous namespace

DnMapper::DnMapper(const BridgeConfig& config)
    : userAttr_(config.userNamingAttribute),
      groupAttr_(config.groupNamingAttribute)
{
    config.validate();

    auto base = Dn::parse(config.baseDn);
    if (!base) {
        throw common::ConfigException("invalid base DN: '" + config.baseDn + "'");
    }
    baseDn_ = *base;
    usersDn_ = baseDn_.child(parseBranchRdn(config.usersRdn, "users branch"));
    groupsDn_ = baseDn_.child(parseBranchRdn(config.groupsRdn, "groups branch"));

    if (usersDn_ == groupsDn_) {
        throw common::ConfigException("users and groups branches must differ: '" +
                                      usersDn_.toString() + "'");
    }

    spdlog::debug("DnMapper: base={}, users={}, groups={}",
                  baseDn_.toString(), usersDn_.toString(), groupsDn_.toString());
}

Dn DnMapper::identityToDn(const std::string& name) const {
    return usersDn_.child(Rdn{userAttr_, name});
}

Dn DnMapper::groupToDn(const std::string& name) const {
    return groupsDn_.child(Rdn{groupAttr_, name});
}

std::optional<std::string> DnMapper::dnToIdentity(const Dn& dn) const {
    if (!dn.isChildOf(usersDn_) || !utils::equalsIgnoreCase(dn.leaf().type, userAttr_)) {
        return std::nullopt;
    }
    return dn.leaf().value;
}

std::optional<std::string> DnMapper::dnToIdentity(const std::string& dn) const {
    auto parsed = Dn::parse(dn);
    if (!parsed) return std::nullopt;
    return dnToIdentity(*parsed);
}

std::optional<std::string> DnMapper::dnToGroup(const Dn& dn) const {
    if (!dn.isChildOf(groupsDn_) || !utils::equalsIgnoreCase(dn.leaf().type, groupAttr_)) {
        return std::nullopt;
    }
    return dn.leaf().value;
}

std::optional<std::string> DnMapper::dnToGroup(const std::string& dn) const {
    auto parsed = Dn::parse(dn);
    if (!parsed) return std::nullopt;
    return dnToGroup(*parsed);
}

DnLocation DnMapper::classify(const Dn& dn) const {
    if (dn == baseDn_) return DnLocation::ROOT;
    if (dn == usersDn_) return DnLocation::USERS_BRANCH;
    if (dn == groupsDn_) return DnLocation::GROUPS_BRANCH;
    if (dnToIdentity(dn)) return DnLocation::USER_ENTRY;
    if (dnToGroup(dn)) return DnLocation::GROUP_ENTRY;
    return DnLocation::OUTSIDE;
}

std::string dnLocationToString(DnLocation location) {
    switch (location) {
        case DnLocation::ROOT:          return "ROOT";
        case DnLocation::USERS_BRANCH:  return "USERS_BRANCH";
        case DnLocation::GROUPS_BRANCH: return "GROUPS_BRANCH";
        case DnLocation::USER_ENTRY:    return "USER_ENTRY";
        case DnLocation::GROUP_ENTRY:   return "GROUP_ENTRY";
        case DnLocation::OUTSIDE:       return "OUTSIDE";
    }
    return "UNKNOWN";
}

} // namespace crowdldap::directory
