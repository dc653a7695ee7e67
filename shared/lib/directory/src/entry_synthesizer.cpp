/**
 * @file entry_synthesizer.cpp
 * @brief Backend record -> LDAP entry
 */

#include "crowdldap/directory/entry_synthesizer.h"
#include "crowdldap/utils/string_utils.h"

namespace crowdldap::directory {

namespace {

const char* const kObjectClass = "objectClass";

std::vector<std::string> nonEmptyValues(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& v : values) {
        if (!v.empty()) result.push_back(v);
    }
    return result;
}

/// Copy backend attributes, skipping the reserved names and empty values
void copyBackendAttributes(const AttributeMap& source,
                           const std::vector<std::string>& reserved,
                           AttributeMap& target) {
    for (const auto& [name, values] : source) {
        bool skip = false;
        for (const auto& r : reserved) {
            if (utils::equalsIgnoreCase(name, r)) {
                skip = true;
                break;
            }
        }
        if (skip) continue;

        auto kept = nonEmptyValues(values);
        if (!kept.empty()) {
            target[name] = std::move(kept);
        }
    }
}

} // anonymous namespace

EntrySynthesizer::EntrySynthesizer(const DnMapper& mapper)
    : mapper_(mapper) {}

const std::vector<std::string>& EntrySynthesizer::userObjectClasses() {
    static const std::vector<std::string> classes = {
        "top", "person", "organizationalPerson", "inetOrgPerson"
    };
    return classes;
}

const std::vector<std::string>& EntrySynthesizer::groupObjectClasses() {
    static const std::vector<std::string> classes = {"top", "groupOfUniqueNames"};
    return classes;
}

Entry EntrySynthesizer::synthesizeUserEntry(const Identity& identity) const {
    const std::string& namingAttr = mapper_.userNamingAttribute();

    AttributeMap attributes;
    attributes[kObjectClass] = userObjectClasses();
    // cn is an anchor for point lookups, so it must equal the record name
    copyBackendAttributes(identity.attributes, {kObjectClass, namingAttr, "cn"}, attributes);
    attributes[namingAttr] = {identity.name};
    attributes["cn"] = {identity.name};

    return Entry(mapper_.identityToDn(identity.name), std::move(attributes));
}

Entry EntrySynthesizer::synthesizeGroupEntry(const Group& group) const {
    const std::string& namingAttr = mapper_.groupNamingAttribute();

    AttributeMap attributes;
    attributes[kObjectClass] = groupObjectClasses();
    copyBackendAttributes(group.attributes, {kObjectClass, namingAttr, "uniqueMember"}, attributes);
    attributes[namingAttr] = {group.name};

    std::vector<std::string> members;
    members.reserve(group.memberUsers.size() + group.memberGroups.size());
    for (const auto& user : group.memberUsers) {
        members.push_back(mapper_.identityToDn(user).toString());
    }
    for (const auto& sub : group.memberGroups) {
        members.push_back(mapper_.groupToDn(sub).toString());
    }
    if (!members.empty()) {
        attributes["uniqueMember"] = std::move(members);
    }

    return Entry(mapper_.groupToDn(group.name), std::move(attributes));
}

Entry EntrySynthesizer::synthesizeContainerEntry(const Dn& dn) const {
    AttributeMap attributes;
    if (dn.isEmpty()) {
        attributes[kObjectClass] = {"top", "extensibleObject"};
        return Entry(dn, std::move(attributes));
    }

    const Rdn& rdn = dn.leaf();
    std::string type = utils::toLower(rdn.type);
    std::string structural = "extensibleObject";
    if (type == "dc") {
        structural = "domain";
    } else if (type == "o") {
        structural = "organization";
    } else if (type == "ou") {
        structural = "organizationalUnit";
    }

    attributes[kObjectClass] = {"top", structural};
    attributes[rdn.type] = {rdn.value};
    return Entry(dn, std::move(attributes));
}

Entry EntrySynthesizer::withMemberOf(const Entry& entry, const std::vector<Dn>& dns) const {
    std::vector<std::string> values;
    values.reserve(dns.size());
    for (const auto& dn : dns) {
        values.push_back(dn.toString());
    }
    return entry.withAttribute("memberOf", std::move(values));
}

} // namespace crowdldap::directory
