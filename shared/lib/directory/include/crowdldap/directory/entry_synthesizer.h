/**
 * @file entry_synthesizer.h
 * @brief Builds LDAP entries from backend records
 *
 * Pure transformation: all backend data must already be in hand.
 */

#pragma once

#include "dn_mapper.h"
#include "entry.h"
#include "types.h"

#include <string>
#include <vector>

namespace crowdldap::directory {

class EntrySynthesizer {
public:
    /**
     * @brief Constructor
     * @param mapper DN mapper (non-owning, must outlive the synthesizer)
     */
    explicit EntrySynthesizer(const DnMapper& mapper);

    /**
     * @brief Person entry for a user
     *
     * objectClass top/person/organizationalPerson/inetOrgPerson, the naming
     * attribute from the record name, backend attributes in backend order,
     * cn defaulting to the name. Empty attributes are omitted.
     */
    Entry synthesizeUserEntry(const Identity& identity) const;

    /**
     * @brief groupOfUniqueNames entry for a group
     *
     * uniqueMember lists member user DNs followed by member group DNs.
     */
    Entry synthesizeGroupEntry(const Group& group) const;

    /**
     * @brief Container entry for the base or a branch DN
     */
    Entry synthesizeContainerEntry(const Dn& dn) const;

    /**
     * @brief Copy of entry carrying memberOf (omitted when dns is empty)
     */
    Entry withMemberOf(const Entry& entry, const std::vector<Dn>& dns) const;

    static const std::vector<std::string>& userObjectClasses();
    static const std::vector<std::string>& groupObjectClasses();

private:
    const DnMapper& mapper_;
};

} // namespace crowdldap::directory
