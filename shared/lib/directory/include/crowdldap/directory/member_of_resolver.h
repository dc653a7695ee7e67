/**
 * @file member_of_resolver.h
 * @brief AD-style memberOf emulation
 *
 * Walks the backend's group-membership graph upwards from a principal.
 * The graph may contain cycles; a visited set bounds the traversal by the
 * number of distinct groups.
 */

#pragma once

#include "backend.h"
#include "config.h"
#include "dn.h"
#include "dn_mapper.h"

#include <string>
#include <vector>

namespace crowdldap::directory {

/**
 * @brief memberOf resolver
 *
 * Usage:
 * @code
 *   MemberOfResolver resolver(config, mapper, &backend);
 *   auto result = resolver.resolveMemberOf("alice", PrincipalKind::USER);
 *   if (result.ok()) { ... *result.value ... }
 * @endcode
 */
class MemberOfResolver {
public:
    /**
     * @brief Constructor
     * @param config Bridge configuration (non-owning)
     * @param mapper DN mapper (non-owning)
     * @param backend Identity backend (non-owning)
     * @throws std::invalid_argument if backend is nullptr
     */
    MemberOfResolver(const BridgeConfig& config, const DnMapper& mapper, IDirectoryBackend* backend);

    /**
     * @brief Group DNs principalName belongs to
     *
     * Algorithm:
     * 1. Seed a queue with the principal's direct groups
     * 2. Pop a group; skip it if already visited, otherwise mark it visited
     * 3. If a selector is configured, fetch the group and drop it unless its
     *    gidNumber equals the selector (it stays visited)
     * 4. Emit its DN; with nested traversal on, enqueue its direct parents
     *
     * Output is deduplicated (by rendered DN) and in discovery order. Any backend outage
     * during the walk fails the whole call; a partial set is never returned.
     * NOT_FOUND for the principal yields an empty set. A parent group that
     * vanishes mid-walk is skipped.
     *
     * @return Group DNs, or UNAVAILABLE
     */
    BackendResult<std::vector<Dn>> resolveMemberOf(const std::string& principalName,
                                                   PrincipalKind kind) const;

    /**
     * @brief DN used for a group in memberOf values
     *
     * groupToDn() when no template component is configured, otherwise
     * "cn=<cn>,ou=<ou>,dc=<dc>" with unset components taking the group name.
     */
    Dn renderGroupDn(const std::string& groupName) const;

    bool enabled() const { return config_.emulateMemberOf; }

private:
    const BridgeConfig& config_;
    const DnMapper& mapper_;
    IDirectoryBackend* backend_;
};

} // namespace crowdldap::directory
