/**
 * @file member_of_resolver.cpp
 * @brief Breadth-first memberOf traversal
 */

#include "crowdldap/directory/member_of_resolver.h"
#include "crowdldap/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <deque>
#include <set>
#include <stdexcept>

namespace crowdldap::directory {

MemberOfResolver::MemberOfResolver(const BridgeConfig& config,
                                   const DnMapper& mapper,
                                   IDirectoryBackend* backend)
    : config_(config), mapper_(mapper), backend_(backend)
{
    if (!backend_) {
        throw std::invalid_argument("MemberOfResolver: backend cannot be nullptr");
    }
}

Dn MemberOfResolver::renderGroupDn(const std::string& groupName) const {
    const MemberOfTemplate& tpl = config_.memberOfTemplate;
    if (!tpl.isSet()) {
        return mapper_.groupToDn(groupName);
    }
    return Dn(std::vector<Rdn>{
        Rdn{"cn", tpl.cn.value_or(groupName)},
        Rdn{"ou", tpl.ou.value_or(groupName)},
        Rdn{"dc", tpl.dc.value_or(groupName)},
    });
}

BackendResult<std::vector<Dn>> MemberOfResolver::resolveMemberOf(const std::string& principalName,
                                                                 PrincipalKind kind) const {
    auto direct = backend_->directGroupsOf(principalName, kind);
    if (direct.unavailable()) {
        spdlog::warn("memberOf: direct groups of {} '{}' unavailable: {}",
                     principalKindToString(kind), principalName, direct.message);
        return BackendResult<std::vector<Dn>>::failure(direct.message);
    }
    if (direct.notFound() || !direct.value) {
        return BackendResult<std::vector<Dn>>::success({});
    }

    std::deque<std::string> queue(direct.value->begin(), direct.value->end());
    std::set<std::string> visited;  // lowercased group names
    std::set<std::string> emitted;  // normalized DNs
    std::vector<Dn> result;

    std::optional<long long> selector;
    if (config_.memberOfGroupSelector) {
        selector = parseGidNumber(*config_.memberOfGroupSelector);
    }

    while (!queue.empty()) {
        std::string group = queue.front();
        queue.pop_front();

        if (!visited.insert(utils::toLower(group)).second) {
            continue;
        }

        if (config_.memberOfGroupSelector) {
            auto record = backend_->findGroup(group);
            if (record.unavailable()) {
                spdlog::warn("memberOf: group '{}' unavailable: {}", group, record.message);
                return BackendResult<std::vector<Dn>>::failure(record.message);
            }
            if (!record.ok() || !record.value) {
                continue;
            }
            auto it = record.value->attributes.find("gidNumber");
            bool selected = false;
            if (it != record.value->attributes.end()) {
                for (const auto& gid : it->second) {
                    auto value = parseGidNumber(gid);
                    if (value && value == selector) {
                        selected = true;
                        break;
                    }
                }
            }
            if (!selected) {
                spdlog::debug("memberOf: group '{}' excluded by gidNumber selector", group);
                continue;
            }
        }

        Dn dn = renderGroupDn(group);
        if (emitted.insert(dn.normalized()).second) {
            result.push_back(std::move(dn));
        }

        if (!config_.includeNestedGroups) {
            continue;
        }

        auto parents = backend_->directGroupsOf(group, PrincipalKind::GROUP);
        if (parents.unavailable()) {
            spdlog::warn("memberOf: parent groups of '{}' unavailable: {}", group, parents.message);
            return BackendResult<std::vector<Dn>>::failure(parents.message);
        }
        if (!parents.ok() || !parents.value) {
            continue;
        }
        for (const auto& parent : *parents.value) {
            if (visited.count(utils::toLower(parent)) == 0) {
                queue.push_back(parent);
            }
        }
    }

    spdlog::debug("memberOf: {} '{}' -> {} group(s) (nested={})",
                  principalKindToString(kind), principalName, result.size(),
                  config_.includeNestedGroups);
    return BackendResult<std::vector<Dn>>::success(std::move(result));
}

} // namespace crowdldap::directory
