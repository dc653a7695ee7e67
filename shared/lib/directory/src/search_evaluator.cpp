/**
 * @file search_evaluator.cpp
 * @brief Search planning, in-memory filtering and the lazy cursor
 */

#include "crowdldap/directory/search_evaluator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace crowdldap::directory {

std::string searchStatusToString(SearchStatus status) {
    switch (status) {
        case SearchStatus::IN_PROGRESS:         return "IN_PROGRESS";
        case SearchStatus::SUCCESS:             return "SUCCESS";
        case SearchStatus::SIZE_LIMIT_EXCEEDED: return "SIZE_LIMIT_EXCEEDED";
        case SearchStatus::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case SearchStatus::ABANDONED:           return "ABANDONED";
    }
    return "UNKNOWN";
}

// =============================================================================
// EntryCursor
// =============================================================================

EntryCursor::EntryCursor(std::vector<Step> steps, std::vector<std::string> requestedAttributes)
    : steps_(std::move(steps)), requested_(std::move(requestedAttributes)) {}

std::unique_ptr<EntryCursor> EntryCursor::empty() {
    return std::make_unique<EntryCursor>(std::vector<Step>{}, std::vector<std::string>{});
}

std::unique_ptr<EntryCursor> EntryCursor::unavailable(const std::string& message) {
    std::vector<Step> steps;
    steps.push_back([message](std::deque<Entry>&, std::string& out) {
        out = message;
        return SearchStatus::BACKEND_UNAVAILABLE;
    });
    return std::make_unique<EntryCursor>(std::move(steps), std::vector<std::string>{});
}

bool EntryCursor::next(Entry& entry) {
    while (status_ == SearchStatus::IN_PROGRESS) {
        if (abandoned_.load()) {
            ready_.clear();
            status_ = SearchStatus::ABANDONED;
            message_ = "search abandoned";
            break;
        }

        if (!ready_.empty()) {
            entry = ready_.front().project(requested_);
            ready_.pop_front();
            return true;
        }

        if (nextStep_ >= steps_.size()) {
            status_ = pendingStatus_;
            message_ = pendingMessage_;
            break;
        }

        std::deque<Entry> produced;
        std::string stepMessage;
        SearchStatus stepStatus = steps_[nextStep_++](produced, stepMessage);

        if (stepStatus == SearchStatus::BACKEND_UNAVAILABLE) {
            ready_.clear();
            status_ = stepStatus;
            message_ = stepMessage;
            break;
        }

        for (auto& e : produced) {
            ready_.push_back(std::move(e));
        }

        if (stepStatus == SearchStatus::SIZE_LIMIT_EXCEEDED) {
            // Deliver what the step produced, then stop
            pendingStatus_ = stepStatus;
            pendingMessage_ = stepMessage;
            nextStep_ = steps_.size();
        }
    }
    return false;
}

std::vector<Entry> EntryCursor::collect() {
    std::vector<Entry> entries;
    Entry entry{Dn(), AttributeMap{}};
    while (next(entry)) {
        entries.push_back(entry);
    }
    return entries;
}

// =============================================================================
// SearchEvaluator
// =============================================================================

SearchEvaluator::SearchEvaluator(const BridgeConfig& config,
                                 const DnMapper& mapper,
                                 const EntrySynthesizer& synthesizer,
                                 const MemberOfResolver& resolver,
                                 IDirectoryBackend* backend)
    : config_(config),
      mapper_(mapper),
      synthesizer_(synthesizer),
      resolver_(resolver),
      backend_(backend)
{
    if (!backend_) {
        throw std::invalid_argument("SearchEvaluator: backend cannot be nullptr");
    }
}

bool SearchEvaluator::needsMemberOf(const Filter& filter,
                                    const std::vector<std::string>& attributes) const {
    if (!config_.emulateMemberOf) return false;
    return isAttributeRequested(attributes, "memberOf") || filter.references("memberOf");
}

std::unique_ptr<EntryCursor> SearchEvaluator::search(const Dn& base,
                                                     SearchScope scope,
                                                     const Filter& filter,
                                                     const std::vector<std::string>& attributes) const {
    bool memberOf = needsMemberOf(filter, attributes);
    DnLocation location = mapper_.classify(base);

    spdlog::debug("search: base='{}' ({}) scope={} filter={} memberOf={}",
                  base.toString(), dnLocationToString(location),
                  searchScopeToString(scope), filter.toString(), memberOf);

    std::vector<EntryCursor::Step> steps;

    switch (location) {
        case DnLocation::ROOT:
            if (scope != SearchScope::ONE_LEVEL) {
                steps.push_back(containerStep(mapper_.baseDn(), filter));
            }
            if (scope == SearchScope::BASE) break;
            steps.push_back(containerStep(mapper_.usersDn(), filter));
            if (scope == SearchScope::SUBTREE) {
                addBranchSteps(Branch::USERS, filter, memberOf, steps);
            }
            steps.push_back(containerStep(mapper_.groupsDn(), filter));
            if (scope == SearchScope::SUBTREE) {
                addBranchSteps(Branch::GROUPS, filter, memberOf, steps);
            }
            break;

        case DnLocation::USERS_BRANCH:
        case DnLocation::GROUPS_BRANCH: {
            Branch branch = (location == DnLocation::USERS_BRANCH) ? Branch::USERS : Branch::GROUPS;
            if (scope != SearchScope::ONE_LEVEL) {
                steps.push_back(containerStep(base, filter));
            }
            if (scope != SearchScope::BASE) {
                addBranchSteps(branch, filter, memberOf, steps);
            }
            break;
        }

        case DnLocation::USER_ENTRY:
            // Entries are leaves: one-level below them is empty
            if (scope != SearchScope::ONE_LEVEL) {
                steps.push_back(userLookupStep(*mapper_.dnToIdentity(base), filter, memberOf));
            }
            break;

        case DnLocation::GROUP_ENTRY:
            if (scope != SearchScope::ONE_LEVEL) {
                steps.push_back(groupLookupStep(*mapper_.dnToGroup(base), filter, memberOf));
            }
            break;

        case DnLocation::OUTSIDE:
            break;
    }

    return std::make_unique<EntryCursor>(std::move(steps), attributes);
}

void SearchEvaluator::addBranchSteps(Branch branch, const Filter& filter, bool memberOf,
                                     std::vector<EntryCursor::Step>& steps) const {
    if (branch == Branch::USERS) {
        auto names = filter.anchoredValues({mapper_.userNamingAttribute(), "cn"});
        if (names) {
            for (const auto& name : *names) {
                steps.push_back(userLookupStep(name, filter, memberOf));
            }
        } else {
            steps.push_back(userListingStep(filter, memberOf));
        }
        return;
    }

    auto names = filter.anchoredValues({mapper_.groupNamingAttribute()});
    if (names) {
        for (const auto& name : *names) {
            steps.push_back(groupLookupStep(name, filter, memberOf));
        }
    } else {
        steps.push_back(groupListingStep(filter, memberOf));
    }
}

SearchStatus SearchEvaluator::emitIfMatching(Entry entry, const std::string& name, PrincipalKind kind,
                                             const Filter& filter, bool memberOf,
                                             std::deque<Entry>& out, std::string& message) const {
    // Resolve before matching only when the filter itself tests memberOf
    const bool filterNeedsMemberOf = memberOf && filter.references("memberOf");
    if (!filterNeedsMemberOf && !filter.matches(entry)) {
        return SearchStatus::SUCCESS;
    }

    if (memberOf) {
        auto groups = resolver_.resolveMemberOf(name, kind);
        if (!groups.ok() || !groups.value) {
            message = "memberOf resolution failed for " + principalKindToString(kind) +
                      " '" + name + "': " + groups.message;
            return SearchStatus::BACKEND_UNAVAILABLE;
        }
        entry = synthesizer_.withMemberOf(entry, *groups.value);
    }

    if (filterNeedsMemberOf && !filter.matches(entry)) {
        return SearchStatus::SUCCESS;
    }
    out.push_back(std::move(entry));
    return SearchStatus::SUCCESS;
}

EntryCursor::Step SearchEvaluator::containerStep(const Dn& dn, const Filter& filter) const {
    return [this, dn, filter](std::deque<Entry>& out, std::string&) {
        Entry entry = synthesizer_.synthesizeContainerEntry(dn);
        if (filter.matches(entry)) {
            out.push_back(std::move(entry));
        }
        return SearchStatus::SUCCESS;
    };
}

EntryCursor::Step SearchEvaluator::userLookupStep(const std::string& name, const Filter& filter,
                                                  bool memberOf) const {
    return [this, name, filter, memberOf](std::deque<Entry>& out, std::string& message) {
        auto result = backend_->findUser(name);
        if (result.unavailable()) {
            message = "user lookup '" + name + "' failed: " + result.message;
            spdlog::warn("search: {}", message);
            return SearchStatus::BACKEND_UNAVAILABLE;
        }
        if (!result.ok() || !result.value) {
            return SearchStatus::SUCCESS;
        }
        return emitIfMatching(synthesizer_.synthesizeUserEntry(*result.value), result.value->name,
                              PrincipalKind::USER, filter, memberOf, out, message);
    };
}

EntryCursor::Step SearchEvaluator::groupLookupStep(const std::string& name, const Filter& filter,
                                                   bool memberOf) const {
    return [this, name, filter, memberOf](std::deque<Entry>& out, std::string& message) {
        auto result = backend_->findGroup(name);
        if (result.unavailable()) {
            message = "group lookup '" + name + "' failed: " + result.message;
            spdlog::warn("search: {}", message);
            return SearchStatus::BACKEND_UNAVAILABLE;
        }
        if (!result.ok() || !result.value) {
            return SearchStatus::SUCCESS;
        }
        return emitIfMatching(synthesizer_.synthesizeGroupEntry(*result.value), result.value->name,
                              PrincipalKind::GROUP, filter, memberOf, out, message);
    };
}

EntryCursor::Step SearchEvaluator::userListingStep(const Filter& filter, bool memberOf) const {
    return [this, filter, memberOf](std::deque<Entry>& out, std::string& message) {
        const size_t limit = config_.searchSizeLimit;
        auto result = backend_->listUsers(limit + 1);
        if (!result.ok() || !result.value) {
            message = "user listing failed: " + result.message;
            spdlog::warn("search: {}", message);
            return SearchStatus::BACKEND_UNAVAILABLE;
        }

        const auto& users = *result.value;
        size_t count = std::min(users.size(), limit);
        for (size_t i = 0; i < count; ++i) {
            SearchStatus status = emitIfMatching(synthesizer_.synthesizeUserEntry(users[i]), users[i].name,
                                                 PrincipalKind::USER, filter, memberOf, out, message);
            if (status != SearchStatus::SUCCESS) return status;
        }

        if (users.size() > limit) {
            message = "user listing exceeds size limit " + std::to_string(limit);
            spdlog::info("search: {}", message);
            return SearchStatus::SIZE_LIMIT_EXCEEDED;
        }
        return SearchStatus::SUCCESS;
    };
}

EntryCursor::Step SearchEvaluator::groupListingStep(const Filter& filter, bool memberOf) const {
    return [this, filter, memberOf](std::deque<Entry>& out, std::string& message) {
        const size_t limit = config_.searchSizeLimit;
        auto result = backend_->listGroups(limit + 1);
        if (!result.ok() || !result.value) {
            message = "group listing failed: " + result.message;
            spdlog::warn("search: {}", message);
            return SearchStatus::BACKEND_UNAVAILABLE;
        }

        const auto& groups = *result.value;
        size_t count = std::min(groups.size(), limit);
        for (size_t i = 0; i < count; ++i) {
            SearchStatus status = emitIfMatching(synthesizer_.synthesizeGroupEntry(groups[i]), groups[i].name,
                                                 PrincipalKind::GROUP, filter, memberOf, out, message);
            if (status != SearchStatus::SUCCESS) return status;
        }

        if (groups.size() > limit) {
            message = "group listing exceeds size limit " + std::to_string(limit);
            spdlog::info("search: {}", message);
            return SearchStatus::SIZE_LIMIT_EXCEEDED;
        }
        return SearchStatus::SUCCESS;
    };
}

} // namespace crowdldap::directory
