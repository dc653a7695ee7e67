/**
 * @file search_evaluator.h
 * @brief LDAP search over a backend without a filter language
 *
 * Candidates come either from point lookups (when the filter pins the
 * naming attribute) or from a bounded bulk listing; the filter is then
 * evaluated in memory. Results are produced lazily through EntryCursor.
 */

#pragma once

#include "backend.h"
#include "config.h"
#include "dn.h"
#include "dn_mapper.h"
#include "entry.h"
#include "entry_synthesizer.h"
#include "filter.h"
#include "member_of_resolver.h"
#include "types.h"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace crowdldap::directory {

/// @brief Terminal (or current) state of a search cursor
enum class SearchStatus {
    IN_PROGRESS,
    SUCCESS,
    SIZE_LIMIT_EXCEEDED,
    BACKEND_UNAVAILABLE,
    ABANDONED
};

std::string searchStatusToString(SearchStatus status);

/**
 * @brief Lazy, forward-only search result
 *
 * Work is split into steps (one backend fetch each). next() runs steps until
 * an entry is ready or no steps remain. Not restartable; re-run the search.
 * abandon() may be called from another thread; the cursor stops at the next
 * step boundary and drops anything buffered. The cursor refers to the
 * evaluator that created it and must not outlive it.
 */
class EntryCursor {
public:
    /**
     * @brief One unit of deferred work
     *
     * Appends matching entries to out and returns SUCCESS, or returns a
     * terminal status with a detail message. Entries appended before
     * SIZE_LIMIT_EXCEEDED are still delivered; BACKEND_UNAVAILABLE discards
     * whatever the failing step buffered.
     */
    using Step = std::function<SearchStatus(std::deque<Entry>& out, std::string& message)>;

    EntryCursor(std::vector<Step> steps, std::vector<std::string> requestedAttributes);

    /// @brief Already-finished cursor (empty result)
    static std::unique_ptr<EntryCursor> empty();

    /// @brief Cursor that ends with BACKEND_UNAVAILABLE and message on first use
    static std::unique_ptr<EntryCursor> unavailable(const std::string& message);

    /**
     * @brief Fetch the next matching entry
     * @param entry Receives the entry, projected to the requested attributes
     * @return false when the cursor is exhausted; check status() then
     */
    bool next(Entry& entry);

    /// @brief Drain the cursor into a vector
    std::vector<Entry> collect();

    SearchStatus status() const { return status_; }
    const std::string& message() const { return message_; }

    /// @brief Request early termination
    void abandon() { abandoned_.store(true); }

private:
    std::vector<Step> steps_;
    size_t nextStep_ = 0;
    std::deque<Entry> ready_;
    std::vector<std::string> requested_;
    SearchStatus status_ = SearchStatus::IN_PROGRESS;
    SearchStatus pendingStatus_ = SearchStatus::SUCCESS;
    std::string message_;
    std::string pendingMessage_;
    std::atomic<bool> abandoned_{false};
};

/**
 * @brief Search evaluator
 */
class SearchEvaluator {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if backend is nullptr
     */
    SearchEvaluator(const BridgeConfig& config,
                    const DnMapper& mapper,
                    const EntrySynthesizer& synthesizer,
                    const MemberOfResolver& resolver,
                    IDirectoryBackend* backend);

    /**
     * @brief Start a search
     *
     * Base outside the layout yields an empty cursor. Scope semantics:
     *   - BASE: only the entry at base
     *   - ONE_LEVEL: direct children of base
     *   - SUBTREE: base and everything beneath it
     *
     * @param base Search base DN
     * @param scope Search scope
     * @param filter Filter tree
     * @param attributes Requested attributes (empty or "*" for all)
     * @return Cursor (never nullptr)
     */
    std::unique_ptr<EntryCursor> search(const Dn& base,
                                        SearchScope scope,
                                        const Filter& filter,
                                        const std::vector<std::string>& attributes) const;

    /// @brief True if memberOf must be computed for this request
    bool needsMemberOf(const Filter& filter, const std::vector<std::string>& attributes) const;

private:
    enum class Branch { USERS, GROUPS };

    // Step builders
    EntryCursor::Step containerStep(const Dn& dn, const Filter& filter) const;
    EntryCursor::Step userLookupStep(const std::string& name, const Filter& filter, bool memberOf) const;
    EntryCursor::Step groupLookupStep(const std::string& name, const Filter& filter, bool memberOf) const;
    EntryCursor::Step userListingStep(const Filter& filter, bool memberOf) const;
    EntryCursor::Step groupListingStep(const Filter& filter, bool memberOf) const;

    /// @brief Point lookups if the filter pins names, otherwise a bulk listing
    void addBranchSteps(Branch branch, const Filter& filter, bool memberOf,
                        std::vector<EntryCursor::Step>& steps) const;

    /// @brief Attach memberOf (if needed) and test the filter
    SearchStatus emitIfMatching(Entry entry, const std::string& name, PrincipalKind kind,
                                const Filter& filter, bool memberOf,
                                std::deque<Entry>& out, std::string& message) const;

    const BridgeConfig& config_;
    const DnMapper& mapper_;
    const EntrySynthesizer& synthesizer_;
    const MemberOfResolver& resolver_;
    IDirectoryBackend* backend_;
};

} // namespace crowdldap::directory
