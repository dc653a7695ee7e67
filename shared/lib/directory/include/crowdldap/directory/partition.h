/**
 * @file partition.h
 * @brief Capability interfaces offered to the host directory framework
 *
 * The host owns the wire protocol (listener, BER codec, TLS, schema). It
 * drives a partition through these interfaces:
 *   initialize() -> lookup()/search() ... -> shutdown()
 * Write operations are part of the contract so the host can route them,
 * but a read-only partition answers them with UNSUPPORTED.
 */

#pragma once

#include "dn.h"
#include "entry.h"
#include "filter.h"
#include "search_evaluator.h"
#include "types.h"
#include "error_codes.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crowdldap::directory {

/// @brief Result of a lookup-by-DN
struct LookupResult {
    common::ErrorCode code = common::ErrorCode::SUCCESS;
    std::optional<Entry> entry;
    std::string message;

    bool found() const { return code == common::ErrorCode::SUCCESS && entry.has_value(); }
};

/// @brief Result of a write request
struct OperationResult {
    common::ErrorCode code = common::ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return code == common::ErrorCode::SUCCESS; }
};

/// @brief One attribute change of a modify request
struct Modification {
    enum class Operation { ADD, REPLACE, DELETE };

    Operation operation = Operation::REPLACE;
    std::string attribute;
    std::vector<std::string> values;
};

/**
 * @brief Directory partition capability
 */
class DirectoryPartition {
public:
    virtual ~DirectoryPartition() = default;

    /**
     * @brief Prepare the partition for requests
     * @throws common::ConfigException if the configuration is unusable
     */
    virtual void initialize() = 0;

    virtual void shutdown() = 0;

    virtual bool isInitialized() const = 0;

    /// @brief DN of the partition's suffix entry
    virtual const Dn& suffix() const = 0;

    /**
     * @brief Fetch a single entry by DN
     * @param dn Entry DN
     * @param attributes Requested attributes (empty or "*" for all)
     */
    virtual LookupResult lookup(const Dn& dn, const std::vector<std::string>& attributes) = 0;

    /// @brief True if an entry exists at dn
    virtual bool hasEntry(const Dn& dn) = 0;

    virtual std::unique_ptr<EntryCursor> search(const Dn& base,
                                                SearchScope scope,
                                                const Filter& filter,
                                                const std::vector<std::string>& attributes) = 0;

    // Write surface
    virtual OperationResult add(const Entry& entry) = 0;
    virtual OperationResult modify(const Dn& dn, const std::vector<Modification>& changes) = 0;
    virtual OperationResult remove(const Dn& dn) = 0;
    virtual OperationResult rename(const Dn& dn, const Rdn& newRdn, bool deleteOldRdn) = 0;
};

/**
 * @brief Simple-bind capability
 */
class BindAuthenticator {
public:
    virtual ~BindAuthenticator() = default;

    virtual AuthOutcome authenticate(const BindCredentials& credentials) = 0;
};

} // namespace crowdldap::directory
