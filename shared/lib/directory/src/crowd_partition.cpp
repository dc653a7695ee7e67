/**
 * @file crowd_partition.cpp
 * @brief Read-only virtual partition over the identity backend
 */

#include "crowdldap/directory/crowd_partition.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crowdldap::directory {

namespace {

IDirectoryBackend* requireBackend(IDirectoryBackend* backend) {
    if (!backend) {
        throw std::invalid_argument("CrowdPartition: backend cannot be nullptr");
    }
    return backend;
}

const char* const kNotInitialized = "partition not initialized";

} // anonymous namespace

CrowdPartition::CrowdPartition(const BridgeConfig& config, IDirectoryBackend* backend)
    : config_(config),
      backend_(requireBackend(backend)),
      mapper_(config_),
      synthesizer_(mapper_),
      resolver_(config_, mapper_, backend_),
      evaluator_(config_, mapper_, synthesizer_, resolver_, backend_),
      authenticator_(mapper_, backend_) {}

CrowdPartition::~CrowdPartition() = default;

void CrowdPartition::initialize() {
    if (initialized_.load()) {
        return;
    }

    spdlog::info("Initializing partition {} (users: {}, groups: {})",
                 mapper_.baseDn().toString(), mapper_.usersDn().toString(), mapper_.groupsDn().toString());
    spdlog::info("memberOf emulation: {}, nested: {}, selector: {}",
                 config_.emulateMemberOf, config_.includeNestedGroups,
                 config_.memberOfGroupSelector.value_or("none"));

    BackendStatus status = backend_->testConnection();
    if (status == BackendStatus::OK) {
        spdlog::info("Identity backend reachable");
    } else {
        spdlog::warn("Identity backend connection test failed ({}); requests report UNAVAILABLE until it recovers",
                     backendStatusToString(status));
    }

    initialized_.store(true);
}

void CrowdPartition::shutdown() {
    if (initialized_.exchange(false)) {
        spdlog::info("Partition {} shut down", mapper_.baseDn().toString());
    }
}

LookupResult CrowdPartition::lookup(const Dn& dn, const std::vector<std::string>& attributes) {
    LookupResult result;
    if (!isInitialized()) {
        result.code = common::ErrorCode::BACKEND_UNAVAILABLE;
        result.message = kNotInitialized;
        return result;
    }

    auto cursor = evaluator_.search(dn, SearchScope::BASE, Filter::matchAll(), attributes);
    Entry entry{Dn(), AttributeMap{}};
    if (cursor->next(entry)) {
        result.entry = std::move(entry);
        return result;
    }

    switch (cursor->status()) {
        case SearchStatus::BACKEND_UNAVAILABLE:
            result.code = common::ErrorCode::BACKEND_UNAVAILABLE;
            break;
        case SearchStatus::ABANDONED:
            result.code = common::ErrorCode::DIRECTORY_ABANDONED;
            break;
        default:
            result.code = common::ErrorCode::DIRECTORY_NO_SUCH_OBJECT;
            break;
    }
    result.message = cursor->message().empty() ? "no such entry: " + dn.toString() : cursor->message();
    return result;
}

bool CrowdPartition::hasEntry(const Dn& dn) {
    return lookup(dn, {"1.1"}).found();
}

std::unique_ptr<EntryCursor> CrowdPartition::search(const Dn& base,
                                                    SearchScope scope,
                                                    const Filter& filter,
                                                    const std::vector<std::string>& attributes) {
    if (!isInitialized()) {
        return EntryCursor::unavailable(kNotInitialized);
    }
    return evaluator_.search(base, scope, filter, attributes);
}

OperationResult CrowdPartition::rejectWrite(const std::string& operation, const Dn& dn) const {
    spdlog::info("Rejected {} on '{}': partition is read-only", operation, dn.toString());
    OperationResult result;
    result.code = common::ErrorCode::DIRECTORY_UNSUPPORTED_OPERATION;
    result.message = operation + " is not supported: directory is read-only";
    return result;
}

OperationResult CrowdPartition::add(const Entry& entry) {
    return rejectWrite("add", entry.dn());
}

OperationResult CrowdPartition::modify(const Dn& dn, const std::vector<Modification>& /*changes*/) {
    return rejectWrite("modify", dn);
}

OperationResult CrowdPartition::remove(const Dn& dn) {
    return rejectWrite("delete", dn);
}

OperationResult CrowdPartition::rename(const Dn& dn, const Rdn& /*newRdn*/, bool /*deleteOldRdn*/) {
    return rejectWrite("modrdn", dn);
}

AuthOutcome CrowdPartition::authenticate(const BindCredentials& credentials) {
    if (!isInitialized()) {
        return AuthOutcome::UNAVAILABLE;
    }
    return authenticator_.authenticate(credentials);
}

} // namespace crowdldap::directory
