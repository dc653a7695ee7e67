/**
 * @file crowd_partition.h
 * @brief Read-only virtual partition backed by an identity service
 *
 * Composes DN mapping, entry synthesis, memberOf emulation, search
 * evaluation and bind authentication over one IDirectoryBackend. Holds
 * no mutable state besides the initialized flag, so one instance serves
 * all host sessions concurrently.
 */

#pragma once

#include "authenticator.h"
#include "backend.h"
#include "config.h"
#include "dn_mapper.h"
#include "entry_synthesizer.h"
#include "member_of_resolver.h"
#include "partition.h"
#include "search_evaluator.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace crowdldap::directory {

class CrowdPartition : public DirectoryPartition, public BindAuthenticator {
public:
    /**
     * @brief Constructor
     * @param config Bridge configuration (copied)
     * @param backend Identity backend (non-owning, must outlive the partition)
     * @throws std::invalid_argument if backend is nullptr
     * @throws common::ConfigException if the layout settings are invalid
     */
    CrowdPartition(const BridgeConfig& config, IDirectoryBackend* backend);
    ~CrowdPartition() override;

    CrowdPartition(const CrowdPartition&) = delete;
    CrowdPartition& operator=(const CrowdPartition&) = delete;

    void initialize() override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_.load(); }
    const Dn& suffix() const override { return mapper_.baseDn(); }

    LookupResult lookup(const Dn& dn, const std::vector<std::string>& attributes) override;
    bool hasEntry(const Dn& dn) override;
    std::unique_ptr<EntryCursor> search(const Dn& base,
                                        SearchScope scope,
                                        const Filter& filter,
                                        const std::vector<std::string>& attributes) override;

    OperationResult add(const Entry& entry) override;
    OperationResult modify(const Dn& dn, const std::vector<Modification>& changes) override;
    OperationResult remove(const Dn& dn) override;
    OperationResult rename(const Dn& dn, const Rdn& newRdn, bool deleteOldRdn) override;

    AuthOutcome authenticate(const BindCredentials& credentials) override;

    const BridgeConfig& config() const { return config_; }
    const DnMapper& mapper() const { return mapper_; }

private:
    OperationResult rejectWrite(const std::string& operation, const Dn& dn) const;

    BridgeConfig config_;
    IDirectoryBackend* backend_;
    DnMapper mapper_;
    EntrySynthesizer synthesizer_;
    MemberOfResolver resolver_;
    SearchEvaluator evaluator_;
    Authenticator authenticator_;
    std::atomic<bool> initialized_{false};
};

} // namespace crowdldap::directory
