/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include "crowdldap/crowd/crowd_rest_backend.h"
#include "crowdldap/crowd/http_client.h"
#include "crowdldap/directory/crowd_partition.h"

#include <spdlog/spdlog.h>

namespace crowdldap::infrastructure {

struct ServiceContainer::Impl {
    std::unique_ptr<crowd::CurlHttpClient> httpClient;
    std::unique_ptr<crowd::CrowdRestBackend> backend;
    std::unique_ptr<directory::CrowdPartition> partition;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing crowd-ldap-bridge dependencies...");

    try {
        // Step 1: HTTP transport
        impl_->httpClient = std::make_unique<crowd::CurlHttpClient>(config.toHttpClientConfig());
        spdlog::info("Crowd endpoint: {} (application: {}, timeout: {}s)",
                     config.crowdUrl, config.crowdAppName, config.crowdTimeoutSec);

        // Step 2: Identity backend
        impl_->backend = std::make_unique<crowd::CrowdRestBackend>(impl_->httpClient.get());

        // Step 3: Partition
        impl_->partition = std::make_unique<directory::CrowdPartition>(
            config.toBridgeConfig(), impl_->backend.get());
        impl_->partition->initialize();

        spdlog::info("All crowd-ldap-bridge dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize crowd-ldap-bridge: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    if (impl_->partition) {
        impl_->partition->shutdown();
    }

    // Delete in reverse order of initialization
    impl_->partition.reset();
    impl_->backend.reset();
    impl_->httpClient.reset();
}

crowd::CrowdRestBackend* ServiceContainer::backend() const { return impl_->backend.get(); }
directory::CrowdPartition* ServiceContainer::partition() const { return impl_->partition.get(); }

} // namespace crowdldap::infrastructure
