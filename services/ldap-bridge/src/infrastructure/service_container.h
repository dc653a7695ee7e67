#pragma once

/**
 * @file service_container.h
 * @brief Owns the HTTP transport, the Crowd backend and the partition
 *
 * Provides non-owning pointer accessors for the command handlers.
 */

#include <memory>

namespace crowdldap {

namespace crowd {
    class CrowdRestBackend;
}
namespace directory {
    class CrowdPartition;
}

namespace infrastructure {

struct AppConfig;

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    crowd::CrowdRestBackend* backend() const;
    directory::CrowdPartition* partition() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
} // namespace crowdldap
