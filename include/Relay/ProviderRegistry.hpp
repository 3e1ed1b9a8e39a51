// =================================================================
// include/Relay/ProviderRegistry.hpp
// =================================================================
// Registry of routable providers and their static profiles.

#pragma once

#include "Relay/RoutingConfig.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Relay {

/**
 * @brief Set of providers the routing engine may choose from
 *
 * Providers keep their registration order, which is also the order in which
 * they are scored and cycled by round-robin balancing.
 */
class ProviderRegistry {
public:
    /**
     * @brief Constructor
     * @param providers Initial providers
     */
    explicit ProviderRegistry(const std::vector<ProviderConfig>& providers = {});
    
    virtual ~ProviderRegistry() = default;

    /**
     * @brief Register a provider
     * @param provider Provider profile
     * @return False if a provider with the same name already exists
     */
    virtual bool registerProvider(const ProviderConfig& provider);

    /**
     * @brief Remove a provider
     * @param name Provider name
     * @return True if the provider was registered
     */
    virtual bool unregisterProvider(const std::string& name);

    /**
     * @brief Lookup by name
     */
    virtual std::optional<ProviderConfig> getProvider(const std::string& name) const;

    /**
     * @brief All providers in registration order
     */
    virtual std::vector<ProviderConfig> getProviders() const;

    virtual std::vector<std::string> getProviderNames() const;

    /**
     * @brief Default model of a provider
     * @return First configured model, or "default"
     */
    virtual std::string defaultModel(const std::string& name) const;

    virtual bool empty() const;
    virtual size_t size() const;

private:
    std::vector<ProviderConfig> m_providers;
    mutable std::mutex m_mutex;
};

} // namespace Relay
