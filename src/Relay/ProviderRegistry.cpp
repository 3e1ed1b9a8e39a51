// =================================================================
// src/Relay/ProviderRegistry.cpp
// =================================================================
// Implementation of the provider registry.

#include "Relay/ProviderRegistry.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>

namespace Relay {

ProviderRegistry::ProviderRegistry(const std::vector<ProviderConfig>& providers) {
    for (const auto& provider : providers) {
        registerProvider(provider);
    }
}

bool ProviderRegistry::registerProvider(const ProviderConfig& provider) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = std::find_if(m_providers.begin(), m_providers.end(),
                           [&provider](const ProviderConfig& existing) {
                               return existing.name == provider.name;
                           });
    if (it != m_providers.end()) {
        Logger::getInstance().warning("ProviderRegistry", "Provider already registered: " + provider.name);
        return false;
    }
    
    m_providers.push_back(provider);
    Logger::getInstance().info("ProviderRegistry", "Registered provider: " + provider.name,
                               std::to_string(provider.models.size()) + " models");
    return true;
}

bool ProviderRegistry::unregisterProvider(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = std::find_if(m_providers.begin(), m_providers.end(),
                           [&name](const ProviderConfig& existing) { return existing.name == name; });
    if (it == m_providers.end()) {
        return false;
    }
    
    m_providers.erase(it);
    Logger::getInstance().info("ProviderRegistry", "Unregistered provider: " + name);
    return true;
}

std::optional<ProviderConfig> ProviderRegistry::getProvider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& provider : m_providers) {
        if (provider.name == name) {
            return provider;
        }
    }
    return std::nullopt;
}

std::vector<ProviderConfig> ProviderRegistry::getProviders() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_providers;
}

std::vector<std::string> ProviderRegistry::getProviderNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& provider : m_providers) {
        names.push_back(provider.name);
    }
    return names;
}

std::string ProviderRegistry::defaultModel(const std::string& name) const {
    auto provider = getProvider(name);
    if (!provider || provider->models.empty()) {
        return "default";
    }
    return provider->models.front();
}

bool ProviderRegistry::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_providers.empty();
}

size_t ProviderRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_providers.size();
}

} // namespace Relay
