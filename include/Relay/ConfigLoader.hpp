// =================================================================
// include/Relay/ConfigLoader.hpp
// =================================================================
// Loads RoutingConfig from YAML files or strings.

#pragma once

#include "Relay/RoutingConfig.hpp"
#include <stdexcept>
#include <string>

namespace YAML {
class Node;
}

namespace Relay {

/**
 * @brief Raised when configuration cannot be read or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief YAML configuration loader
 *
 * Missing keys keep their defaults. Every loaded configuration is validated
 * before it is returned.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param path Path to the file
     * @return Parsed configuration
     * @throws ConfigError on I/O, syntax or validation failure
     */
    static RoutingConfig loadFromFile(const std::string& path);

    /**
     * @brief Load configuration from YAML text
     * @param yaml YAML document
     * @return Parsed configuration
     * @throws ConfigError on syntax or validation failure
     */
    static RoutingConfig loadFromString(const std::string& yaml);

    /**
     * @brief Built-in configuration with four providers and four services
     */
    static RoutingConfig defaults();

    /**
     * @brief Check a configuration for inconsistent values
     * @throws ConfigError describing the first problem found
     */
    static void validate(const RoutingConfig& config);

    /**
     * @brief Parse an algorithm name (round_robin, weighted, ...)
     * @throws ConfigError for unknown names
     */
    static BalancingAlgorithm parseAlgorithm(const std::string& name);

    /**
     * @brief Canonical name of an algorithm
     */
    static std::string algorithmName(BalancingAlgorithm algorithm);

private:
    static RoutingConfig parseRoot(const YAML::Node& root);
    static void parseMonitor(const YAML::Node& node, MonitorConfig& monitor);
    static void parseThresholds(const YAML::Node& node, AlertThresholds& thresholds);
    static void parseLoadBalancing(const YAML::Node& node, LoadBalancingConfig& lb);
    static void parseAdaptive(const YAML::Node& node, AdaptiveRoutingConfig& adaptive);
    static void parseHealth(const YAML::Node& node, HealthConfig& health);
    static std::vector<ProviderConfig> parseProviders(const YAML::Node& node);
    static std::vector<ServiceRoute> parseServices(const YAML::Node& node);
};

} // namespace Relay
