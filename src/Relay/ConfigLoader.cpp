// =================================================================
// src/Relay/ConfigLoader.cpp
// =================================================================
// Implementation of the YAML configuration loader.

#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <utility>
#include <unordered_set>

namespace Relay {

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

template <typename Duration>
void readDuration(const YAML::Node& node, const char* key, Duration& target) {
    if (node[key]) {
        target = Duration(node[key].as<long>());
    }
}

void readThresholdPair(const YAML::Node& node, const char* key, ThresholdPair& target) {
    if (node[key]) {
        readValue(node[key], "warning", target.warning);
        readValue(node[key], "critical", target.critical);
    }
}

bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // namespace

RoutingConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        Logger::getInstance().error("ConfigLoader", "Configuration file not readable: " + path);
        throw ConfigError("Configuration file not readable: " + path);
    }
    
    try {
        YAML::Node root = YAML::LoadFile(path);
        RoutingConfig config = parseRoot(root);
        validate(config);
        Logger::getInstance().info("ConfigLoader", "Loaded configuration",
            path + ", providers: " + std::to_string(config.providers.size()));
        return config;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigLoader", 
            "Failed to parse configuration file: " + std::string(e.what()), path);
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
}

RoutingConfig ConfigLoader::loadFromString(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        RoutingConfig config = parseRoot(root);
        validate(config);
        return config;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigLoader", 
            "Failed to parse configuration: " + std::string(e.what()));
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

RoutingConfig ConfigLoader::defaults() {
    RoutingConfig config;
    
    config.load_balancing.weights = {
        {"openai", 1.0},
        {"anthropic", 1.0},
        {"google", 0.8},
        {"local", 0.6}
    };
    
    ProviderConfig openai;
    openai.name = "openai";
    openai.models = {"gpt-4", "gpt-3.5-turbo"};
    
    ProviderConfig anthropic;
    anthropic.name = "anthropic";
    anthropic.models = {"claude-3-opus", "claude-3-sonnet"};
    
    ProviderConfig google;
    google.name = "google";
    google.models = {"gemini-pro", "gemini-pro-vision"};
    
    ProviderConfig local;
    local.name = "local";
    local.models = {"llama-2", "mistral"};
    local.expected_latency_ms = 2500.0;
    local.quality_score = 0.75;
    
    config.providers = {openai, anthropic, google, local};
    
    config.services = {
        {"unified-message-analysis", 0.0, 500.0, 0.95},
        {"advanced-intent-detection", 0.4, 500.0, 0.95},
        {"smart-context-manager", 0.6, 500.0, 0.95},
        {"enhanced-autonomous-activation", 0.8, 500.0, 0.95}
    };
    
    return config;
}

void ConfigLoader::validate(const RoutingConfig& config) {
    auto fail = [](const std::string& message) {
        Logger::getInstance().error("ConfigLoader", "Invalid configuration: " + message);
        throw ConfigError("Invalid configuration: " + message);
    };
    
    const auto& t = config.thresholds;
    if (t.response_time_ms.warning <= 0.0 || t.response_time_ms.critical < t.response_time_ms.warning) {
        fail("response_time_ms thresholds must satisfy 0 < warning <= critical");
    }
    if (!inUnitRange(t.error_rate.warning) || !inUnitRange(t.error_rate.critical) ||
        t.error_rate.critical < t.error_rate.warning) {
        fail("error_rate thresholds must satisfy 0 <= warning <= critical <= 1");
    }
    if (!inUnitRange(t.quality_minimum) || !inUnitRange(t.quality_target)) {
        fail("quality thresholds must be within [0, 1]");
    }
    if (t.inactivity_window.count() < 0 || t.alert_cooldown.count() < 0) {
        fail("inactivity_window_s and alert_cooldown_s must not be negative");
    }
    
    const auto& m = config.monitor;
    const std::pair<const char*, std::chrono::seconds> intervals[] = {
        {"collection_interval_s", m.collection_interval},
        {"analysis_interval_s", m.analysis_interval},
        {"alert_check_interval_s", m.alert_check_interval},
        {"health_sweep_interval_s", m.health_sweep_interval},
        {"cleanup_interval_s", m.cleanup_interval},
        {"log_flush_interval_s", m.log_flush_interval}
    };
    for (const auto& [key, interval] : intervals) {
        if (interval.count() <= 0) {
            fail(std::string(key) + " must be positive");
        }
    }
    if (m.metrics_retention.count() < 0 || m.alert_retention.count() < 0) {
        fail("metrics_retention_h and alert_retention_h must not be negative");
    }
    if (m.max_in_flight_age.count() < 0) {
        fail("max_in_flight_age_s must not be negative");
    }
    if (m.percentile_sample_capacity == 0) {
        fail("percentile_sample_capacity must be positive");
    }
    if (m.percentile_refresh_interval == 0) {
        fail("percentile_refresh_interval must be positive");
    }
    if (m.min_duration_ms <= 0.0) {
        fail("min_duration_ms must be positive");
    }
    
    const auto& h = config.health;
    if (h.stale_after.count() < 0) {
        fail("stale_after_s must not be negative");
    }
    if (h.degraded_after_failures == 0 || h.unhealthy_after_failures < h.degraded_after_failures) {
        fail("health failure counts must satisfy 0 < degraded_after <= unhealthy_after");
    }
    
    const auto& a = config.adaptive;
    if (a.learning_rate <= 0.0 || a.learning_rate > 1.0) {
        fail("learning_rate must be within (0, 1]");
    }
    if (a.historical_window_size == 0) {
        fail("historical_window_size must be positive");
    }
    
    const auto& lb = config.load_balancing;
    if (lb.default_capacity == 0) {
        fail("default_capacity must be positive");
    }
    if (lb.tie_epsilon < 0.0) {
        fail("tie_epsilon must not be negative");
    }
    for (const auto& [name, weight] : lb.weights) {
        if (weight < 0.0) {
            fail("weight for " + name + " must not be negative");
        }
    }
    
    std::unordered_set<std::string> names;
    for (const auto& provider : config.providers) {
        if (provider.name.empty()) {
            fail("provider name must not be empty");
        }
        if (!names.insert(provider.name).second) {
            fail("duplicate provider: " + provider.name);
        }
        if (!inUnitRange(provider.baseline_success_rate) || !inUnitRange(provider.quality_score)) {
            fail("provider " + provider.name + " rates must be within [0, 1]");
        }
        if (provider.expected_latency_ms < 0.0) {
            fail("provider " + provider.name + " expected_latency_ms must not be negative");
        }
    }
}

BalancingAlgorithm ConfigLoader::parseAlgorithm(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    
    if (normalized == "round_robin") return BalancingAlgorithm::ROUND_ROBIN;
    if (normalized == "weighted") return BalancingAlgorithm::WEIGHTED;
    if (normalized == "least_connections") return BalancingAlgorithm::LEAST_CONNECTIONS;
    if (normalized == "performance_based") return BalancingAlgorithm::PERFORMANCE_BASED;
    
    throw ConfigError("Unknown load balancing algorithm: " + name);
}

std::string ConfigLoader::algorithmName(BalancingAlgorithm algorithm) {
    switch (algorithm) {
        case BalancingAlgorithm::ROUND_ROBIN: return "round_robin";
        case BalancingAlgorithm::WEIGHTED: return "weighted";
        case BalancingAlgorithm::LEAST_CONNECTIONS: return "least_connections";
        case BalancingAlgorithm::PERFORMANCE_BASED: return "performance_based";
        default: return "unknown";
    }
}

RoutingConfig ConfigLoader::parseRoot(const YAML::Node& root) {
    RoutingConfig config = defaults();
    
    if (!root || root.IsNull()) {
        Logger::getInstance().warning("ConfigLoader", "Empty configuration, using defaults");
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }
    
    if (root["monitor"]) {
        parseMonitor(root["monitor"], config.monitor);
    }
    if (root["thresholds"]) {
        parseThresholds(root["thresholds"], config.thresholds);
    }
    if (root["load_balancing"]) {
        parseLoadBalancing(root["load_balancing"], config.load_balancing);
    }
    if (root["adaptive_routing"]) {
        parseAdaptive(root["adaptive_routing"], config.adaptive);
    }
    if (root["health"]) {
        parseHealth(root["health"], config.health);
    }
    if (root["providers"]) {
        config.providers = parseProviders(root["providers"]);

        // Per-provider weight overrides load_balancing.weights
        for (YAML::const_iterator it = root["providers"].begin(); it != root["providers"].end(); ++it) {
            if (it->second.IsMap() && it->second["weight"]) {
                config.load_balancing.weights[it->first.as<std::string>()] = it->second["weight"].as<double>();
            }
        }
    }
    if (root["services"]) {
        config.services = parseServices(root["services"]);
    }
    
    return config;
}

void ConfigLoader::parseMonitor(const YAML::Node& node, MonitorConfig& monitor) {
    readValue(node, "enabled", monitor.enabled);
    readDuration(node, "collection_interval_s", monitor.collection_interval);
    readDuration(node, "analysis_interval_s", monitor.analysis_interval);
    readDuration(node, "alert_check_interval_s", monitor.alert_check_interval);
    readDuration(node, "health_sweep_interval_s", monitor.health_sweep_interval);
    readDuration(node, "cleanup_interval_s", monitor.cleanup_interval);
    readDuration(node, "log_flush_interval_s", monitor.log_flush_interval);
    readDuration(node, "metrics_retention_h", monitor.metrics_retention);
    readDuration(node, "alert_retention_h", monitor.alert_retention);
    readValue(node, "max_metrics_history", monitor.max_metrics_history);
    readValue(node, "dashboard_history_limit", monitor.dashboard_history_limit);
    readValue(node, "dashboard_alert_limit", monitor.dashboard_alert_limit);
    readValue(node, "percentile_sample_capacity", monitor.percentile_sample_capacity);
    readValue(node, "percentile_refresh_interval", monitor.percentile_refresh_interval);
    readValue(node, "min_duration_ms", monitor.min_duration_ms);
    readDuration(node, "max_in_flight_age_s", monitor.max_in_flight_age);
    readValue(node, "decision_log_size", monitor.decision_log_size);
    readValue(node, "trend_history_size", monitor.trend_history_size);
    readValue(node, "random_seed", monitor.random_seed);
}

void ConfigLoader::parseThresholds(const YAML::Node& node, AlertThresholds& thresholds) {
    readThresholdPair(node, "response_time_ms", thresholds.response_time_ms);
    readThresholdPair(node, "error_rate", thresholds.error_rate);
    
    if (node["quality"]) {
        readValue(node["quality"], "minimum", thresholds.quality_minimum);
        readValue(node["quality"], "target", thresholds.quality_target);
    }
    if (node["throughput"]) {
        readValue(node["throughput"], "minimum", thresholds.throughput_minimum);
        readValue(node["throughput"], "target", thresholds.throughput_target);
    }
    
    readDuration(node, "inactivity_window_s", thresholds.inactivity_window);
    readDuration(node, "alert_cooldown_s", thresholds.alert_cooldown);
}

void ConfigLoader::parseLoadBalancing(const YAML::Node& node, LoadBalancingConfig& lb) {
    if (node["algorithm"]) {
        lb.algorithm = parseAlgorithm(node["algorithm"].as<std::string>());
    }
    
    if (node["weights"]) {
        lb.weights.clear();
        for (YAML::const_iterator it = node["weights"].begin(); it != node["weights"].end(); ++it) {
            lb.weights[it->first.as<std::string>()] = it->second.as<double>();
        }
    }
    
    readValue(node, "default_capacity", lb.default_capacity);
    readValue(node, "tie_epsilon", lb.tie_epsilon);
    readValue(node, "preferred_bonus", lb.preferred_bonus);
    readValue(node, "least_connections_window", lb.least_connections_window);
    
    if (node["latency_budget_ms"]) {
        YAML::Node budget = node["latency_budget_ms"];
        readValue(budget, "high", lb.latency_budget_high_ms);
        readValue(budget, "medium", lb.latency_budget_medium_ms);
        readValue(budget, "low", lb.latency_budget_low_ms);
    }
}

void ConfigLoader::parseAdaptive(const YAML::Node& node, AdaptiveRoutingConfig& adaptive) {
    readValue(node, "enabled", adaptive.enabled);
    readValue(node, "learning_rate", adaptive.learning_rate);
    readValue(node, "adaptation_threshold", adaptive.adaptation_threshold);
    readValue(node, "historical_window_size", adaptive.historical_window_size);
}

void ConfigLoader::parseHealth(const YAML::Node& node, HealthConfig& health) {
    readValue(node, "degraded_after_failures", health.degraded_after_failures);
    readValue(node, "unhealthy_after_failures", health.unhealthy_after_failures);
    readDuration(node, "stale_after_s", health.stale_after);
}

std::vector<ProviderConfig> ConfigLoader::parseProviders(const YAML::Node& node) {
    std::vector<ProviderConfig> providers;
    
    if (!node.IsMap()) {
        throw ConfigError("'providers' must be a mapping of provider name to settings");
    }
    
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        ProviderConfig provider;
        provider.name = it->first.as<std::string>();
        
        YAML::Node provider_node = it->second;
        if (provider_node && provider_node.IsMap()) {
            if (provider_node["models"]) {
                for (const auto& model : provider_node["models"]) {
                    provider.models.push_back(model.as<std::string>());
                }
            }
            readValue(provider_node, "expected_latency_ms", provider.expected_latency_ms);
            readValue(provider_node, "baseline_success_rate", provider.baseline_success_rate);
            readValue(provider_node, "quality_score", provider.quality_score);
            readValue(provider_node, "max_concurrent", provider.max_concurrent);
        }
        
        providers.push_back(provider);
    }
    
    return providers;
}

std::vector<ServiceRoute> ConfigLoader::parseServices(const YAML::Node& node) {
    std::vector<ServiceRoute> services;
    
    if (!node.IsMap()) {
        throw ConfigError("'services' must be a mapping of service name to settings");
    }
    
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        ServiceRoute service;
        service.name = it->first.as<std::string>();
        
        YAML::Node service_node = it->second;
        if (service_node && service_node.IsMap()) {
            readValue(service_node, "min_complexity", service.min_complexity);
            readValue(service_node, "expected_latency_ms", service.expected_latency_ms);
            readValue(service_node, "baseline_success_rate", service.baseline_success_rate);
        }
        
        services.push_back(service);
    }
    
    return services;
}

} // namespace Relay
