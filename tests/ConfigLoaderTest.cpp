// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for YAML configuration loading and validation.

#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>

class ConfigLoaderTest {
public:
    ConfigLoaderTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;
        
        auto config = Relay::ConfigLoader::defaults();
        
        assert(config.providers.size() == 4 && "Should have four default providers");
        assert(config.services.size() == 4 && "Should have four default services");
        assert(config.providers[0].name == "openai" && "Providers should keep declaration order");
        assert(config.load_balancing.algorithm == Relay::BalancingAlgorithm::PERFORMANCE_BASED);
        assert(config.thresholds.response_time_ms.warning == 3000.0);
        assert(config.thresholds.error_rate.critical == 0.15);
        assert(config.health.degraded_after_failures == 3);
        
        Relay::ConfigLoader::validate(config);
        
        std::cout << "✓ Default configuration test passed" << std::endl;
    }
    
    void testLoadFromString() {
        std::cout << "Testing loading from YAML text..." << std::endl;
        
        const std::string yaml = R"(
monitor:
  collection_interval_s: 5
  metrics_retention_h: 12
thresholds:
  response_time_ms:
    warning: 2000
    critical: 8000
  alert_cooldown_s: 60
load_balancing:
  algorithm: Least-Connections
  weights:
    fast: 2.0
  latency_budget_ms:
    high: 1000
providers:
  fast:
    models: [fast-1]
    expected_latency_ms: 400
    max_concurrent: 8
  slow:
    quality_score: 0.95
    weight: 0.5
)";
        
        auto config = Relay::ConfigLoader::loadFromString(yaml);
        
        assert(config.monitor.collection_interval == std::chrono::seconds(5));
        assert(config.monitor.metrics_retention == std::chrono::hours(12));
        assert(config.monitor.analysis_interval == std::chrono::seconds(60) && "Missing keys keep defaults");
        assert(config.thresholds.response_time_ms.warning == 2000.0);
        assert(config.thresholds.alert_cooldown == std::chrono::seconds(60));
        assert(config.load_balancing.algorithm == Relay::BalancingAlgorithm::LEAST_CONNECTIONS);
        assert(config.load_balancing.weights.size() == 2 && "Weights should be replaced");
        assert(config.load_balancing.weights.at("slow") == 0.5 && "Provider weight should apply");
        assert(config.load_balancing.latency_budget_high_ms == 1000.0);
        assert(config.load_balancing.latency_budget_medium_ms == 5000.0);
        
        assert(config.providers.size() == 2 && "Providers should replace defaults");
        assert(config.providers[0].name == "fast");
        assert(config.providers[0].models.size() == 1);
        assert(config.providers[0].max_concurrent == 8);
        assert(config.providers[1].name == "slow");
        assert(std::abs(config.providers[1].quality_score - 0.95) < 1e-9);
        assert(config.services.size() == 4 && "Services should keep defaults");
        
        std::cout << "✓ Load from string test passed" << std::endl;
    }
    
    void testLoadFromFile() {
        std::cout << "Testing loading from file..." << std::endl;
        
        const std::string path = "relay_config_test.yml";
        {
            std::ofstream file(path);
            file << "services:\n"
                 << "  summarize:\n"
                 << "    min_complexity: 0.0\n"
                 << "  reason:\n"
                 << "    min_complexity: 0.7\n"
                 << "    expected_latency_ms: 1200\n";
        }
        
        auto config = Relay::ConfigLoader::loadFromFile(path);
        std::remove(path.c_str());
        
        assert(config.services.size() == 2);
        assert(config.services[1].name == "reason");
        assert(config.services[1].min_complexity == 0.7);
        assert(config.services[1].expected_latency_ms == 1200.0);
        
        bool missing_rejected = false;
        try {
            Relay::ConfigLoader::loadFromFile("does_not_exist.yml");
        } catch (const Relay::ConfigError&) {
            missing_rejected = true;
        }
        assert(missing_rejected && "Missing file should raise ConfigError");
        
        std::cout << "✓ Load from file test passed" << std::endl;
    }
    
    void testValidation() {
        std::cout << "Testing configuration validation..." << std::endl;
        
        assert(rejects("thresholds:\n  response_time_ms:\n    warning: 5000\n    critical: 1000\n") &&
               "Warning above critical should be rejected");
        assert(rejects("thresholds:\n  error_rate:\n    warning: 1.5\n") &&
               "Error rate above 1 should be rejected");
        assert(rejects("adaptive_routing:\n  learning_rate: 0\n") &&
               "Zero learning rate should be rejected");
        assert(rejects("health:\n  degraded_after_failures: 5\n  unhealthy_after_failures: 2\n") &&
               "Inverted health thresholds should be rejected");
        assert(rejects("providers:\n  a:\n    baseline_success_rate: 1.2\n") &&
               "Out of range provider rate should be rejected");
        assert(rejects("load_balancing:\n  algorithm: fastest\n") &&
               "Unknown algorithm should be rejected");
        assert(rejects("providers: [a, b]\n") && "Provider list must be a mapping");
        assert(rejects("monitor: {enabled: [unclosed\n") && "Malformed YAML should be rejected");
        assert(rejects("monitor:\n  collection_interval_s: soon\n") && "Bad scalar should be rejected");
        assert(rejects("monitor:\n  cleanup_interval_s: 0\n") && "Zero interval should be rejected");
        assert(rejects("monitor:\n  alert_check_interval_s: -30\n") && "Negative interval should be rejected");
        assert(rejects("thresholds:\n  alert_cooldown_s: -60\n") && "Negative cooldown should be rejected");
        assert(rejects("thresholds:\n  inactivity_window_s: -1\n") && "Negative window should be rejected");
        assert(rejects("monitor:\n  alert_retention_h: -1\n") && "Negative retention should be rejected");
        assert(!rejects("thresholds:\n  alert_cooldown_s: 0\n") && "Zero cooldown is allowed");
        
        auto config = Relay::ConfigLoader::defaults();
        config.providers.push_back(config.providers.front());
        bool duplicate_rejected = false;
        try {
            Relay::ConfigLoader::validate(config);
        } catch (const Relay::ConfigError&) {
            duplicate_rejected = true;
        }
        assert(duplicate_rejected && "Duplicate provider should be rejected");
        
        auto empty = Relay::ConfigLoader::loadFromString("");
        assert(empty.providers.size() == 4 && "Empty document should yield defaults");
        
        std::cout << "✓ Validation test passed" << std::endl;
    }
    
    void testAlgorithmNames() {
        std::cout << "Testing algorithm names..." << std::endl;
        
        using Relay::BalancingAlgorithm;
        using Relay::ConfigLoader;
        
        assert(ConfigLoader::parseAlgorithm("ROUND_ROBIN") == BalancingAlgorithm::ROUND_ROBIN);
        assert(ConfigLoader::parseAlgorithm("round-robin") == BalancingAlgorithm::ROUND_ROBIN);
        assert(ConfigLoader::parseAlgorithm("Weighted") == BalancingAlgorithm::WEIGHTED);
        
        for (auto algorithm : {BalancingAlgorithm::ROUND_ROBIN, BalancingAlgorithm::WEIGHTED,
                               BalancingAlgorithm::LEAST_CONNECTIONS, BalancingAlgorithm::PERFORMANCE_BASED}) {
            assert(ConfigLoader::parseAlgorithm(ConfigLoader::algorithmName(algorithm)) == algorithm);
        }
        
        std::cout << "✓ Algorithm name test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running ConfigLoader unit tests..." << std::endl;
        std::cout << "===================================" << std::endl << std::endl;
        
        testDefaults();
        std::cout << std::endl;
        
        testLoadFromString();
        std::cout << std::endl;
        
        testLoadFromFile();
        std::cout << std::endl;
        
        testValidation();
        std::cout << std::endl;
        
        testAlgorithmNames();
        std::cout << std::endl;
        
        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }

private:
    static bool rejects(const std::string& yaml) {
        try {
            Relay::ConfigLoader::loadFromString(yaml);
        } catch (const Relay::ConfigError&) {
            return true;
        }
        return false;
    }
};

int main() {
    try {
        ConfigLoaderTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All ConfigLoader component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
