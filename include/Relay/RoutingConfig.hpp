// =================================================================
// include/Relay/RoutingConfig.hpp
// =================================================================
// Typed configuration for monitoring, alerting and provider routing.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

/**
 * @brief Load balancing algorithm applied after scoring
 */
enum class BalancingAlgorithm {
    ROUND_ROBIN,        ///< Cycle through the scored provider list
    WEIGHTED,           ///< Score multiplied by a static per-provider weight
    LEAST_CONNECTIONS,  ///< Fewest in-flight requests among near-best scores
    PERFORMANCE_BASED   ///< Best score among providers meeting hard requirements
};

/**
 * @brief Warning / critical threshold pair
 */
struct ThresholdPair {
    double warning = 0.0;   ///< Crossing raises a HIGH alert
    double critical = 0.0;  ///< Crossing raises a CRITICAL alert
};

/**
 * @brief Thresholds used by the alert engine
 */
struct AlertThresholds {
    ThresholdPair response_time_ms{3000.0, 10000.0}; ///< Mean latency thresholds
    ThresholdPair error_rate{0.05, 0.15};            ///< Error rate thresholds
    double quality_minimum = 0.7;                    ///< Quality below this raises LOW_QUALITY
    double quality_target = 0.9;                     ///< Desired quality level
    double throughput_minimum = 10.0;                ///< Operations per minute considered healthy
    double throughput_target = 100.0;                ///< Desired operations per minute
    std::chrono::seconds inactivity_window{300};     ///< Silence before "possibly down"
    std::chrono::seconds alert_cooldown{300};        ///< Quiet period after a resolution
};

/**
 * @brief Load balancing configuration
 */
struct LoadBalancingConfig {
    BalancingAlgorithm algorithm = BalancingAlgorithm::PERFORMANCE_BASED;
    std::unordered_map<std::string, double> weights; ///< Static weights for WEIGHTED (default 1.0)
    size_t default_capacity = 20;                    ///< Assumed concurrent capacity per provider
    double tie_epsilon = 1e-3;                       ///< Scores closer than this are tied
    double preferred_bonus = 1.1;                    ///< Multiplier for preferred providers
    double least_connections_window = 0.10;          ///< Fraction of best score considered "near"
    double latency_budget_high_ms = 2500.0;          ///< Max acceptable latency, urgent requests
    double latency_budget_medium_ms = 5000.0;        ///< Max acceptable latency, normal requests
    double latency_budget_low_ms = 10000.0;          ///< Max acceptable latency, background requests
};

/**
 * @brief Adaptive routing configuration
 */
struct AdaptiveRoutingConfig {
    bool enabled = true;                 ///< Smooth reported quality into provider scores
    double learning_rate = 0.1;          ///< Weight of a new quality observation
    double adaptation_threshold = 0.05;  ///< Relative change treated as a trend
    size_t historical_window_size = 1000; ///< Per-provider history ring capacity
};

/**
 * @brief Provider health state machine configuration
 */
struct HealthConfig {
    size_t degraded_after_failures = 3;   ///< Consecutive failures to become degraded
    size_t unhealthy_after_failures = 6;  ///< Consecutive failures to become unhealthy
    std::chrono::seconds stale_after{300}; ///< Inactivity before a provider is flagged stale
};

/**
 * @brief Monitoring configuration
 */
struct MonitorConfig {
    bool enabled = true;                                  ///< Master switch for instrumentation
    std::chrono::seconds collection_interval{10};         ///< Trend snapshot period
    std::chrono::seconds analysis_interval{60};           ///< Trend analysis period
    std::chrono::seconds alert_check_interval{30};        ///< Alert sweep period
    std::chrono::seconds health_sweep_interval{30};       ///< Staleness sweep period
    std::chrono::seconds cleanup_interval{3600};          ///< Retention cleanup period
    std::chrono::seconds log_flush_interval{1};           ///< Buffered log lines written to file
    std::chrono::hours metrics_retention{24};             ///< Recent-operation log retention
    std::chrono::hours alert_retention{168};              ///< Alert retention
    size_t max_metrics_history = 10000;                   ///< Recent-operation log capacity
    size_t dashboard_history_limit = 100;                 ///< Entries shown on the dashboard
    size_t dashboard_alert_limit = 50;                    ///< Alerts shown on the dashboard
    size_t percentile_sample_capacity = 200;              ///< Reservoir size for p95
    size_t percentile_refresh_interval = 100;             ///< Operations between p95 recomputes
    double min_duration_ms = 0.001;                       ///< Lower clamp for measured durations
    std::chrono::seconds max_in_flight_age{600};          ///< In-flight entries older than this leak
    size_t decision_log_size = 1000;                      ///< Routing decisions kept for inspection
    size_t trend_history_size = 100;                      ///< System snapshots kept for trends
    uint64_t random_seed = 42;                            ///< Seed for reservoirs and tie-breaks
};

/**
 * @brief Static profile of a routable provider
 */
struct ProviderConfig {
    std::string name;                     ///< Provider identifier
    std::vector<std::string> models;      ///< Available models, first is the default
    double expected_latency_ms = 1500.0;  ///< Prior mean latency before observations
    double baseline_success_rate = 0.98;  ///< Prior success rate before observations
    double quality_score = 0.85;          ///< Prior quality before feedback
    size_t max_concurrent = 0;            ///< Concurrent capacity (0 = load balancing default)
};

/**
 * @brief Internal processing service chosen by request complexity
 */
struct ServiceRoute {
    std::string name;                    ///< Service identifier
    double min_complexity = 0.0;         ///< Chosen when complexity exceeds this
    double expected_latency_ms = 500.0;  ///< Prior mean latency before observations
    double baseline_success_rate = 0.95; ///< Prior success rate before observations
};

/**
 * @brief Complete routing core configuration
 */
struct RoutingConfig {
    MonitorConfig monitor;
    AlertThresholds thresholds;
    LoadBalancingConfig load_balancing;
    AdaptiveRoutingConfig adaptive;
    HealthConfig health;
    std::vector<ProviderConfig> providers;
    std::vector<ServiceRoute> services;
};

} // namespace Relay
