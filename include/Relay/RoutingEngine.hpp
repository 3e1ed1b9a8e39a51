// =================================================================
// include/Relay/RoutingEngine.hpp
// =================================================================
// Performance-aware provider selection for outgoing requests.

#pragma once

#include "Relay/Clock.hpp"
#include "Relay/HealthTracker.hpp"
#include "Relay/LoadBalancer.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/ProviderRegistry.hpp"
#include "Relay/RequestTracker.hpp"
#include "Relay/RoutingConfig.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

/**
 * @brief How urgently a request needs an answer
 */
enum class Urgency {
    LOW,     ///< Background work, generous latency budget
    MEDIUM,  ///< Normal interactive request
    HIGH     ///< Latency-sensitive request
};

/**
 * @brief Constraints a caller places on provider selection
 */
struct RoutingRequirements {
    std::optional<double> max_response_time_ms;  ///< Hard latency ceiling
    std::optional<double> min_quality;           ///< Hard quality floor
    std::optional<double> min_reliability;       ///< Hard success-rate floor
    std::vector<std::string> preferred_providers; ///< Providers receiving a score bonus
    Urgency urgency = Urgency::MEDIUM;           ///< Sets the default latency budget
};

/**
 * @brief Opaque request description (content is never inspected)
 */
struct RequestContext {
    std::string request_id;                      ///< Request identifier
    std::optional<double> complexity;            ///< Complexity estimate in [0, 1]
    std::unordered_map<std::string, std::string> metadata; ///< Free-form caller metadata
};

/**
 * @brief Runner-up provider listed in a decision
 */
struct RoutingAlternative {
    std::string provider;   ///< Provider identifier
    double score = 0.0;     ///< Composite score
    std::string reason;     ///< Score breakdown
};

/**
 * @brief Expected outcome of routing to the selected provider
 */
struct PerformanceEstimates {
    double response_time_ms = 0.0; ///< Provider mean + service mean
    double reliability = 0.0;      ///< Provider success rate x service success rate
    double quality = 0.0;          ///< Provider quality, slightly discounted
};

/**
 * @brief Decision factors reported alongside the selection
 */
struct RoutingFactors {
    double current_load = 0.0;            ///< System-wide in-flight load in [0, 1]
    double historical_performance = 0.5;  ///< Recent history of the selected provider
    double real_time_score = 0.5;         ///< Current stats of the selected provider
    double requirement_alignment = 1.0;   ///< Alignment component of the selected provider
};

/**
 * @brief Result of provider selection
 */
struct RoutingDecision {
    std::string request_id;                      ///< Request being routed
    std::string selected_provider;               ///< Chosen provider
    std::string selected_model;                  ///< Provider's default model
    std::string selected_service;                ///< Internal service chosen by complexity
    double score = 0.0;                          ///< Composite score of the chosen provider
    PerformanceEstimates estimates;              ///< Expected outcome
    std::vector<RoutingAlternative> alternatives; ///< Up to three next-best providers
    std::string load_balancing_reason;           ///< Why the balancer chose this provider
    double expected_load_impact = 0.0;           ///< Load impact reported by the balancer
    bool fallback_used = false;                  ///< No provider met every requirement
    std::string algorithm;                       ///< Balancing algorithm name
    RoutingFactors factors;                      ///< Decision factors
    std::chrono::system_clock::time_point timestamp; ///< Decision time
};

/**
 * @brief Operator-facing advice derived from provider statistics
 */
struct Recommendation {
    std::string type;          ///< optimization, scaling or configuration
    std::string priority;      ///< low, medium or high
    std::string description;   ///< What was observed
    std::string action;        ///< Suggested action
};

/**
 * @brief Raised by selectProvider() when no provider is registered
 */
class NoProvidersAvailableError : public std::runtime_error {
public:
    NoProvidersAvailableError() : std::runtime_error("No providers available") {}
};

/**
 * @brief Scores providers and applies the balancing policy
 *
 * Composite score = 0.4 performance + 0.2 load + 0.2 health + 0.2 alignment,
 * multiplied by the preferred bonus for preferred providers and capped at 1.
 * Selection reads statistics synchronously and never blocks on I/O.
 */
class RoutingEngine {
public:
    /**
     * @brief Constructor
     * @param config Routing configuration
     * @param registry Known providers
     * @param metrics Statistics store
     * @param health Provider health
     * @param tracker In-flight counts and request history
     * @param balancer Balancing policy
     * @param clock Time source
     */
    RoutingEngine(const RoutingConfig& config, ProviderRegistry& registry, MetricsStore& metrics,
                  HealthTracker& health, RequestTracker& tracker, LoadBalancer& balancer,
                  const Clock& clock);
    
    virtual ~RoutingEngine() = default;

    /**
     * @brief Select the provider, model and service for a request
     * @param context Request description
     * @param requirements Caller constraints
     * @return Routing decision
     * @throws NoProvidersAvailableError when the registry is empty
     */
    virtual RoutingDecision selectProvider(const RequestContext& context,
                                           const RoutingRequirements& requirements = RoutingRequirements());

    /**
     * @brief Score every registered provider
     * @param requirements Caller constraints
     * @return Scores in registration order
     */
    virtual std::vector<ProviderScore> scoreProviders(const RoutingRequirements& requirements) const;

    /**
     * @brief Score a single provider
     */
    virtual ProviderScore scoreProvider(const ProviderConfig& provider,
                                        const RoutingRequirements& requirements) const;

    /**
     * @brief Internal service path for a request, chosen by complexity
     * @param context Request description (complexity defaults to 0.5)
     * @return Service name, or "default" when none is configured
     */
    virtual std::string selectService(const RequestContext& context) const;

    /**
     * @brief Latency used to normalize the performance component
     * @return Requirement ceiling when given, otherwise the urgency budget
     */
    double maxAcceptableLatency(const RoutingRequirements& requirements) const;

    /**
     * @brief System-wide load: total in-flight over total capacity
     */
    double currentLoad() const;

    /**
     * @brief Recent-history score of a provider (0.5 without data)
     */
    double historicalPerformance(const std::string& provider) const;

    /**
     * @brief Recent decisions, oldest first
     * @param limit Most recent decisions to return (0 = all)
     */
    virtual std::vector<RoutingDecision> getRecentDecisions(size_t limit = 0) const;

    /**
     * @brief Advice for providers past critical thresholds
     */
    virtual std::vector<Recommendation> getPerformanceRecommendations() const;

    static std::string urgencyName(Urgency urgency);

private:
    double realTimeScore(const ProviderScore& score) const;
    PerformanceEstimates estimate(const ProviderScore& score, const std::string& service) const;
    size_t capacityOf(const ProviderConfig& provider) const;
    void recordDecision(const RoutingDecision& decision);

    RoutingConfig m_config;
    ProviderRegistry& m_registry;
    MetricsStore& m_metrics;
    HealthTracker& m_health;
    RequestTracker& m_tracker;
    LoadBalancer& m_balancer;
    const Clock& m_clock;

    std::deque<RoutingDecision> m_decisions;
    mutable std::mutex m_decisions_mutex;
};

} // namespace Relay
