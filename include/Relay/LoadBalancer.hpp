// =================================================================
// include/Relay/LoadBalancer.hpp
// =================================================================
// Load balancing strategies applied to a list of scored providers.

#pragma once

#include "Relay/HealthTracker.hpp"
#include "Relay/RandomSource.hpp"
#include "Relay/RoutingConfig.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

/**
 * @brief Composite score and its inputs for one provider
 */
struct ProviderScore {
    std::string provider;                        ///< Provider identifier
    double score = 0.0;                          ///< Composite score in [0, 1]
    double performance = 0.0;                    ///< Performance component
    double load = 0.0;                           ///< Load component
    double health = 0.0;                         ///< Health component
    double alignment = 1.0;                      ///< Requirement alignment component
    size_t in_flight = 0;                        ///< Requests currently in flight
    HealthState health_state = HealthState::HEALTHY; ///< Health state used for scoring
    double average_response_time_ms = 0.0;       ///< Observed (or prior) mean latency
    double success_rate = 1.0;                   ///< Observed (or prior) success rate
    double quality = 0.0;                        ///< Observed (or prior) quality
    bool has_observations = false;               ///< False when priors were used
    bool preferred = false;                      ///< Listed as preferred by the request
    std::vector<std::string> unmet_requirements; ///< Hard requirements the provider misses
    std::string reason;                          ///< Score breakdown for display

    bool meetsRequirements() const { return unmet_requirements.empty(); }
};

/**
 * @brief Load balancing result
 */
struct BalancingResult {
    std::string provider;        ///< Selected provider
    double score = 0.0;          ///< Composite score of the selected provider
    std::string reason;          ///< Reason for selection
    double load_impact = 0.0;    ///< Expected load impact of routing here
    bool fallback_used = false;  ///< True when no provider met the requirements
};

/**
 * @brief Load balancing strategy base class
 */
class BalancingStrategy {
public:
    virtual ~BalancingStrategy() = default;
    
    /**
     * @brief Select a provider
     * @param scored Scored providers in registration order (never empty)
     * @param config Load balancing configuration
     * @param random Tie-break source
     * @return Balancing result
     */
    virtual BalancingResult select(
        const std::vector<ProviderScore>& scored,
        const LoadBalancingConfig& config,
        RandomSource& random
    ) = 0;
    
    /**
     * @brief Get strategy name
     * @return Strategy identifier
     */
    virtual std::string getName() const = 0;

protected:
    /**
     * @brief Highest-valued candidate, near-ties broken at random
     * @param candidates Candidates (never empty)
     * @param values Value of each candidate, same order
     * @param epsilon Values within epsilon of the best are tied
     * @param random Tie-break source
     * @return Index into candidates
     */
    static size_t pickBest(const std::vector<const ProviderScore*>& candidates,
                           const std::vector<double>& values,
                           double epsilon, RandomSource& random);
};

/**
 * @brief Applies the configured balancing strategy to scored providers
 */
class LoadBalancer {
public:
    /**
     * @brief Constructor
     * @param config Load balancing configuration
     * @param random Tie-break source shared with the routing engine
     */
    LoadBalancer(const LoadBalancingConfig& config, RandomSource& random);
    
    virtual ~LoadBalancer() = default;

    /**
     * @brief Select a provider using the active strategy
     * @param scored Scored providers in registration order
     * @return Balancing result (empty provider when scored is empty)
     */
    virtual BalancingResult select(const std::vector<ProviderScore>& scored);

    /**
     * @brief Register load balancing strategy
     * @param algorithm Algorithm the implementation serves
     * @param implementation Strategy implementation
     */
    virtual void registerStrategy(BalancingAlgorithm algorithm, std::shared_ptr<BalancingStrategy> implementation);

    /**
     * @brief Set active algorithm
     * @param algorithm Algorithm to use
     */
    virtual void setAlgorithm(BalancingAlgorithm algorithm);

    virtual BalancingAlgorithm getAlgorithm() const;
    virtual std::string getAlgorithmName() const;

    /**
     * @brief Get load balancer statistics
     * @return Statistics as formatted string
     */
    virtual std::string getStatistics() const;

    /**
     * @brief Selection counts per provider since construction
     */
    virtual std::map<std::string, size_t> getSelectionCounts() const;

    virtual LoadBalancingConfig getConfig() const;

private:
    LoadBalancingConfig m_config;
    RandomSource& m_random;
    BalancingAlgorithm m_algorithm;
    
    std::unordered_map<BalancingAlgorithm, std::shared_ptr<BalancingStrategy>> m_strategies;
    std::map<std::string, size_t> m_selection_counts;
    size_t m_fallback_count = 0;
    
    mutable std::mutex m_mutex;
    
    // Built-in strategy classes
    class RoundRobinStrategy;
    class WeightedStrategy;
    class LeastConnectionsStrategy;
    class PerformanceBasedStrategy;
};

} // namespace Relay
