// =================================================================
// src/Relay/LoadBalancer.cpp
// =================================================================
// Implementation of load balancing strategies.

#include "Relay/LoadBalancer.hpp"
#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Relay {

size_t BalancingStrategy::pickBest(const std::vector<const ProviderScore*>& candidates,
                                   const std::vector<double>& values,
                                   double epsilon, RandomSource& random) {
    double best = *std::max_element(values.begin(), values.end());
    
    std::vector<size_t> tied;
    for (size_t i = 0; i < candidates.size(); i++) {
        if (values[i] >= best - epsilon) {
            tied.push_back(i);
        }
    }
    
    if (tied.size() == 1) {
        return tied.front();
    }
    return tied[random.pick(tied.size())];
}

// =================================================================
// Built-in Load Balancing Strategies
// =================================================================

/**
 * @brief Round-robin over the scored list ranked by score
 */
class LoadBalancer::RoundRobinStrategy : public BalancingStrategy {
private:
    size_t m_counter = 0;
    mutable std::mutex m_mutex;
    
public:
    BalancingResult select(
        const std::vector<ProviderScore>& scored,
        const LoadBalancingConfig& config,
        RandomSource& random
    ) override {
        // Position in the list ranked by score, highest first
        std::vector<const ProviderScore*> ranked;
        ranked.reserve(scored.size());
        for (const auto& entry : scored) {
            ranked.push_back(&entry);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const ProviderScore* a, const ProviderScore* b) { return a->score > b->score; });
        
        size_t index;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            index = m_counter % ranked.size();
            m_counter++;
        }
        
        const ProviderScore& selected = *ranked[index];
        BalancingResult result;
        result.provider = selected.provider;
        result.score = selected.score;
        result.reason = selected.reason + " (round-robin: index " + std::to_string(index) + ")";
        result.load_impact = selected.in_flight * 0.04;
        return result;
    }
    
    std::string getName() const override {
        return "round_robin";
    }
};

/**
 * @brief Score multiplied by a static weight, no requirement filtering
 */
class LoadBalancer::WeightedStrategy : public BalancingStrategy {
public:
    BalancingResult select(
        const std::vector<ProviderScore>& scored,
        const LoadBalancingConfig& config,
        RandomSource& random
    ) override {
        std::vector<const ProviderScore*> candidates;
        std::vector<double> values;
        for (const auto& entry : scored) {
            double weight = 1.0;
            auto weight_it = config.weights.find(entry.provider);
            if (weight_it != config.weights.end()) {
                weight = weight_it->second;
            }
            candidates.push_back(&entry);
            values.push_back(entry.score * weight);
        }
        
        size_t index = pickBest(candidates, values, config.tie_epsilon, random);
        const ProviderScore& selected = *candidates[index];
        
        std::ostringstream reason;
        reason << selected.reason << " (weighted selection: " 
               << std::fixed << std::setprecision(3) << values[index] << ")";
        
        BalancingResult result;
        result.provider = selected.provider;
        result.score = selected.score;
        result.reason = reason.str();
        result.load_impact = selected.in_flight * 0.03;
        return result;
    }
    
    std::string getName() const override {
        return "weighted";
    }
};

/**
 * @brief Fewest in-flight requests among providers near the best score
 */
class LoadBalancer::LeastConnectionsStrategy : public BalancingStrategy {
public:
    BalancingResult select(
        const std::vector<ProviderScore>& scored,
        const LoadBalancingConfig& config,
        RandomSource& random
    ) override {
        double best_score = std::max_element(scored.begin(), scored.end(),
            [](const ProviderScore& a, const ProviderScore& b) { return a.score < b.score; })->score;
        double cutoff = best_score * (1.0 - config.least_connections_window);
        
        std::vector<const ProviderScore*> near_best;
        for (const auto& entry : scored) {
            if (entry.score >= cutoff) {
                near_best.push_back(&entry);
            }
        }
        
        size_t fewest = (*std::min_element(near_best.begin(), near_best.end(),
            [](const ProviderScore* a, const ProviderScore* b) {
                return a->in_flight < b->in_flight;
            }))->in_flight;
        
        std::vector<const ProviderScore*> candidates;
        std::vector<double> values;
        for (const auto* entry : near_best) {
            if (entry->in_flight == fewest) {
                candidates.push_back(entry);
                values.push_back(entry->score);
            }
        }
        
        const ProviderScore& selected = *candidates[pickBest(candidates, values, config.tie_epsilon, random)];
        
        BalancingResult result;
        result.provider = selected.provider;
        result.score = selected.score;
        result.reason = selected.reason + " (least connections: " + std::to_string(selected.in_flight) + ")";
        result.load_impact = selected.in_flight * 0.02;
        return result;
    }
    
    std::string getName() const override {
        return "least_connections";
    }
};

/**
 * @brief Best score among providers meeting every hard requirement
 */
class LoadBalancer::PerformanceBasedStrategy : public BalancingStrategy {
public:
    BalancingResult select(
        const std::vector<ProviderScore>& scored,
        const LoadBalancingConfig& config,
        RandomSource& random
    ) override {
        std::vector<const ProviderScore*> eligible;
        std::vector<double> eligible_values;
        std::vector<const ProviderScore*> everyone;
        std::vector<double> everyone_values;
        
        for (const auto& entry : scored) {
            everyone.push_back(&entry);
            everyone_values.push_back(entry.score);
            if (entry.meetsRequirements()) {
                eligible.push_back(&entry);
                eligible_values.push_back(entry.score);
            }
        }
        
        BalancingResult result;
        
        if (eligible.empty()) {
            const ProviderScore& best = *everyone[pickBest(everyone, everyone_values, config.tie_epsilon, random)];
            result.provider = best.provider;
            result.score = best.score;
            result.reason = best.reason + " (fallback - requirements not fully met)";
            result.load_impact = 0.1;
            result.fallback_used = true;
            return result;
        }
        
        const ProviderScore& selected = *eligible[pickBest(eligible, eligible_values, config.tie_epsilon, random)];
        result.provider = selected.provider;
        result.score = selected.score;
        result.reason = selected.reason + " (performance-based selection)";
        result.load_impact = std::min(0.8, selected.in_flight * 0.05);
        return result;
    }
    
    std::string getName() const override {
        return "performance_based";
    }
};

// =================================================================
// LoadBalancer Implementation
// =================================================================

LoadBalancer::LoadBalancer(const LoadBalancingConfig& config, RandomSource& random)
    : m_config(config), m_random(random), m_algorithm(config.algorithm) {
    
    registerStrategy(BalancingAlgorithm::ROUND_ROBIN, 
                    std::make_shared<RoundRobinStrategy>());
    registerStrategy(BalancingAlgorithm::WEIGHTED, 
                    std::make_shared<WeightedStrategy>());
    registerStrategy(BalancingAlgorithm::LEAST_CONNECTIONS, 
                    std::make_shared<LeastConnectionsStrategy>());
    registerStrategy(BalancingAlgorithm::PERFORMANCE_BASED, 
                    std::make_shared<PerformanceBasedStrategy>());
    
    Logger::getInstance().info("LoadBalancer", "Initialized with algorithm: " + 
                              ConfigLoader::algorithmName(m_algorithm));
}

BalancingResult LoadBalancer::select(const std::vector<ProviderScore>& scored) {
    BalancingResult result;
    if (scored.empty()) {
        result.reason = "No providers to balance";
        Logger::getInstance().error("LoadBalancer", result.reason);
        return result;
    }
    
    std::shared_ptr<BalancingStrategy> strategy;
    LoadBalancingConfig config;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto strategy_it = m_strategies.find(m_algorithm);
        if (strategy_it == m_strategies.end()) {
            result.reason = "Load balancing strategy not found";
            Logger::getInstance().error("LoadBalancer", result.reason);
            return result;
        }
        strategy = strategy_it->second;
        config = m_config;
    }
    
    result = strategy->select(scored, config, m_random);
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_selection_counts[result.provider]++;
        if (result.fallback_used) {
            m_fallback_count++;
        }
    }
    
    Logger::getInstance().debug("LoadBalancer", 
        "Selected " + result.provider + " by " + strategy->getName() + " strategy");
    
    return result;
}

void LoadBalancer::registerStrategy(BalancingAlgorithm algorithm, 
                                    std::shared_ptr<BalancingStrategy> implementation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Logger::getInstance().debug("LoadBalancer", 
        "Registered strategy: " + implementation->getName());
    m_strategies[algorithm] = std::move(implementation);
}

void LoadBalancer::setAlgorithm(BalancingAlgorithm algorithm) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_strategies.find(algorithm) != m_strategies.end()) {
        m_algorithm = algorithm;
        m_config.algorithm = algorithm;
        Logger::getInstance().info("LoadBalancer", 
            "Active algorithm set to: " + ConfigLoader::algorithmName(algorithm));
    } else {
        Logger::getInstance().warning("LoadBalancer", 
            "Strategy not found: " + ConfigLoader::algorithmName(algorithm));
    }
}

BalancingAlgorithm LoadBalancer::getAlgorithm() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_algorithm;
}

std::string LoadBalancer::getAlgorithmName() const {
    return ConfigLoader::algorithmName(getAlgorithm());
}

std::string LoadBalancer::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    size_t total = 0;
    for (const auto& [provider, count] : m_selection_counts) {
        total += count;
    }
    
    std::ostringstream stats;
    stats << "Load Balancer Statistics\n";
    stats << "========================\n\n";
    stats << "Algorithm: " << ConfigLoader::algorithmName(m_algorithm) << "\n";
    stats << "Total Selections: " << total << "\n";
    stats << "Fallback Selections: " << m_fallback_count << "\n\n";
    
    for (const auto& [provider, count] : m_selection_counts) {
        double share = total > 0 ? 100.0 * count / total : 0.0;
        stats << "  " << provider << ": " << count << " (" 
              << std::fixed << std::setprecision(1) << share << "%)\n";
    }
    
    return stats.str();
}

std::map<std::string, size_t> LoadBalancer::getSelectionCounts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_selection_counts;
}

LoadBalancingConfig LoadBalancer::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace Relay
