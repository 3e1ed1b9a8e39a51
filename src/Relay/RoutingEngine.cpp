// =================================================================
// src/Relay/RoutingEngine.cpp
// =================================================================
// Implementation of performance-aware provider selection.

#include "Relay/RoutingEngine.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Relay {

namespace {

double clampUnit(double value) {
    return std::clamp(value, 0.0, 1.0);
}

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value * 100.0 << "%";
    return oss.str();
}

} // namespace

RoutingEngine::RoutingEngine(const RoutingConfig& config, ProviderRegistry& registry, MetricsStore& metrics,
                             HealthTracker& health, RequestTracker& tracker, LoadBalancer& balancer,
                             const Clock& clock)
    : m_config(config), m_registry(registry), m_metrics(metrics), m_health(health),
      m_tracker(tracker), m_balancer(balancer), m_clock(clock) {
}

RoutingDecision RoutingEngine::selectProvider(const RequestContext& context,
                                              const RoutingRequirements& requirements) {
    if (m_registry.empty()) {
        Logger::getInstance().error("RoutingEngine", "No providers available", context.request_id);
        throw NoProvidersAvailableError();
    }
    
    std::vector<ProviderScore> scored = scoreProviders(requirements);
    if (scored.empty()) {
        // Registry emptied between the check and scoring
        throw NoProvidersAvailableError();
    }
    
    BalancingResult balanced = m_balancer.select(scored);
    auto selected_it = std::find_if(scored.begin(), scored.end(),
                                    [&balanced](const ProviderScore& entry) {
                                        return entry.provider == balanced.provider;
                                    });
    if (selected_it == scored.end()) {
        throw std::runtime_error("Load balancer selected an unknown provider: " + balanced.provider);
    }
    const ProviderScore& selected = *selected_it;
    
    RoutingDecision decision;
    decision.request_id = context.request_id;
    decision.selected_provider = selected.provider;
    decision.selected_model = m_registry.defaultModel(selected.provider);
    decision.selected_service = selectService(context);
    decision.score = selected.score;
    decision.load_balancing_reason = balanced.reason;
    decision.expected_load_impact = balanced.load_impact;
    decision.fallback_used = balanced.fallback_used;
    decision.algorithm = m_balancer.getAlgorithmName();
    decision.timestamp = m_clock.now();
    decision.estimates = estimate(selected, decision.selected_service);
    
    std::vector<const ProviderScore*> ranked;
    for (const auto& entry : scored) {
        if (entry.provider != selected.provider) {
            ranked.push_back(&entry);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ProviderScore* a, const ProviderScore* b) { return a->score > b->score; });
    for (size_t i = 0; i < ranked.size() && i < 3; i++) {
        decision.alternatives.push_back({ranked[i]->provider, ranked[i]->score, ranked[i]->reason});
    }
    
    decision.factors.current_load = currentLoad();
    decision.factors.historical_performance = historicalPerformance(selected.provider);
    decision.factors.real_time_score = realTimeScore(selected);
    decision.factors.requirement_alignment = selected.alignment;
    
    recordDecision(decision);
    Logger::getInstance().logRoutingDecision(decision.request_id, decision.selected_provider,
                                             decision.algorithm, decision.score, decision.fallback_used);
    
    return decision;
}

std::vector<ProviderScore> RoutingEngine::scoreProviders(const RoutingRequirements& requirements) const {
    std::vector<ProviderScore> scored;
    for (const auto& provider : m_registry.getProviders()) {
        scored.push_back(scoreProvider(provider, requirements));
    }
    return scored;
}

ProviderScore RoutingEngine::scoreProvider(const ProviderConfig& provider,
                                           const RoutingRequirements& requirements) const {
    ProviderScore score;
    score.provider = provider.name;
    
    auto stats = m_metrics.getStats(SubjectKind::PROVIDER, provider.name);
    if (stats && stats->total_operations > 0) {
        score.average_response_time_ms = stats->average_duration_ms;
        score.success_rate = stats->successRate();
        score.has_observations = true;
    } else {
        score.average_response_time_ms = provider.expected_latency_ms;
        score.success_rate = provider.baseline_success_rate;
    }
    score.quality = (stats && stats->hasQuality()) ? stats->quality_score : provider.quality_score;
    
    score.in_flight = m_tracker.getInFlight(provider.name);
    score.health_state = m_health.getStatus(provider.name).state;
    
    // Performance: latency against the acceptable budget, reliability, quality
    double max_acceptable = maxAcceptableLatency(requirements);
    double latency_score = max_acceptable > 0.0
        ? clampUnit(1.0 - score.average_response_time_ms / max_acceptable) : 0.0;
    score.performance = 0.4 * latency_score + 0.3 * score.success_rate + 0.3 * score.quality;
    
    score.load = clampUnit(1.0 - static_cast<double>(score.in_flight) /
                                 static_cast<double>(capacityOf(provider)));
    score.health = HealthTracker::healthFactor(score.health_state);
    
    score.alignment = 1.0;
    if (requirements.max_response_time_ms &&
        score.average_response_time_ms > *requirements.max_response_time_ms) {
        score.alignment *= 0.7;
        score.unmet_requirements.push_back("latency");
    }
    if (requirements.min_quality && score.quality < *requirements.min_quality) {
        score.alignment *= 0.8;
        score.unmet_requirements.push_back("quality");
    }
    if (requirements.min_reliability && score.success_rate < *requirements.min_reliability) {
        score.alignment *= 0.6;
        score.unmet_requirements.push_back("reliability");
    }
    
    double composite = 0.4 * score.performance + 0.2 * score.load +
                       0.2 * score.health + 0.2 * score.alignment;
    
    const auto& preferred = requirements.preferred_providers;
    score.preferred = std::find(preferred.begin(), preferred.end(), provider.name) != preferred.end();
    if (score.preferred) {
        composite *= m_config.load_balancing.preferred_bonus;
    }
    score.score = std::min(1.0, composite);
    
    std::ostringstream reason;
    reason << "Performance: " << percent(score.performance)
           << ", Load: " << percent(score.load)
           << ", Health: " << HealthTracker::stateName(score.health_state)
           << ", Alignment: " << percent(score.alignment);
    if (score.preferred) {
        reason << ", Preferred provider";
    }
    if (!score.unmet_requirements.empty()) {
        reason << ", Misses:";
        for (const auto& unmet : score.unmet_requirements) {
            reason << " " << unmet;
        }
    }
    score.reason = reason.str();
    
    return score;
}

std::string RoutingEngine::selectService(const RequestContext& context) const {
    const auto& services = m_config.services;
    if (services.empty()) {
        return "default";
    }
    
    double complexity = context.complexity.value_or(0.5);
    
    std::vector<const ServiceRoute*> ordered;
    for (const auto& service : services) {
        ordered.push_back(&service);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ServiceRoute* a, const ServiceRoute* b) {
                         return a->min_complexity > b->min_complexity;
                     });
    
    for (const auto* service : ordered) {
        if (complexity > service->min_complexity) {
            return service->name;
        }
    }
    return ordered.back()->name;
}

double RoutingEngine::maxAcceptableLatency(const RoutingRequirements& requirements) const {
    if (requirements.max_response_time_ms) {
        return *requirements.max_response_time_ms;
    }
    
    const auto& lb = m_config.load_balancing;
    switch (requirements.urgency) {
        case Urgency::HIGH: return lb.latency_budget_high_ms;
        case Urgency::LOW: return lb.latency_budget_low_ms;
        case Urgency::MEDIUM:
        default: return lb.latency_budget_medium_ms;
    }
}

double RoutingEngine::currentLoad() const {
    size_t total_in_flight = 0;
    size_t total_capacity = 0;
    
    for (const auto& provider : m_registry.getProviders()) {
        total_in_flight += m_tracker.getInFlight(provider.name);
        total_capacity += capacityOf(provider);
    }
    
    if (total_capacity == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(total_in_flight) / static_cast<double>(total_capacity));
}

double RoutingEngine::historicalPerformance(const std::string& provider) const {
    auto history = m_tracker.getProviderHistory(provider, 100);
    if (history.empty()) {
        return 0.5;
    }
    
    size_t successes = 0;
    double duration_sum = 0.0;
    for (const auto& record : history) {
        if (record.success) successes++;
        duration_sum += record.duration_ms;
    }
    
    double success_rate = static_cast<double>(successes) / history.size();
    double average = duration_sum / history.size();
    double latency_score = std::max(0.0, 1.0 - average / m_config.load_balancing.latency_budget_medium_ms);
    
    return success_rate * 0.6 + latency_score * 0.4;
}

std::vector<RoutingDecision> RoutingEngine::getRecentDecisions(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_decisions_mutex);
    size_t count = (limit == 0) ? m_decisions.size() : std::min(limit, m_decisions.size());
    return std::vector<RoutingDecision>(m_decisions.end() - static_cast<std::ptrdiff_t>(count),
                                        m_decisions.end());
}

std::vector<Recommendation> RoutingEngine::getPerformanceRecommendations() const {
    std::vector<Recommendation> recommendations;
    const auto& thresholds = m_config.thresholds;
    
    for (const auto& stats : m_metrics.getAllStats(SubjectKind::PROVIDER)) {
        if (stats.total_operations == 0) continue;
        
        if (stats.error_rate > thresholds.error_rate.critical) {
            recommendations.push_back({
                "configuration", "high",
                "Provider " + stats.subject_id + " has critical error rate: " + percent(stats.error_rate),
                "Review provider configuration and consider temporary failover"
            });
        }
        
        if (stats.average_duration_ms > thresholds.response_time_ms.critical) {
            std::ostringstream description;
            description << "Provider " << stats.subject_id << " has critical response time: "
                        << std::fixed << std::setprecision(0) << stats.average_duration_ms << "ms";
            recommendations.push_back({
                "scaling", "high", description.str(),
                "Consider scaling up resources or load balancing to other providers"
            });
        }
        
        if (stats.hasQuality() && stats.quality_score < thresholds.quality_minimum) {
            recommendations.push_back({
                "optimization", "medium",
                "Provider " + stats.subject_id + " has low quality score: " + percent(stats.quality_score),
                "Review model configuration and consider fine-tuning parameters"
            });
        }
    }
    
    return recommendations;
}

std::string RoutingEngine::urgencyName(Urgency urgency) {
    switch (urgency) {
        case Urgency::LOW: return "low";
        case Urgency::MEDIUM: return "medium";
        case Urgency::HIGH: return "high";
        default: return "unknown";
    }
}

double RoutingEngine::realTimeScore(const ProviderScore& score) const {
    if (!score.has_observations) {
        return 0.5;
    }
    
    double latency_score = std::max(0.0, 1.0 - score.average_response_time_ms /
                                             m_config.load_balancing.latency_budget_medium_ms);
    double error_rate = 1.0 - score.success_rate;
    return 0.4 * latency_score + 0.3 * (1.0 - error_rate) + 0.3 * score.load;
}

PerformanceEstimates RoutingEngine::estimate(const ProviderScore& score, const std::string& service) const {
    double service_latency = 500.0;
    double service_success = 0.95;
    
    for (const auto& route : m_config.services) {
        if (route.name == service) {
            service_latency = route.expected_latency_ms;
            service_success = route.baseline_success_rate;
            break;
        }
    }
    
    auto stats = m_metrics.getStats(SubjectKind::SERVICE, service);
    if (stats && stats->total_operations > 0) {
        service_latency = stats->average_duration_ms;
        service_success = stats->successRate();
    }
    
    PerformanceEstimates estimates;
    estimates.response_time_ms = score.average_response_time_ms + service_latency;
    estimates.reliability = score.success_rate * service_success;
    estimates.quality = score.quality * 0.9;
    return estimates;
}

size_t RoutingEngine::capacityOf(const ProviderConfig& provider) const {
    size_t capacity = provider.max_concurrent > 0 ? provider.max_concurrent
                                                  : m_config.load_balancing.default_capacity;
    return std::max<size_t>(1, capacity);
}

void RoutingEngine::recordDecision(const RoutingDecision& decision) {
    std::lock_guard<std::mutex> lock(m_decisions_mutex);
    m_decisions.push_back(decision);
    while (m_decisions.size() > m_config.monitor.decision_log_size) {
        m_decisions.pop_front();
    }
}

} // namespace Relay
