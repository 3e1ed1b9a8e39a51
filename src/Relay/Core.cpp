// =================================================================
// src/Relay/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Relay/Core.hpp"
#include "Relay/Clock.hpp"
#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include "Relay/PerformanceMonitor.hpp"
#include "Relay/RandomSource.hpp"
#include "Relay/SnapshotExporter.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Relay {

namespace {

Urgency parseUrgency(const std::string& name) {
    if (name == "high") return Urgency::HIGH;
    if (name == "low") return Urgency::LOW;
    return Urgency::MEDIUM;
}

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value * 100.0 << "%";
    return oss.str();
}

// Logging is configured before the configuration file is read
RoutingConfig loadConfiguration(const Commands& commands) {
    LogSettings settings;
    settings.console_enabled = commands.verbose;
    settings.console_level = LogLevel::DEBUG;
    Logger::getInstance().configure(settings);
    
    if (commands.config_path.empty()) {
        return ConfigLoader::defaults();
    }
    return ConfigLoader::loadFromFile(commands.config_path);
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(loadConfiguration(commands)),
      m_clock(std::make_shared<ManualClock>()),
      m_workload_random(std::make_unique<RandomSource>(commands.seed))
{
    if (!m_commands.algorithm.empty()) {
        m_config.load_balancing.algorithm = ConfigLoader::parseAlgorithm(m_commands.algorithm);
    }
    m_config.monitor.random_seed = m_commands.seed;
    
    m_monitor = std::make_unique<PerformanceMonitor>(m_config, m_clock);
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "simulate") {
        return handleSimulate();
    } else if (m_commands.active_command == "route") {
        return handleRoute();
    } else if (m_commands.active_command == "export") {
        return handleExport();
    }
    
    std::cerr << "No command given. Use --help for usage." << std::endl;
    return 1;
}

int Core::handleSimulate() {
    std::cout << "[INFO] Simulating " << m_commands.requests << " requests with "
              << m_monitor->getLoadBalancer().getAlgorithmName() << std::endl;
    
    runWorkload(m_commands.requests);
    printDashboard(m_monitor->getDashboard());
    
    RequestContext context;
    context.request_id = "simulate_probe";
    if (m_commands.complexity >= 0.0) {
        context.complexity = m_commands.complexity;
    }
    std::cout << std::endl;
    printDecision(m_monitor->selectProvider(context, buildRequirements()));
    
    auto recommendations = m_monitor->getPerformanceRecommendations();
    if (!recommendations.empty()) {
        std::cout << "\nRecommendations:" << std::endl;
        for (const auto& recommendation : recommendations) {
            std::cout << "  [" << recommendation.priority << "] " << recommendation.type << ": "
                      << recommendation.description << " -> " << recommendation.action << std::endl;
        }
    }
    
    std::cout << "\n" << m_monitor->getLoadBalancer().getStatistics() << std::endl;
    return 0;
}

int Core::handleRoute() {
    if (m_commands.warmup > 0) {
        runWorkload(m_commands.warmup);
    }
    
    RequestContext context;
    context.request_id = "route_request";
    if (m_commands.complexity >= 0.0) {
        context.complexity = m_commands.complexity;
    }
    
    try {
        printDecision(m_monitor->selectProvider(context, buildRequirements()));
    } catch (const NoProvidersAvailableError& e) {
        LOG_ERROR("Core", "Routing failed", e.what());
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int Core::handleExport() {
    runWorkload(m_commands.requests);
    nlohmann::json snapshot = m_monitor->exportSnapshot();
    
    if (m_commands.output_path.empty()) {
        std::cout << snapshot.dump(m_commands.indent) << std::endl;
        return 0;
    }
    
    SnapshotExporter::writeToFile(snapshot, m_commands.output_path, m_commands.indent);
    std::cout << "[INFO] Snapshot written to " << m_commands.output_path << std::endl;
    return 0;
}

void Core::runWorkload(size_t count) {
    LOG_INFO("Core", "Running synthetic workload", std::to_string(count) + " requests");
    
    for (size_t i = 0; i < count; i++) {
        std::string request_id = "req_" + std::to_string(++m_request_counter);
        
        RequestContext context;
        context.request_id = request_id;
        context.complexity = m_workload_random->uniform();
        
        RoutingDecision decision = m_monitor->selectProvider(context, buildRequirements());
        const auto& providers = m_monitor->getConfig().providers;
        auto profile = std::find_if(providers.begin(), providers.end(),
                                    [&decision](const ProviderConfig& p) { return p.name == decision.selected_provider; });
        double expected_ms = profile != providers.end() ? profile->expected_latency_ms : 1000.0;
        double success_rate = profile != providers.end() ? profile->baseline_success_rate : 0.95;
        double quality = profile != providers.end() ? profile->quality_score : 0.8;
        
        m_monitor->trackRequestStart(request_id, decision.selected_provider,
                                     decision.selected_model, decision.selected_service);
        
        // Service-side processing
        std::string handle = m_monitor->startOperation(decision.selected_service, "process");
        double service_ms = 100.0 + m_workload_random->uniform() * 400.0;
        m_clock->advance(std::chrono::duration<double, std::milli>(service_ms));
        m_monitor->endOperation(handle, decision.selected_service, "process", true);
        
        // Provider call
        double latency_ms = expected_ms * (0.5 + m_workload_random->uniform());
        m_clock->advance(std::chrono::duration<double, std::milli>(latency_ms));
        
        bool success = m_workload_random->uniform() < success_rate;
        if (success) {
            double observed = std::clamp(quality + (m_workload_random->uniform() - 0.5) * 0.2, 0.0, 1.0);
            m_monitor->trackRequestComplete(request_id, true, std::nullopt, observed);
        } else {
            m_monitor->trackRequestComplete(request_id, false, std::string("synthetic_failure"));
        }
        
        m_monitor->getScheduler().runDueTasks();
    }
}

RoutingRequirements Core::buildRequirements() const {
    RoutingRequirements requirements;
    if (m_commands.max_response_time_ms > 0.0) {
        requirements.max_response_time_ms = m_commands.max_response_time_ms;
    }
    if (m_commands.min_quality >= 0.0) {
        requirements.min_quality = m_commands.min_quality;
    }
    if (m_commands.min_reliability >= 0.0) {
        requirements.min_reliability = m_commands.min_reliability;
    }
    requirements.preferred_providers = m_commands.preferred;
    requirements.urgency = parseUrgency(m_commands.urgency);
    return requirements;
}

void Core::printDashboard(const Dashboard& dashboard) const {
    std::cout << "\n=== Dashboard ===" << std::endl;
    std::cout << "Operations: " << dashboard.overall.total_operations
              << " (failed " << dashboard.overall.failed_operations << ")"
              << ", error rate " << formatPercent(dashboard.overall.error_rate)
              << ", in flight " << dashboard.in_flight << std::endl;
    
    std::cout << "\nProviders:" << std::endl;
    std::cout << std::left << std::setw(14) << "  name" << std::right
              << std::setw(8) << "total" << std::setw(10) << "mean ms"
              << std::setw(10) << "p95 ms" << std::setw(9) << "errors"
              << std::setw(9) << "quality" << std::endl;
    for (const auto& stats : dashboard.providers) {
        std::cout << "  " << std::left << std::setw(12) << stats.subject_id << std::right
                  << std::setw(8) << stats.total_operations
                  << std::setw(10) << std::fixed << std::setprecision(1) << stats.average_duration_ms
                  << std::setw(10) << stats.p95_duration_ms
                  << std::setw(9) << formatPercent(stats.error_rate)
                  << std::setw(9) << std::setprecision(2)
                  << (stats.hasQuality() ? stats.quality_score : 0.0) << std::endl;
    }
    
    std::cout << "\nServices:" << std::endl;
    for (const auto& stats : dashboard.services) {
        std::cout << "  " << std::left << std::setw(32) << stats.subject_id << std::right
                  << std::setw(8) << stats.total_operations
                  << std::setw(10) << std::fixed << std::setprecision(1) << stats.average_duration_ms
                  << " ms" << std::endl;
    }
    
    std::cout << "\nHealth:" << std::endl;
    for (const auto& status : dashboard.health) {
        std::cout << "  " << std::left << std::setw(12) << status.provider_id << std::right
                  << HealthTracker::stateName(status.state)
                  << (status.stale ? " (stale)" : "") << std::endl;
    }
    
    if (!dashboard.active_alerts.empty()) {
        std::cout << "\nActive alerts:" << std::endl;
        for (const auto& alert : dashboard.active_alerts) {
            std::cout << "  " << alert.id << " [" << AlertEngine::severityName(alert.severity) << "] "
                      << alert.message << std::endl;
        }
    }
    
    if (!dashboard.trends.empty()) {
        std::cout << "\nTrends:" << std::endl;
        for (const auto& trend : dashboard.trends) {
            std::cout << "  " << std::left << std::setw(16) << trend.metric << std::right
                      << TrendAnalyzer::directionName(trend.direction) << std::endl;
        }
    }
}

void Core::printDecision(const RoutingDecision& decision) const {
    std::cout << "Routing decision for " << decision.request_id << std::endl;
    std::cout << "  Provider:  " << decision.selected_provider << " (" << decision.selected_model << ")" << std::endl;
    std::cout << "  Service:   " << decision.selected_service << std::endl;
    std::cout << "  Score:     " << std::fixed << std::setprecision(3) << decision.score << std::endl;
    std::cout << "  Algorithm: " << decision.algorithm
              << (decision.fallback_used ? " [fallback]" : "") << std::endl;
    std::cout << "  Reason:    " << decision.load_balancing_reason << std::endl;
    std::cout << "  Estimates: " << std::setprecision(0) << decision.estimates.response_time_ms << " ms, "
              << "reliability " << formatPercent(decision.estimates.reliability) << ", "
              << "quality " << std::setprecision(2) << decision.estimates.quality << std::endl;
    for (const auto& alternative : decision.alternatives) {
        std::cout << "  Alternative: " << alternative.provider << " ("
                  << std::setprecision(3) << alternative.score << ")" << std::endl;
    }
}

} // namespace Relay
