// =================================================================
// include/Relay/PerformanceMonitor.hpp
// =================================================================
// Composition root owning the monitoring and routing components.

#pragma once

#include "Relay/AlertEngine.hpp"
#include "Relay/Clock.hpp"
#include "Relay/Dashboard.hpp"
#include "Relay/HealthTracker.hpp"
#include "Relay/LoadBalancer.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/ProviderRegistry.hpp"
#include "Relay/RandomSource.hpp"
#include "Relay/RequestTracker.hpp"
#include "Relay/RoutingConfig.hpp"
#include "Relay/RoutingEngine.hpp"
#include "Relay/Scheduler.hpp"
#include "Relay/TrendAnalyzer.hpp"
#include "nlohmann/json.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

/**
 * @brief Performance monitor and router
 *
 * Owns every component, wires them together and registers the periodic
 * passes (metrics collection, trend analysis, alert checks, health sweep,
 * cleanup, log flushing) with a single scheduler. Nothing is started until start() is
 * called; the destructor stops the scheduler.
 */
class PerformanceMonitor {
public:
    /**
     * @brief Constructor
     * @param config Routing configuration
     * @param clock Time source (a SystemClock when null)
     * @throws ConfigError if the configuration is invalid
     */
    explicit PerformanceMonitor(const RoutingConfig& config, std::shared_ptr<Clock> clock = nullptr);
    
    virtual ~PerformanceMonitor();

    // Prevent copying
    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    /**
     * @brief Start the background scheduler
     */
    virtual void start();

    /**
     * @brief Stop every periodic task and write buffered log lines
     */
    virtual void stop();

    // --- Instrumentation -------------------------------------------------

    virtual std::string startOperation(const std::string& subject_id, const std::string& operation);

    virtual void endOperation(const std::string& handle, const std::string& subject_id,
                              const std::string& operation, bool success,
                              const std::optional<std::string>& error_message = std::nullopt,
                              const std::unordered_map<std::string, std::string>& metadata = {});

    virtual void trackRequestStart(const std::string& request_id, const std::string& provider,
                                   const std::string& model, const std::string& service);

    virtual void trackRequestComplete(const std::string& request_id, bool success,
                                      const std::optional<std::string>& error_type = std::nullopt,
                                      const std::optional<double>& quality = std::nullopt);

    /**
     * @brief Enable or disable instrumentation at runtime
     */
    virtual void setEnabled(bool enabled);

    // --- Queries ---------------------------------------------------------

    virtual std::optional<OperationStats> getServiceStats(const std::string& service_id) const;
    virtual std::optional<OperationStats> getProviderStats(const std::string& provider_id) const;

    /**
     * @brief Overall totals, per-subject stats, recent history and active alerts
     */
    virtual Dashboard getDashboard() const;

    virtual std::vector<HistoryRecord> getMetricsForTimeRange(
        const std::optional<std::string>& subject_id = std::nullopt,
        const std::optional<std::chrono::system_clock::time_point>& start = std::nullopt,
        const std::optional<std::chrono::system_clock::time_point>& end = std::nullopt) const;

    virtual std::vector<Recommendation> getPerformanceRecommendations() const;

    /**
     * @brief Dump of the full monitoring state for external persistence
     */
    virtual nlohmann::json exportSnapshot() const;

    /**
     * @brief exportSnapshot() serialized as text
     * @param indent Indentation width (-1 for compact output)
     */
    virtual std::string exportSnapshotString(int indent = 2) const;

    // --- Routing ---------------------------------------------------------

    /**
     * @brief Choose a provider for a request
     * @throws NoProvidersAvailableError when no provider is registered
     */
    virtual RoutingDecision selectProvider(const RequestContext& context,
                                           const RoutingRequirements& requirements = RoutingRequirements());

    /**
     * @brief Add a provider at runtime
     * @return False if already registered
     */
    virtual bool registerProvider(const ProviderConfig& provider);

    // --- Alerts ----------------------------------------------------------

    virtual bool resolveAlert(const std::string& alert_id);

    // --- Periodic passes -------------------------------------------------

    /**
     * @brief Store a system snapshot for trend analysis
     */
    virtual SystemSnapshot collectMetrics();

    /**
     * @brief Compare the latest snapshots
     */
    virtual std::vector<TrendData> analyzeTrends();

    /**
     * @brief Evaluate alert rules over every provider and service
     * @return Alerts raised by this pass
     */
    virtual std::vector<Alert> checkAlerts();

    /**
     * @brief Recompute provider staleness
     * @return Number of stale providers
     */
    virtual size_t sweepHealth();

    /**
     * @brief Drop leaked in-flight entries and expired records and alerts
     * @return Number of entries removed
     */
    virtual size_t runCleanup();

    // --- Components ------------------------------------------------------

    const RoutingConfig& getConfig() const { return m_config; }
    Clock& getClock() const { return *m_clock; }
    Scheduler& getScheduler() { return *m_scheduler; }
    LoadBalancer& getLoadBalancer() { return *m_balancer; }
    AlertEngine& getAlertEngine() { return *m_alerts; }
    HealthTracker& getHealthTracker() { return *m_health; }
    RequestTracker& getRequestTracker() { return *m_tracker; }
    RoutingEngine& getRoutingEngine() { return *m_router; }

private:
    void registerPeriodicTasks();

    RoutingConfig m_config;
    std::shared_ptr<Clock> m_clock;
    RandomSource m_random;

    std::unique_ptr<ProviderRegistry> m_registry;
    std::unique_ptr<MetricsStore> m_metrics;
    std::unique_ptr<HealthTracker> m_health;
    std::unique_ptr<RequestTracker> m_tracker;
    std::unique_ptr<AlertEngine> m_alerts;
    std::unique_ptr<LoadBalancer> m_balancer;
    std::unique_ptr<RoutingEngine> m_router;
    std::unique_ptr<TrendAnalyzer> m_trends;
    std::unique_ptr<Scheduler> m_scheduler;
};

} // namespace Relay
