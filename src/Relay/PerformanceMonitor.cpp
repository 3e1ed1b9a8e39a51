// =================================================================
// src/Relay/PerformanceMonitor.cpp
// =================================================================
// Implementation of the monitoring and routing composition root.

#include "Relay/PerformanceMonitor.hpp"
#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include "Relay/SnapshotExporter.hpp"

namespace Relay {

namespace {

OverallStats combineTotals(const OverallStats& a, const OverallStats& b) {
    OverallStats combined;
    combined.total_operations = a.total_operations + b.total_operations;
    combined.successful_operations = a.successful_operations + b.successful_operations;
    combined.failed_operations = a.failed_operations + b.failed_operations;
    combined.subject_count = a.subject_count + b.subject_count;
    
    if (combined.total_operations > 0) {
        double duration_sum = a.average_duration_ms * static_cast<double>(a.total_operations) +
                              b.average_duration_ms * static_cast<double>(b.total_operations);
        combined.average_duration_ms = duration_sum / static_cast<double>(combined.total_operations);
        combined.error_rate = static_cast<double>(combined.failed_operations) /
                              static_cast<double>(combined.total_operations);
    }
    
    return combined;
}

const RoutingConfig& validated(const RoutingConfig& config) {
    ConfigLoader::validate(config);
    return config;
}

template <typename Duration>
std::chrono::milliseconds toMillis(Duration interval) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(interval);
}

} // namespace

PerformanceMonitor::PerformanceMonitor(const RoutingConfig& config, std::shared_ptr<Clock> clock)
    : m_config(validated(config)),
      m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      m_random(config.monitor.random_seed) {
    
    m_registry = std::make_unique<ProviderRegistry>(m_config.providers);
    m_metrics = std::make_unique<MetricsStore>(m_config.monitor, m_config.adaptive);
    m_health = std::make_unique<HealthTracker>(m_config.health, *m_clock);
    m_tracker = std::make_unique<RequestTracker>(m_config.monitor, m_config.adaptive,
                                                 *m_metrics, *m_health, *m_clock);
    m_alerts = std::make_unique<AlertEngine>(m_config.thresholds, m_config.monitor, *m_clock);
    m_balancer = std::make_unique<LoadBalancer>(m_config.load_balancing, m_random);
    m_router = std::make_unique<RoutingEngine>(m_config, *m_registry, *m_metrics, *m_health,
                                               *m_tracker, *m_balancer, *m_clock);
    m_trends = std::make_unique<TrendAnalyzer>(m_config.monitor, m_config.adaptive,
                                               *m_metrics, *m_tracker, *m_clock);
    m_scheduler = std::make_unique<Scheduler>(*m_clock);
    
    for (const auto& provider : m_config.providers) {
        m_health->registerProvider(provider.name);
    }
    
    m_tracker->setEnabled(m_config.monitor.enabled);
    registerPeriodicTasks();
    
    Logger::getInstance().info("PerformanceMonitor", "Initialized",
        "providers: " + std::to_string(m_registry->size()) +
        ", algorithm: " + m_balancer->getAlgorithmName());
}

PerformanceMonitor::~PerformanceMonitor() {
    stop();
}

void PerformanceMonitor::registerPeriodicTasks() {
    const MonitorConfig& monitor = m_config.monitor;
    
    m_scheduler->addTask("collect_metrics", toMillis(monitor.collection_interval),
                         [this]() { collectMetrics(); });
    m_scheduler->addTask("analyze_trends", toMillis(monitor.analysis_interval),
                         [this]() { analyzeTrends(); });
    m_scheduler->addTask("check_alerts", toMillis(monitor.alert_check_interval),
                         [this]() { checkAlerts(); });
    m_scheduler->addTask("health_sweep", toMillis(monitor.health_sweep_interval),
                         [this]() { sweepHealth(); });
    m_scheduler->addTask("cleanup", toMillis(monitor.cleanup_interval),
                         [this]() { runCleanup(); });
    m_scheduler->addTask("flush_logs", toMillis(monitor.log_flush_interval),
                         []() { Logger::getInstance().flush(); });
}

void PerformanceMonitor::start() {
    m_scheduler->start();
}

void PerformanceMonitor::stop() {
    if (m_scheduler && m_scheduler->isRunning()) {
        m_scheduler->stop();
        Logger::getInstance().info("PerformanceMonitor", "Stopped");
    }
    Logger::getInstance().flush();
}

std::string PerformanceMonitor::startOperation(const std::string& subject_id, const std::string& operation) {
    return m_tracker->startOperation(subject_id, operation);
}

void PerformanceMonitor::endOperation(const std::string& handle, const std::string& subject_id,
                                      const std::string& operation, bool success,
                                      const std::optional<std::string>& error_message,
                                      const std::unordered_map<std::string, std::string>& metadata) {
    m_tracker->endOperation(handle, subject_id, operation, success, error_message, metadata);
}

void PerformanceMonitor::trackRequestStart(const std::string& request_id, const std::string& provider,
                                           const std::string& model, const std::string& service) {
    m_tracker->trackRequestStart(request_id, provider, model, service);
}

void PerformanceMonitor::trackRequestComplete(const std::string& request_id, bool success,
                                              const std::optional<std::string>& error_type,
                                              const std::optional<double>& quality) {
    m_tracker->trackRequestComplete(request_id, success, error_type, quality);
}

void PerformanceMonitor::setEnabled(bool enabled) {
    m_tracker->setEnabled(enabled);
}

std::optional<OperationStats> PerformanceMonitor::getServiceStats(const std::string& service_id) const {
    return m_metrics->getStats(SubjectKind::SERVICE, service_id);
}

std::optional<OperationStats> PerformanceMonitor::getProviderStats(const std::string& provider_id) const {
    return m_metrics->getStats(SubjectKind::PROVIDER, provider_id);
}

Dashboard PerformanceMonitor::getDashboard() const {
    Dashboard dashboard;
    dashboard.generated_at = m_clock->now();
    dashboard.providers_overall = m_metrics->computeTotals(SubjectKind::PROVIDER);
    dashboard.services_overall = m_metrics->computeTotals(SubjectKind::SERVICE);
    dashboard.overall = combineTotals(dashboard.providers_overall, dashboard.services_overall);
    dashboard.providers = m_metrics->getAllStats(SubjectKind::PROVIDER);
    dashboard.services = m_metrics->getAllStats(SubjectKind::SERVICE);
    dashboard.recent_history = m_tracker->getRecentHistory(m_config.monitor.dashboard_history_limit);
    dashboard.active_alerts = m_alerts->getActiveAlerts(m_config.monitor.dashboard_alert_limit);
    dashboard.health = m_health->getAllStatuses();
    dashboard.trends = m_trends->getLatestTrends();
    dashboard.in_flight = m_tracker->getTotalInFlight();
    dashboard.monitoring_enabled = m_tracker->isEnabled();
    return dashboard;
}

std::vector<HistoryRecord> PerformanceMonitor::getMetricsForTimeRange(
    const std::optional<std::string>& subject_id,
    const std::optional<std::chrono::system_clock::time_point>& start,
    const std::optional<std::chrono::system_clock::time_point>& end) const {
    return m_tracker->getMetricsForTimeRange(subject_id, start, end);
}

std::vector<Recommendation> PerformanceMonitor::getPerformanceRecommendations() const {
    return m_router->getPerformanceRecommendations();
}

nlohmann::json PerformanceMonitor::exportSnapshot() const {
    return SnapshotExporter::buildSnapshot(getDashboard(),
                                           m_alerts->getAllAlerts(),
                                           m_router->getRecentDecisions(),
                                           m_balancer->getAlgorithmName());
}

std::string PerformanceMonitor::exportSnapshotString(int indent) const {
    return exportSnapshot().dump(indent);
}

RoutingDecision PerformanceMonitor::selectProvider(const RequestContext& context,
                                                   const RoutingRequirements& requirements) {
    return m_router->selectProvider(context, requirements);
}

bool PerformanceMonitor::registerProvider(const ProviderConfig& provider) {
    if (!m_registry->registerProvider(provider)) {
        Logger::getInstance().warning("PerformanceMonitor", "Provider already registered", provider.name);
        return false;
    }
    m_health->registerProvider(provider.name);
    Logger::getInstance().info("PerformanceMonitor", "Registered provider", provider.name);
    return true;
}

bool PerformanceMonitor::resolveAlert(const std::string& alert_id) {
    return m_alerts->resolveAlert(alert_id);
}

SystemSnapshot PerformanceMonitor::collectMetrics() {
    return m_trends->collectSnapshot();
}

std::vector<TrendData> PerformanceMonitor::analyzeTrends() {
    return m_trends->analyze();
}

std::vector<Alert> PerformanceMonitor::checkAlerts() {
    std::vector<OperationStats> subjects = m_metrics->getAllStats(SubjectKind::PROVIDER);
    std::vector<OperationStats> services = m_metrics->getAllStats(SubjectKind::SERVICE);
    subjects.insert(subjects.end(), services.begin(), services.end());
    return m_alerts->evaluate(subjects);
}

size_t PerformanceMonitor::sweepHealth() {
    return m_health->sweepStaleness();
}

size_t PerformanceMonitor::runCleanup() {
    size_t stale = m_tracker->cleanupStaleRequests();
    size_t metrics = m_tracker->cleanupOldMetrics();
    size_t alerts = m_alerts->cleanupOldAlerts();
    
    if (stale + metrics + alerts > 0) {
        Logger::getInstance().info("PerformanceMonitor", "Cleanup completed",
            "stale requests: " + std::to_string(stale) +
            ", records: " + std::to_string(metrics) +
            ", alerts: " + std::to_string(alerts));
    }
    return stale + metrics + alerts;
}

} // namespace Relay
