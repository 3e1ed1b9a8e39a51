// =================================================================
// include/Relay/Dashboard.hpp
// =================================================================
// Aggregated read-only view of the routing core state.

#pragma once

#include "Relay/AlertEngine.hpp"
#include "Relay/HealthTracker.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/RequestTracker.hpp"
#include "Relay/TrendAnalyzer.hpp"
#include <chrono>
#include <vector>

namespace Relay {

/**
 * @brief Dashboard contents
 */
struct Dashboard {
    std::chrono::system_clock::time_point generated_at; ///< Build time
    OverallStats overall;                    ///< Totals across providers and services
    OverallStats providers_overall;          ///< Totals across providers
    OverallStats services_overall;           ///< Totals across services
    std::vector<OperationStats> providers;   ///< Per-provider statistics
    std::vector<OperationStats> services;    ///< Per-service statistics
    std::vector<HistoryRecord> recent_history; ///< Latest completions, oldest first
    std::vector<Alert> active_alerts;        ///< Latest unresolved alerts
    std::vector<HealthStatus> health;        ///< Provider health
    std::vector<TrendData> trends;           ///< Latest trend analysis
    size_t in_flight = 0;                    ///< Provider requests in flight
    bool monitoring_enabled = true;          ///< Instrumentation switch
};

} // namespace Relay
