// =================================================================
// include/Relay/TrendAnalyzer.hpp
// =================================================================
// Periodic system snapshots and trend classification.

#pragma once

#include "Relay/Clock.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/RequestTracker.hpp"
#include "Relay/RoutingConfig.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace Relay {

/**
 * @brief Direction of a metric between two snapshots
 */
enum class TrendDirection {
    IMPROVING,
    DECLINING,
    STABLE
};

/**
 * @brief System-wide metrics at one point in time
 */
struct SystemSnapshot {
    std::chrono::system_clock::time_point timestamp; ///< Collection time
    double average_response_time_ms = 0.0;  ///< Mean over all subjects
    double error_rate = 0.0;                ///< Failed / total over all subjects
    double throughput_per_minute = 0.0;     ///< Completions in the last minute
    double average_quality = -1.0;          ///< Mean provider quality, -1 if none reported
    uint64_t total_operations = 0;          ///< Operations recorded so far
    size_t in_flight = 0;                   ///< Provider requests in flight
};

/**
 * @brief Change of one metric between the two latest snapshots
 */
struct TrendData {
    std::string metric;                     ///< Metric name
    double current = 0.0;                   ///< Latest value
    double previous = 0.0;                  ///< Previous value
    double change = 0.0;                    ///< current - previous
    double change_percent = 0.0;            ///< Relative change in percent
    TrendDirection direction = TrendDirection::STABLE; ///< Classified direction
    double confidence = 0.0;                ///< Grows with observed operations, in [0, 1]
};

/**
 * @brief Collects snapshots and classifies trends
 */
class TrendAnalyzer {
public:
    TrendAnalyzer(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive,
                  MetricsStore& metrics, RequestTracker& tracker, const Clock& clock);
    
    virtual ~TrendAnalyzer() = default;

    /**
     * @brief Compute and store a snapshot of current system metrics
     * @return The stored snapshot
     */
    virtual SystemSnapshot collectSnapshot();

    /**
     * @brief Compare the two most recent snapshots
     * @return Trends per metric (empty with fewer than two snapshots)
     */
    virtual std::vector<TrendData> analyze();

    virtual std::vector<TrendData> getLatestTrends() const;
    virtual std::vector<SystemSnapshot> getSnapshots() const;

    /**
     * @brief Classify the change of one metric
     * @param metric Metric name
     * @param current Latest value
     * @param previous Previous value
     * @param lower_is_better True for latency and error rate
     * @param threshold Relative change considered significant
     * @param confidence Confidence to report
     */
    static TrendData computeTrend(const std::string& metric, double current, double previous,
                                  bool lower_is_better, double threshold, double confidence);

    static std::string directionName(TrendDirection direction);

private:
    MonitorConfig m_config;
    AdaptiveRoutingConfig m_adaptive;
    MetricsStore& m_metrics;
    RequestTracker& m_tracker;
    const Clock& m_clock;

    std::deque<SystemSnapshot> m_snapshots;
    std::vector<TrendData> m_latest_trends;
    mutable std::mutex m_mutex;
};

} // namespace Relay
