// =================================================================
// src/Relay/TrendAnalyzer.cpp
// =================================================================
// Implementation of trend analysis.

#include "Relay/TrendAnalyzer.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Relay {

TrendAnalyzer::TrendAnalyzer(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive,
                             MetricsStore& metrics, RequestTracker& tracker, const Clock& clock)
    : m_config(config), m_adaptive(adaptive), m_metrics(metrics), m_tracker(tracker), m_clock(clock) {
}

SystemSnapshot TrendAnalyzer::collectSnapshot() {
    SystemSnapshot snapshot;
    snapshot.timestamp = m_clock.now();
    
    OverallStats providers = m_metrics.computeTotals(SubjectKind::PROVIDER);
    OverallStats services = m_metrics.computeTotals(SubjectKind::SERVICE);
    
    snapshot.total_operations = providers.total_operations + services.total_operations;
    if (snapshot.total_operations > 0) {
        double duration_sum = providers.average_duration_ms * providers.total_operations +
                              services.average_duration_ms * services.total_operations;
        snapshot.average_response_time_ms = duration_sum / snapshot.total_operations;
        snapshot.error_rate = static_cast<double>(providers.failed_operations + services.failed_operations) /
                              snapshot.total_operations;
    }
    
    auto window_start = snapshot.timestamp - std::chrono::minutes(1);
    snapshot.throughput_per_minute = static_cast<double>(
        m_tracker.getMetricsForTimeRange(std::nullopt, window_start, snapshot.timestamp).size());
    
    double quality_sum = 0.0;
    size_t quality_count = 0;
    for (const auto& stats : m_metrics.getAllStats(SubjectKind::PROVIDER)) {
        if (stats.hasQuality()) {
            quality_sum += stats.quality_score;
            quality_count++;
        }
    }
    if (quality_count > 0) {
        snapshot.average_quality = quality_sum / quality_count;
    }
    
    snapshot.in_flight = m_tracker.getTotalInFlight();
    
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshots.push_back(snapshot);
    while (m_snapshots.size() > m_config.trend_history_size) {
        m_snapshots.pop_front();
    }
    
    return snapshot;
}

std::vector<TrendData> TrendAnalyzer::analyze() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_snapshots.size() < 2) {
        return {};
    }
    
    const SystemSnapshot& current = m_snapshots.back();
    const SystemSnapshot& previous = m_snapshots[m_snapshots.size() - 2];
    double confidence = std::min(1.0, static_cast<double>(current.total_operations) / 100.0);
    double threshold = m_adaptive.adaptation_threshold;
    
    std::vector<TrendData> trends;
    trends.push_back(computeTrend("response_time", current.average_response_time_ms,
                                  previous.average_response_time_ms, true, threshold, confidence));
    trends.push_back(computeTrend("error_rate", current.error_rate,
                                  previous.error_rate, true, threshold, confidence));
    trends.push_back(computeTrend("throughput", current.throughput_per_minute,
                                  previous.throughput_per_minute, false, threshold, confidence));
    if (current.average_quality >= 0.0 && previous.average_quality >= 0.0) {
        trends.push_back(computeTrend("quality", current.average_quality,
                                      previous.average_quality, false, threshold, confidence));
    }
    
    for (const auto& trend : trends) {
        if (trend.direction == TrendDirection::DECLINING && trend.confidence >= 0.5) {
            Logger::getInstance().warning("TrendAnalyzer", "Declining " + trend.metric,
                std::to_string(trend.previous) + " -> " + std::to_string(trend.current));
        }
    }
    
    m_latest_trends = trends;
    return trends;
}

std::vector<TrendData> TrendAnalyzer::getLatestTrends() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latest_trends;
}

std::vector<SystemSnapshot> TrendAnalyzer::getSnapshots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<SystemSnapshot>(m_snapshots.begin(), m_snapshots.end());
}

TrendData TrendAnalyzer::computeTrend(const std::string& metric, double current, double previous,
                                      bool lower_is_better, double threshold, double confidence) {
    TrendData trend;
    trend.metric = metric;
    trend.current = current;
    trend.previous = previous;
    trend.change = current - previous;
    trend.confidence = confidence;
    
    double relative;
    if (previous != 0.0) {
        relative = trend.change / std::fabs(previous);
    } else {
        relative = (current == 0.0) ? 0.0 : 1.0;
    }
    trend.change_percent = relative * 100.0;
    
    if (std::fabs(relative) <= threshold) {
        trend.direction = TrendDirection::STABLE;
    } else {
        bool increased = trend.change > 0.0;
        trend.direction = (increased != lower_is_better) ? TrendDirection::IMPROVING
                                                         : TrendDirection::DECLINING;
    }
    
    return trend;
}

std::string TrendAnalyzer::directionName(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::IMPROVING: return "improving";
        case TrendDirection::DECLINING: return "declining";
        case TrendDirection::STABLE: return "stable";
        default: return "unknown";
    }
}

} // namespace Relay
