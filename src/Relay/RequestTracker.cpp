// =================================================================
// src/Relay/RequestTracker.cpp
// =================================================================
// Implementation of operation and request tracking.

#include "Relay/RequestTracker.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <sys/resource.h>

namespace Relay {

const std::string RequestTracker::kDisabledHandle = "disabled";

RequestTracker::RequestTracker(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive,
                               MetricsStore& metrics, HealthTracker& health, const Clock& clock)
    : m_config(config), m_adaptive(adaptive), m_metrics(metrics), m_health(health),
      m_clock(clock), m_enabled(config.enabled) {
}

std::string RequestTracker::startOperation(const std::string& subject_id, const std::string& operation) {
    if (!m_enabled.load()) {
        return kDisabledHandle;
    }
    
    ActiveOperation active;
    active.handle = subject_id + "_" + operation + "_" + std::to_string(m_next_handle.fetch_add(1));
    active.subject_id = subject_id;
    active.operation = operation;
    active.start = m_clock.monotonicNow();
    active.started_at = m_clock.now();
    
    std::string handle = active.handle;
    {
        std::lock_guard<std::mutex> lock(m_operations_mutex);
        m_active_operations.emplace(handle, std::move(active));
    }
    
    return handle;
}

void RequestTracker::endOperation(const std::string& handle, const std::string& subject_id,
                                  const std::string& operation, bool success,
                                  const std::optional<std::string>& error_message,
                                  const std::unordered_map<std::string, std::string>& metadata) {
    if (handle == kDisabledHandle) {
        return;
    }
    
    try {
        ActiveOperation active;
        {
            std::lock_guard<std::mutex> lock(m_operations_mutex);
            auto it = m_active_operations.find(handle);
            if (it == m_active_operations.end()) {
                Logger::getInstance().warning("RequestTracker", 
                    "No active operation for handle: " + handle, subject_id + "/" + operation);
                return;
            }
            active = std::move(it->second);
            m_active_operations.erase(it);
        }
        
        double duration_ms = clampDuration(elapsedMs(active.start, m_clock.monotonicNow()));
        auto now = m_clock.now();
        
        m_metrics.record(SubjectKind::SERVICE, subject_id, duration_ms, success, now);
        
        HistoryRecord record;
        record.request_id = handle;
        record.service = subject_id;
        record.operation = operation;
        record.duration_ms = duration_ms;
        record.success = success;
        record.error_type = error_message.value_or("");
        record.metadata = metadata;
        record.timestamp = now;
        appendRecent(record);
        
        if (!success) {
            Logger::getInstance().debug("RequestTracker", 
                "Operation failed: " + subject_id + "/" + operation, record.error_type);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("RequestTracker", 
            "Failed to record operation: " + std::string(e.what()), handle);
    }
}

void RequestTracker::trackRequestStart(const std::string& request_id, const std::string& provider,
                                       const std::string& model, const std::string& service) {
    if (!m_enabled.load()) {
        return;
    }
    
    try {
        ActiveRequest active;
        active.request_id = request_id;
        active.provider = provider;
        active.model = model;
        active.service = service;
        active.start = m_clock.monotonicNow();
        active.started_at = m_clock.now();
        active.start_memory_kb = currentMemoryKb();
        
        {
            std::lock_guard<std::mutex> lock(m_requests_mutex);
            if (!m_active_requests.emplace(request_id, std::move(active)).second) {
                Logger::getInstance().warning("RequestTracker", 
                    "Request already in flight, ignoring duplicate start: " + request_id);
                return;
            }
        }
        
        laneFor(provider).in_flight.fetch_add(1);
        m_health.registerProvider(provider);
    } catch (const std::exception& e) {
        Logger::getInstance().error("RequestTracker", 
            "Failed to track request start: " + std::string(e.what()), request_id);
    }
}

void RequestTracker::trackRequestComplete(const std::string& request_id, bool success,
                                          const std::optional<std::string>& error_type,
                                          const std::optional<double>& quality) {
    try {
        ActiveRequest active;
        {
            std::lock_guard<std::mutex> lock(m_requests_mutex);
            auto it = m_active_requests.find(request_id);
            if (it == m_active_requests.end()) {
                if (m_enabled.load()) {
                    Logger::getInstance().warning("RequestTracker", 
                        "No tracking data found for request: " + request_id);
                }
                return;
            }
            active = std::move(it->second);
            m_active_requests.erase(it);
        }
        
        double duration_ms = clampDuration(elapsedMs(active.start, m_clock.monotonicNow()));
        auto now = m_clock.now();
        
        HistoryRecord record;
        record.request_id = request_id;
        record.provider = active.provider;
        record.model = active.model;
        record.service = active.service;
        record.operation = "request";
        record.duration_ms = duration_ms;
        record.success = success;
        record.error_type = error_type.value_or("");
        record.quality = quality.value_or(-1.0);
        record.memory_delta_kb = currentMemoryKb() - active.start_memory_kb;
        record.timestamp = now;
        
        ProviderLane& lane = laneFor(active.provider);
        {
            std::lock_guard<std::mutex> lock(lane.mutex);
            lane.history.push_back(record);
            while (lane.history.size() > m_adaptive.historical_window_size) {
                lane.history.pop_front();
            }
        }
        
        m_metrics.record(SubjectKind::PROVIDER, active.provider, duration_ms, success, now);
        if (quality) {
            m_metrics.recordQuality(SubjectKind::PROVIDER, active.provider, *quality);
        }
        
        if (success) {
            m_health.recordSuccess(active.provider);
        } else {
            m_health.recordFailure(active.provider);
        }
        
        releaseInFlight(active.provider);
        appendRecent(record);
        
        Logger::getInstance().logRequestOutcome(request_id, active.provider, duration_ms, success);
    } catch (const std::exception& e) {
        Logger::getInstance().error("RequestTracker", 
            "Failed to track request completion: " + std::string(e.what()), request_id);
    }
}

size_t RequestTracker::getInFlight(const std::string& provider) const {
    ProviderLane* lane = findLane(provider);
    return lane ? lane->in_flight.load() : 0;
}

std::unordered_map<std::string, size_t> RequestTracker::getInFlightCounts() const {
    std::lock_guard<std::mutex> lock(m_lanes_mutex);
    std::unordered_map<std::string, size_t> counts;
    for (const auto& [provider, lane] : m_lanes) {
        counts[provider] = lane->in_flight.load();
    }
    return counts;
}

size_t RequestTracker::getTotalInFlight() const {
    size_t total = 0;
    for (const auto& [provider, count] : getInFlightCounts()) {
        total += count;
    }
    return total;
}

std::vector<HistoryRecord> RequestTracker::getProviderHistory(const std::string& provider, size_t limit) const {
    ProviderLane* lane = findLane(provider);
    if (!lane) {
        return {};
    }
    
    std::lock_guard<std::mutex> lock(lane->mutex);
    size_t count = (limit == 0) ? lane->history.size() : std::min(limit, lane->history.size());
    return std::vector<HistoryRecord>(lane->history.end() - static_cast<std::ptrdiff_t>(count),
                                      lane->history.end());
}

std::vector<HistoryRecord> RequestTracker::getRecentHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_recent_mutex);
    size_t count = std::min(limit, m_recent.size());
    return std::vector<HistoryRecord>(m_recent.end() - static_cast<std::ptrdiff_t>(count), m_recent.end());
}

std::vector<HistoryRecord> RequestTracker::getMetricsForTimeRange(
    const std::optional<std::string>& subject_id,
    const std::optional<std::chrono::system_clock::time_point>& start,
    const std::optional<std::chrono::system_clock::time_point>& end) const {
    std::lock_guard<std::mutex> lock(m_recent_mutex);
    std::vector<HistoryRecord> result;
    
    for (const auto& record : m_recent) {
        if (subject_id && record.provider != *subject_id && record.service != *subject_id) {
            continue;
        }
        if (start && record.timestamp < *start) {
            continue;
        }
        if (end && record.timestamp > *end) {
            continue;
        }
        result.push_back(record);
    }
    
    return result;
}

size_t RequestTracker::cleanupStaleRequests() {
    auto now = m_clock.monotonicNow();
    auto max_age = std::chrono::duration_cast<std::chrono::steady_clock::duration>(m_config.max_in_flight_age);
    size_t removed = 0;
    
    {
        std::lock_guard<std::mutex> lock(m_operations_mutex);
        for (auto it = m_active_operations.begin(); it != m_active_operations.end();) {
            if (now - it->second.start > max_age) {
                Logger::getInstance().warning("RequestTracker", 
                    "Dropping operation that never ended: " + it->first);
                it = m_active_operations.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    
    std::vector<std::string> leaked_providers;
    {
        std::lock_guard<std::mutex> lock(m_requests_mutex);
        for (auto it = m_active_requests.begin(); it != m_active_requests.end();) {
            if (now - it->second.start > max_age) {
                Logger::getInstance().warning("RequestTracker", 
                    "Dropping request that never completed: " + it->first, it->second.provider);
                leaked_providers.push_back(it->second.provider);
                it = m_active_requests.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    
    for (const auto& provider : leaked_providers) {
        releaseInFlight(provider);
    }
    
    return removed;
}

size_t RequestTracker::cleanupOldMetrics() {
    auto cutoff = m_clock.now() - m_config.metrics_retention;
    std::lock_guard<std::mutex> lock(m_recent_mutex);
    
    size_t before = m_recent.size();
    m_recent.erase(std::remove_if(m_recent.begin(), m_recent.end(),
                                  [&cutoff](const HistoryRecord& record) {
                                      return record.timestamp < cutoff;
                                  }),
                   m_recent.end());
    size_t removed = before - m_recent.size();
    
    if (removed > 0) {
        Logger::getInstance().info("RequestTracker", 
            "Removed " + std::to_string(removed) + " expired operation records");
    }
    return removed;
}

void RequestTracker::setEnabled(bool enabled) {
    m_enabled.store(enabled);
    Logger::getInstance().info("RequestTracker", 
        "Monitoring " + std::string(enabled ? "enabled" : "disabled"));
}

size_t RequestTracker::activeOperationCount() const {
    std::lock_guard<std::mutex> lock(m_operations_mutex);
    return m_active_operations.size();
}

size_t RequestTracker::activeRequestCount() const {
    std::lock_guard<std::mutex> lock(m_requests_mutex);
    return m_active_requests.size();
}

RequestTracker::ProviderLane& RequestTracker::laneFor(const std::string& provider) {
    std::lock_guard<std::mutex> lock(m_lanes_mutex);
    auto& lane = m_lanes[provider];
    if (!lane) {
        lane = std::make_unique<ProviderLane>();
    }
    return *lane;
}

RequestTracker::ProviderLane* RequestTracker::findLane(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(m_lanes_mutex);
    auto it = m_lanes.find(provider);
    return it != m_lanes.end() ? it->second.get() : nullptr;
}

void RequestTracker::releaseInFlight(const std::string& provider) {
    ProviderLane& lane = laneFor(provider);
    size_t current = lane.in_flight.load();
    while (current > 0 && !lane.in_flight.compare_exchange_weak(current, current - 1)) {
    }
}

void RequestTracker::appendRecent(const HistoryRecord& record) {
    std::lock_guard<std::mutex> lock(m_recent_mutex);
    m_recent.push_back(record);
    while (m_recent.size() > m_config.max_metrics_history) {
        m_recent.pop_front();
    }
}

double RequestTracker::clampDuration(double duration_ms) const {
    return std::max(duration_ms, m_config.min_duration_ms);
}

long RequestTracker::currentMemoryKb() {
    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0;
    }
    return usage.ru_maxrss;
}

} // namespace Relay
