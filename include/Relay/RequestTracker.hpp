// =================================================================
// include/Relay/RequestTracker.hpp
// =================================================================
// Start/end pairing of operations and provider requests, in-flight
// accounting and bounded request history.

#pragma once

#include "Relay/Clock.hpp"
#include "Relay/HealthTracker.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/RoutingConfig.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Relay {

/**
 * @brief An operation started with startOperation() and not yet ended
 */
struct ActiveOperation {
    std::string handle;                                  ///< Unique handle
    std::string subject_id;                              ///< Service being measured
    std::string operation;                               ///< Operation name
    std::chrono::steady_clock::time_point start;         ///< Monotonic start
    std::chrono::system_clock::time_point started_at;    ///< Wall-clock start
};

/**
 * @brief A provider request started with trackRequestStart() and not yet completed
 */
struct ActiveRequest {
    std::string request_id;                              ///< Caller-supplied request id
    std::string provider;                                ///< Provider handling the request
    std::string model;                                   ///< Model used
    std::string service;                                 ///< Internal service path
    std::chrono::steady_clock::time_point start;         ///< Monotonic start
    std::chrono::system_clock::time_point started_at;    ///< Wall-clock start
    long start_memory_kb = 0;                            ///< Process max RSS at start
};

/**
 * @brief Outcome of one completed operation or request
 */
struct HistoryRecord {
    std::string request_id;                              ///< Request id or operation handle
    std::string provider;                                ///< Provider (empty for service operations)
    std::string model;                                   ///< Model (empty for service operations)
    std::string service;                                 ///< Service path or measured subject
    std::string operation;                               ///< Operation name
    double duration_ms = 0.0;                            ///< Clamped duration
    bool success = false;                                ///< Outcome
    std::string error_type;                              ///< Error kind or message, empty on success
    double quality = -1.0;                               ///< Reported quality, -1 when absent
    long memory_delta_kb = 0;                            ///< Max RSS growth during the request
    std::unordered_map<std::string, std::string> metadata; ///< Caller metadata
    std::chrono::system_clock::time_point timestamp;     ///< Completion time
};

/**
 * @brief Pairs start/end events and feeds the metrics store
 *
 * Instrumentation never throws into the caller: failures inside an end
 * call are logged and swallowed. Per-provider in-flight counters and
 * history rings live in independent lanes so that providers do not
 * contend with each other.
 */
class RequestTracker {
public:
    /// Handle returned by startOperation() while monitoring is disabled
    static const std::string kDisabledHandle;

    /**
     * @brief Constructor
     * @param config Monitoring configuration
     * @param adaptive Adaptive routing configuration (history window, quality)
     * @param metrics Statistics store to update
     * @param health Health tracker driven by provider outcomes
     * @param clock Time source
     */
    RequestTracker(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive,
                   MetricsStore& metrics, HealthTracker& health, const Clock& clock);
    
    virtual ~RequestTracker() = default;

    /**
     * @brief Start timing an operation on a service
     * @param subject_id Service identifier
     * @param operation Operation name
     * @return Unique handle, or kDisabledHandle when monitoring is off
     */
    virtual std::string startOperation(const std::string& subject_id, const std::string& operation);

    /**
     * @brief Finish a timed operation and record its outcome
     * @param handle Handle from startOperation()
     * @param subject_id Service identifier
     * @param operation Operation name
     * @param success Whether the operation succeeded
     * @param error_message Optional error description
     * @param metadata Optional caller metadata kept with the history record
     */
    virtual void endOperation(const std::string& handle, const std::string& subject_id,
                              const std::string& operation, bool success,
                              const std::optional<std::string>& error_message = std::nullopt,
                              const std::unordered_map<std::string, std::string>& metadata = {});

    /**
     * @brief Mark a provider request as in flight
     * @param request_id Unique request identifier
     * @param provider Provider handling the request
     * @param model Model used
     * @param service Internal service path
     */
    virtual void trackRequestStart(const std::string& request_id, const std::string& provider,
                                   const std::string& model, const std::string& service);

    /**
     * @brief Complete a provider request
     * @param request_id Request identifier passed to trackRequestStart()
     * @param success Whether the request succeeded
     * @param error_type Optional error kind
     * @param quality Optional quality score in [0, 1]
     */
    virtual void trackRequestComplete(const std::string& request_id, bool success,
                                      const std::optional<std::string>& error_type = std::nullopt,
                                      const std::optional<double>& quality = std::nullopt);

    /**
     * @brief Requests currently in flight for a provider
     */
    virtual size_t getInFlight(const std::string& provider) const;

    /**
     * @brief In-flight counts for every provider seen so far
     */
    virtual std::unordered_map<std::string, size_t> getInFlightCounts() const;

    /**
     * @brief Sum of all provider in-flight counts
     */
    virtual size_t getTotalInFlight() const;

    /**
     * @brief History ring of a provider, oldest first
     * @param provider Provider identifier
     * @param limit Most recent entries to return (0 = all)
     */
    virtual std::vector<HistoryRecord> getProviderHistory(const std::string& provider, size_t limit = 0) const;

    /**
     * @brief Most recent completed operations and requests across all subjects
     * @param limit Maximum entries, newest last
     */
    virtual std::vector<HistoryRecord> getRecentHistory(size_t limit) const;

    /**
     * @brief Completed operations within a time range
     * @param subject_id Restrict to one provider or service
     * @param start Inclusive lower bound
     * @param end Inclusive upper bound
     */
    virtual std::vector<HistoryRecord> getMetricsForTimeRange(
        const std::optional<std::string>& subject_id = std::nullopt,
        const std::optional<std::chrono::system_clock::time_point>& start = std::nullopt,
        const std::optional<std::chrono::system_clock::time_point>& end = std::nullopt) const;

    /**
     * @brief Drop in-flight operations and requests older than max_in_flight_age
     * @return Number of entries removed
     */
    virtual size_t cleanupStaleRequests();

    /**
     * @brief Drop recent-operation entries older than metrics_retention
     * @return Number of entries removed
     */
    virtual size_t cleanupOldMetrics();

    /**
     * @brief Enable or disable instrumentation at runtime
     */
    virtual void setEnabled(bool enabled);

    bool isEnabled() const { return m_enabled.load(); }

    size_t activeOperationCount() const;
    size_t activeRequestCount() const;

private:
    struct ProviderLane {
        std::atomic<size_t> in_flight{0};
        std::deque<HistoryRecord> history;
        mutable std::mutex mutex;
    };

    ProviderLane& laneFor(const std::string& provider);
    ProviderLane* findLane(const std::string& provider) const;
    void releaseInFlight(const std::string& provider);
    void appendRecent(const HistoryRecord& record);
    double clampDuration(double duration_ms) const;
    static long currentMemoryKb();

    MonitorConfig m_config;
    AdaptiveRoutingConfig m_adaptive;
    MetricsStore& m_metrics;
    HealthTracker& m_health;
    const Clock& m_clock;

    std::atomic<bool> m_enabled;
    std::atomic<uint64_t> m_next_handle{1};

    std::unordered_map<std::string, ActiveOperation> m_active_operations;
    mutable std::mutex m_operations_mutex;

    std::unordered_map<std::string, ActiveRequest> m_active_requests;
    mutable std::mutex m_requests_mutex;

    std::map<std::string, std::unique_ptr<ProviderLane>> m_lanes;
    mutable std::mutex m_lanes_mutex;

    std::deque<HistoryRecord> m_recent;
    mutable std::mutex m_recent_mutex;
};

} // namespace Relay
