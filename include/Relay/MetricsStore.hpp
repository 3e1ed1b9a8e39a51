// =================================================================
// include/Relay/MetricsStore.hpp
// =================================================================
// Per-provider and per-service running operation statistics.

#pragma once

#include "Relay/PercentileReservoir.hpp"
#include "Relay/RoutingConfig.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Relay {

/**
 * @brief Kind of subject a statistics entry describes
 */
enum class SubjectKind {
    PROVIDER,   ///< External AI backend
    SERVICE     ///< Internal processing path
};

/**
 * @brief Running statistics for one provider or service
 */
struct OperationStats {
    std::string subject_id;                 ///< Provider or service identifier
    SubjectKind kind = SubjectKind::SERVICE; ///< Subject kind
    uint64_t total_operations = 0;          ///< successful + failed
    uint64_t successful_operations = 0;     ///< Operations that succeeded
    uint64_t failed_operations = 0;         ///< Operations that failed
    double total_duration_ms = 0.0;         ///< Sum of durations
    double average_duration_ms = 0.0;       ///< total_duration_ms / total_operations
    double min_duration_ms = 0.0;           ///< Fastest observed duration
    double max_duration_ms = 0.0;           ///< Slowest observed duration
    double p95_duration_ms = 0.0;           ///< Approximate 95th percentile
    double error_rate = 0.0;                ///< failed / total, in [0, 1]
    double quality_score = -1.0;            ///< Smoothed reported quality, -1 if never reported
    std::chrono::system_clock::time_point last_operation_time; ///< Last recorded activity

    bool hasQuality() const { return quality_score >= 0.0; }

    double successRate() const {
        return total_operations == 0 ? 1.0
            : static_cast<double>(successful_operations) / static_cast<double>(total_operations);
    }
};

/**
 * @brief Aggregate over all subjects of one kind
 */
struct OverallStats {
    uint64_t total_operations = 0;
    uint64_t successful_operations = 0;
    uint64_t failed_operations = 0;
    double average_duration_ms = 0.0;
    double error_rate = 0.0;
    size_t subject_count = 0;
};

/**
 * @brief Store of running statistics keyed by (kind, subject)
 *
 * The map lock is held only to find or create an entry. Each entry has its
 * own mutex, so updates for one key are serialized while different keys
 * proceed in parallel. Entries are never removed.
 */
class MetricsStore {
public:
    /**
     * @brief Constructor
     * @param config Monitoring configuration (reservoir sizing, seed)
     * @param adaptive Adaptive routing configuration (quality smoothing)
     */
    MetricsStore(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive);
    
    virtual ~MetricsStore() = default;

    /**
     * @brief Record one completed operation
     * @param kind Subject kind
     * @param subject_id Provider or service identifier
     * @param duration_ms Duration, already clamped by the caller
     * @param success Whether the operation succeeded
     * @param when Completion time
     * @return Snapshot of the entry after the update
     */
    virtual OperationStats record(SubjectKind kind, const std::string& subject_id,
                                  double duration_ms, bool success,
                                  std::chrono::system_clock::time_point when);

    /**
     * @brief Fold a reported quality value into the subject's quality score
     * @param kind Subject kind
     * @param subject_id Provider or service identifier
     * @param quality Reported quality in [0, 1] (clamped)
     */
    virtual void recordQuality(SubjectKind kind, const std::string& subject_id, double quality);

    /**
     * @brief Snapshot of one subject
     * @return Stats or std::nullopt if the subject has never been recorded
     */
    virtual std::optional<OperationStats> getStats(SubjectKind kind, const std::string& subject_id) const;

    /**
     * @brief Snapshots of all subjects of one kind, ordered by id
     */
    virtual std::vector<OperationStats> getAllStats(SubjectKind kind) const;

    /**
     * @brief Totals computed at read time by summing per-subject sums and counts
     */
    virtual OverallStats computeTotals(SubjectKind kind) const;

    /**
     * @brief Readable name of a subject kind
     */
    static std::string kindName(SubjectKind kind);

private:
    struct StatsEntry {
        std::mutex mutex;
        OperationStats stats;
        PercentileReservoir reservoir;

        StatsEntry(size_t capacity, size_t refresh_interval, uint64_t seed)
            : reservoir(capacity, refresh_interval, seed) {}
    };

    using EntryMap = std::map<std::string, std::unique_ptr<StatsEntry>>;

    StatsEntry& entryFor(SubjectKind kind, const std::string& subject_id);
    StatsEntry* findEntry(SubjectKind kind, const std::string& subject_id) const;
    const EntryMap& mapFor(SubjectKind kind) const;

    MonitorConfig m_config;
    AdaptiveRoutingConfig m_adaptive;
    
    EntryMap m_providers;
    EntryMap m_services;
    mutable std::mutex m_map_mutex;
};

} // namespace Relay
