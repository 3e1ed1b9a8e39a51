// =================================================================
// src/Relay/MetricsStore.cpp
// =================================================================
// Implementation of the running statistics store.

#include "Relay/MetricsStore.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <functional>

namespace Relay {

MetricsStore::MetricsStore(const MonitorConfig& config, const AdaptiveRoutingConfig& adaptive)
    : m_config(config), m_adaptive(adaptive) {
}

OperationStats MetricsStore::record(SubjectKind kind, const std::string& subject_id,
                                    double duration_ms, bool success,
                                    std::chrono::system_clock::time_point when) {
    StatsEntry& entry = entryFor(kind, subject_id);
    std::lock_guard<std::mutex> lock(entry.mutex);
    OperationStats& stats = entry.stats;
    
    stats.total_operations++;
    if (success) {
        stats.successful_operations++;
    } else {
        stats.failed_operations++;
    }
    
    stats.total_duration_ms += duration_ms;
    stats.average_duration_ms = stats.total_duration_ms / static_cast<double>(stats.total_operations);
    
    if (stats.total_operations == 1) {
        stats.min_duration_ms = duration_ms;
        stats.max_duration_ms = duration_ms;
    } else {
        stats.min_duration_ms = std::min(stats.min_duration_ms, duration_ms);
        stats.max_duration_ms = std::max(stats.max_duration_ms, duration_ms);
    }
    
    stats.error_rate = static_cast<double>(stats.failed_operations) /
                       static_cast<double>(stats.total_operations);
    stats.last_operation_time = when;
    
    entry.reservoir.add(duration_ms);
    stats.p95_duration_ms = entry.reservoir.percentile95();
    
    return stats;
}

void MetricsStore::recordQuality(SubjectKind kind, const std::string& subject_id, double quality) {
    quality = std::clamp(quality, 0.0, 1.0);
    
    StatsEntry& entry = entryFor(kind, subject_id);
    std::lock_guard<std::mutex> lock(entry.mutex);
    OperationStats& stats = entry.stats;
    
    if (!stats.hasQuality() || !m_adaptive.enabled) {
        stats.quality_score = quality;
    } else {
        stats.quality_score += m_adaptive.learning_rate * (quality - stats.quality_score);
    }
}

std::optional<OperationStats> MetricsStore::getStats(SubjectKind kind, const std::string& subject_id) const {
    StatsEntry* entry = findEntry(kind, subject_id);
    if (!entry) {
        return std::nullopt;
    }
    
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->stats;
}

std::vector<OperationStats> MetricsStore::getAllStats(SubjectKind kind) const {
    std::vector<StatsEntry*> entries;
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        for (const auto& [id, entry] : mapFor(kind)) {
            entries.push_back(entry.get());
        }
    }
    
    std::vector<OperationStats> result;
    result.reserve(entries.size());
    for (auto* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        result.push_back(entry->stats);
    }
    
    return result;
}

OverallStats MetricsStore::computeTotals(SubjectKind kind) const {
    OverallStats totals;
    double duration_sum = 0.0;
    
    for (const auto& stats : getAllStats(kind)) {
        totals.total_operations += stats.total_operations;
        totals.successful_operations += stats.successful_operations;
        totals.failed_operations += stats.failed_operations;
        duration_sum += stats.total_duration_ms;
        totals.subject_count++;
    }
    
    if (totals.total_operations > 0) {
        totals.average_duration_ms = duration_sum / static_cast<double>(totals.total_operations);
        totals.error_rate = static_cast<double>(totals.failed_operations) /
                            static_cast<double>(totals.total_operations);
    }
    
    return totals;
}

std::string MetricsStore::kindName(SubjectKind kind) {
    return kind == SubjectKind::PROVIDER ? "provider" : "service";
}

MetricsStore::StatsEntry& MetricsStore::entryFor(SubjectKind kind, const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(m_map_mutex);
    EntryMap& map = (kind == SubjectKind::PROVIDER) ? m_providers : m_services;
    
    auto it = map.find(subject_id);
    if (it != map.end()) {
        return *it->second;
    }
    
    uint64_t seed = m_config.random_seed ^ std::hash<std::string>{}(kindName(kind) + ":" + subject_id);
    auto entry = std::make_unique<StatsEntry>(m_config.percentile_sample_capacity,
                                              m_config.percentile_refresh_interval, seed);
    entry->stats.subject_id = subject_id;
    entry->stats.kind = kind;
    
    StatsEntry& ref = *entry;
    map.emplace(subject_id, std::move(entry));
    
    Logger::getInstance().debug("MetricsStore", "Tracking new " + kindName(kind) + ": " + subject_id);
    return ref;
}

MetricsStore::StatsEntry* MetricsStore::findEntry(SubjectKind kind, const std::string& subject_id) const {
    std::lock_guard<std::mutex> lock(m_map_mutex);
    const EntryMap& map = mapFor(kind);
    auto it = map.find(subject_id);
    return it != map.end() ? it->second.get() : nullptr;
}

const MetricsStore::EntryMap& MetricsStore::mapFor(SubjectKind kind) const {
    return kind == SubjectKind::PROVIDER ? m_providers : m_services;
}

} // namespace Relay
