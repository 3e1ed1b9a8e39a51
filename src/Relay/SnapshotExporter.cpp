// =================================================================
// src/Relay/SnapshotExporter.cpp
// =================================================================
// Implementation of JSON snapshot export.

#include "Relay/SnapshotExporter.hpp"
#include "Relay/Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace Relay {

nlohmann::json SnapshotExporter::toJson(const OverallStats& stats) {
    return {
        {"total_operations", stats.total_operations},
        {"successful_operations", stats.successful_operations},
        {"failed_operations", stats.failed_operations},
        {"average_duration_ms", stats.average_duration_ms},
        {"error_rate", stats.error_rate},
        {"subject_count", stats.subject_count}
    };
}

nlohmann::json SnapshotExporter::toJson(const OperationStats& stats) {
    nlohmann::json json = {
        {"id", stats.subject_id},
        {"kind", MetricsStore::kindName(stats.kind)},
        {"total_operations", stats.total_operations},
        {"successful_operations", stats.successful_operations},
        {"failed_operations", stats.failed_operations},
        {"total_duration_ms", stats.total_duration_ms},
        {"average_duration_ms", stats.average_duration_ms},
        {"min_duration_ms", stats.min_duration_ms},
        {"max_duration_ms", stats.max_duration_ms},
        {"p95_duration_ms", stats.p95_duration_ms},
        {"error_rate", stats.error_rate},
        {"last_operation_ms", toEpochMs(stats.last_operation_time)}
    };
    
    if (stats.hasQuality()) {
        json["quality_score"] = stats.quality_score;
    } else {
        json["quality_score"] = nullptr;
    }
    
    return json;
}

nlohmann::json SnapshotExporter::toJson(const HistoryRecord& record) {
    nlohmann::json json = {
        {"request_id", record.request_id},
        {"provider", record.provider},
        {"model", record.model},
        {"service", record.service},
        {"operation", record.operation},
        {"duration_ms", record.duration_ms},
        {"success", record.success},
        {"memory_delta_kb", record.memory_delta_kb},
        {"timestamp_ms", toEpochMs(record.timestamp)}
    };
    
    if (!record.error_type.empty()) {
        json["error"] = record.error_type;
    }
    if (record.quality >= 0.0) {
        json["quality"] = record.quality;
    }
    if (!record.metadata.empty()) {
        json["metadata"] = record.metadata;
    }
    
    return json;
}

nlohmann::json SnapshotExporter::toJson(const Alert& alert) {
    nlohmann::json json = {
        {"id", alert.id},
        {"subject", alert.subject_id},
        {"subject_kind", MetricsStore::kindName(alert.subject_kind)},
        {"type", AlertEngine::typeName(alert.type)},
        {"severity", AlertEngine::severityName(alert.severity)},
        {"message", alert.message},
        {"threshold", alert.threshold},
        {"current_value", alert.current_value},
        {"created_ms", toEpochMs(alert.created_at)},
        {"resolved", alert.resolved}
    };
    
    if (alert.resolved_at) {
        json["resolved_ms"] = toEpochMs(*alert.resolved_at);
    }
    
    return json;
}

nlohmann::json SnapshotExporter::toJson(const HealthStatus& status) {
    return {
        {"provider", status.provider_id},
        {"state", HealthTracker::stateName(status.state)},
        {"consecutive_failures", status.consecutive_failures},
        {"stale", status.stale},
        {"last_check_ms", toEpochMs(status.last_check)},
        {"last_activity_ms", toEpochMs(status.last_activity)}
    };
}

nlohmann::json SnapshotExporter::toJson(const TrendData& trend) {
    return {
        {"metric", trend.metric},
        {"current", trend.current},
        {"previous", trend.previous},
        {"change", trend.change},
        {"change_percent", trend.change_percent},
        {"direction", TrendAnalyzer::directionName(trend.direction)},
        {"confidence", trend.confidence}
    };
}

nlohmann::json SnapshotExporter::toJson(const RoutingDecision& decision) {
    nlohmann::json alternatives = nlohmann::json::array();
    for (const auto& alternative : decision.alternatives) {
        alternatives.push_back({
            {"provider", alternative.provider},
            {"score", alternative.score},
            {"reason", alternative.reason}
        });
    }
    
    return {
        {"request_id", decision.request_id},
        {"provider", decision.selected_provider},
        {"model", decision.selected_model},
        {"service", decision.selected_service},
        {"score", decision.score},
        {"algorithm", decision.algorithm},
        {"fallback_used", decision.fallback_used},
        {"load_balancing_reason", decision.load_balancing_reason},
        {"expected_load_impact", decision.expected_load_impact},
        {"estimates", {
            {"response_time_ms", decision.estimates.response_time_ms},
            {"reliability", decision.estimates.reliability},
            {"quality", decision.estimates.quality}
        }},
        {"factors", {
            {"current_load", decision.factors.current_load},
            {"historical_performance", decision.factors.historical_performance},
            {"real_time_score", decision.factors.real_time_score},
            {"requirement_alignment", decision.factors.requirement_alignment}
        }},
        {"alternatives", alternatives},
        {"timestamp_ms", toEpochMs(decision.timestamp)}
    };
}

nlohmann::json SnapshotExporter::toJson(const Recommendation& recommendation) {
    return {
        {"type", recommendation.type},
        {"priority", recommendation.priority},
        {"description", recommendation.description},
        {"action", recommendation.action}
    };
}

nlohmann::json SnapshotExporter::toJson(const Dashboard& dashboard) {
    nlohmann::json json;
    json["generated_ms"] = toEpochMs(dashboard.generated_at);
    json["monitoring_enabled"] = dashboard.monitoring_enabled;
    json["in_flight"] = dashboard.in_flight;
    json["overall"] = toJson(dashboard.overall);
    json["providers_overall"] = toJson(dashboard.providers_overall);
    json["services_overall"] = toJson(dashboard.services_overall);
    
    json["providers"] = nlohmann::json::array();
    for (const auto& stats : dashboard.providers) {
        json["providers"].push_back(toJson(stats));
    }
    
    json["services"] = nlohmann::json::array();
    for (const auto& stats : dashboard.services) {
        json["services"].push_back(toJson(stats));
    }
    
    json["recent_history"] = nlohmann::json::array();
    for (const auto& record : dashboard.recent_history) {
        json["recent_history"].push_back(toJson(record));
    }
    
    json["active_alerts"] = nlohmann::json::array();
    for (const auto& alert : dashboard.active_alerts) {
        json["active_alerts"].push_back(toJson(alert));
    }
    
    json["health"] = nlohmann::json::array();
    for (const auto& status : dashboard.health) {
        json["health"].push_back(toJson(status));
    }
    
    json["trends"] = nlohmann::json::array();
    for (const auto& trend : dashboard.trends) {
        json["trends"].push_back(toJson(trend));
    }
    
    return json;
}

nlohmann::json SnapshotExporter::buildSnapshot(const Dashboard& dashboard,
                                               const std::vector<Alert>& alerts,
                                               const std::vector<RoutingDecision>& decisions,
                                               const std::string& algorithm) {
    nlohmann::json snapshot;
    snapshot["version"] = 1;
    snapshot["algorithm"] = algorithm;
    snapshot["dashboard"] = toJson(dashboard);
    
    snapshot["alerts"] = nlohmann::json::array();
    for (const auto& alert : alerts) {
        snapshot["alerts"].push_back(toJson(alert));
    }
    
    snapshot["decisions"] = nlohmann::json::array();
    for (const auto& decision : decisions) {
        snapshot["decisions"].push_back(toJson(decision));
    }
    
    return snapshot;
}

void SnapshotExporter::writeToFile(const nlohmann::json& document, const std::string& path, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::getInstance().error("SnapshotExporter", "Cannot open export file: " + path);
        throw std::runtime_error("Cannot open export file: " + path);
    }
    
    file << document.dump(indent) << std::endl;
    if (!file.good()) {
        throw std::runtime_error("Failed writing export file: " + path);
    }
    
    Logger::getInstance().info("SnapshotExporter", "Exported snapshot to " + path);
}

long long SnapshotExporter::toEpochMs(std::chrono::system_clock::time_point time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

} // namespace Relay
