// =================================================================
// include/Relay/SnapshotExporter.hpp
// =================================================================
// JSON serialization of monitoring state for external persistence.

#pragma once

#include "Relay/Dashboard.hpp"
#include "Relay/RoutingEngine.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>

namespace Relay {

/**
 * @brief Converts monitoring state to nlohmann::json
 *
 * Time points are written as milliseconds since the Unix epoch.
 */
class SnapshotExporter {
public:
    static nlohmann::json toJson(const OverallStats& stats);
    static nlohmann::json toJson(const OperationStats& stats);
    static nlohmann::json toJson(const HistoryRecord& record);
    static nlohmann::json toJson(const Alert& alert);
    static nlohmann::json toJson(const HealthStatus& status);
    static nlohmann::json toJson(const TrendData& trend);
    static nlohmann::json toJson(const RoutingDecision& decision);
    static nlohmann::json toJson(const Recommendation& recommendation);

    /**
     * @brief Dashboard as a JSON object
     */
    static nlohmann::json toJson(const Dashboard& dashboard);

    /**
     * @brief Full snapshot: dashboard, every retained alert and recent decisions
     * @param dashboard Dashboard view
     * @param alerts Every retained alert, resolved ones included
     * @param decisions Recent routing decisions
     * @param algorithm Active balancing algorithm
     */
    static nlohmann::json buildSnapshot(const Dashboard& dashboard,
                                        const std::vector<Alert>& alerts,
                                        const std::vector<RoutingDecision>& decisions,
                                        const std::string& algorithm);

    /**
     * @brief Write a JSON document to a file
     * @param document Document to write
     * @param path Destination path
     * @param indent Indentation width (-1 for compact output)
     * @throws std::runtime_error if the file cannot be written
     */
    static void writeToFile(const nlohmann::json& document, const std::string& path, int indent = 2);

    /**
     * @brief Milliseconds since the Unix epoch
     */
    static long long toEpochMs(std::chrono::system_clock::time_point time_point);
};

} // namespace Relay
