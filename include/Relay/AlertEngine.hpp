// =================================================================
// include/Relay/AlertEngine.hpp
// =================================================================
// Threshold rules, alert de-duplication, cooldown and resolution.

#pragma once

#include "Relay/Clock.hpp"
#include "Relay/MetricsStore.hpp"
#include "Relay/RoutingConfig.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Relay {

/**
 * @brief Kind of condition an alert reports
 */
enum class AlertType {
    HIGH_LATENCY,     ///< Mean duration above threshold
    HIGH_ERROR_RATE,  ///< Error rate above threshold
    SERVICE_DOWN,     ///< Previously active subject went silent
    LOW_QUALITY       ///< Reported quality below minimum
};

/**
 * @brief Alert severity
 */
enum class AlertSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief A raised alert
 */
struct Alert {
    std::string id;                                  ///< Unique alert id
    std::string subject_id;                          ///< Provider or service
    SubjectKind subject_kind = SubjectKind::SERVICE; ///< Subject kind
    AlertType type = AlertType::HIGH_LATENCY;        ///< Condition type
    AlertSeverity severity = AlertSeverity::LOW;     ///< Severity
    std::string message;                             ///< Human-readable description
    double threshold = 0.0;                          ///< Threshold that was crossed
    double current_value = 0.0;                      ///< Observed value
    std::chrono::system_clock::time_point created_at; ///< Creation time
    bool resolved = false;                           ///< Whether resolved
    std::optional<std::chrono::system_clock::time_point> resolved_at; ///< Resolution time
};

/**
 * @brief Condition detected by a rule, before de-duplication
 */
struct AlertCandidate {
    AlertType type = AlertType::HIGH_LATENCY;
    AlertSeverity severity = AlertSeverity::LOW;
    std::string message;
    double threshold = 0.0;
    double current_value = 0.0;
};

/**
 * @brief Alert rule base class
 */
class AlertRule {
public:
    virtual ~AlertRule() = default;
    
    /**
     * @brief Evaluate a subject snapshot
     * @param stats Statistics snapshot of the subject
     * @param thresholds Configured thresholds
     * @param now Evaluation time
     * @return Candidate alert, or std::nullopt when the condition does not hold
     */
    virtual std::optional<AlertCandidate> evaluate(
        const OperationStats& stats,
        const AlertThresholds& thresholds,
        std::chrono::system_clock::time_point now
    ) = 0;
    
    /**
     * @brief Get rule name
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Evaluates alert rules over subject snapshots
 *
 * At most one unresolved alert exists per (subject, type). Once resolved, the
 * same (subject, type) cannot be raised again until alert_cooldown has passed.
 */
class AlertEngine {
public:
    /**
     * @brief Constructor
     * @param thresholds Alert thresholds
     * @param config Monitoring configuration (retention)
     * @param clock Time source
     */
    AlertEngine(const AlertThresholds& thresholds, const MonitorConfig& config, const Clock& clock);
    
    virtual ~AlertEngine() = default;

    /**
     * @brief Add a rule evaluated on every sweep
     * @param rule Rule implementation
     */
    virtual void registerRule(std::shared_ptr<AlertRule> rule);

    /**
     * @brief Evaluate every rule against every subject
     * @param subjects Statistics snapshots
     * @return Alerts newly raised by this sweep
     */
    virtual std::vector<Alert> evaluate(const std::vector<OperationStats>& subjects);

    /**
     * @brief Raise an alert unless suppressed by de-duplication or cooldown
     * @param subject_id Subject identifier
     * @param kind Subject kind
     * @param candidate Detected condition
     * @return The new alert, or std::nullopt when suppressed
     */
    virtual std::optional<Alert> raiseAlert(const std::string& subject_id, SubjectKind kind,
                                            const AlertCandidate& candidate);

    /**
     * @brief Resolve an alert
     * @param alert_id Alert id
     * @return True if the alert existed and was unresolved
     */
    virtual bool resolveAlert(const std::string& alert_id);

    /**
     * @brief Unresolved alerts, oldest first
     * @param limit Most recent alerts to return (0 = all)
     */
    virtual std::vector<Alert> getActiveAlerts(size_t limit = 0) const;

    /**
     * @brief Every retained alert, oldest first
     */
    virtual std::vector<Alert> getAllAlerts() const;

    /**
     * @brief Lookup by id
     */
    virtual std::optional<Alert> getAlert(const std::string& alert_id) const;

    /**
     * @brief Remove alerts older than alert_retention
     * @return Number of alerts removed
     */
    virtual size_t cleanupOldAlerts();

    static std::string typeName(AlertType type);
    static std::string severityName(AlertSeverity severity);

private:
    using AlertKey = std::pair<std::string, AlertType>;

    static std::string subjectKey(const std::string& subject_id, SubjectKind kind);

    AlertThresholds m_thresholds;
    MonitorConfig m_config;
    const Clock& m_clock;

    std::vector<std::shared_ptr<AlertRule>> m_rules;
    mutable std::mutex m_rules_mutex;

    std::vector<Alert> m_alerts;
    std::map<AlertKey, std::chrono::system_clock::time_point> m_last_resolved;
    size_t m_next_alert_id = 1;
    mutable std::mutex m_alerts_mutex;

    // Built-in rule classes
    class LatencyRule;
    class ErrorRateRule;
    class InactivityRule;
    class QualityRule;
};

} // namespace Relay
