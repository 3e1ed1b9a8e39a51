// =================================================================
// src/Relay/AlertEngine.cpp
// =================================================================
// Implementation of alert evaluation and lifecycle.

#include "Relay/AlertEngine.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Relay {

namespace {

std::string formatValue(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace

// =================================================================
// Built-in Alert Rules
// =================================================================

/**
 * @brief Mean latency above the warning or critical threshold
 */
class AlertEngine::LatencyRule : public AlertRule {
public:
    std::optional<AlertCandidate> evaluate(
        const OperationStats& stats,
        const AlertThresholds& thresholds,
        std::chrono::system_clock::time_point now
    ) override {
        if (stats.total_operations == 0) return std::nullopt;
        
        const auto& limits = thresholds.response_time_ms;
        AlertCandidate candidate;
        candidate.type = AlertType::HIGH_LATENCY;
        candidate.current_value = stats.average_duration_ms;
        
        if (stats.average_duration_ms > limits.critical) {
            candidate.severity = AlertSeverity::CRITICAL;
            candidate.threshold = limits.critical;
        } else if (stats.average_duration_ms > limits.warning) {
            candidate.severity = AlertSeverity::HIGH;
            candidate.threshold = limits.warning;
        } else {
            return std::nullopt;
        }
        
        candidate.message = "High response time for " + stats.subject_id + ": " +
                            formatValue(stats.average_duration_ms, 0) + "ms (threshold " +
                            formatValue(candidate.threshold, 0) + "ms)";
        return candidate;
    }
    
    std::string getName() const override {
        return "latency";
    }
};

/**
 * @brief Error rate above the warning or critical threshold
 */
class AlertEngine::ErrorRateRule : public AlertRule {
public:
    std::optional<AlertCandidate> evaluate(
        const OperationStats& stats,
        const AlertThresholds& thresholds,
        std::chrono::system_clock::time_point now
    ) override {
        if (stats.total_operations == 0) return std::nullopt;
        
        const auto& limits = thresholds.error_rate;
        AlertCandidate candidate;
        candidate.type = AlertType::HIGH_ERROR_RATE;
        candidate.current_value = stats.error_rate;
        
        if (stats.error_rate > limits.critical) {
            candidate.severity = AlertSeverity::CRITICAL;
            candidate.threshold = limits.critical;
        } else if (stats.error_rate > limits.warning) {
            candidate.severity = AlertSeverity::HIGH;
            candidate.threshold = limits.warning;
        } else {
            return std::nullopt;
        }
        
        candidate.message = "High error rate for " + stats.subject_id + ": " +
                            formatValue(stats.error_rate * 100.0, 1) + "% (threshold " +
                            formatValue(candidate.threshold * 100.0, 1) + "%)";
        return candidate;
    }
    
    std::string getName() const override {
        return "error_rate";
    }
};

/**
 * @brief Previously active subject silent for longer than the inactivity window
 */
class AlertEngine::InactivityRule : public AlertRule {
public:
    std::optional<AlertCandidate> evaluate(
        const OperationStats& stats,
        const AlertThresholds& thresholds,
        std::chrono::system_clock::time_point now
    ) override {
        if (stats.total_operations == 0) return std::nullopt;
        
        auto silence = now - stats.last_operation_time;
        if (silence <= thresholds.inactivity_window) return std::nullopt;
        
        double silent_minutes = std::chrono::duration<double, std::ratio<60>>(silence).count();
        
        AlertCandidate candidate;
        candidate.type = AlertType::SERVICE_DOWN;
        candidate.severity = AlertSeverity::MEDIUM;
        candidate.threshold = std::chrono::duration<double, std::ratio<60>>(thresholds.inactivity_window).count();
        candidate.current_value = silent_minutes;
        candidate.message = stats.subject_id + " has been inactive for " +
                            formatValue(silent_minutes, 1) + " minutes, possibly down";
        return candidate;
    }
    
    std::string getName() const override {
        return "inactivity";
    }
};

/**
 * @brief Reported provider quality below the configured minimum
 */
class AlertEngine::QualityRule : public AlertRule {
public:
    std::optional<AlertCandidate> evaluate(
        const OperationStats& stats,
        const AlertThresholds& thresholds,
        std::chrono::system_clock::time_point now
    ) override {
        if (!stats.hasQuality() || stats.quality_score >= thresholds.quality_minimum) {
            return std::nullopt;
        }
        
        AlertCandidate candidate;
        candidate.type = AlertType::LOW_QUALITY;
        candidate.severity = AlertSeverity::MEDIUM;
        candidate.threshold = thresholds.quality_minimum;
        candidate.current_value = stats.quality_score;
        candidate.message = "Low quality for " + stats.subject_id + ": " +
                            formatValue(stats.quality_score, 2) + " (minimum " +
                            formatValue(thresholds.quality_minimum, 2) + ")";
        return candidate;
    }
    
    std::string getName() const override {
        return "quality";
    }
};

// =================================================================
// AlertEngine Implementation
// =================================================================

AlertEngine::AlertEngine(const AlertThresholds& thresholds, const MonitorConfig& config, const Clock& clock)
    : m_thresholds(thresholds), m_config(config), m_clock(clock) {
    
    registerRule(std::make_shared<LatencyRule>());
    registerRule(std::make_shared<ErrorRateRule>());
    registerRule(std::make_shared<InactivityRule>());
    registerRule(std::make_shared<QualityRule>());
}

void AlertEngine::registerRule(std::shared_ptr<AlertRule> rule) {
    std::lock_guard<std::mutex> lock(m_rules_mutex);
    Logger::getInstance().debug("AlertEngine", "Registered rule: " + rule->getName());
    m_rules.push_back(std::move(rule));
}

std::vector<Alert> AlertEngine::evaluate(const std::vector<OperationStats>& subjects) {
    std::vector<std::shared_ptr<AlertRule>> rules;
    {
        std::lock_guard<std::mutex> lock(m_rules_mutex);
        rules = m_rules;
    }
    
    auto now = m_clock.now();
    std::vector<Alert> raised;
    
    for (const auto& stats : subjects) {
        try {
            for (const auto& rule : rules) {
                auto candidate = rule->evaluate(stats, m_thresholds, now);
                if (!candidate) continue;
                
                auto alert = raiseAlert(stats.subject_id, stats.kind, *candidate);
                if (alert) {
                    raised.push_back(*alert);
                }
            }
        } catch (const std::exception& e) {
            Logger::getInstance().error("AlertEngine", 
                "Alert evaluation failed for " + stats.subject_id + ": " + std::string(e.what()));
        }
    }
    
    return raised;
}

std::optional<Alert> AlertEngine::raiseAlert(const std::string& subject_id, SubjectKind kind,
                                             const AlertCandidate& candidate) {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    auto now = m_clock.now();
    
    for (const auto& existing : m_alerts) {
        if (!existing.resolved && existing.subject_id == subject_id &&
            existing.subject_kind == kind && existing.type == candidate.type) {
            return std::nullopt;
        }
    }
    
    AlertKey key{subjectKey(subject_id, kind), candidate.type};
    auto resolved_it = m_last_resolved.find(key);
    if (resolved_it != m_last_resolved.end() &&
        now - resolved_it->second < m_thresholds.alert_cooldown) {
        return std::nullopt;
    }
    
    Alert alert;
    alert.id = "alert_" + std::to_string(m_next_alert_id++);
    alert.subject_id = subject_id;
    alert.subject_kind = kind;
    alert.type = candidate.type;
    alert.severity = candidate.severity;
    alert.message = candidate.message;
    alert.threshold = candidate.threshold;
    alert.current_value = candidate.current_value;
    alert.created_at = now;
    
    m_alerts.push_back(alert);
    Logger::getInstance().logAlert(severityName(alert.severity), subject_id, alert.message);
    
    return alert;
}

bool AlertEngine::resolveAlert(const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    
    auto it = std::find_if(m_alerts.begin(), m_alerts.end(),
                           [&alert_id](const Alert& alert) { return alert.id == alert_id; });
    if (it == m_alerts.end() || it->resolved) {
        return false;
    }
    
    auto now = m_clock.now();
    it->resolved = true;
    it->resolved_at = now;
    m_last_resolved[AlertKey{subjectKey(it->subject_id, it->subject_kind), it->type}] = now;
    
    Logger::getInstance().info("AlertEngine", "Resolved " + alert_id, it->message);
    return true;
}

std::vector<Alert> AlertEngine::getActiveAlerts(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    std::vector<Alert> active;
    for (const auto& alert : m_alerts) {
        if (!alert.resolved) {
            active.push_back(alert);
        }
    }
    
    if (limit > 0 && active.size() > limit) {
        active.erase(active.begin(), active.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return active;
}

std::vector<Alert> AlertEngine::getAllAlerts() const {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    return m_alerts;
}

std::optional<Alert> AlertEngine::getAlert(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    for (const auto& alert : m_alerts) {
        if (alert.id == alert_id) {
            return alert;
        }
    }
    return std::nullopt;
}

size_t AlertEngine::cleanupOldAlerts() {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    auto now = m_clock.now();
    auto cutoff = now - m_config.alert_retention;
    
    size_t before = m_alerts.size();
    m_alerts.erase(std::remove_if(m_alerts.begin(), m_alerts.end(),
                                  [&cutoff](const Alert& alert) { return alert.created_at < cutoff; }),
                   m_alerts.end());
    
    for (auto it = m_last_resolved.begin(); it != m_last_resolved.end();) {
        if (now - it->second >= m_thresholds.alert_cooldown) {
            it = m_last_resolved.erase(it);
        } else {
            ++it;
        }
    }
    
    size_t removed = before - m_alerts.size();
    if (removed > 0) {
        Logger::getInstance().info("AlertEngine", 
            "Removed " + std::to_string(removed) + " expired alerts");
    }
    return removed;
}

std::string AlertEngine::typeName(AlertType type) {
    switch (type) {
        case AlertType::HIGH_LATENCY: return "high_latency";
        case AlertType::HIGH_ERROR_RATE: return "high_error_rate";
        case AlertType::SERVICE_DOWN: return "service_down";
        case AlertType::LOW_QUALITY: return "low_quality";
        default: return "unknown";
    }
}

std::string AlertEngine::severityName(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::LOW: return "LOW";
        case AlertSeverity::MEDIUM: return "MEDIUM";
        case AlertSeverity::HIGH: return "HIGH";
        case AlertSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string AlertEngine::subjectKey(const std::string& subject_id, SubjectKind kind) {
    return MetricsStore::kindName(kind) + ":" + subject_id;
}

} // namespace Relay
