// =================================================================
// src/Relay/HealthTracker.cpp
// =================================================================
// Implementation of the provider health state machine.

#include "Relay/HealthTracker.hpp"
#include "Relay/Logger.hpp"

namespace Relay {

HealthTracker::HealthTracker(const HealthConfig& config, const Clock& clock)
    : m_config(config), m_clock(clock) {
}

void HealthTracker::registerProvider(const std::string& provider_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    statusFor(provider_id);
}

HealthState HealthTracker::recordSuccess(const std::string& provider_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    HealthStatus& status = statusFor(provider_id);
    
    auto now = m_clock.now();
    status.consecutive_failures = 0;
    status.last_activity = now;
    status.last_check = now;
    status.stale = false;
    transition(status, HealthState::HEALTHY);
    
    return status.state;
}

HealthState HealthTracker::recordFailure(const std::string& provider_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    HealthStatus& status = statusFor(provider_id);
    
    auto now = m_clock.now();
    status.consecutive_failures++;
    status.last_activity = now;
    status.last_check = now;
    status.stale = false;
    
    if (status.consecutive_failures >= m_config.unhealthy_after_failures) {
        transition(status, HealthState::UNHEALTHY);
    } else if (status.consecutive_failures >= m_config.degraded_after_failures) {
        transition(status, HealthState::DEGRADED);
    }
    
    return status.state;
}

HealthStatus HealthTracker::getStatus(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_statuses.find(provider_id);
    if (it != m_statuses.end()) {
        return it->second;
    }
    
    HealthStatus unknown;
    unknown.provider_id = provider_id;
    return unknown;
}

std::vector<HealthStatus> HealthTracker::getAllStatuses() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<HealthStatus> result;
    result.reserve(m_statuses.size());
    for (const auto& [id, status] : m_statuses) {
        result.push_back(status);
    }
    return result;
}

size_t HealthTracker::sweepStaleness() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = m_clock.now();
    size_t stale_count = 0;
    
    for (auto& [id, status] : m_statuses) {
        bool stale = (now - status.last_activity) > m_config.stale_after;
        if (stale && !status.stale) {
            Logger::getInstance().warning("HealthTracker", "Provider " + id + " has gone stale");
        }
        status.stale = stale;
        status.last_check = now;
        if (stale) {
            stale_count++;
        }
    }
    
    return stale_count;
}

std::string HealthTracker::stateName(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY: return "healthy";
        case HealthState::DEGRADED: return "degraded";
        case HealthState::UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

double HealthTracker::healthFactor(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY: return 1.0;
        case HealthState::DEGRADED: return 0.5;
        case HealthState::UNHEALTHY: return 0.1;
        default: return 0.1;
    }
}

HealthStatus& HealthTracker::statusFor(const std::string& provider_id) {
    auto it = m_statuses.find(provider_id);
    if (it != m_statuses.end()) {
        return it->second;
    }
    
    HealthStatus status;
    status.provider_id = provider_id;
    status.last_check = m_clock.now();
    status.last_activity = status.last_check;
    return m_statuses.emplace(provider_id, status).first->second;
}

void HealthTracker::transition(HealthStatus& status, HealthState next) {
    if (status.state == next) {
        return;
    }
    
    std::string message = "Provider " + status.provider_id + " " + stateName(status.state) +
                          " -> " + stateName(next);
    std::string context = "Consecutive failures: " + std::to_string(status.consecutive_failures);
    
    if (next == HealthState::HEALTHY) {
        Logger::getInstance().info("HealthTracker", message, context);
    } else {
        Logger::getInstance().warning("HealthTracker", message, context);
    }
    
    status.state = next;
}

} // namespace Relay
