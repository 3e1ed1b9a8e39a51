// =================================================================
// include/Relay/HealthTracker.hpp
// =================================================================
// Consecutive-failure health state machine per provider.

#pragma once

#include "Relay/Clock.hpp"
#include "Relay/RoutingConfig.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Relay {

/**
 * @brief Provider health state
 */
enum class HealthState {
    HEALTHY,    ///< Serving normally
    DEGRADED,   ///< Several consecutive failures
    UNHEALTHY   ///< Failing persistently
};

/**
 * @brief Health record for one provider
 */
struct HealthStatus {
    std::string provider_id;                     ///< Provider identifier
    HealthState state = HealthState::HEALTHY;    ///< Current state
    size_t consecutive_failures = 0;             ///< Failures since the last success
    std::chrono::system_clock::time_point last_check;    ///< Last state evaluation
    std::chrono::system_clock::time_point last_activity; ///< Last success or failure
    bool stale = false;                          ///< No activity within the stale window
};

/**
 * @brief Tracks provider health from request outcomes
 *
 * degraded_after_failures consecutive failures move a healthy provider to
 * DEGRADED and unhealthy_after_failures move it to UNHEALTHY. Any success
 * resets it to HEALTHY. Staleness is evaluated separately by
 * sweepStaleness() and never touches the failure counter.
 */
class HealthTracker {
public:
    /**
     * @brief Constructor
     * @param config Health configuration
     * @param clock Time source
     */
    HealthTracker(const HealthConfig& config, const Clock& clock);
    
    virtual ~HealthTracker() = default;

    /**
     * @brief Register a provider as healthy if unknown
     * @param provider_id Provider identifier
     */
    virtual void registerProvider(const std::string& provider_id);

    /**
     * @brief Record a successful request
     * @param provider_id Provider identifier
     * @return State after the event
     */
    virtual HealthState recordSuccess(const std::string& provider_id);

    /**
     * @brief Record a failed request
     * @param provider_id Provider identifier
     * @return State after the event
     */
    virtual HealthState recordFailure(const std::string& provider_id);

    /**
     * @brief Status of one provider (a fresh healthy status when unknown)
     */
    virtual HealthStatus getStatus(const std::string& provider_id) const;

    /**
     * @brief Status of every known provider, ordered by id
     */
    virtual std::vector<HealthStatus> getAllStatuses() const;

    /**
     * @brief Recompute the stale flag of every provider
     * @return Number of providers currently stale
     */
    virtual size_t sweepStaleness();

    /**
     * @brief Readable state name
     */
    static std::string stateName(HealthState state);

    /**
     * @brief Routing health factor: 1.0 healthy, 0.5 degraded, 0.1 unhealthy
     */
    static double healthFactor(HealthState state);

private:
    HealthStatus& statusFor(const std::string& provider_id);
    void transition(HealthStatus& status, HealthState next);

    HealthConfig m_config;
    const Clock& m_clock;
    std::map<std::string, HealthStatus> m_statuses;
    mutable std::mutex m_mutex;
};

} // namespace Relay
