// =================================================================
// include/Relay/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Relay/CliParser.hpp"
#include "Relay/RoutingConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Relay {
    class ManualClock;
    class PerformanceMonitor;
    class RandomSource;
    struct Dashboard;
    struct RoutingDecision;
    struct RoutingRequirements;
}

namespace Relay {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @throws ConfigError if the configuration file is invalid
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleSimulate();
    int handleRoute();
    int handleExport();

    /**
     * @brief Drive synthetic requests through routing and tracking
     * @param count Number of requests
     */
    void runWorkload(size_t count);

    RoutingRequirements buildRequirements() const;
    void printDashboard(const Dashboard& dashboard) const;
    void printDecision(const RoutingDecision& decision) const;

    const Commands& m_commands;
    RoutingConfig m_config;
    std::shared_ptr<ManualClock> m_clock;
    std::unique_ptr<RandomSource> m_workload_random;
    std::unique_ptr<PerformanceMonitor> m_monitor;
    size_t m_request_counter = 0;
};

} // namespace Relay
