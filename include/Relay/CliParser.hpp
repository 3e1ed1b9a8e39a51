// =================================================================
// include/Relay/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Relay {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path;    // YAML configuration (built-in defaults when empty)
    bool verbose = false;       // Echo log lines to the console

    // Workload options
    size_t requests = 200;      // Synthetic requests for 'simulate' and 'export'
    size_t warmup = 0;          // Synthetic requests before the 'route' decision
    uint64_t seed = 42;         // Seed for synthetic latencies and outcomes
    std::string algorithm;      // Overrides load_balancing.algorithm when set

    // Routing requirements (negative means unset)
    double max_response_time_ms = -1.0;
    double min_quality = -1.0;
    double min_reliability = -1.0;
    std::vector<std::string> preferred;
    std::string urgency = "medium";
    double complexity = -1.0;

    // Options for 'export'
    std::string output_path;    // Writes to stdout when empty
    int indent = 2;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupSimulateCommand(CLI::App& app);
    void setupRouteCommand(CLI::App& app);
    void setupExportCommand(CLI::App& app);
    void addWorkloadOptions(CLI::App& sub);
    void addRequirementOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Relay
