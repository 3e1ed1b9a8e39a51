// =================================================================
// src/Relay/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Relay/CliParser.hpp"

namespace Relay {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Relay: performance-aware routing across LLM providers.");
    m_app->require_subcommand(1);
    
    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.")
        ->check(CLI::ExistingFile);
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print log messages to the console.");
    
    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupSimulateCommand(*m_app);
    setupRouteCommand(*m_app);
    setupExportCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addWorkloadOptions(CLI::App& sub) {
    sub.add_option("--seed", m_commands.seed, "Seed for synthetic latencies and outcomes (default: 42)");
    sub.add_option("-a,--algorithm", m_commands.algorithm,
                   "Balancing algorithm: round_robin, weighted, least_connections, performance_based");
}

void CliParser::addRequirementOptions(CLI::App& sub) {
    sub.add_option("--max-response-time", m_commands.max_response_time_ms, "Maximum acceptable latency in ms")
        ->check(CLI::PositiveNumber);
    sub.add_option("--min-quality", m_commands.min_quality, "Minimum quality score")
        ->check(CLI::Range(0.0, 1.0));
    sub.add_option("--min-reliability", m_commands.min_reliability, "Minimum success rate")
        ->check(CLI::Range(0.0, 1.0));
    sub.add_option("-p,--prefer", m_commands.preferred, "Preferred providers (repeatable)");
    sub.add_option("-u,--urgency", m_commands.urgency, "Request urgency: low, medium, high (default: medium)")
        ->check(CLI::IsMember({"low", "medium", "high"}));
    sub.add_option("--complexity", m_commands.complexity, "Request complexity in [0, 1]")
        ->check(CLI::Range(0.0, 1.0));
}

void CliParser::setupSimulateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("simulate", "Runs a synthetic workload and prints the dashboard.");
    sub->add_option("-n,--requests", m_commands.requests, "Number of synthetic requests (default: 200)");
    addWorkloadOptions(*sub);
    addRequirementOptions(*sub);
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Prints one routing decision, after an optional warm-up workload.");
    sub->add_option("-w,--warmup", m_commands.warmup, "Synthetic requests to run before routing (default: 0)");
    addWorkloadOptions(*sub);
    addRequirementOptions(*sub);
}

void CliParser::setupExportCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("export", "Runs a synthetic workload and writes a JSON snapshot.");
    sub->add_option("-n,--requests", m_commands.requests, "Number of synthetic requests (default: 200)");
    addWorkloadOptions(*sub);
    sub->add_option("-o,--output", m_commands.output_path, "Output file (default: stdout)");
    sub->add_option("--indent", m_commands.indent, "JSON indentation, -1 for compact output (default: 2)");
}

} // namespace Relay
