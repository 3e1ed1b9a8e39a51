// =================================================================
// tests/PerformanceMonitorTest.cpp
// =================================================================
// Integration tests for the monitoring and routing composition root.

#include "Relay/PerformanceMonitor.hpp"
#include "Relay/ConfigLoader.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <memory>

class PerformanceMonitorTest {
public:
    PerformanceMonitorTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    struct Fixture {
        std::shared_ptr<Relay::ManualClock> clock = std::make_shared<Relay::ManualClock>();
        Relay::PerformanceMonitor monitor{Relay::ConfigLoader::defaults(), clock};
        
        void completeRequest(const std::string& request_id, const std::string& provider,
                             std::chrono::milliseconds latency, bool success) {
            monitor.trackRequestStart(request_id, provider, "default", "unified-message-analysis");
            clock->advance(latency);
            monitor.trackRequestComplete(request_id, success,
                success ? std::nullopt : std::optional<std::string>("timeout"), 0.9);
        }
    };
    
    void testRequestFlow() {
        std::cout << "Testing request flow into the dashboard..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        Relay::RequestContext context;
        context.request_id = "req_1";
        context.complexity = 0.65;
        auto decision = monitor.selectProvider(context);
        
        assert(!decision.selected_provider.empty() && "A provider should be selected");
        assert(decision.selected_service == "smart-context-manager" && "Service follows complexity");
        
        monitor.trackRequestStart("req_1", decision.selected_provider,
                                  decision.selected_model, decision.selected_service);
        assert(monitor.getDashboard().in_flight == 1 && "Request should be in flight");
        
        std::string handle = monitor.startOperation(decision.selected_service, "process");
        fixture.clock->advance(std::chrono::milliseconds(200));
        monitor.endOperation(handle, decision.selected_service, "process", true);
        
        fixture.clock->advance(std::chrono::milliseconds(1000));
        monitor.trackRequestComplete("req_1", true, std::nullopt, 0.9);
        
        auto dashboard = monitor.getDashboard();
        assert(dashboard.in_flight == 0 && "Request should be complete");
        assert(dashboard.providers_overall.total_operations == 1);
        assert(dashboard.services_overall.total_operations == 1);
        assert(dashboard.overall.total_operations == 2 && "Overall combines both kinds");
        assert(dashboard.recent_history.size() == 2);
        assert(dashboard.health.size() == 4 && "Every configured provider is tracked");
        assert(dashboard.monitoring_enabled);
        
        auto provider_stats = monitor.getProviderStats(decision.selected_provider);
        assert(provider_stats && provider_stats->average_duration_ms == 1200.0);
        auto service_stats = monitor.getServiceStats(decision.selected_service);
        assert(service_stats && service_stats->average_duration_ms == 200.0);
        assert(!monitor.getProviderStats("unknown") && "Unknown provider has no stats");
        
        auto range = monitor.getMetricsForTimeRange(decision.selected_provider);
        assert(range.size() == 1 && "Range filter should match the provider record");
        
        std::cout << "✓ Request flow test passed" << std::endl;
    }
    
    void testAlertCheck() {
        std::cout << "Testing alert checks..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        fixture.completeRequest("slow_1", "openai", std::chrono::milliseconds(4000), true);
        fixture.completeRequest("slow_2", "openai", std::chrono::milliseconds(4000), true);
        
        auto raised = monitor.checkAlerts();
        assert(raised.size() == 1 && "One latency alert should be raised");
        assert(raised[0].type == Relay::AlertType::HIGH_LATENCY);
        assert(raised[0].severity == Relay::AlertSeverity::HIGH);
        assert(raised[0].subject_id == "openai");
        
        assert(monitor.checkAlerts().empty() && "Active alert should not repeat");
        assert(monitor.getDashboard().active_alerts.size() == 1);
        
        assert(monitor.resolveAlert(raised[0].id) && "Alert should resolve");
        assert(monitor.getDashboard().active_alerts.empty());
        
        std::cout << "✓ Alert check test passed" << std::endl;
    }
    
    void testCleanup() {
        std::cout << "Testing periodic cleanup..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        monitor.trackRequestStart("leaked", "anthropic", "claude-3-opus", "unified-message-analysis");
        assert(monitor.runCleanup() == 0 && "Fresh request should not be removed");
        
        fixture.clock->advance(std::chrono::seconds(601));
        assert(monitor.runCleanup() == 1 && "Leaked request should be removed");
        assert(monitor.getDashboard().in_flight == 0);
        
        std::cout << "✓ Cleanup test passed" << std::endl;
    }
    
    void testSnapshotExport() {
        std::cout << "Testing snapshot export..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        Relay::RequestContext context;
        context.request_id = "req_export";
        monitor.selectProvider(context);
        fixture.completeRequest("req_export", "google", std::chrono::milliseconds(800), false);
        
        auto snapshot = nlohmann::json::parse(monitor.exportSnapshotString());
        assert(snapshot["algorithm"] == "performance_based");
        assert(snapshot["decisions"].size() == 1);
        assert(snapshot["decisions"][0]["request_id"] == "req_export");
        assert(snapshot["dashboard"]["providers_overall"]["failed_operations"] == 1);
        
        std::string compact = monitor.exportSnapshotString(-1);
        assert(compact.find('\n') == std::string::npos && "Compact output has no newlines");
        
        std::cout << "✓ Snapshot export test passed" << std::endl;
    }
    
    void testProviderRegistration() {
        std::cout << "Testing runtime provider registration..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        Relay::ProviderConfig extra;
        extra.name = "mistral-cloud";
        extra.models = {"mistral-large"};
        
        assert(monitor.registerProvider(extra) && "New provider should register");
        assert(!monitor.registerProvider(extra) && "Duplicate provider should be rejected");
        assert(monitor.getHealthTracker().getAllStatuses().size() == 5);
        
        Relay::RequestContext context;
        context.request_id = "req_pref";
        Relay::RoutingRequirements requirements;
        requirements.preferred_providers = {"mistral-cloud"};
        auto decision = monitor.selectProvider(context, requirements);
        assert(decision.alternatives.size() == 3 && "Up to three alternatives are listed");
        
        std::cout << "✓ Provider registration test passed" << std::endl;
    }
    
    void testDisabledMonitoring() {
        std::cout << "Testing disabled monitoring..." << std::endl;
        
        Fixture fixture;
        auto& monitor = fixture.monitor;
        
        monitor.setEnabled(false);
        fixture.completeRequest("ignored", "openai", std::chrono::milliseconds(500), true);
        
        auto dashboard = monitor.getDashboard();
        assert(!dashboard.monitoring_enabled);
        assert(dashboard.providers_overall.total_operations == 0 && "Nothing should be recorded");
        
        monitor.setEnabled(true);
        fixture.completeRequest("counted", "openai", std::chrono::milliseconds(500), true);
        assert(monitor.getDashboard().providers_overall.total_operations == 1);
        
        std::cout << "✓ Disabled monitoring test passed" << std::endl;
    }
    
    void testPeriodicTasks() {
        std::cout << "Testing periodic task registration..." << std::endl;
        
        Fixture fixture;
        auto& scheduler = fixture.monitor.getScheduler();
        
        assert(scheduler.getTasks().size() == 6 && "Six periodic passes should be registered");
        
        fixture.clock->advance(std::chrono::seconds(10));
        assert(scheduler.runDueTasks() == 2 && "Collection and log flush are due");
        
        fixture.clock->advance(std::chrono::seconds(20));
        assert(scheduler.runDueTasks() == 4 && "Collection, alert check, health sweep and log flush are due");
        
        fixture.monitor.start();
        assert(scheduler.isRunning());
        fixture.monitor.stop();
        assert(!scheduler.isRunning());
        assert(scheduler.getTasks().empty() && "Stop cancels the periodic passes");
        
        std::cout << "✓ Periodic task test passed" << std::endl;
    }
    
    void testRequestPathLogging() {
        std::cout << "Testing that request handling leaves the disk alone..." << std::endl;
        
        namespace fs = std::filesystem;
        const std::string log_dir = "relay_request_path_logs";
        fs::remove_all(log_dir);
        
        Relay::LogSettings settings;
        settings.log_dir = log_dir;
        settings.console_enabled = false;
        settings.file_level = Relay::LogLevel::DEBUG;
        Relay::Logger::getInstance().configure(settings);
        
        {
            Fixture fixture;
            auto& monitor = fixture.monitor;
            
            Relay::RequestContext context;
            context.request_id = "req_quiet";
            auto decision = monitor.selectProvider(context);
            fixture.completeRequest("req_quiet", decision.selected_provider, std::chrono::milliseconds(300), true);
            fixture.completeRequest("req_failed", decision.selected_provider, std::chrono::milliseconds(300), false);
            std::string handle = monitor.startOperation("unified-message-analysis", "process");
            monitor.endOperation(handle, "unified-message-analysis", "process", false, std::string("boom"));
            
            assert(!fs::exists(log_dir) && "Request handling should not create log files");
            assert(Relay::Logger::getInstance().pendingLines() > 0 && "Lines should wait in memory");
            
            fixture.clock->advance(std::chrono::seconds(1));
            fixture.monitor.getScheduler().runDueTasks();
            assert(fs::exists(log_dir) && "The scheduled flush should write the log file");
            assert(Relay::Logger::getInstance().pendingLines() == 0);
        }
        
        Relay::LogSettings quiet;
        quiet.console_enabled = false;
        Relay::Logger::getInstance().configure(quiet);
        fs::remove_all(log_dir);
        
        std::cout << "✓ Request path logging test passed" << std::endl;
    }
    
    void testInvalidConfig() {
        std::cout << "Testing invalid configuration..." << std::endl;
        
        Relay::RoutingConfig config = Relay::ConfigLoader::defaults();
        config.monitor.cleanup_interval = std::chrono::seconds(0);
        
        bool rejected = false;
        try {
            Relay::PerformanceMonitor monitor(config, std::make_shared<Relay::ManualClock>());
        } catch (const Relay::ConfigError&) {
            rejected = true;
        }
        assert(rejected && "Zero interval should raise ConfigError");
        
        std::cout << "✓ Invalid configuration test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running PerformanceMonitor integration tests..." << std::endl;
        std::cout << "===============================================" << std::endl << std::endl;
        
        testRequestFlow();
        std::cout << std::endl;
        
        testAlertCheck();
        std::cout << std::endl;
        
        testCleanup();
        std::cout << std::endl;
        
        testSnapshotExport();
        std::cout << std::endl;
        
        testProviderRegistration();
        std::cout << std::endl;
        
        testDisabledMonitoring();
        std::cout << std::endl;
        
        testPeriodicTasks();
        std::cout << std::endl;
        
        testRequestPathLogging();
        std::cout << std::endl;
        
        testInvalidConfig();
        std::cout << std::endl;
        
        std::cout << "All PerformanceMonitor tests passed!" << std::endl;
    }
};

int main() {
    try {
        PerformanceMonitorTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All PerformanceMonitor component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
