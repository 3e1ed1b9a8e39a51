// =================================================================
// tests/SnapshotExporterTest.cpp
// =================================================================
// Unit tests for JSON snapshot export.

#include "Relay/SnapshotExporter.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>

class SnapshotExporterTest {
public:
    SnapshotExporterTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testStatsJson() {
        std::cout << "Testing statistics serialization..." << std::endl;
        
        Relay::OperationStats stats;
        stats.subject_id = "openai";
        stats.kind = Relay::SubjectKind::PROVIDER;
        stats.total_operations = 4;
        stats.successful_operations = 3;
        stats.failed_operations = 1;
        stats.average_duration_ms = 1250.0;
        stats.error_rate = 0.25;
        
        auto json = Relay::SnapshotExporter::toJson(stats);
        assert(json["id"] == "openai");
        assert(json["kind"] == "provider");
        assert(json["total_operations"] == 4);
        assert(json["error_rate"].get<double>() == 0.25);
        assert(json["quality_score"].is_null() && "Unreported quality should be null");
        
        stats.quality_score = 0.8;
        json = Relay::SnapshotExporter::toJson(stats);
        assert(json["quality_score"].get<double>() == 0.8);
        
        std::cout << "✓ Statistics serialization test passed" << std::endl;
    }
    
    void testAlertJson() {
        std::cout << "Testing alert serialization..." << std::endl;
        
        Relay::Alert alert;
        alert.id = "alert_1";
        alert.subject_id = "anthropic";
        alert.subject_kind = Relay::SubjectKind::PROVIDER;
        alert.type = Relay::AlertType::HIGH_ERROR_RATE;
        alert.severity = Relay::AlertSeverity::CRITICAL;
        alert.threshold = 0.15;
        alert.current_value = 0.4;
        alert.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(5000));
        
        auto json = Relay::SnapshotExporter::toJson(alert);
        assert(json["type"] == "high_error_rate");
        assert(json["severity"] == "CRITICAL");
        assert(json["created_ms"] == 5000);
        assert(json["resolved"] == false);
        assert(!json.contains("resolved_ms") && "Open alert has no resolution time");
        
        alert.resolved = true;
        alert.resolved_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(9000));
        json = Relay::SnapshotExporter::toJson(alert);
        assert(json["resolved_ms"] == 9000);
        
        std::cout << "✓ Alert serialization test passed" << std::endl;
    }
    
    void testSnapshot() {
        std::cout << "Testing snapshot assembly..." << std::endl;
        
        Relay::Dashboard dashboard;
        dashboard.in_flight = 2;
        Relay::OperationStats provider;
        provider.subject_id = "google";
        provider.kind = Relay::SubjectKind::PROVIDER;
        dashboard.providers.push_back(provider);
        
        Relay::Alert alert;
        alert.id = "alert_7";
        
        Relay::RoutingDecision decision;
        decision.request_id = "req_1";
        decision.selected_provider = "google";
        decision.alternatives.push_back({"openai", 0.7, "lower score"});
        
        auto snapshot = Relay::SnapshotExporter::buildSnapshot(dashboard, {alert}, {decision}, "weighted");
        
        assert(snapshot["version"] == 1);
        assert(snapshot["algorithm"] == "weighted");
        assert(snapshot["dashboard"]["in_flight"] == 2);
        assert(snapshot["dashboard"]["providers"].size() == 1);
        assert(snapshot["dashboard"]["services"].empty());
        assert(snapshot["alerts"].size() == 1);
        assert(snapshot["alerts"][0]["id"] == "alert_7");
        assert(snapshot["decisions"][0]["provider"] == "google");
        assert(snapshot["decisions"][0]["alternatives"][0]["provider"] == "openai");
        
        std::cout << "✓ Snapshot assembly test passed" << std::endl;
    }
    
    void testWriteToFile() {
        std::cout << "Testing snapshot file output..." << std::endl;
        
        const std::string path = "relay_snapshot_test.json";
        nlohmann::json document = {{"version", 1}, {"algorithm", "round_robin"}};
        
        Relay::SnapshotExporter::writeToFile(document, path);
        
        std::ifstream file(path);
        assert(file.is_open() && "Snapshot file should exist");
        nlohmann::json loaded = nlohmann::json::parse(file);
        file.close();
        std::remove(path.c_str());
        
        assert(loaded == document && "Written document should parse back unchanged");
        
        bool rejected = false;
        try {
            Relay::SnapshotExporter::writeToFile(document, "missing_directory/nested/snapshot.json");
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        assert(rejected && "Unwritable path should raise an error");
        
        std::cout << "✓ Snapshot file output test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running SnapshotExporter unit tests..." << std::endl;
        std::cout << "======================================" << std::endl << std::endl;
        
        testStatsJson();
        std::cout << std::endl;
        
        testAlertJson();
        std::cout << std::endl;
        
        testSnapshot();
        std::cout << std::endl;
        
        testWriteToFile();
        std::cout << std::endl;
        
        std::cout << "All SnapshotExporter tests passed!" << std::endl;
    }
};

int main() {
    try {
        SnapshotExporterTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All SnapshotExporter component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
