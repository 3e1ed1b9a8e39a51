// =================================================================
// tests/TrendAnalyzerTest.cpp
// =================================================================
// Unit tests for system snapshots and trend classification.

#include "Relay/TrendAnalyzer.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <memory>

class TrendAnalyzerTest {
private:
    struct Fixture {
        Relay::ManualClock clock;
        Relay::MetricsStore metrics;
        Relay::HealthTracker health;
        Relay::RequestTracker tracker;
        Relay::TrendAnalyzer analyzer;
        
        Fixture(const Relay::MonitorConfig& config, const Relay::AdaptiveRoutingConfig& adaptive)
            : metrics(config, adaptive),
              health(Relay::HealthConfig(), clock),
              tracker(config, adaptive, metrics, health, clock),
              analyzer(config, adaptive, metrics, tracker, clock) {}
        
        void runRequests(const std::string& prefix, int count, std::chrono::milliseconds latency, int failures) {
            for (int i = 0; i < count; i++) {
                std::string id = prefix + std::to_string(i);
                tracker.trackRequestStart(id, "openai", "gpt-4", "svc");
                clock.advance(latency);
                tracker.trackRequestComplete(id, i >= failures);
            }
        }
    };
    
    Relay::MonitorConfig m_config;
    Relay::AdaptiveRoutingConfig m_adaptive;
    
public:
    TrendAnalyzerTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testTrendClassification() {
        std::cout << "Testing trend classification..." << std::endl;
        
        using Relay::TrendAnalyzer;
        using Relay::TrendDirection;
        
        auto slower = TrendAnalyzer::computeTrend("response_time", 1200.0, 1000.0, true, 0.05, 1.0);
        assert(slower.direction == TrendDirection::DECLINING && "Higher latency is declining");
        assert(std::abs(slower.change - 200.0) < 1e-9 && "Change should be current - previous");
        assert(std::abs(slower.change_percent - 20.0) < 1e-9 && "Change percent should be relative");
        
        auto faster = TrendAnalyzer::computeTrend("response_time", 800.0, 1000.0, true, 0.05, 1.0);
        assert(faster.direction == TrendDirection::IMPROVING && "Lower latency is improving");
        
        auto steady = TrendAnalyzer::computeTrend("response_time", 1020.0, 1000.0, true, 0.05, 1.0);
        assert(steady.direction == TrendDirection::STABLE && "Change within the threshold is stable");
        
        auto busier = TrendAnalyzer::computeTrend("throughput", 20.0, 10.0, false, 0.05, 1.0);
        assert(busier.direction == TrendDirection::IMPROVING && "More throughput is improving");
        
        auto from_zero = TrendAnalyzer::computeTrend("error_rate", 0.1, 0.0, true, 0.05, 1.0);
        assert(from_zero.direction == TrendDirection::DECLINING && "Errors appearing is declining");
        
        auto zeros = TrendAnalyzer::computeTrend("error_rate", 0.0, 0.0, true, 0.05, 1.0);
        assert(zeros.direction == TrendDirection::STABLE && "No change from zero is stable");
        
        assert(TrendAnalyzer::directionName(TrendDirection::DECLINING) == "declining" && "Direction name");
        
        std::cout << "✓ Trend classification test passed" << std::endl;
    }
    
    void testSnapshotCollection() {
        std::cout << "Testing snapshot collection..." << std::endl;
        
        auto f = std::make_unique<Fixture>(m_config, m_adaptive);
        assert(f->analyzer.analyze().empty() && "No trends without two snapshots");
        
        f->runRequests("first_", 10, std::chrono::milliseconds(500), 0);
        f->tracker.trackRequestStart("pending", "openai", "gpt-4", "svc");
        
        auto snapshot = f->analyzer.collectSnapshot();
        assert(snapshot.total_operations == 10 && "Snapshot should count operations");
        assert(std::abs(snapshot.average_response_time_ms - 500.0) < 1e-6 && "Mean latency");
        assert(snapshot.error_rate == 0.0 && "No failures yet");
        assert(snapshot.throughput_per_minute == 10.0 && "Completions in the last minute");
        assert(snapshot.in_flight == 1 && "Pending request should be in flight");
        assert(snapshot.average_quality < 0.0 && "No quality reported");
        assert(f->analyzer.analyze().empty() && "One snapshot is not enough");
        
        std::cout << "✓ Snapshot collection test passed" << std::endl;
    }
    
    void testDecliningTrend() {
        std::cout << "Testing declining trend detection..." << std::endl;
        
        auto f = std::make_unique<Fixture>(m_config, m_adaptive);
        f->runRequests("first_", 10, std::chrono::milliseconds(500), 0);
        f->analyzer.collectSnapshot();
        
        f->clock.advance(std::chrono::minutes(2));
        f->runRequests("second_", 10, std::chrono::milliseconds(1500), 3);
        auto snapshot = f->analyzer.collectSnapshot();
        assert(std::abs(snapshot.average_response_time_ms - 1000.0) < 1e-6 && "Mean over both batches");
        assert(std::abs(snapshot.error_rate - 0.15) < 1e-9 && "Failures over all operations");
        
        auto trends = f->analyzer.analyze();
        assert(trends.size() == 3 && "Quality trend needs reported quality");
        assert(trends[0].metric == "response_time" &&
               trends[0].direction == Relay::TrendDirection::DECLINING && "Slower responses are declining");
        assert(trends[1].metric == "error_rate" &&
               trends[1].direction == Relay::TrendDirection::DECLINING && "More errors are declining");
        assert(trends[2].metric == "throughput" &&
               trends[2].direction == Relay::TrendDirection::STABLE && "Same throughput is stable");
        assert(std::abs(trends[0].confidence - 0.2) < 1e-9 && "Confidence grows with operation count");
        
        assert(f->analyzer.getLatestTrends().size() == 3 && "Latest trends should be kept");
        
        std::cout << "✓ Declining trend test passed" << std::endl;
    }
    
    void testSnapshotBound() {
        std::cout << "Testing snapshot history bound..." << std::endl;
        
        Relay::MonitorConfig config = m_config;
        config.trend_history_size = 3;
        auto f = std::make_unique<Fixture>(config, m_adaptive);
        
        for (int i = 0; i < 5; i++) {
            f->clock.advance(std::chrono::seconds(10));
            f->analyzer.collectSnapshot();
        }
        assert(f->analyzer.getSnapshots().size() == 3 && "History should be bounded");
        
        std::cout << "✓ Snapshot bound test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running TrendAnalyzer unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;
        
        testTrendClassification();
        std::cout << std::endl;
        
        testSnapshotCollection();
        std::cout << std::endl;
        
        testDecliningTrend();
        std::cout << std::endl;
        
        testSnapshotBound();
        std::cout << std::endl;
        
        std::cout << "All TrendAnalyzer tests passed!" << std::endl;
    }
};

int main() {
    try {
        TrendAnalyzerTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All TrendAnalyzer component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
