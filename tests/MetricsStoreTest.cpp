// =================================================================
// tests/MetricsStoreTest.cpp
// =================================================================
// Unit tests for the running statistics store.

#include "Relay/MetricsStore.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

} // namespace

class MetricsStoreTest {
private:
    Relay::MonitorConfig m_config;
    Relay::AdaptiveRoutingConfig m_adaptive;
    std::chrono::system_clock::time_point m_now = std::chrono::system_clock::now();
    
public:
    MetricsStoreTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testRunningStatistics() {
        std::cout << "Testing running statistics..." << std::endl;
        
        Relay::MetricsStore store(m_config, m_adaptive);
        store.record(Relay::SubjectKind::SERVICE, "analysis", 100.0, true, m_now);
        store.record(Relay::SubjectKind::SERVICE, "analysis", 200.0, false, m_now);
        auto stats = store.record(Relay::SubjectKind::SERVICE, "analysis", 300.0, true, m_now);
        
        assert(stats.total_operations == 3 && "Should count three operations");
        assert(stats.successful_operations == 2 && "Should count two successes");
        assert(stats.failed_operations == 1 && "Should count one failure");
        assert(stats.total_operations == stats.successful_operations + stats.failed_operations &&
               "Total should equal successes plus failures");
        assert(near(stats.average_duration_ms, 200.0) && "Mean should be exact");
        assert(near(stats.min_duration_ms, 100.0) && "Min should be tracked");
        assert(near(stats.max_duration_ms, 300.0) && "Max should be tracked");
        assert(near(stats.error_rate, 1.0 / 3.0) && "Error rate should be failed / total");
        assert(near(stats.successRate(), 2.0 / 3.0) && "Success rate should complement error rate");
        assert(stats.kind == Relay::SubjectKind::SERVICE && "Kind should be recorded");
        
        std::cout << "✓ Running statistics test passed" << std::endl;
    }
    
    void testKindsAreSeparate() {
        std::cout << "Testing provider and service separation..." << std::endl;
        
        Relay::MetricsStore store(m_config, m_adaptive);
        store.record(Relay::SubjectKind::PROVIDER, "openai", 1000.0, true, m_now);
        store.record(Relay::SubjectKind::SERVICE, "openai", 50.0, false, m_now);
        
        auto provider = store.getStats(Relay::SubjectKind::PROVIDER, "openai");
        auto service = store.getStats(Relay::SubjectKind::SERVICE, "openai");
        assert(provider.has_value() && service.has_value() && "Both kinds should be tracked");
        assert(near(provider->average_duration_ms, 1000.0) && "Provider stats should be independent");
        assert(near(service->error_rate, 1.0) && "Service stats should be independent");
        
        assert(!store.getStats(Relay::SubjectKind::PROVIDER, "unknown").has_value() &&
               "Unknown subject should have no stats");
        assert(store.getAllStats(Relay::SubjectKind::PROVIDER).size() == 1 && "One provider tracked");
        
        std::cout << "✓ Kind separation test passed" << std::endl;
    }
    
    void testQualitySmoothing() {
        std::cout << "Testing quality smoothing..." << std::endl;
        
        Relay::MetricsStore store(m_config, m_adaptive);
        store.record(Relay::SubjectKind::PROVIDER, "anthropic", 500.0, true, m_now);
        assert(!store.getStats(Relay::SubjectKind::PROVIDER, "anthropic")->hasQuality() &&
               "Quality should be absent until reported");
        
        store.recordQuality(Relay::SubjectKind::PROVIDER, "anthropic", 0.8);
        assert(near(store.getStats(Relay::SubjectKind::PROVIDER, "anthropic")->quality_score, 0.8) &&
               "First report should be taken as is");
        
        store.recordQuality(Relay::SubjectKind::PROVIDER, "anthropic", 0.4);
        assert(near(store.getStats(Relay::SubjectKind::PROVIDER, "anthropic")->quality_score, 0.76) &&
               "Later reports should move by the learning rate");
        
        Relay::AdaptiveRoutingConfig fixed;
        fixed.enabled = false;
        Relay::MetricsStore plain(m_config, fixed);
        plain.recordQuality(Relay::SubjectKind::PROVIDER, "google", 0.8);
        plain.recordQuality(Relay::SubjectKind::PROVIDER, "google", 0.4);
        assert(near(plain.getStats(Relay::SubjectKind::PROVIDER, "google")->quality_score, 0.4) &&
               "Without adaptive routing the latest report wins");
        
        std::cout << "✓ Quality smoothing test passed" << std::endl;
    }
    
    void testTotals() {
        std::cout << "Testing aggregated totals..." << std::endl;
        
        Relay::MetricsStore store(m_config, m_adaptive);
        store.record(Relay::SubjectKind::PROVIDER, "openai", 100.0, true, m_now);
        store.record(Relay::SubjectKind::PROVIDER, "openai", 300.0, false, m_now);
        store.record(Relay::SubjectKind::PROVIDER, "google", 800.0, true, m_now);
        store.record(Relay::SubjectKind::SERVICE, "analysis", 10.0, true, m_now);
        
        auto totals = store.computeTotals(Relay::SubjectKind::PROVIDER);
        assert(totals.total_operations == 3 && "Totals should sum provider operations");
        assert(totals.failed_operations == 1 && "Totals should sum failures");
        assert(totals.subject_count == 2 && "Two providers should be counted");
        assert(near(totals.average_duration_ms, 400.0) && "Mean should be weighted by operation count");
        assert(near(totals.error_rate, 1.0 / 3.0) && "Error rate should use summed counts");
        
        auto empty = Relay::MetricsStore(m_config, m_adaptive).computeTotals(Relay::SubjectKind::SERVICE);
        assert(empty.total_operations == 0 && near(empty.error_rate, 0.0) && "Empty totals should be zero");
        
        std::cout << "✓ Totals test passed" << std::endl;
    }
    
    void testConcurrentUpdates() {
        std::cout << "Testing concurrent updates..." << std::endl;
        
        Relay::MetricsStore store(m_config, m_adaptive);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; t++) {
            threads.emplace_back([&store, t, this]() {
                for (int i = 0; i < 1000; i++) {
                    store.record(Relay::SubjectKind::PROVIDER, "shared", 10.0, (i + t) % 4 != 0, m_now);
                    store.record(Relay::SubjectKind::PROVIDER, "own_" + std::to_string(t), 5.0, true, m_now);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        
        auto shared = store.getStats(Relay::SubjectKind::PROVIDER, "shared");
        assert(shared->total_operations == 8000 && "No update should be lost");
        assert(shared->failed_operations == 2000 && "Failures should be counted exactly");
        assert(near(shared->average_duration_ms, 10.0) && "Mean should be exact");
        assert(store.getAllStats(Relay::SubjectKind::PROVIDER).size() == 9 && "Nine providers tracked");
        
        std::cout << "✓ Concurrent updates test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running MetricsStore unit tests..." << std::endl;
        std::cout << "===================================" << std::endl << std::endl;
        
        testRunningStatistics();
        std::cout << std::endl;
        
        testKindsAreSeparate();
        std::cout << std::endl;
        
        testQualitySmoothing();
        std::cout << std::endl;
        
        testTotals();
        std::cout << std::endl;
        
        testConcurrentUpdates();
        std::cout << std::endl;
        
        std::cout << "All MetricsStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        MetricsStoreTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All MetricsStore component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
