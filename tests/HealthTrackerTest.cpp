// =================================================================
// tests/HealthTrackerTest.cpp
// =================================================================
// Unit tests for the provider health state machine.

#include "Relay/HealthTracker.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>

class HealthTrackerTest {
private:
    Relay::HealthConfig m_config;
    Relay::ManualClock m_clock;
    
public:
    HealthTrackerTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testFailureEscalation() {
        std::cout << "Testing failure escalation..." << std::endl;
        
        Relay::HealthTracker tracker(m_config, m_clock);
        tracker.registerProvider("openai");
        assert(tracker.getStatus("openai").state == Relay::HealthState::HEALTHY &&
               "Registered provider should start healthy");
        
        assert(tracker.recordFailure("openai") == Relay::HealthState::HEALTHY && "One failure keeps healthy");
        assert(tracker.recordFailure("openai") == Relay::HealthState::HEALTHY && "Two failures keep healthy");
        assert(tracker.recordFailure("openai") == Relay::HealthState::DEGRADED &&
               "Three consecutive failures should degrade");
        
        for (int i = 0; i < 2; i++) {
            tracker.recordFailure("openai");
        }
        assert(tracker.getStatus("openai").state == Relay::HealthState::DEGRADED && "Five failures stay degraded");
        assert(tracker.recordFailure("openai") == Relay::HealthState::UNHEALTHY &&
               "Six consecutive failures should make the provider unhealthy");
        assert(tracker.getStatus("openai").consecutive_failures == 6 && "Failures should be counted");
        
        std::cout << "✓ Failure escalation test passed" << std::endl;
    }
    
    void testRecovery() {
        std::cout << "Testing recovery on success..." << std::endl;
        
        Relay::HealthTracker tracker(m_config, m_clock);
        for (int i = 0; i < 7; i++) {
            tracker.recordFailure("google");
        }
        assert(tracker.getStatus("google").state == Relay::HealthState::UNHEALTHY && "Should be unhealthy");
        
        assert(tracker.recordSuccess("google") == Relay::HealthState::HEALTHY &&
               "A success should restore health");
        assert(tracker.getStatus("google").consecutive_failures == 0 && "A success should reset the counter");
        
        // Interleaved successes never escalate
        for (int i = 0; i < 10; i++) {
            tracker.recordFailure("google");
            tracker.recordFailure("google");
            tracker.recordSuccess("google");
        }
        assert(tracker.getStatus("google").state == Relay::HealthState::HEALTHY &&
               "Non-consecutive failures should not degrade");
        
        std::cout << "✓ Recovery test passed" << std::endl;
    }
    
    void testUnknownProvider() {
        std::cout << "Testing unknown provider status..." << std::endl;
        
        Relay::HealthTracker tracker(m_config, m_clock);
        auto status = tracker.getStatus("nobody");
        assert(status.provider_id == "nobody" && "Unknown status should carry the requested id");
        assert(status.state == Relay::HealthState::HEALTHY && "Unknown provider should be reported healthy");
        assert(tracker.getAllStatuses().empty() && "Queries should not register providers");
        
        std::cout << "✓ Unknown provider test passed" << std::endl;
    }
    
    void testStaleness() {
        std::cout << "Testing staleness sweep..." << std::endl;
        
        Relay::HealthTracker tracker(m_config, m_clock);
        tracker.registerProvider("local");
        tracker.registerProvider("anthropic");
        
        assert(tracker.sweepStaleness() == 0 && "Fresh providers should not be stale");
        
        m_clock.advance(std::chrono::seconds(200));
        tracker.recordSuccess("anthropic");
        m_clock.advance(std::chrono::seconds(150));
        
        assert(tracker.sweepStaleness() == 1 && "Only the idle provider should be stale");
        assert(tracker.getStatus("local").stale && "Idle provider should be flagged");
        assert(!tracker.getStatus("anthropic").stale && "Active provider should not be flagged");
        assert(tracker.getStatus("local").state == Relay::HealthState::HEALTHY &&
               "Staleness should not change the health state");
        
        tracker.recordSuccess("local");
        assert(!tracker.getStatus("local").stale && "Activity should clear the stale flag");
        
        std::cout << "✓ Staleness test passed" << std::endl;
    }
    
    void testHealthFactors() {
        std::cout << "Testing health factors..." << std::endl;
        
        assert(Relay::HealthTracker::healthFactor(Relay::HealthState::HEALTHY) == 1.0 && "Healthy factor");
        assert(Relay::HealthTracker::healthFactor(Relay::HealthState::DEGRADED) == 0.5 && "Degraded factor");
        assert(Relay::HealthTracker::healthFactor(Relay::HealthState::UNHEALTHY) == 0.1 && "Unhealthy factor");
        assert(Relay::HealthTracker::stateName(Relay::HealthState::DEGRADED) == "degraded" && "State name");
        
        std::cout << "✓ Health factors test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running HealthTracker unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;
        
        testFailureEscalation();
        std::cout << std::endl;
        
        testRecovery();
        std::cout << std::endl;
        
        testUnknownProvider();
        std::cout << std::endl;
        
        testStaleness();
        std::cout << std::endl;
        
        testHealthFactors();
        std::cout << std::endl;
        
        std::cout << "All HealthTracker tests passed!" << std::endl;
    }
};

int main() {
    try {
        HealthTrackerTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All HealthTracker component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
