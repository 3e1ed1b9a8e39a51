// =================================================================
// tests/SchedulerTest.cpp
// =================================================================
// Unit tests for the periodic task scheduler.

#include "Relay/Scheduler.hpp"
#include "Relay/Logger.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <stdexcept>
#include <thread>

class SchedulerTest {
public:
    SchedulerTest() {
        Relay::Logger::getInstance().setConsoleLogging(false);
    }
    
    void testTaskValidation() {
        std::cout << "Testing task validation..." << std::endl;
        
        Relay::ManualClock clock;
        Relay::Scheduler scheduler(clock);
        
        bool rejected_interval = false;
        try {
            scheduler.addTask("zero", std::chrono::milliseconds(0), []() {});
        } catch (const std::invalid_argument&) {
            rejected_interval = true;
        }
        assert(rejected_interval && "Non-positive interval should be rejected");
        
        scheduler.addTask("collect", std::chrono::milliseconds(1000), []() {});
        bool rejected_duplicate = false;
        try {
            scheduler.addTask("collect", std::chrono::milliseconds(500), []() {});
        } catch (const std::invalid_argument&) {
            rejected_duplicate = true;
        }
        assert(rejected_duplicate && "Duplicate task name should be rejected");
        assert(scheduler.getTasks().size() == 1 && "Only one task should be scheduled");
        
        std::cout << "✓ Task validation test passed" << std::endl;
    }
    
    void testDueTasks() {
        std::cout << "Testing due task execution..." << std::endl;
        
        Relay::ManualClock clock;
        Relay::Scheduler scheduler(clock);
        
        int fast_runs = 0;
        int slow_runs = 0;
        scheduler.addTask("fast", std::chrono::milliseconds(1000), [&fast_runs]() { fast_runs++; });
        scheduler.addTask("slow", std::chrono::milliseconds(5000), [&slow_runs]() { slow_runs++; });
        
        assert(scheduler.runDueTasks() == 0 && "Tasks first run one interval after being added");
        
        clock.advance(std::chrono::milliseconds(1000));
        assert(scheduler.runDueTasks() == 1 && "Fast task should be due");
        assert(scheduler.runDueTasks() == 0 && "Task should be rescheduled after running");
        
        clock.advance(std::chrono::milliseconds(4000));
        assert(scheduler.runDueTasks() == 2 && "Both tasks should be due");
        assert(fast_runs == 2 && slow_runs == 1 && "Run counts should match");
        
        for (const auto& info : scheduler.getTasks()) {
            if (info.name == "fast") {
                assert(info.run_count == 2 && "Task info should report runs");
            }
        }
        
        assert(scheduler.cancelTask("slow") && "Cancelling a task should succeed");
        assert(!scheduler.cancelTask("slow") && "Cancelling twice should fail");
        clock.advance(std::chrono::milliseconds(5000));
        scheduler.runDueTasks();
        assert(slow_runs == 1 && "Cancelled task should not run");
        
        std::cout << "✓ Due task test passed" << std::endl;
    }
    
    void testFailingTask() {
        std::cout << "Testing failing task isolation..." << std::endl;
        
        Relay::ManualClock clock;
        Relay::Scheduler scheduler(clock);
        
        int healthy_runs = 0;
        scheduler.addTask("broken", std::chrono::milliseconds(100), []() {
            throw std::runtime_error("task failure");
        });
        scheduler.addTask("healthy", std::chrono::milliseconds(100), [&healthy_runs]() { healthy_runs++; });
        
        for (int i = 0; i < 3; i++) {
            clock.advance(std::chrono::milliseconds(100));
            scheduler.runDueTasks();
        }
        
        assert(healthy_runs == 3 && "Other tasks should keep running");
        for (const auto& info : scheduler.getTasks()) {
            if (info.name == "broken") {
                assert(info.failure_count == 3 && "Failures should be counted");
                assert(info.run_count == 3 && "Failing task should stay scheduled");
            }
        }
        
        std::cout << "✓ Failing task test passed" << std::endl;
    }
    
    void testWorkerThread() {
        std::cout << "Testing worker thread and shutdown..." << std::endl;
        
        Relay::SystemClock clock;
        Relay::Scheduler scheduler(clock, std::chrono::milliseconds(5));
        
        std::atomic<int> runs{0};
        scheduler.addTask("tick", std::chrono::milliseconds(10), [&runs]() { runs++; });
        
        scheduler.start();
        assert(scheduler.isRunning() && "Scheduler should be running");
        scheduler.start();
        
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        scheduler.stop();
        
        assert(!scheduler.isRunning() && "Scheduler should be stopped");
        assert(runs.load() >= 3 && "Task should have run repeatedly");
        assert(scheduler.getTasks().empty() && "Stop should cancel every task");
        
        int after_stop = runs.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(runs.load() == after_stop && "No task should run after stop");
        
        scheduler.stop();
        
        std::cout << "✓ Worker thread test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running Scheduler unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;
        
        testTaskValidation();
        std::cout << std::endl;
        
        testDueTasks();
        std::cout << std::endl;
        
        testFailingTask();
        std::cout << std::endl;
        
        testWorkerThread();
        std::cout << std::endl;
        
        std::cout << "All Scheduler tests passed!" << std::endl;
    }
};

int main() {
    try {
        SchedulerTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All Scheduler component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
