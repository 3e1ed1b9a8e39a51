// =================================================================
// include/Relay/Scheduler.hpp
// =================================================================
// Named periodic background tasks with a single shutdown signal.

#pragma once

#include "Relay/Clock.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Relay {

/**
 * @brief Read-only view of a scheduled task
 */
struct TaskInfo {
    std::string name;                                 ///< Task name
    std::chrono::milliseconds interval{0};            ///< Period
    std::chrono::steady_clock::time_point next_run;   ///< Next due time
    size_t run_count = 0;                             ///< Completed runs
    size_t failure_count = 0;                         ///< Runs that threw
};

/**
 * @brief Runs periodic tasks on one worker thread
 *
 * Due tasks are collected under the scheduler lock and executed outside it.
 * A task that throws is logged, counted and rescheduled. stop() cancels every
 * task and joins the worker. Tests drive time through a ManualClock and
 * runDueTasks() without starting the worker.
 */
class Scheduler {
public:
    /**
     * @brief Constructor
     * @param clock Time source deciding when tasks are due
     * @param poll_interval Longest the worker sleeps between due checks
     */
    explicit Scheduler(const Clock& clock,
                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
    
    /**
     * @brief Destructor, stops the worker
     */
    virtual ~Scheduler();

    /**
     * @brief Add a periodic task, first due one interval from now
     * @param name Unique task name
     * @param interval Period (must be positive)
     * @param task Callable to run
     * @throws std::invalid_argument for a non-positive interval or a duplicate name
     */
    virtual void addTask(const std::string& name, std::chrono::milliseconds interval,
                         std::function<void()> task);

    /**
     * @brief Cancel one task
     * @return True if the task existed
     */
    virtual bool cancelTask(const std::string& name);

    /**
     * @brief Start the worker thread
     */
    virtual void start();

    /**
     * @brief Cancel all tasks and join the worker
     */
    virtual void stop();

    /**
     * @brief Run every task that is due now
     * @return Number of tasks run
     */
    virtual size_t runDueTasks();

    virtual std::vector<TaskInfo> getTasks() const;

    bool isRunning() const { return m_running.load(); }

private:
    struct Task {
        std::string name;
        std::chrono::milliseconds interval{0};
        std::chrono::steady_clock::time_point next_run;
        std::function<void()> fn;
        std::atomic<size_t> run_count{0};
        std::atomic<size_t> failure_count{0};
    };

    void schedulerLoop();
    std::chrono::steady_clock::duration timeUntilNextTask() const;

    const Clock& m_clock;
    std::chrono::milliseconds m_poll_interval;

    std::map<std::string, std::shared_ptr<Task>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;

    std::unique_ptr<std::thread> m_worker;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
};

} // namespace Relay
