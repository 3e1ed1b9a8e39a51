// =================================================================
// src/Relay/Scheduler.cpp
// =================================================================
// Implementation of the periodic task scheduler.

#include "Relay/Scheduler.hpp"
#include "Relay/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Relay {

Scheduler::Scheduler(const Clock& clock, std::chrono::milliseconds poll_interval)
    : m_clock(clock), m_poll_interval(poll_interval) {
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::addTask(const std::string& name, std::chrono::milliseconds interval,
                        std::function<void()> task) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Task interval must be positive: " + name);
    }
    
    auto entry = std::make_shared<Task>();
    entry->name = name;
    entry->interval = interval;
    entry->next_run = m_clock.monotonicNow() + interval;
    entry->fn = std::move(task);
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_tasks.find(name) != m_tasks.end()) {
            throw std::invalid_argument("Task already scheduled: " + name);
        }
        m_tasks[name] = entry;
    }
    m_wakeup.notify_all();
    
    Logger::getInstance().debug("Scheduler", "Scheduled task " + name,
        "Interval: " + std::to_string(interval.count()) + "ms");
}

bool Scheduler::cancelTask(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.erase(name) > 0;
}

void Scheduler::start() {
    if (m_running.load()) {
        return;
    }
    
    m_stop_requested.store(false);
    m_running.store(true);
    m_worker = std::make_unique<std::thread>(&Scheduler::schedulerLoop, this);
    Logger::getInstance().info("Scheduler", "Started scheduler thread");
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested.store(true);
        m_tasks.clear();
    }
    m_wakeup.notify_all();
    
    if (m_worker) {
        m_worker->join();
        m_worker.reset();
        Logger::getInstance().info("Scheduler", "Stopped scheduler thread");
    }
    m_running.store(false);
}

size_t Scheduler::runDueTasks() {
    std::vector<std::shared_ptr<Task>> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = m_clock.monotonicNow();
        for (auto& [name, task] : m_tasks) {
            if (task->next_run <= now) {
                due.push_back(task);
                task->next_run = now + task->interval;
            }
        }
    }
    
    for (const auto& task : due) {
        try {
            task->fn();
        } catch (const std::exception& e) {
            task->failure_count.fetch_add(1);
            Logger::getInstance().error("Scheduler", 
                "Task " + task->name + " failed: " + std::string(e.what()));
        }
        task->run_count.fetch_add(1);
    }
    
    return due.size();
}

std::vector<TaskInfo> Scheduler::getTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TaskInfo> tasks;
    for (const auto& [name, task] : m_tasks) {
        TaskInfo info;
        info.name = name;
        info.interval = task->interval;
        info.next_run = task->next_run;
        info.run_count = task->run_count.load();
        info.failure_count = task->failure_count.load();
        tasks.push_back(info);
    }
    return tasks;
}

void Scheduler::schedulerLoop() {
    while (!m_stop_requested.load()) {
        try {
            runDueTasks();
        } catch (const std::exception& e) {
            Logger::getInstance().error("Scheduler", 
                "Scheduler loop error: " + std::string(e.what()));
        }
        
        std::unique_lock<std::mutex> lock(m_mutex);
        auto wait = std::min<std::chrono::steady_clock::duration>(timeUntilNextTask(), m_poll_interval);
        m_wakeup.wait_for(lock, wait, [this]() { return m_stop_requested.load(); });
    }
}

std::chrono::steady_clock::duration Scheduler::timeUntilNextTask() const {
    // Caller holds m_mutex
    auto now = m_clock.monotonicNow();
    std::chrono::steady_clock::duration shortest = m_poll_interval;
    for (const auto& [name, task] : m_tasks) {
        auto remaining = task->next_run - now;
        if (remaining < shortest) {
            shortest = remaining;
        }
    }
    return std::max<std::chrono::steady_clock::duration>(shortest, std::chrono::steady_clock::duration::zero());
}

} // namespace Relay
