// =================================================================
// include/Relay/Clock.hpp
// =================================================================
// Injectable time source for wall-clock timestamps and durations.

#pragma once

#include <chrono>
#include <mutex>

namespace Relay {

/**
 * @brief Time source used by every monitoring component
 *
 * Wall-clock time stamps records and alerts; monotonic time measures
 * durations. Components never call std::chrono clocks directly so that
 * tests can drive time deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current wall-clock time
     * @return System time point
     */
    virtual std::chrono::system_clock::time_point now() const = 0;

    /**
     * @brief Current monotonic time
     * @return Steady time point
     */
    virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;
};

/**
 * @brief Clock backed by the real system and steady clocks
 */
class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    std::chrono::steady_clock::time_point monotonicNow() const override {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Clock that only moves when advanced explicitly
 */
class ManualClock : public Clock {
public:
    ManualClock()
        : m_wall(std::chrono::system_clock::now()),
          m_mono(std::chrono::steady_clock::time_point{}) {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_wall;
    }

    std::chrono::steady_clock::time_point monotonicNow() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_mono;
    }

    /**
     * @brief Move both wall and monotonic time forward
     * @param delta Amount of time to advance
     */
    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto step = std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta);
        m_wall += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
        m_mono += step;
    }

private:
    mutable std::mutex m_mutex;
    std::chrono::system_clock::time_point m_wall;
    std::chrono::steady_clock::time_point m_mono;
};

/**
 * @brief Milliseconds between two monotonic time points
 */
inline double elapsedMs(std::chrono::steady_clock::time_point from,
                        std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace Relay
