// =================================================================
// include/Relay/PercentileReservoir.hpp
// =================================================================
// Fixed-capacity reservoir sample with a cached approximate p95.

#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace Relay {

/**
 * @brief Reservoir sample of observed durations
 *
 * Until the reservoir is full every value is kept. Afterwards slot j,
 * drawn uniformly from [0, total), is overwritten when j < capacity, so a
 * new value is admitted with probability capacity/total.
 *
 * The p95 is recomputed on every insertion while filling and then only
 * every refresh_interval insertions; between recomputes the cached value
 * is returned. Not thread-safe: the owning stats entry serializes access.
 */
class PercentileReservoir {
public:
    /**
     * @brief Constructor
     * @param capacity Maximum number of retained samples
     * @param refresh_interval Insertions between p95 recomputes once full
     * @param seed Seed for the replacement draw
     */
    PercentileReservoir(size_t capacity = 200, size_t refresh_interval = 100, uint64_t seed = 42);

    /**
     * @brief Observe a value
     * @param value Duration in milliseconds
     */
    void add(double value);

    /**
     * @brief Cached 95th percentile (0 when empty)
     */
    double percentile95() const { return m_p95; }

    size_t size() const { return m_samples.size(); }
    size_t capacity() const { return m_capacity; }
    uint64_t totalObserved() const { return m_total; }

    /**
     * @brief Copy of the retained samples
     */
    std::vector<double> samples() const { return m_samples; }

    /**
     * @brief Percentile of a sample using the index floor(n * q)
     * @param values Sample (taken by value, sorted internally)
     * @param q Quantile in [0, 1]
     * @return Percentile value, 0 for an empty sample
     */
    static double computePercentile(std::vector<double> values, double q);

private:
    void recompute();

    size_t m_capacity;
    size_t m_refresh_interval;
    uint64_t m_total = 0;
    double m_p95 = 0.0;
    std::vector<double> m_samples;
    std::mt19937_64 m_engine;
};

} // namespace Relay
