// =================================================================
// include/Relay/RandomSource.hpp
// =================================================================
// Seeded pseudo-random source shared by tie-breaking code paths.

#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace Relay {

/**
 * @brief Thread-safe seeded PRNG
 *
 * One instance is injected into the routing engine so that near-tie
 * resolution is reproducible for a given seed.
 */
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 42) : m_engine(seed) {}

    /**
     * @brief Pick an index uniformly from [0, n)
     * @param n Number of candidates (must be > 0)
     * @return Selected index
     */
    size_t pick(size_t n) {
        if (n <= 1) return 0;
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(m_engine);
    }

    /**
     * @brief Uniform real value in [0, 1)
     */
    double uniform() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(m_engine);
    }

    /**
     * @brief Reset the generator to a new seed
     */
    void reseed(uint64_t seed) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_engine.seed(seed);
    }

private:
    std::mutex m_mutex;
    std::mt19937_64 m_engine;
};

} // namespace Relay
