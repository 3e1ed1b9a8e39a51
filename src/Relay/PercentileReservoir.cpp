// =================================================================
// src/Relay/PercentileReservoir.cpp
// =================================================================
// Implementation of the reservoir percentile estimator.

#include "Relay/PercentileReservoir.hpp"
#include <algorithm>
#include <cmath>

namespace Relay {

PercentileReservoir::PercentileReservoir(size_t capacity, size_t refresh_interval, uint64_t seed)
    : m_capacity(std::max<size_t>(1, capacity)),
      m_refresh_interval(std::max<size_t>(1, refresh_interval)),
      m_engine(seed) {
    m_samples.reserve(m_capacity);
}

void PercentileReservoir::add(double value) {
    m_total++;
    
    if (m_samples.size() < m_capacity) {
        m_samples.push_back(value);
        recompute();
        return;
    }
    
    std::uniform_int_distribution<uint64_t> dist(0, m_total - 1);
    uint64_t slot = dist(m_engine);
    if (slot < m_capacity) {
        m_samples[static_cast<size_t>(slot)] = value;
    }
    
    if (m_total % m_refresh_interval == 0) {
        recompute();
    }
}

double PercentileReservoir::computePercentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    
    std::sort(values.begin(), values.end());
    size_t index = static_cast<size_t>(std::floor(values.size() * q));
    index = std::min(index, values.size() - 1);
    return values[index];
}

void PercentileReservoir::recompute() {
    m_p95 = computePercentile(m_samples, 0.95);
}

} // namespace Relay
