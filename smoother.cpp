#include "smoother.hpp"
#include <numeric>
#include <stdexcept>

CRollingAverage::CRollingAverage(size_t capacity) : m_capacity(capacity) {
    if (capacity == 0)
        throw std::invalid_argument("CRollingAverage: capacity must be at least 1");
}

double CRollingAverage::smooth(double value) {
    m_values.push_back(value);
    while (m_values.size() > m_capacity)
        m_values.pop_front();

    const double sum = std::accumulate(m_values.begin(), m_values.end(), 0.0);
    return sum / static_cast<double>(m_values.size());
}

void CRollingAverage::reset() {
    m_values.clear();
}
