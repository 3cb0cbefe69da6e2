#pragma once
#include <cstddef>
#include <deque>

// Moving average over the last N samples.
class CRollingAverage {
  public:
    explicit CRollingAverage(size_t capacity);

    double smooth(double value);
    void   reset();

    size_t size() const {
        return m_values.size();
    }
    size_t capacity() const {
        return m_capacity;
    }

  private:
    size_t             m_capacity = 0;
    std::deque<double> m_values;
};
