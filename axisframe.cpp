#include "axisframe.hpp"

std::optional<SVector> CAxisFrame::add(uint32_t timeMs, const SVector& delta) {
    std::optional<SVector> previous;
    if (m_pending && timeMs != m_timeMs)
        previous = flush();

    m_pending = true;
    m_timeMs  = timeMs;
    m_delta.x += delta.x;
    m_delta.y += delta.y;

    return previous;
}

std::optional<SVector> CAxisFrame::flush() {
    if (!m_pending)
        return std::nullopt;

    const SVector out = m_delta;
    reset();
    return out;
}

void CAxisFrame::reset() {
    m_pending = false;
    m_timeMs  = 0;
    m_delta   = {};
}
