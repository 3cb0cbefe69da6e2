#include "waylandclock.hpp"
#include "log.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

CWaylandFrameClock::CWaylandFrameClock(wl_event_loop* loop) {
    if (!loop)
        throw std::runtime_error("CWaylandFrameClock: no event loop");

    m_timer = wl_event_loop_add_timer(loop, onTimer, this);
    if (!m_timer)
        throw std::runtime_error("CWaylandFrameClock: failed to add timer source");
}

CWaylandFrameClock::~CWaylandFrameClock() {
    if (m_timer)
        wl_event_source_remove(m_timer);
}

double CWaylandFrameClock::now() const {
    const auto since = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(since).count();
}

void CWaylandFrameClock::schedule(uint32_t intervalMs, std::function<void()> onTick) {
    m_intervalMs = intervalMs == 0 ? 1 : intervalMs;
    m_onTick     = std::move(onTick);
    m_scheduled  = true;
    wl_event_source_timer_update(m_timer, m_intervalMs);
}

void CWaylandFrameClock::cancel() {
    m_scheduled = false;
    m_onTick    = nullptr;
    // 0 disarms
    wl_event_source_timer_update(m_timer, 0);
}

bool CWaylandFrameClock::isScheduled() const {
    return m_scheduled;
}

int CWaylandFrameClock::onTimer(void* data) {
    auto* self = static_cast<CWaylandFrameClock*>(data);

    if (!self->m_scheduled || !self->m_onTick) {
        GSLog::log(GSLog::TRACE, "frame clock: tick skipped (not scheduled)");
        return 0;
    }

    // the tick may cancel or reschedule us
    auto onTick = self->m_onTick;
    onTick();

    if (self->m_scheduled)
        wl_event_source_timer_update(self->m_timer, self->m_intervalMs);

    return 0;
}
