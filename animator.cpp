#include "animator.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

const char* animationPhaseName(eAnimationPhase phase) {
    switch (phase) {
        case ANIMATION_PHASE_START: return "start";
        case ANIMATION_PHASE_CONTINUE: return "continue";
        case ANIMATION_PHASE_END: return "end";
        case ANIMATION_PHASE_START_AND_END: return "startAndEnd";
    }
    return "?";
}

CFrameAnimator::CFrameAnimator(IFrameClock& clock, uint32_t intervalMs) : m_clock(clock), m_intervalMs(std::max<uint32_t>(intervalMs, 1)) {
    ;
}

CFrameAnimator::~CFrameAnimator() {
    stop();
}

void CFrameAnimator::setInterval(uint32_t intervalMs) {
    m_intervalMs = std::max<uint32_t>(intervalMs, 1);
}

void CFrameAnimator::start(double duration, ANIMATION_VALUE_FN valueFn, ANIMATION_TICK_FN callback) {
    if (m_running)
        stop();

    m_valueFn   = std::move(valueFn);
    m_callback  = std::move(callback);
    m_duration  = std::max(duration, 0.0);
    m_startTime = m_clock.now();
    m_lastTime  = m_startTime;
    m_lastValue = 0.0;
    m_firstTick = true;
    m_pixelator.reset();
    m_running = true;

    GSLog::log(GSLog::TRACE, "animator: start duration=", m_duration, " interval=", m_intervalMs, "ms");

    m_clock.schedule(m_intervalMs, [this]() { onTick(); });
}

void CFrameAnimator::stop() {
    if (!m_running)
        return;

    GSLog::log(GSLog::TRACE, "animator: stop");

    m_running = false;
    m_clock.cancel();
    m_valueFn  = nullptr;
    m_callback = nullptr;
}

void CFrameAnimator::onTick() {
    if (!m_running)
        return;

    const double now     = m_clock.now();
    const double elapsed = now - m_startTime;
    const bool   last    = elapsed >= m_duration;

    const double value = m_valueFn(last ? m_duration : elapsed);
    const auto   delta = static_cast<int64_t>(m_pixelator.intDelta(value - m_lastValue));
    m_lastValue        = value;

    const double timeDelta = now - m_lastTime;
    m_lastTime             = now;

    eAnimationPhase phase = ANIMATION_PHASE_CONTINUE;
    if (m_firstTick && last)
        phase = ANIMATION_PHASE_START_AND_END;
    else if (m_firstTick)
        phase = ANIMATION_PHASE_START;
    else if (last)
        phase = ANIMATION_PHASE_END;
    m_firstTick = false;

    if (!last) {
        // the callback may stop or restart us, keep our own copy alive for the call
        auto callback = m_callback;
        callback(delta, timeDelta, phase);
        return;
    }

    // unschedule before the final callback so it observes !isRunning()
    auto callback = std::move(m_callback);
    m_running     = false;
    m_clock.cancel();
    m_valueFn  = nullptr;
    m_callback = nullptr;

    callback(delta, timeDelta, phase);
}
