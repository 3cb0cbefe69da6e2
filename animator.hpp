#pragma once
#include "frameclock.hpp"
#include "subpixelator.hpp"
#include <cstdint>
#include <functional>

enum eAnimationPhase {
    ANIMATION_PHASE_START = 0,
    ANIMATION_PHASE_CONTINUE,
    ANIMATION_PHASE_END,
    ANIMATION_PHASE_START_AND_END,
};

const char* animationPhaseName(eAnimationPhase phase);

// cumulative value at elapsed time t (seconds), must not have side effects
using ANIMATION_VALUE_FN = std::function<double(double t)>;
// integer delta since the previous tick, seconds since the previous tick
using ANIMATION_TICK_FN = std::function<void(int64_t delta, double timeDelta, eAnimationPhase phase)>;

/*
    Drives one animation run off an IFrameClock. Every tick samples the value
    function, quantizes the increment through a round-policy subpixelator and
    hands the integer delta to the callback. The summed deltas of a finished
    run equal the final value within one unit.
*/
class CFrameAnimator {
  public:
    explicit CFrameAnimator(IFrameClock& clock, uint32_t intervalMs = 16);
    ~CFrameAnimator();

    CFrameAnimator(const CFrameAnimator&)            = delete;
    CFrameAnimator& operator=(const CFrameAnimator&) = delete;

    // stops a run that is still active before starting
    void start(double duration, ANIMATION_VALUE_FN valueFn, ANIMATION_TICK_FN callback);
    void stop();

    bool isRunning() const {
        return m_running;
    }

    void     setInterval(uint32_t intervalMs);
    uint32_t interval() const {
        return m_intervalMs;
    }

  private:
    void               onTick();

    IFrameClock&       m_clock;
    uint32_t           m_intervalMs = 16;

    bool               m_running    = false;
    bool               m_firstTick  = true;
    double             m_duration   = 0.0;
    double             m_startTime  = 0.0;
    double             m_lastTime   = 0.0;
    double             m_lastValue  = 0.0;

    ANIMATION_VALUE_FN m_valueFn;
    ANIMATION_TICK_FN  m_callback;
    CSubPixelator      m_pixelator;
};
