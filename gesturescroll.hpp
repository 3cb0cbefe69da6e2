#pragma once
#include "animator.hpp"
#include "config.hpp"
#include "dragcurve.hpp"
#include "frameclock.hpp"
#include "smoother.hpp"
#include "subpixelator.hpp"
#include "vector.hpp"
#include <functional>
#include <optional>

enum eInputPhase {
    INPUT_PHASE_BEGAN = 0,
    INPUT_PHASE_CHANGED,
    INPUT_PHASE_ENDED,
    // only on momentum events, never valid as input
    INPUT_PHASE_UNDEFINED,
};

enum eMomentumPhase {
    MOMENTUM_PHASE_NONE = 0,
    MOMENTUM_PHASE_BEGIN,
    MOMENTUM_PHASE_CONTINUE,
    MOMENTUM_PHASE_END,
};

const char* inputPhaseName(eInputPhase phase);
const char* momentumPhaseName(eMomentumPhase phase);

struct SScrollEventDescriptor {
    SVector        gesture;
    SVector        line;
    SVector        point;
    eInputPhase    phase         = INPUT_PHASE_UNDEFINED;
    eMomentumPhase momentumPhase = MOMENTUM_PHASE_NONE;
    SVector        location;
};

// An event is either gesture input (momentumPhase NONE) or momentum
// (phase UNDEFINED), never both.
bool isValidScrollEvent(const SScrollEventDescriptor& e);

class IScrollEventSink {
  public:
    virtual ~IScrollEventSink() = default;

    virtual void post(const SScrollEventDescriptor& e) = 0;
};

using POINTER_LOCATION_FN = std::function<SVector()>;

SVector lineVectorFromPointVector(const SVector& point, double pixelsPerLine);
SVector gestureVectorFromPointVector(const SVector& point, double gestureGain);
SVector initialVelocityFromExitVelocity(const SVector& exitVelocity, double velocityExponent);

/*
    Turns a Began -> Changed* -> Ended stream of scroll deltas into
    trackpad-like scroll events, followed by a momentum tail driven by a drag
    curve once the input ends.

    feed(), stop() and the clock's ticks must all run on the same thread.
*/
class CGestureScrollEngine {
  public:
    enum eState {
        STATE_IDLE = 0,
        STATE_ACTIVE,
        STATE_MOMENTUM,
    };

    CGestureScrollEngine(IFrameClock& clock, IScrollEventSink& sink, POINTER_LOCATION_FN location, const SGestureScrollConfig& config = {});
    ~CGestureScrollEngine();

    CGestureScrollEngine(const CGestureScrollEngine&)            = delete;
    CGestureScrollEngine& operator=(const CGestureScrollEngine&) = delete;

    void feed(const SVector& delta, eInputPhase phase);

    // Ends a running momentum scroll with a momentum end event.
    // No-op if nothing is running.
    void stop();

    // applied at the start of the next session
    void                        setConfig(const SGestureScrollConfig& config);
    const SGestureScrollConfig& config() const {
        return m_nextConfig;
    }

    eState state() const {
        return m_state;
    }
    bool isMomentumRunning() const {
        return m_animator.isRunning();
    }
    SVector origin() const {
        return m_origin;
    }
    // curve of the current or most recent momentum run of this session
    const CDragCurve* momentumCurve() const {
        return m_curve ? &*m_curve : nullptr;
    }

  private:
    void                  beginSession(const SVector& delta);
    void                  changeSession(const SVector& delta, double now);
    void                  endSession(double now);
    void                  startMomentum(const SVector& exitVelocity);
    void                  onMomentumTick(const SVector& direction, int64_t delta, double timeDelta, eAnimationPhase phase);

    void                  postDeltas(const SVector& point, eInputPhase phase);
    void                  post(const SVector& gesture, const SVector& line, const SVector& point, eInputPhase phase, eMomentumPhase momentumPhase,
                               const SVector& location);

    IFrameClock&          m_clock;
    IScrollEventSink&     m_sink;
    POINTER_LOCATION_FN   m_location;

    SGestureScrollConfig  m_config;
    SGestureScrollConfig  m_nextConfig;

    eState                m_state = STATE_IDLE;
    SVector               m_origin;
    std::optional<double> m_lastInputTime;
    bool                  m_sawChanged = false;

    CRollingAverage       m_xDistanceSmoother;
    CRollingAverage       m_yDistanceSmoother;
    CRollingAverage       m_timeBetweenInputsSmoother;
    double                m_smoothedXDistance         = 0.0;
    double                m_smoothedYDistance         = 0.0;
    double                m_smoothedTimeBetweenInputs = 0.0;

    CVectorSubPixelator   m_gesturePixelator = CVectorSubPixelator::roundPixelator();
    CVectorSubPixelator   m_pointPixelator   = CVectorSubPixelator::roundPixelator();
    CVectorSubPixelator   m_linePixelator    = CVectorSubPixelator::biasedPixelator();

    std::optional<CDragCurve> m_curve;
    CFrameAnimator            m_animator;
};
