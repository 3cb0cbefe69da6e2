#include "gesturescroll.hpp"
#include "log.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

const char* inputPhaseName(eInputPhase phase) {
    switch (phase) {
        case INPUT_PHASE_BEGAN: return "began";
        case INPUT_PHASE_CHANGED: return "changed";
        case INPUT_PHASE_ENDED: return "ended";
        case INPUT_PHASE_UNDEFINED: return "undefined";
    }
    return "?";
}

const char* momentumPhaseName(eMomentumPhase phase) {
    switch (phase) {
        case MOMENTUM_PHASE_NONE: return "none";
        case MOMENTUM_PHASE_BEGIN: return "begin";
        case MOMENTUM_PHASE_CONTINUE: return "continue";
        case MOMENTUM_PHASE_END: return "end";
    }
    return "?";
}

bool isValidScrollEvent(const SScrollEventDescriptor& e) {
    return e.phase == INPUT_PHASE_UNDEFINED || e.momentumPhase == MOMENTUM_PHASE_NONE;
}

SVector lineVectorFromPointVector(const SVector& point, double pixelsPerLine) {
    return transformedVector(point, [pixelsPerLine](double x) { return x / pixelsPerLine; });
}

SVector gestureVectorFromPointVector(const SVector& point, double gestureGain) {
    return transformedVector(point, [gestureGain](double x) { return x * gestureGain; });
}

SVector initialVelocityFromExitVelocity(const SVector& exitVelocity, double velocityExponent) {
    return transformedVector(exitVelocity, [velocityExponent](double x) { return std::copysign(std::pow(std::abs(x), velocityExponent), x); });
}

[[noreturn]] static void fatal(const std::string& msg) {
    GSLog::log(GSLog::ERR, msg);
    std::cerr << "[hypr-gesture-scroll] fatal: " << msg << "\n";
    std::abort();
}

CGestureScrollEngine::CGestureScrollEngine(IFrameClock& clock, IScrollEventSink& sink, POINTER_LOCATION_FN location, const SGestureScrollConfig& config) :
    m_clock(clock), m_sink(sink), m_location(std::move(location)), m_config(sanitizeConfig(config)), m_nextConfig(m_config),
    m_xDistanceSmoother(m_config.smootherCapacity), m_yDistanceSmoother(m_config.smootherCapacity), m_timeBetweenInputsSmoother(m_config.smootherCapacity),
    m_animator(clock, m_config.intervalMs) {
    ;
}

CGestureScrollEngine::~CGestureScrollEngine() {
    // no end event here, the sink may already be gone
    m_animator.stop();
}

void CGestureScrollEngine::setConfig(const SGestureScrollConfig& config) {
    m_nextConfig = sanitizeConfig(config);
}

void CGestureScrollEngine::feed(const SVector& delta, eInputPhase phase) {
    GSLog::log(GSLog::TRACE, "feed: delta=(", delta.x, ", ", delta.y, ") phase=", inputPhaseName(phase));

    if (phase != INPUT_PHASE_BEGAN && phase != INPUT_PHASE_CHANGED && phase != INPUT_PHASE_ENDED)
        fatal(std::string{"feed: invalid input phase "} + std::to_string(static_cast<int>(phase)));

    if (phase != INPUT_PHASE_ENDED && delta.isZero()) {
        // real trackpads only report zero deltas on the end event
        GSLog::log(GSLog::WARN, "feed: zero delta with phase ", inputPhaseName(phase), ", ignoring");
        return;
    }

    stop();

    const double now = m_clock.now();

    if (phase == INPUT_PHASE_CHANGED && m_state != STATE_ACTIVE) {
        GSLog::log(GSLog::WARN, "feed: changed without an active session, treating as began");
        phase = INPUT_PHASE_BEGAN;
    }

    switch (phase) {
        case INPUT_PHASE_BEGAN: beginSession(delta); break;
        case INPUT_PHASE_CHANGED: changeSession(delta, now); break;
        case INPUT_PHASE_ENDED: endSession(now); break;
        default: fatal("feed: unreachable phase");
    }

    m_lastInputTime = now;
}

void CGestureScrollEngine::beginSession(const SVector& delta) {
    if (m_config.smootherCapacity != m_nextConfig.smootherCapacity) {
        m_xDistanceSmoother         = CRollingAverage(m_nextConfig.smootherCapacity);
        m_yDistanceSmoother         = CRollingAverage(m_nextConfig.smootherCapacity);
        m_timeBetweenInputsSmoother = CRollingAverage(m_nextConfig.smootherCapacity);
    }
    m_config = m_nextConfig;
    m_animator.setInterval(m_config.intervalMs);

    m_origin     = m_location();
    m_state      = STATE_ACTIVE;
    m_sawChanged = false;
    m_curve.reset();

    m_gesturePixelator.reset();
    m_pointPixelator.reset();
    m_linePixelator.reset();

    m_xDistanceSmoother.reset();
    m_yDistanceSmoother.reset();
    m_timeBetweenInputsSmoother.reset();
    m_smoothedXDistance         = 0.0;
    m_smoothedYDistance         = 0.0;
    m_smoothedTimeBetweenInputs = 0.0;

    // no predecessor, so the time since the last input says nothing and the smoothers are left alone
    postDeltas(delta, INPUT_PHASE_BEGAN);
}

void CGestureScrollEngine::changeSession(const SVector& delta, double now) {
    const double timeSinceLastInput = m_lastInputTime ? now - *m_lastInputTime : std::numeric_limits<double>::infinity();

    m_sawChanged = true;

    m_smoothedXDistance         = m_xDistanceSmoother.smooth(delta.x);
    m_smoothedYDistance         = m_yDistanceSmoother.smooth(delta.y);
    m_smoothedTimeBetweenInputs = m_timeBetweenInputsSmoother.smooth(timeSinceLastInput);

    postDeltas(delta, INPUT_PHASE_CHANGED);
}

void CGestureScrollEngine::endSession(double now) {
    const bool   hadSession         = m_state == STATE_ACTIVE;
    const double timeSinceLastInput = hadSession && m_lastInputTime ? now - *m_lastInputTime : std::numeric_limits<double>::infinity();

    m_state = STATE_IDLE;

    post({}, {}, {}, INPUT_PHASE_ENDED, MOMENTUM_PHASE_NONE, m_location());

    if (!hadSession) {
        GSLog::log(GSLog::WARN, "feed: ended without began, not sending momentum scroll");
        return;
    }

    if (!m_sawChanged) {
        GSLog::log(GSLog::INFO, "no changed events in this session, not sending momentum scroll");
        return;
    }

    // also rejects infinity
    if (!(timeSinceLastInput <= m_config.maxMomentumStartGap)) {
        GSLog::log(GSLog::INFO, "not sending momentum scroll: timeSinceLastInput=", timeSinceLastInput);
        return;
    }

    // end events carry no distance, the last smoothed distance is fed back in instead
    m_smoothedTimeBetweenInputs = m_timeBetweenInputsSmoother.smooth(timeSinceLastInput);
    m_smoothedXDistance         = m_xDistanceSmoother.smooth(m_smoothedXDistance);
    m_smoothedYDistance         = m_yDistanceSmoother.smooth(m_smoothedYDistance);

    if (m_smoothedTimeBetweenInputs <= 0.0) {
        GSLog::log(GSLog::INFO, "no time between inputs, not sending momentum scroll");
        return;
    }

    const SVector exitVelocity{m_smoothedXDistance / m_smoothedTimeBetweenInputs, m_smoothedYDistance / m_smoothedTimeBetweenInputs};

    startMomentum(exitVelocity);
}

void CGestureScrollEngine::startMomentum(const SVector& exitVelocity) {
    GSLog::log(GSLog::INFO, "exit velocity: (", exitVelocity.x, ", ", exitVelocity.y, ")");

    const SVector initialVelocity = initialVelocityFromExitVelocity(exitVelocity, m_config.velocityExponent);
    const double  initialSpeed    = magnitudeOfVector(initialVelocity);

    if (!(initialSpeed > m_config.stopSpeed)) {
        GSLog::log(GSLog::INFO, "initial speed ", initialSpeed, " <= stop speed ", m_config.stopSpeed, ", not sending momentum scroll");
        return;
    }

    m_curve.emplace(SDragCurveParams{
        .coefficient  = m_config.dragCoefficient,
        .exponent     = m_config.dragExponent,
        .initialSpeed = initialSpeed,
        .stopSpeed    = m_config.stopSpeed,
    });

    m_pointPixelator.reset();
    m_linePixelator.reset();
    // gesture deltas are always zero during momentum

    const SVector direction = unitVector(initialVelocity);
    m_state                 = STATE_MOMENTUM;

    GSLog::log(GSLog::INFO, "momentum: speed=", initialSpeed, " duration=", m_curve->duration(), " distance=", m_curve->totalDistance());

    m_animator.start(
        m_curve->duration(), [curve = *m_curve](double t) { return curve.distanceAt(t); },
        [this, direction](int64_t delta, double timeDelta, eAnimationPhase phase) { onMomentumTick(direction, delta, timeDelta, phase); });
}

void CGestureScrollEngine::onMomentumTick(const SVector& direction, int64_t delta, double timeDelta, eAnimationPhase phase) {
    GSLog::log(GSLog::TRACE, "momentum tick: delta=", delta, " dt=", timeDelta, " phase=", animationPhaseName(phase));

    const SVector directedPoint = scaledVector(direction, static_cast<double>(delta));
    const SVector directedLine  = lineVectorFromPointVector(directedPoint, m_config.pixelsPerLine);

    const SVector point = m_pointPixelator.intVector(directedPoint);
    const SVector line  = m_linePixelator.intVector(directedLine);

    eMomentumPhase momentumPhase = MOMENTUM_PHASE_CONTINUE;
    switch (phase) {
        case ANIMATION_PHASE_START: momentumPhase = MOMENTUM_PHASE_BEGIN; break;
        case ANIMATION_PHASE_CONTINUE: momentumPhase = MOMENTUM_PHASE_CONTINUE; break;
        case ANIMATION_PHASE_END:
        case ANIMATION_PHASE_START_AND_END: momentumPhase = MOMENTUM_PHASE_END; break;
    }

    if (momentumPhase == MOMENTUM_PHASE_END)
        m_state = STATE_IDLE;

    post({}, line, point, INPUT_PHASE_UNDEFINED, momentumPhase, m_location());
}

void CGestureScrollEngine::stop() {
    if (!m_animator.isRunning() && m_state != STATE_MOMENTUM)
        return;

    m_animator.stop();
    m_state = STATE_IDLE;

    post({}, {}, {}, INPUT_PHASE_UNDEFINED, MOMENTUM_PHASE_END, m_location());
}

void CGestureScrollEngine::postDeltas(const SVector& point, eInputPhase phase) {
    const SVector line    = lineVectorFromPointVector(point, m_config.pixelsPerLine);
    const SVector gesture = gestureVectorFromPointVector(point, m_config.gestureGain);

    post(m_gesturePixelator.intVector(gesture), m_linePixelator.intVector(line), m_pointPixelator.intVector(point), phase, MOMENTUM_PHASE_NONE, m_location());
}

void CGestureScrollEngine::post(const SVector& gesture, const SVector& line, const SVector& point, eInputPhase phase, eMomentumPhase momentumPhase, const SVector& location) {
    GSLog::log(GSLog::TRACE, "post: gesture=(", gesture.x, ", ", gesture.y, ") line=(", line.x, ", ", line.y, ") point=(", point.x, ", ", point.y,
               ") phase=", inputPhaseName(phase), " momentum=", momentumPhaseName(momentumPhase), " loc=(", location.x, ", ", location.y, ")");

    const SScrollEventDescriptor e{
        .gesture       = gesture,
        .line          = line,
        .point         = point,
        .phase         = phase,
        .momentumPhase = momentumPhase,
        .location      = location,
    };

    if (!isValidScrollEvent(e))
        fatal(std::string{"post: phase "} + inputPhaseName(phase) + " with momentum phase " + momentumPhaseName(momentumPhase));

    m_sink.post(e);
}
