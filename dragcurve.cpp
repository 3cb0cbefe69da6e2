#include "dragcurve.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

static bool isOne(double a) {
    return std::abs(a - 1.0) < 1e-9;
}

static bool isTwo(double a) {
    return std::abs(a - 2.0) < 1e-9;
}

CDragCurve::CDragCurve(const SDragCurveParams& params) : m_params(params) {
    if (!(params.coefficient > 0.0))
        throw std::invalid_argument("CDragCurve: coefficient must be positive");
    if (!(params.exponent > 0.0))
        throw std::invalid_argument("CDragCurve: exponent must be positive");
    if (!(params.stopSpeed > 0.0))
        throw std::invalid_argument("CDragCurve: stopSpeed must be positive");

    if (params.initialSpeed <= params.stopSpeed) {
        m_degenerate = true;
        return;
    }

    const double a  = params.exponent;
    const double c  = params.coefficient;
    const double v0 = params.initialSpeed;
    const double vs = params.stopSpeed;

    if (isOne(a))
        m_duration = std::log(v0 / vs) / c;
    else
        m_duration = (std::pow(v0, 1.0 - a) - std::pow(vs, 1.0 - a)) / ((1.0 - a) * c);

    m_totalDistance = rawDistanceForSpeed(vs);
}

double CDragCurve::rawSpeedAt(double t) const {
    const double a  = m_params.exponent;
    const double c  = m_params.coefficient;
    const double v0 = m_params.initialSpeed;

    if (isOne(a))
        return v0 * std::exp(-c * t);

    const double base = std::pow(v0, 1.0 - a) - (1.0 - a) * c * t;
    if (base <= 0.0) // a < 1 reaches zero speed in finite time
        return 0.0;
    return std::pow(base, 1.0 / (1.0 - a));
}

// distance travelled from t = 0 until the speed has dropped to `speed`
double CDragCurve::rawDistanceForSpeed(double speed) const {
    const double a  = m_params.exponent;
    const double c  = m_params.coefficient;
    const double v0 = m_params.initialSpeed;

    if (isOne(a))
        return (v0 - speed) / c;
    if (isTwo(a))
        return std::log(v0 / speed) / c;
    return (std::pow(v0, 2.0 - a) - std::pow(speed, 2.0 - a)) / ((2.0 - a) * c);
}

double CDragCurve::speedAt(double t) const {
    if (m_degenerate)
        return m_params.initialSpeed;

    return rawSpeedAt(std::clamp(t, 0.0, m_duration));
}

double CDragCurve::distanceAt(double t) const {
    if (m_degenerate || t <= 0.0)
        return 0.0;
    if (t >= m_duration)
        return m_totalDistance;

    return std::clamp(rawDistanceForSpeed(rawSpeedAt(t)), 0.0, m_totalDistance);
}
