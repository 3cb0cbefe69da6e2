#include "config.hpp"
#include "log.hpp"
#include <cmath>

template <typename T>
static void replaceIf(bool invalid, T& value, const T& fallback, const char* name) {
    if (!invalid)
        return;

    GSLog::log(GSLog::WARN, "config: invalid ", name, "=", value, ", using ", fallback);
    value = fallback;
}

SGestureScrollConfig sanitizeConfig(const SGestureScrollConfig& config) {
    const SGestureScrollConfig DEFAULTS;
    SGestureScrollConfig       out = config;

    replaceIf(!std::isfinite(out.pixelsPerLine) || out.pixelsPerLine <= 0.0, out.pixelsPerLine, DEFAULTS.pixelsPerLine, "pixels_per_line");
    replaceIf(!std::isfinite(out.gestureGain), out.gestureGain, DEFAULTS.gestureGain, "gesture_gain");
    replaceIf(!std::isfinite(out.maxMomentumStartGap) || out.maxMomentumStartGap < 0.0, out.maxMomentumStartGap, DEFAULTS.maxMomentumStartGap, "max_momentum_start_gap");
    replaceIf(!std::isfinite(out.stopSpeed) || out.stopSpeed <= 0.0, out.stopSpeed, DEFAULTS.stopSpeed, "stop_speed");
    replaceIf(!std::isfinite(out.dragCoefficient) || out.dragCoefficient <= 0.0, out.dragCoefficient, DEFAULTS.dragCoefficient, "drag_coefficient");
    replaceIf(!std::isfinite(out.dragExponent) || out.dragExponent <= 0.0, out.dragExponent, DEFAULTS.dragExponent, "drag_exponent");
    replaceIf(!std::isfinite(out.velocityExponent) || out.velocityExponent <= 0.0, out.velocityExponent, DEFAULTS.velocityExponent, "velocity_exponent");
    replaceIf(out.smootherCapacity == 0, out.smootherCapacity, DEFAULTS.smootherCapacity, "smoother_capacity");
    replaceIf(out.intervalMs == 0, out.intervalMs, DEFAULTS.intervalMs, "interval_ms");

    return out;
}
