#pragma once
#include <cstddef>
#include <cstdint>

struct SGestureScrollConfig {
    // point delta -> line delta divisor
    double   pixelsPerLine = 10.0;
    // point delta -> gesture delta factor
    double   gestureGain = 1.15;
    // seconds between the last input and the end event, above this there is no momentum
    double   maxMomentumStartGap = 0.1;
    // px/s
    double   stopSpeed       = 1.0;
    double   dragCoefficient = 30.0;
    double   dragExponent    = 0.7;
    // exit velocity -> initial momentum velocity, sign(v) * |v|^velocityExponent per axis
    double   velocityExponent = 1.0;
    size_t   smootherCapacity = 5;
    uint32_t intervalMs       = 16;
};

// Returns a copy with every out-of-range field replaced by its default.
// Replacements are logged as warnings.
SGestureScrollConfig sanitizeConfig(const SGestureScrollConfig& config);
