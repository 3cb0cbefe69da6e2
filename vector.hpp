#pragma once
#include <cmath>
#include <functional>

struct SVector {
    double x = 0.0;
    double y = 0.0;

    bool   operator==(const SVector& other) const {
        return x == other.x && y == other.y;
    }

    bool isZero() const {
        return x == 0.0 && y == 0.0;
    }
};

inline SVector scaledVector(const SVector& v, double scale) {
    return SVector{v.x * scale, v.y * scale};
}

// applies fn to each component independently
inline SVector transformedVector(const SVector& v, const std::function<double(double)>& fn) {
    return SVector{fn(v.x), fn(v.y)};
}

inline double magnitudeOfVector(const SVector& v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

// zero vector has no direction, returns zero
inline SVector unitVector(const SVector& v) {
    const double mag = magnitudeOfVector(v);
    if (mag == 0.0)
        return SVector{};
    return scaledVector(v, 1.0 / mag);
}
