#include "subpixelator.hpp"
#include <cmath>

CSubPixelator::CSubPixelator(eSubPixelPolicy policy, int biasSign) : m_policy(policy), m_biasSign(biasSign < 0 ? -1 : 1) {
    ;
}

double CSubPixelator::intDelta(double delta) {
    const double total = m_remainder + delta;

    double       out = 0.0;
    if (m_policy == SUBPIXEL_BIASED)
        out = m_biasSign > 0 ? std::floor(total) : std::ceil(total);
    else
        out = std::round(total); // ties away from zero

    m_remainder  = total - out;
    m_lastOutput = out;
    return out;
}

void CSubPixelator::reset() {
    m_remainder  = 0.0;
    m_lastOutput = 0.0;
}

CVectorSubPixelator::CVectorSubPixelator(eSubPixelPolicy policy, int biasSign) : m_x(policy, biasSign), m_y(policy, biasSign) {
    ;
}

CVectorSubPixelator CVectorSubPixelator::roundPixelator() {
    return CVectorSubPixelator(SUBPIXEL_ROUND, 1);
}

CVectorSubPixelator CVectorSubPixelator::biasedPixelator() {
    return CVectorSubPixelator(SUBPIXEL_BIASED, 1);
}

SVector CVectorSubPixelator::intVector(const SVector& delta) {
    return SVector{m_x.intDelta(delta.x), m_y.intDelta(delta.y)};
}

void CVectorSubPixelator::reset() {
    m_x.reset();
    m_y.reset();
}
