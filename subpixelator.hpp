#pragma once
#include "vector.hpp"

enum eSubPixelPolicy {
    SUBPIXEL_ROUND = 0,
    SUBPIXEL_BIASED,
};

// Turns real-valued deltas into integer deltas, carrying the fractional
// remainder so the integer sum never drifts more than 1 from the real sum.
class CSubPixelator {
  public:
    // bias sign only matters for SUBPIXEL_BIASED: > 0 floors, < 0 ceils
    explicit CSubPixelator(eSubPixelPolicy policy = SUBPIXEL_ROUND, int biasSign = 1);

    double intDelta(double delta);
    void   reset();

    double remainder() const {
        return m_remainder;
    }
    double lastOutput() const {
        return m_lastOutput;
    }

  private:
    eSubPixelPolicy m_policy     = SUBPIXEL_ROUND;
    int             m_biasSign   = 1;
    double          m_remainder  = 0.0;
    double          m_lastOutput = 0.0;
};

class CVectorSubPixelator {
  public:
    static CVectorSubPixelator roundPixelator();
    static CVectorSubPixelator biasedPixelator();

    SVector                    intVector(const SVector& delta);
    void                       reset();

    SVector                    remainder() const {
        return {m_x.remainder(), m_y.remainder()};
    }

  private:
    CVectorSubPixelator(eSubPixelPolicy policy, int biasSign);

    CSubPixelator m_x;
    CSubPixelator m_y;
};
