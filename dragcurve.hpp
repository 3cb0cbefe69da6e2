#pragma once

struct SDragCurveParams {
    double coefficient  = 30.0;
    double exponent     = 0.7;
    double initialSpeed = 0.0;
    double stopSpeed    = 1.0;
};

/*
    Deceleration under power-law drag:
        dv/dt = -coefficient * v^exponent

    The curve starts at initialSpeed and ends when the speed reaches stopSpeed.
    Time is in seconds, distance in the same unit as speed * seconds.
*/
class CDragCurve {
  public:
    explicit CDragCurve(const SDragCurveParams& params);

    double speedAt(double t) const;
    double distanceAt(double t) const;

    double duration() const {
        return m_duration;
    }
    double totalDistance() const {
        return m_totalDistance;
    }
    // initialSpeed <= stopSpeed, nothing to animate
    bool isDegenerate() const {
        return m_degenerate;
    }
    const SDragCurveParams& params() const {
        return m_params;
    }

  private:
    double           rawSpeedAt(double t) const;
    double           rawDistanceForSpeed(double speed) const;

    SDragCurveParams m_params;
    bool             m_degenerate    = false;
    double           m_duration      = 0.0;
    double           m_totalDistance = 0.0;
};
