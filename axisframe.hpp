#pragma once
#include "vector.hpp"
#include <cstdint>
#include <optional>

// Collects the per-axis events of one input frame into a single delta.
// libinput reports a diagonal scroll as a vertical and a horizontal event
// with the same timestamp.
class CAxisFrame {
  public:
    // Returns the previous frame's delta when timeMs starts a new frame.
    std::optional<SVector> add(uint32_t timeMs, const SVector& delta);
    // Returns the pending delta, if any, and empties the frame.
    std::optional<SVector> flush();
    void                   reset();

    bool pending() const {
        return m_pending;
    }
    uint32_t timeMs() const {
        return m_timeMs;
    }

  private:
    bool     m_pending = false;
    uint32_t m_timeMs  = 0;
    SVector  m_delta;
};
