#pragma once
#include "frameclock.hpp"
#include <wayland-server-core.h>
#include <functional>

// Fixed-rate ticks off a wl_event_loop timer source, re-armed after every tick.
class CWaylandFrameClock : public IFrameClock {
  public:
    explicit CWaylandFrameClock(wl_event_loop* loop);
    virtual ~CWaylandFrameClock();

    CWaylandFrameClock(const CWaylandFrameClock&)            = delete;
    CWaylandFrameClock& operator=(const CWaylandFrameClock&) = delete;

    virtual double now() const;
    virtual void   schedule(uint32_t intervalMs, std::function<void()> onTick);
    virtual void   cancel();
    virtual bool   isScheduled() const;

  private:
    static int            onTimer(void* data);

    wl_event_source*      m_timer      = nullptr;
    uint32_t              m_intervalMs = 16;
    bool                  m_scheduled  = false;
    std::function<void()> m_onTick;
};
