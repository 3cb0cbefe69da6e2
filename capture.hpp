#pragma once
#include "axisframe.hpp"
#include "gesturescroll.hpp"
#include "seatsink.hpp"
#include "waylandclock.hpp"
#include <hyprland/src/devices/IPointer.hpp>
#include <hyprland/src/plugins/HookSystem.hpp>
#include <wayland-server-core.h>
#include <cstdint>

// Reads smooth axis events, replaces them with the engine's synthesized
// ones and ends a scroll once the finger lifts or input goes quiet.
class CScrollCapture {
  public:
    CScrollCapture();
    ~CScrollCapture();

    void onAxis(IPointer::SAxisEvent& e, SCallbackInfo& info);
    void onButton(IPointer::SButtonEvent& e);
    void onActiveWindow();

    void stopScroll(const char* reason = nullptr);

  private:
    static int           onEndTimer(void* data);
    static int           onFrameIdle(void* data);
    void                 endGesture(const char* reason);
    void                 flushFrame();
    void                 feedFrame(const SVector& delta);

    CWaylandFrameClock   m_clock;
    CSeatScrollSink      m_sink;
    CGestureScrollEngine m_engine;

    CAxisFrame           m_frame;
    bool                 m_tracking               = false;
    uintptr_t            m_scrollTargetWindowKey  = 0;
    uintptr_t            m_scrollTargetSurfaceKey = 0;

    wl_event_source*     m_endTimer  = nullptr;
    wl_event_source*     m_frameIdle = nullptr;
};

SGestureScrollConfig readEngineConfig();
