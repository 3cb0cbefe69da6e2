#pragma once
#include "gesturescroll.hpp"

// Delivers engine events to the focused client as wl_pointer axis events.
// Only the point vector has a Wayland counterpart; end events become axis_stop.
class CSeatScrollSink : public IScrollEventSink {
  public:
    CSeatScrollSink()          = default;
    virtual ~CSeatScrollSink() = default;

    virtual void post(const SScrollEventDescriptor& e);
};

// current cursor position in layout coordinates
SVector currentPointerLocation();
