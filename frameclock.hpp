#pragma once
#include <cstdint>
#include <functional>

// Monotonic time plus one periodic tick. Everything driven by a clock runs on
// the thread that dispatches its ticks.
class IFrameClock {
  public:
    virtual ~IFrameClock() = default;

    // seconds, monotonic
    virtual double now() const = 0;

    // replaces any previous schedule
    virtual void schedule(uint32_t intervalMs, std::function<void()> onTick) = 0;
    // no tick fires after this returns
    virtual void cancel()            = 0;
    virtual bool isScheduled() const = 0;
};
