#include "seatsink.hpp"
#include "log.hpp"
#include <hyprland/src/managers/SeatManager.hpp>
#include <hyprland/src/managers/input/InputManager.hpp>
#include <hyprland/src/config/ConfigValue.hpp>
#include <chrono>
#include <cstdint>

SVector currentPointerLocation() {
    if (!g_pInputManager)
        return {};

    const auto COORDS = g_pInputManager->getMouseCoordsInternal();
    return SVector{COORDS.x, COORDS.y};
}

void CSeatScrollSink::post(const SScrollEventDescriptor& e) {
    static auto PSCROLLFACTOR = CConfigValue<Hyprlang::FLOAT>("input:touchpad:scroll_factor");

    if (!g_pSeatManager)
        return;

    auto         now          = std::chrono::steady_clock::now();
    uint32_t     timeMs       = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    const double scrollFactor = *PSCROLLFACTOR;
    const bool   stopEvent    = e.phase == INPUT_PHASE_ENDED || e.momentumPhase == MOMENTUM_PHASE_END;

    GSLog::log(GSLog::TRACE, "seat: point=(", e.point.x, ", ", e.point.y, ") gesture=(", e.gesture.x, ", ", e.gesture.y, ") line=(", e.line.x, ", ", e.line.y,
               ") phase=", inputPhaseName(e.phase), " momentum=", momentumPhaseName(e.momentumPhase));

    if (e.point.y != 0.0)
        g_pSeatManager->sendPointerAxis(timeMs, WL_POINTER_AXIS_VERTICAL_SCROLL, e.point.y * scrollFactor, 0, 0, WL_POINTER_AXIS_SOURCE_CONTINUOUS,
                                        WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);

    if (e.point.x != 0.0)
        g_pSeatManager->sendPointerAxis(timeMs, WL_POINTER_AXIS_HORIZONTAL_SCROLL, e.point.x * scrollFactor, 0, 0, WL_POINTER_AXIS_SOURCE_CONTINUOUS,
                                        WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);

    // a zero value is sent to clients as axis_stop
    if (stopEvent) {
        g_pSeatManager->sendPointerAxis(timeMs, WL_POINTER_AXIS_VERTICAL_SCROLL, 0.0, 0, 0, WL_POINTER_AXIS_SOURCE_CONTINUOUS, WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);
        g_pSeatManager->sendPointerAxis(timeMs, WL_POINTER_AXIS_HORIZONTAL_SCROLL, 0.0, 0, 0, WL_POINTER_AXIS_SOURCE_CONTINUOUS,
                                        WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);
    }

    g_pSeatManager->sendPointerFrame();
}
