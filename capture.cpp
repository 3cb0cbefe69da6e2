#include "capture.hpp"
#include "globals.hpp"
#include "log.hpp"
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/managers/SeatManager.hpp>
#include <hyprland/src/managers/input/InputManager.hpp>
#include <algorithm>
#include <cctype>
#include <string>

static bool classLooksLikeBrowser(std::string cls) {
    for (auto& c : cls)
        c = std::tolower(static_cast<unsigned char>(c));

    return cls.find("firefox") != std::string::npos || cls.find("chrom") != std::string::npos || cls.find("brave") != std::string::npos ||
           cls.find("vivaldi") != std::string::npos || cls.find("opera") != std::string::npos || cls.find("librewolf") != std::string::npos ||
           cls.find("zen") != std::string::npos;
}

struct SScrollTargetKeys {
    uintptr_t windowKey  = 0;
    uintptr_t surfaceKey = 0;
};

static SScrollTargetKeys currentScrollTargetKeys() {
    SScrollTargetKeys out;

    if (g_pInputManager) {
        const auto PWIN = g_pInputManager->m_lastMouseFocus.lock();
        out.windowKey   = PWIN ? reinterpret_cast<uintptr_t>(PWIN.get()) : 0;
    }

    if (g_pSeatManager) {
        const auto PSURF = g_pSeatManager->m_state.pointerFocus.lock();
        out.surfaceKey   = PSURF ? reinterpret_cast<uintptr_t>(PSURF.get()) : 0;
    }

    return out;
}

static bool focusIsBrowser() {
    const auto PWIN = g_pInputManager ? g_pInputManager->m_lastMouseFocus.lock() : nullptr;
    return PWIN && classLooksLikeBrowser(PWIN->m_class);
}

static void updateLogging() {
    static auto const* PDEBUG = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:debug")->getDataStaticPtr();
    GSLog::setEnabled(**PDEBUG);
}

SGestureScrollConfig readEngineConfig() {
    static auto const* PPIXELSPERLINE = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:pixels_per_line")->getDataStaticPtr();
    static auto const* PGESTUREGAIN   = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:gesture_gain")->getDataStaticPtr();
    static auto const* PMAXGAP        = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:max_momentum_start_gap")->getDataStaticPtr();
    static auto const* PSTOPSPEED     = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:stop_speed")->getDataStaticPtr();
    static auto const* PDRAGCOEFF     = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:drag_coefficient")->getDataStaticPtr();
    static auto const* PDRAGEXP       = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:drag_exponent")->getDataStaticPtr();
    static auto const* PVELOCITYEXP   = (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:velocity_exponent")->getDataStaticPtr();
    static auto const* PCAPACITY      = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:smoother_capacity")->getDataStaticPtr();
    static auto const* PINTERVAL      = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:interval_ms")->getDataStaticPtr();

    SGestureScrollConfig config;
    config.pixelsPerLine       = **PPIXELSPERLINE;
    config.gestureGain         = **PGESTUREGAIN;
    config.maxMomentumStartGap = **PMAXGAP;
    config.stopSpeed           = **PSTOPSPEED;
    config.dragCoefficient     = **PDRAGCOEFF;
    config.dragExponent        = **PDRAGEXP;
    config.velocityExponent    = **PVELOCITYEXP;
    // negative values wrap to huge numbers otherwise, let sanitizeConfig see a 0
    config.smootherCapacity = **PCAPACITY > 0 ? static_cast<size_t>(**PCAPACITY) : 0;
    config.intervalMs       = **PINTERVAL > 0 ? static_cast<uint32_t>(**PINTERVAL) : 0;

    return sanitizeConfig(config);
}

CScrollCapture::CScrollCapture() : m_clock(g_pCompositor->m_wlEventLoop), m_engine(m_clock, m_sink, currentPointerLocation, readEngineConfig()) {
    m_endTimer = wl_event_loop_add_timer(g_pCompositor->m_wlEventLoop, onEndTimer, this);
}

CScrollCapture::~CScrollCapture() {
    if (m_frameIdle)
        wl_event_source_remove(m_frameIdle);
    if (m_endTimer)
        wl_event_source_remove(m_endTimer);
}

void CScrollCapture::onAxis(IPointer::SAxisEvent& e, SCallbackInfo& info) {
    static auto const* PENABLED    = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:enabled")->getDataStaticPtr();
    static auto const* PDISABLE_BROWSER =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:disable_in_browser")->getDataStaticPtr();
    static auto const* PSTOPTARGET =
        (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_target_change")->getDataStaticPtr();
    static auto const* PDELTA_MUL =
        (Hyprlang::FLOAT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:delta_multiplier")->getDataStaticPtr();
    static auto const* PENDTIMEOUT = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:end_timeout_ms")->getDataStaticPtr();

    updateLogging();

    if (!**PENABLED) {
        if (m_tracking || m_frame.pending() || m_engine.isMomentumRunning())
            stopScroll("disabled");
        return;
    }

    const auto targetKeys = currentScrollTargetKeys();

    if (**PSTOPTARGET && m_scrollTargetWindowKey != 0) {
        const bool windowChanged  = targetKeys.windowKey != 0 && targetKeys.windowKey != m_scrollTargetWindowKey;
        const bool surfaceChanged = targetKeys.surfaceKey != 0 && targetKeys.surfaceKey != m_scrollTargetSurfaceKey;
        if (windowChanged || surfaceChanged)
            stopScroll("targetChanged");
    }

    // browsers do their own kinetic scrolling, leave their input alone
    if (**PDISABLE_BROWSER && focusIsBrowser()) {
        if (m_tracking || m_frame.pending() || m_engine.isMomentumRunning())
            stopScroll("browserFocus");
        return;
    }

    // Only touchpad scrolling (some devices report as mouse with smooth deltas)
    const bool touchpadSource = (e.source == WL_POINTER_AXIS_SOURCE_FINGER || e.source == WL_POINTER_AXIS_SOURCE_CONTINUOUS);
    const bool smoothMouse    = (e.mouse && e.deltaDiscrete == 0);
    if (!touchpadSource && !smoothMouse)
        return;

    if (e.delta == 0.0) {
        // libinput reports a finger lift as a zero finger delta
        flushFrame();
        if (!m_tracking)
            return;

        info.cancelled = true;
        endGesture("fingerLifted");
        return;
    }

    info.cancelled = true;

    const double  scaledDelta = e.delta * **PDELTA_MUL;
    const SVector delta       = e.axis == WL_POINTER_AXIS_VERTICAL_SCROLL ? SVector{0.0, scaledDelta} : SVector{scaledDelta, 0.0};

    // both axes of a diagonal scroll share one timestamp and reach the engine as one delta
    if (const auto previous = m_frame.add(e.timeMs, delta))
        feedFrame(*previous);

    if (!m_frameIdle)
        m_frameIdle = wl_event_loop_add_idle(g_pCompositor->m_wlEventLoop, onFrameIdle, this);

    m_scrollTargetWindowKey  = targetKeys.windowKey;
    m_scrollTargetSurfaceKey = targetKeys.surfaceKey;

    // no event within the timeout => input stopped without a finger lift
    wl_event_source_timer_update(m_endTimer, std::max<int>(**PENDTIMEOUT, 1));
}

void CScrollCapture::feedFrame(const SVector& delta) {
    if (delta.isZero())
        return;

    if (!m_tracking) {
        m_engine.setConfig(readEngineConfig());
        m_engine.feed(delta, INPUT_PHASE_BEGAN);
        m_tracking = true;
    } else
        m_engine.feed(delta, INPUT_PHASE_CHANGED);
}

void CScrollCapture::flushFrame() {
    if (const auto delta = m_frame.flush())
        feedFrame(*delta);
}

void CScrollCapture::onButton(IPointer::SButtonEvent& e) {
    static auto const* PSTOPCLICK = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_click")->getDataStaticPtr();

    updateLogging();

    if (!**PSTOPCLICK || e.state != WL_POINTER_BUTTON_STATE_PRESSED)
        return;

    stopScroll("mouseButton");
}

void CScrollCapture::onActiveWindow() {
    static auto const* PSTOPFOCUS = (Hyprlang::INT* const*)HyprlandAPI::getConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_focus")->getDataStaticPtr();

    updateLogging();

    if (!**PSTOPFOCUS)
        return;

    stopScroll("activeWindow");
}

void CScrollCapture::endGesture(const char* reason) {
    GSLog::log(GSLog::INFO, "endGesture reason=", reason ? reason : "(null)");

    wl_event_source_timer_update(m_endTimer, 0);
    flushFrame();

    if (!m_tracking)
        return;

    m_tracking = false;
    m_engine.feed({}, INPUT_PHASE_ENDED);
}

void CScrollCapture::stopScroll(const char* reason) {
    GSLog::log(GSLog::INFO, "stopScroll reason=", reason ? reason : "(null)");

    // an unflushed frame is dropped with the scroll
    m_frame.reset();

    // an active gesture still gets its end event, but without momentum
    if (m_tracking) {
        m_tracking = false;
        wl_event_source_timer_update(m_endTimer, 0);
        m_engine.feed({}, INPUT_PHASE_ENDED);
    }

    m_engine.stop();

    m_scrollTargetWindowKey  = 0;
    m_scrollTargetSurfaceKey = 0;
}

int CScrollCapture::onEndTimer(void* data) {
    auto* self = static_cast<CScrollCapture*>(data);

    if (!self->m_tracking)
        return 0;

    self->endGesture("timeout");
    return 0;
}

int CScrollCapture::onFrameIdle(void* data) {
    auto* self = static_cast<CScrollCapture*>(data);

    // idle sources are one-shot, the loop removes it after this call
    self->m_frameIdle = nullptr;
    self->flushFrame();
    return 0;
}
