#include "globals.hpp"
#include "capture.hpp"
#include "log.hpp"
#include <hyprland/src/plugins/PluginAPI.hpp>
#include <hyprland/src/devices/IPointer.hpp>
#include <unordered_map>
#include <any>
#include <stdexcept>

static SP<HOOK_CALLBACK_FN> g_pAxisCallback;
static SP<HOOK_CALLBACK_FN> g_pButtonCallback;
static SP<HOOK_CALLBACK_FN> g_pWindowCallback;

static void onMouseAxis(void* /*self*/, SCallbackInfo& info, std::any data) {
    if (!g_pScrollCapture)
        return;

    auto eventData = std::any_cast<std::unordered_map<std::string, std::any>>(data);
    auto e         = std::any_cast<IPointer::SAxisEvent>(eventData["event"]);

    // cancels the original event when it gets replaced by synthesized ones
    g_pScrollCapture->onAxis(e, info);
}

static void onMouseButton(void* /*self*/, SCallbackInfo& /*info*/, std::any data) {
    if (!g_pScrollCapture)
        return;

    auto eventData = std::any_cast<std::unordered_map<std::string, std::any>>(data);
    auto e         = std::any_cast<IPointer::SButtonEvent>(eventData["event"]);

    g_pScrollCapture->onButton(e);
}

static void onActiveWindow(void* /*self*/, SCallbackInfo& /*info*/, std::any /*data*/) {
    if (!g_pScrollCapture)
        return;

    g_pScrollCapture->onActiveWindow();
}

APICALL EXPORT std::string PLUGIN_API_VERSION() {
    return HYPRLAND_API_VERSION;
}

APICALL EXPORT PLUGIN_DESCRIPTION_INFO PLUGIN_INIT(HANDLE handle) {
    PHANDLE = handle;

    const std::string HASH = __hyprland_api_get_hash();
    if (HASH != __hyprland_api_get_client_hash()) {
        HyprlandAPI::addNotification(PHANDLE, "[hypr-gesture-scroll] Mismatched headers! Can't proceed.", CHyprColor{1.0, 0.2, 0.2, 1.0}, 5000);
        throw std::runtime_error("[hypr-gesture-scroll] Version mismatch");
    }

    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:enabled", Hyprlang::INT{1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:pixels_per_line", Hyprlang::FLOAT{10.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:gesture_gain", Hyprlang::FLOAT{1.15});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:max_momentum_start_gap", Hyprlang::FLOAT{0.1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:stop_speed", Hyprlang::FLOAT{1.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:drag_coefficient", Hyprlang::FLOAT{30.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:drag_exponent", Hyprlang::FLOAT{0.7});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:velocity_exponent", Hyprlang::FLOAT{1.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:smoother_capacity", Hyprlang::INT{5});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:interval_ms", Hyprlang::INT{16});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:delta_multiplier", Hyprlang::FLOAT{1.0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:end_timeout_ms", Hyprlang::INT{50});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:disable_in_browser", Hyprlang::INT{1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_click", Hyprlang::INT{0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_focus", Hyprlang::INT{0});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:stop_on_target_change", Hyprlang::INT{1});
    HyprlandAPI::addConfigValue(PHANDLE, "plugin:gesture-scroll:debug", Hyprlang::INT{0});

    // needs the compositor's event loop, which exists during PLUGIN_INIT
    g_pScrollCapture = new CScrollCapture();

    g_pAxisCallback   = HyprlandAPI::registerCallbackDynamic(PHANDLE, "mouseAxis", onMouseAxis);
    g_pButtonCallback = HyprlandAPI::registerCallbackDynamic(PHANDLE, "mouseButton", onMouseButton);
    g_pWindowCallback = HyprlandAPI::registerCallbackDynamic(PHANDLE, "activeWindow", onActiveWindow);

    HyprlandAPI::addNotification(PHANDLE, "[hypr-gesture-scroll] Loaded!", CHyprColor{0.2, 0.8, 0.2, 1.0}, 3000);

    return {"hypr-gesture-scroll", "Trackpad-like gesture scrolling with momentum", "hypr-gesture-scroll", "0.1"};
}

APICALL EXPORT void PLUGIN_EXIT() {
    g_pAxisCallback.reset();
    g_pButtonCallback.reset();
    g_pWindowCallback.reset();

    if (g_pScrollCapture)
        g_pScrollCapture->stopScroll("pluginExit");

    // removes the wl timer sources
    delete g_pScrollCapture;
    g_pScrollCapture = nullptr;
}
