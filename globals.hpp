#pragma once
#include <hyprland/src/plugins/PluginAPI.hpp>

class CScrollCapture;

inline HANDLE          PHANDLE          = nullptr;
inline CScrollCapture* g_pScrollCapture = nullptr;
