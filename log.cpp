#include "log.hpp"
#include <fstream>

static bool        s_enabled = false;
static std::string s_path    = "/tmp/hypr-gesture-scroll.log";

static const char* levelName(GSLog::eLevel level) {
    switch (level) {
        case GSLog::TRACE: return "TRACE";
        case GSLog::INFO: return "LOG";
        case GSLog::WARN: return "WARN";
        case GSLog::ERR: return "ERR";
    }
    return "?";
}

void GSLog::setEnabled(bool enabled) {
    s_enabled = enabled;
}

bool GSLog::enabled() {
    return s_enabled;
}

void GSLog::setPath(const std::string& path) {
    s_path = path;
}

std::string GSLog::path() {
    return s_path;
}

void GSLog::write(eLevel level, const std::string& msg) {
    if (!s_enabled)
        return;

    std::ofstream log(s_path, std::ios::app);
    if (log.is_open())
        log << "[hypr-gesture-scroll] " << levelName(level) << ": " << msg << "\n";
}
