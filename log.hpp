#pragma once
#include <sstream>
#include <string>

// Append-only debug log, one "[hypr-gesture-scroll]" line per record.
// Nothing is written unless enabled.
namespace GSLog {
    enum eLevel {
        TRACE = 0,
        INFO,
        WARN,
        ERR,
    };

    void        setEnabled(bool enabled);
    bool        enabled();
    void        setPath(const std::string& path);
    std::string path();

    void        write(eLevel level, const std::string& msg);

    template <typename... Args>
    void log(eLevel level, Args&&... args) {
        if (!enabled())
            return;

        std::ostringstream ss;
        (ss << ... << args);
        write(level, ss.str());
    }
}
