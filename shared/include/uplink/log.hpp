#pragma once

#include <sstream>
#include <string>

namespace uplink {

enum class LogLevel { Debug, Info, Warning, Error };

void set_log_level(LogLevel level);
void set_log_file(const std::string &path);
bool log_enabled(LogLevel level);

// writes one "[level] message" line to stdout (stderr for warnings and errors)
// and to the log file, if one is open
void log_line(LogLevel level, const std::string &msg);

template <typename... Args>
void log(LogLevel level, const Args &...args) {
    if (!log_enabled(level)) {
        return;
    }
    std::ostringstream out;
    (out << ... << args);
    log_line(level, out.str());
}

template <typename... Args>
void log_debug(const Args &...args) {
    log(LogLevel::Debug, args...);
}

template <typename... Args>
void log_info(const Args &...args) {
    log(LogLevel::Info, args...);
}

template <typename... Args>
void log_warning(const Args &...args) {
    log(LogLevel::Warning, args...);
}

template <typename... Args>
void log_error(const Args &...args) {
    log(LogLevel::Error, args...);
}

} // namespace uplink
