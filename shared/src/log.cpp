#include "uplink/log.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace uplink {

namespace {

std::mutex log_mutex;
std::ofstream log_file;
std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};

const char *tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "[debug] ";
        case LogLevel::Info:
            return "[info] ";
        case LogLevel::Warning:
            return "[warning] ";
        case LogLevel::Error:
            return "[error] ";
    }
    return "";
}

} // namespace

void set_log_level(LogLevel level) {
    min_level = static_cast<int>(level);
}

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    if (path.empty()) {
        return;
    }
    log_file.open(path, std::ios::app);
    if (!log_file) {
        throw std::runtime_error("file_open_failed: Failed to open log file (path: " + path + ")");
    }
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= min_level.load();
}

void log_line(LogLevel level, const std::string &msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ostream &out = (level == LogLevel::Warning || level == LogLevel::Error) ? std::cerr : std::cout;
    out << tag(level) << msg << std::endl;
    if (log_file.is_open()) {
        log_file << tag(level) << msg << "\n";
        log_file.flush();
    }
}

} // namespace uplink
