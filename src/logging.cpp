#include "sanityml/logging.hpp"

#include <iostream>
#include <mutex>

namespace sanityml {

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Warning;
}

void log_message(LogLevel threshold, LogLevel level, const std::string& message) {
    if (level < threshold) {
        return;
    }

    static std::mutex log_mutex;
    const char* prefix = "";
    switch (level) {
        case LogLevel::Debug: prefix = "Debug: "; break;
        case LogLevel::Info: prefix = ""; break;
        case LogLevel::Warning: prefix = "Warning: "; break;
        case LogLevel::Error: prefix = "Error: "; break;
    }

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << prefix << message << "\n";
}

} // namespace sanityml
