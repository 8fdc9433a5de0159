#pragma once

#include <string>

namespace sanityml {

/// Diagnostic levels, matching ScanOptions::log_level names
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/// Parse "debug" / "info" / "warning" / "error"; unknown names map to Warning
LogLevel parse_log_level(const std::string& name);

/// Write one diagnostic line to stderr if `level` passes `threshold`.
/// Safe to call from worker threads; each line is written atomically.
void log_message(LogLevel threshold, LogLevel level, const std::string& message);

} // namespace sanityml
