#include "sanityml/finding.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

namespace sanityml {

const char* scan_error_kind_name(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::TruncatedStream: return "TruncatedStream";
        case ScanErrorKind::UnknownOpcode: return "UnknownOpcode";
        case ScanErrorKind::ProtocolMismatch: return "ProtocolMismatch";
        case ScanErrorKind::StreamTooLarge: return "StreamTooLarge";
        case ScanErrorKind::StackUnderflow: return "StackUnderflow";
        case ScanErrorKind::NoPickleStreamFound: return "NoPickleStreamFound";
        case ScanErrorKind::ContainerCorrupt: return "ContainerCorrupt";
        case ScanErrorKind::ScanTimeout: return "ScanTimeout";
        case ScanErrorKind::ReadError: return "ReadError";
    }
    return "Unknown";
}

// ============================================================================
// Locator
// ============================================================================

Locator Locator::at_offset(std::string entry, uint64_t offset) {
    Locator loc;
    loc.entry = std::move(entry);
    loc.offset = offset;
    return loc;
}

Locator Locator::at_line(std::string entry, uint32_t line, uint32_t column) {
    Locator loc;
    loc.entry = std::move(entry);
    loc.line = line;
    loc.column = column;
    return loc;
}

std::string Locator::to_string() const {
    std::ostringstream oss;
    if (line > 0) {
        if (!entry.empty()) {
            oss << entry << ", ";
        }
        oss << "line " << line;
        if (column > 0) {
            oss << ":" << column;
        }
        return oss.str();
    }
    if (!entry.empty()) {
        oss << entry;
    }
    oss << "@0x" << std::hex << offset;
    return oss.str();
}

bool Locator::operator==(const Locator& other) const {
    return entry == other.entry && offset == other.offset &&
           line == other.line && column == other.column;
}

bool Locator::operator<(const Locator& other) const {
    return std::tie(entry, line, column, offset) <
           std::tie(other.entry, other.line, other.column, other.offset);
}

// ============================================================================
// Error findings
// ============================================================================

std::string error_rule_id(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::TruncatedStream:
        case ScanErrorKind::UnknownOpcode:
        case ScanErrorKind::ProtocolMismatch:
        case ScanErrorKind::StackUnderflow:
            return "PARSE_ERROR";
        case ScanErrorKind::StreamTooLarge: return "STREAM_TOO_LARGE";
        case ScanErrorKind::NoPickleStreamFound: return "NO_PICKLE_STREAM";
        case ScanErrorKind::ContainerCorrupt: return "CONTAINER_CORRUPT";
        case ScanErrorKind::ScanTimeout: return "SCAN_TIMEOUT";
        case ScanErrorKind::ReadError: return "READ_ERROR";
    }
    return "PARSE_ERROR";
}

Severity error_severity(ScanErrorKind kind) {
    return kind == ScanErrorKind::NoPickleStreamFound ? Severity::Info : Severity::Warn;
}

Finding make_error_finding(const std::string& artifact_path,
                           const std::string& entry,
                           ScanErrorKind kind,
                           const std::string& message,
                           uint64_t offset) {
    Finding f;
    f.artifact_path = artifact_path;
    f.locator = Locator::at_offset(entry, offset);
    f.rule_id = error_rule_id(kind);
    f.severity = error_severity(kind);
    switch (kind) {
        case ScanErrorKind::NoPickleStreamFound:
            f.rationale = "Archive contains no embedded pickle stream to inspect";
            break;
        case ScanErrorKind::ContainerCorrupt:
            f.rationale = "Archive framing is malformed; contents were not fully inspected";
            break;
        case ScanErrorKind::ScanTimeout:
            f.rationale = "Scan did not finish within the time limit; results are partial";
            break;
        case ScanErrorKind::StreamTooLarge:
            f.rationale = "Artifact exceeds a configured size limit; results are partial";
            break;
        case ScanErrorKind::ReadError:
            f.rationale = "Artifact could not be read";
            break;
        default:
            f.rationale = "Artifact could not be fully parsed; results are partial";
            break;
    }
    f.evidence = std::string(scan_error_kind_name(kind)) + ": " + message;
    return f;
}

// ============================================================================
// Ordering
// ============================================================================

bool finding_less(const Finding& a, const Finding& b) {
    if (a.artifact_path != b.artifact_path) {
        return a.artifact_path < b.artifact_path;
    }
    if (a.severity != b.severity) {
        return a.severity > b.severity;
    }
    if (a.locator != b.locator) {
        return a.locator < b.locator;
    }
    return a.rule_id < b.rule_id;
}

void sort_findings(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), finding_less);
}

void dedupe_findings(std::vector<Finding>& findings) {
    std::set<std::tuple<std::string, std::string, uint64_t, uint32_t, uint32_t>> seen;
    std::vector<Finding> unique;
    unique.reserve(findings.size());
    for (auto& f : findings) {
        auto key = std::make_tuple(f.rule_id, f.locator.entry, f.locator.offset,
                                   f.locator.line, f.locator.column);
        if (seen.insert(std::move(key)).second) {
            unique.push_back(std::move(f));
        }
    }
    findings = std::move(unique);
}

size_t count_at_least(const std::vector<Finding>& findings, Severity severity) {
    return static_cast<size_t>(std::count_if(
        findings.begin(), findings.end(),
        [severity](const Finding& f) { return f.severity >= severity; }));
}

} // namespace sanityml
