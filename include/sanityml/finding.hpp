#pragma once

#include "sanityml/errors.hpp"
#include "sanityml/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sanityml {

/// Position of a finding inside an artifact
struct Locator {
    /// Container member, stream index or notebook cell ("" for the artifact itself)
    std::string entry;

    /// Byte offset (pickle path)
    uint64_t offset = 0;

    /// 1-based line and column (source path), 0 when not applicable
    uint32_t line = 0;
    uint32_t column = 0;

    static Locator at_offset(std::string entry, uint64_t offset);
    static Locator at_line(std::string entry, uint32_t line, uint32_t column);

    /// e.g. "archive/data.pkl@0x1f", "line 12:5", "cell 3, line 2:1"
    std::string to_string() const;

    bool operator==(const Locator& other) const;
    bool operator!=(const Locator& other) const { return !(*this == other); }
    bool operator<(const Locator& other) const;
};

/// One classified risk observation. Produced once, never mutated.
struct Finding {
    std::string artifact_path;
    Locator locator;
    std::string rule_id;
    Severity severity = Severity::Info;
    std::string rationale;
    std::string evidence;
};

/// Matched span on the source path, before conversion to a Finding
struct SourceToken {
    std::string file;
    uint32_t line = 0;
    uint32_t column = 0;
    std::string text;
    std::string rule_id;
};

// ============================================================================
// Error findings
// ============================================================================

/// Rule id used for findings raised from an artifact-local error
std::string error_rule_id(ScanErrorKind kind);

/// Severity used for findings raised from an artifact-local error
Severity error_severity(ScanErrorKind kind);

/// Convert an artifact-local error into its single finding
Finding make_error_finding(const std::string& artifact_path,
                           const std::string& entry,
                           ScanErrorKind kind,
                           const std::string& message,
                           uint64_t offset = 0);

// ============================================================================
// Ordering
// ============================================================================

/// Report order: artifact path, severity descending, locator, rule id
bool finding_less(const Finding& a, const Finding& b);

/// Stable sort into report order
void sort_findings(std::vector<Finding>& findings);

/// Remove duplicates by (rule id, locator), keeping the first occurrence.
/// Callers pass findings of a single artifact.
void dedupe_findings(std::vector<Finding>& findings);

/// Count findings at or above a severity
size_t count_at_least(const std::vector<Finding>& findings, Severity severity);

} // namespace sanityml
