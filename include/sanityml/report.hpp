#pragma once

#include "sanityml/finding.hpp"
#include "sanityml/scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sanityml {

/// Results of one run over a project
struct ScanReport {
    std::vector<ArtifactReport> artifacts;
    std::vector<Finding> findings;  // all artifacts, report order
    double duration_seconds = 0.0;

    /// Merge artifact reports and sort their findings
    static ScanReport build(std::vector<ArtifactReport> artifacts, double duration_seconds);

    size_t artifact_count(ArtifactClass kind) const;
    size_t finding_count(Severity severity) const;

    /// A warn or critical finding raised by a rule
    bool any_issue() const;

    /// A warn finding raised because an artifact could not be fully scanned
    bool any_error() const;
};

/// True for the rule ids used by error findings (PARSE_ERROR, ...)
bool is_error_rule(const std::string& rule_id);

/// Human-readable report: one section per artifact class, then the summary
std::string render_text(const ScanReport& report, bool show_info = true);

/// Machine-readable report
std::string render_json(const ScanReport& report);

/// Summary block:
///     Issues detected.
///     3 python files, 1 notebook, 2 models, 1 requirements file scanned
///     Findings: 1 critical, 2 warn, 0 info
///     Completed in 0.4s
std::string render_summary(const ScanReport& report);

/// Process exit status: 1 if any warn or critical finding, else 0
int exit_status(const ScanReport& report);

/// Escape text for a JSON string literal. Invalid UTF-8 becomes U+FFFD.
std::string json_escape(std::string_view text);

} // namespace sanityml
