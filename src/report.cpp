#include "sanityml/report.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace sanityml {

namespace {

const char* section_title(ArtifactClass kind) {
    switch (kind) {
        case ArtifactClass::Source: return "Python code";
        case ArtifactClass::Notebook: return "Notebooks";
        case ArtifactClass::Requirements: return "Dependencies";
        case ArtifactClass::Model: return "Models";
    }
    return "?";
}

std::string plural(size_t n, const char* one, const char* many) {
    return std::to_string(n) + " " + (n == 1 ? one : many);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Length of the valid UTF-8 sequence at p, 0 if invalid
size_t utf8_sequence(const unsigned char* p, size_t left) {
    unsigned char c = p[0];
    size_t len;
    uint32_t min;
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) { len = 2; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { len = 3; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { len = 4; min = 0x10000; }
    else return 0;
    if (left < len) return 0;

    uint32_t cp = c & (0x7F >> len);
    for (size_t i = 1; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (p[i] & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

void write_finding_json(std::ostringstream& oss, const Finding& f) {
    oss << "{\"rule_id\":\"" << json_escape(f.rule_id) << "\""
        << ",\"severity\":\"" << severity_name(f.severity) << "\""
        << ",\"locator\":{\"entry\":\"" << json_escape(f.locator.entry) << "\"";
    if (f.locator.line > 0) {
        oss << ",\"line\":" << f.locator.line << ",\"column\":" << f.locator.column;
    } else {
        oss << ",\"offset\":" << f.locator.offset;
    }
    oss << "}"
        << ",\"rationale\":\"" << json_escape(f.rationale) << "\""
        << ",\"evidence\":\"" << json_escape(f.evidence) << "\"}";
}

} // anonymous namespace

bool is_error_rule(const std::string& rule_id) {
    static const char* const ids[] = {
        "PARSE_ERROR", "STREAM_TOO_LARGE", "NO_PICKLE_STREAM",
        "CONTAINER_CORRUPT", "SCAN_TIMEOUT", "READ_ERROR", "TRAILING_DATA",
    };
    return std::any_of(std::begin(ids), std::end(ids),
                       [&](const char* id) { return rule_id == id; });
}

// ============================================================================
// ScanReport
// ============================================================================

ScanReport ScanReport::build(std::vector<ArtifactReport> artifacts, double duration_seconds) {
    ScanReport report;
    report.artifacts = std::move(artifacts);
    report.duration_seconds = duration_seconds;
    for (const auto& a : report.artifacts) {
        report.findings.insert(report.findings.end(), a.findings.begin(), a.findings.end());
    }
    sort_findings(report.findings);
    return report;
}

size_t ScanReport::artifact_count(ArtifactClass kind) const {
    return static_cast<size_t>(std::count_if(artifacts.begin(), artifacts.end(),
                                             [kind](const ArtifactReport& a) { return a.kind == kind; }));
}

size_t ScanReport::finding_count(Severity severity) const {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
                                             [severity](const Finding& f) { return f.severity == severity; }));
}

bool ScanReport::any_issue() const {
    return std::any_of(findings.begin(), findings.end(), [](const Finding& f) {
        return f.severity >= Severity::Warn && !is_error_rule(f.rule_id);
    });
}

bool ScanReport::any_error() const {
    return std::any_of(findings.begin(), findings.end(), [](const Finding& f) {
        return f.severity >= Severity::Warn && is_error_rule(f.rule_id);
    });
}

int exit_status(const ScanReport& report) {
    return count_at_least(report.findings, Severity::Warn) > 0 ? 1 : 0;
}

// ============================================================================
// Text
// ============================================================================

std::string render_summary(const ScanReport& report) {
    std::ostringstream oss;
    if (report.any_issue()) {
        oss << "Issues detected.\n";
    } else if (report.any_error()) {
        oss << "Scan completed with errors.\n";
    } else {
        oss << "All checks passed.\n";
    }

    oss << plural(report.artifact_count(ArtifactClass::Source), "python file", "python files") << ", "
        << plural(report.artifact_count(ArtifactClass::Notebook), "notebook", "notebooks") << ", "
        << plural(report.artifact_count(ArtifactClass::Model), "model", "models") << ", "
        << plural(report.artifact_count(ArtifactClass::Requirements),
                  "requirements file", "requirements files")
        << " scanned\n";

    oss << "Findings: " << report.finding_count(Severity::Critical) << " critical, "
        << report.finding_count(Severity::Warn) << " warn, "
        << report.finding_count(Severity::Info) << " info\n";

    oss << "Completed in " << std::fixed << std::setprecision(1) << report.duration_seconds << "s\n";
    return oss.str();
}

std::string render_text(const ScanReport& report, bool show_info) {
    std::ostringstream oss;
    const std::string rule(60, '-');

    static const ArtifactClass order[] = {
        ArtifactClass::Source, ArtifactClass::Notebook,
        ArtifactClass::Requirements, ArtifactClass::Model,
    };

    for (ArtifactClass kind : order) {
        if (report.artifact_count(kind) == 0) {
            continue;
        }
        oss << section_title(kind) << "\n" << std::string(40, '-') << "\n";

        bool any = false;
        for (const auto& artifact : report.artifacts) {
            if (artifact.kind != kind) {
                continue;
            }
            std::vector<const Finding*> shown;
            for (const auto& f : artifact.findings) {
                if (show_info || f.severity != Severity::Info) {
                    shown.push_back(&f);
                }
            }
            if (shown.empty()) {
                continue;
            }
            any = true;
            oss << "| " << artifact.path << "\n";
            for (const Finding* f : shown) {
                oss << "|   [" << upper(severity_name(f->severity)) << "] " << f->rule_id
                    << " at " << f->locator.to_string() << ": " << f->rationale << "\n";
                if (!f->evidence.empty()) {
                    oss << "|       " << f->evidence << "\n";
                }
            }
        }
        if (!any) {
            oss << "| Nothing to report\n";
        }
        oss << "\n";
    }

    oss << rule << "\n" << render_summary(report) << rule << "\n";
    return oss.str();
}

// ============================================================================
// JSON
// ============================================================================

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = p[i];
        switch (c) {
            case '"': out += "\\\""; ++i; continue;
            case '\\': out += "\\\\"; ++i; continue;
            case '\n': out += "\\n"; ++i; continue;
            case '\r': out += "\\r"; ++i; continue;
            case '\t': out += "\\t"; ++i; continue;
            default: break;
        }
        if (c < 0x20 || c == 0x7F) {
            static const char digits[] = "0123456789abcdef";
            out += "\\u00";
            out += digits[c >> 4];
            out += digits[c & 0x0F];
            ++i;
            continue;
        }
        size_t len = utf8_sequence(p + i, text.size() - i);
        if (len == 0) {
            out += "\\ufffd";
            ++i;
            continue;
        }
        out.append(text.data() + i, len);
        i += len;
    }
    return out;
}

std::string render_json(const ScanReport& report) {
    std::ostringstream oss;
    oss << "{\"summary\":{"
        << "\"critical\":" << report.finding_count(Severity::Critical)
        << ",\"warn\":" << report.finding_count(Severity::Warn)
        << ",\"info\":" << report.finding_count(Severity::Info)
        << ",\"python_files\":" << report.artifact_count(ArtifactClass::Source)
        << ",\"notebooks\":" << report.artifact_count(ArtifactClass::Notebook)
        << ",\"requirements\":" << report.artifact_count(ArtifactClass::Requirements)
        << ",\"models\":" << report.artifact_count(ArtifactClass::Model)
        << ",\"duration_seconds\":" << std::fixed << std::setprecision(3) << report.duration_seconds
        << ",\"exit_status\":" << exit_status(report)
        << "}";

    oss << ",\"artifacts\":[";
    bool first = true;
    for (const auto& artifact : report.artifacts) {
        if (!first) oss << ",";
        first = false;

        oss << "{\"path\":\"" << json_escape(artifact.path) << "\""
            << ",\"kind\":\"" << artifact_class_name(artifact.kind) << "\""
            << ",\"state\":\"" << scan_state_name(artifact.state) << "\""
            << ",\"aborted_in\":";
        if (artifact.aborted_in) {
            oss << "\"" << scan_state_name(*artifact.aborted_in) << "\"";
        } else {
            oss << "null";
        }
        oss << ",\"streams\":" << artifact.streams << ",\"findings\":[";

        bool first_finding = true;
        for (const auto& f : artifact.findings) {
            if (!first_finding) oss << ",";
            first_finding = false;
            write_finding_json(oss, f);
        }
        oss << "]}";
    }
    oss << "]}";
    return oss.str();
}

} // namespace sanityml
