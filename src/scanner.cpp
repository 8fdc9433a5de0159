#include "sanityml/scanner.hpp"
#include "sanityml/logging.hpp"
#include "sanityml/pickle/capability_graph.hpp"
#include "sanityml/source/notebook.hpp"
#include "sanityml/source/source_scanner.hpp"

#include <iterator>
#include <new>
#include <string_view>

namespace sanityml {

const char* scan_state_name(ScanState state) {
    switch (state) {
        case ScanState::Unopened: return "unopened";
        case ScanState::Demultiplexed: return "demultiplexed";
        case ScanState::Parsed: return "parsed";
        case ScanState::Classified: return "classified";
        case ScanState::Reported: return "reported";
    }
    return "?";
}

namespace {

/// PROTO 2..5 starts the next concatenated pickle
bool next_is_pickle(ByteView bytes, size_t pos) {
    return pos + 1 < bytes.size && bytes[pos] == 0x80 && bytes[pos + 1] >= 2 && bytes[pos + 1] <= 5;
}

Finding trailing_data_finding(const std::string& path, const std::string& entry,
                              size_t offset, size_t length) {
    Finding f;
    f.artifact_path = path;
    f.locator = Locator::at_offset(entry, offset);
    f.rule_id = "TRAILING_DATA";
    f.severity = Severity::Info;
    f.rationale = "Bytes after the last pickle stream do not parse as a pickle and were not classified";
    f.evidence = std::to_string(length) + " trailing bytes";
    return f;
}

void append(std::vector<Finding>& out, std::vector<Finding>&& more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

} // anonymous namespace

ArtifactScanner::ArtifactScanner(std::shared_ptr<const rules::RuleTable> rules,
                                 ScanOptions options,
                                 const deps::AdvisorySource* advisories)
    : rules_(rules)
    , options_(std::move(options))
    , advisories_(advisories)
    , classifier_(std::move(rules))
    , demux_(options_) {
    auto errors = options_.validate();
    if (!errors.empty()) {
        throw OptionsError(errors);
    }
}

void ArtifactScanner::fail(ArtifactReport& report,
                           const std::string& entry,
                           const ScanFailure& failure) const {
    report.findings.push_back(make_error_finding(report.path, entry, failure.kind,
                                                 failure.message, failure.offset));
    if (!report.aborted_in) {
        report.aborted_in = report.state;
    }
    log_message(parse_log_level(options_.log_level), LogLevel::Debug,
                sanitize_path_for_error(report.path) + (entry.empty() ? "" : ":" + entry) +
                ": " + scan_error_kind_name(failure.kind) + " in state " +
                scan_state_name(report.state) + ": " + failure.message);
}

ArtifactReport ArtifactScanner::scan(const Artifact& artifact, Deadline deadline) const {
    ArtifactReport report;
    report.path = artifact.path;
    report.kind = artifact.kind;

    try {
        switch (artifact.kind) {
            case ArtifactClass::Model:
                scan_model(artifact, deadline, report);
                break;
            case ArtifactClass::Source:
                scan_source(artifact, deadline, report);
                break;
            case ArtifactClass::Notebook:
                scan_notebook(artifact, deadline, report);
                break;
            case ArtifactClass::Requirements:
                scan_requirements(artifact, report);
                break;
        }
    } catch (const StreamError& e) {
        fail(report, "", ScanFailure::from(e));
    } catch (const std::bad_alloc&) {
        // Security: hostile sizes that slipped past the limits end the artifact, not the run
        fail(report, "", ScanFailure{ScanErrorKind::StreamTooLarge,
                                     "Out of memory while scanning", 0});
    }

    dedupe_findings(report.findings);
    sort_findings(report.findings);
    report.state = ScanState::Reported;
    return report;
}

// ============================================================================
// Model path
// ============================================================================

void ArtifactScanner::scan_model(const Artifact& artifact,
                                 Deadline deadline,
                                 ArtifactReport& report) const {
    container::DemuxResult parts = demux_.split(artifact.bytes, artifact.extension, deadline);
    report.state = ScanState::Demultiplexed;

    for (const auto& entry_failure : parts.failures) {
        fail(report, entry_failure.entry, entry_failure.failure);
    }

    const bool bare = parts.format == container::ContainerFormat::Pickle;
    bool keep_going = true;
    for (const auto& stream : parts.streams) {
        if (!keep_going) {
            break;
        }
        keep_going = scan_stream(artifact, stream, bare, deadline, report);
    }
    if (report.state == ScanState::Demultiplexed) {
        report.state = ScanState::Parsed;
    }

    for (const auto& config : parts.configs) {
        append(report.findings,
               classifier_.classify_layers(config.text.as_string_view(), artifact.path, config.name));
    }
    report.state = ScanState::Classified;
}

bool ArtifactScanner::scan_stream(const Artifact& artifact,
                                  const container::EmbeddedStream& stream,
                                  bool follow_concatenated,
                                  Deadline deadline,
                                  ArtifactReport& report) const {
    pickle::ReaderLimits reader_limits;
    reader_limits.max_stream_bytes = options_.max_stream_bytes;
    reader_limits.deadline = deadline;
    const auto builder_limits = pickle::BuilderLimits::from_options(options_);

    size_t start = stream.start;
    bool trailing = false;
    for (size_t n = 0;; ++n) {
        if (n == options_.max_streams_per_artifact) {
            fail(report, stream.name,
                 ScanFailure{ScanErrorKind::StreamTooLarge,
                             "More than " + std::to_string(options_.max_streams_per_artifact) +
                             " concatenated pickle streams",
                             start});
            return true;
        }

        pickle::StreamScan scan =
            pickle::build_capability_graph(stream.bytes, start, reader_limits, builder_limits);

        const auto& failure = scan.graph.failure();
        if (trailing && failure && failure->kind != ScanErrorKind::ScanTimeout) {
            // Bytes after the last stream that do not form a pickle: only
            // denylist hits from what did parse are kept
            for (auto& f : classifier_.classify(scan.graph, artifact.path, stream.name)) {
                if (f.severity == Severity::Critical) {
                    report.findings.push_back(std::move(f));
                }
            }
            report.findings.push_back(trailing_data_finding(artifact.path, stream.name, start,
                                                            stream.bytes.size - start));
            return true;
        }

        ++report.streams;
        report.state = ScanState::Parsed;

        append(report.findings, classifier_.classify(scan.graph, artifact.path, stream.name));

        if (scan.graph.depth_limited()) {
            log_message(parse_log_level(options_.log_level), LogLevel::Warning,
                        sanitize_path_for_error(artifact.path) +
                        ": reachability stopped at max_traversal_depth");
        }

        if (failure) {
            fail(report, stream.name, *failure);
            return failure->kind != ScanErrorKind::ScanTimeout;
        }

        if (!follow_concatenated || scan.end_offset >= stream.bytes.size) {
            return true;
        }
        // Trailing bytes without PROTO 2..5 are tried as a protocol 0/1 stream
        trailing = !next_is_pickle(stream.bytes, scan.end_offset);
        start = scan.end_offset;
    }
}

// ============================================================================
// Source paths
// ============================================================================

void ArtifactScanner::scan_source(const Artifact& artifact,
                                  Deadline deadline,
                                  ArtifactReport& report) const {
    source::SourceScanLimits limits;
    limits.max_line_chars = options_.max_source_line;
    limits.deadline = deadline;
    source::SourceScanner scanner(rules_, limits);

    auto result = scanner.scan(artifact.bytes.as_string_view(), artifact.path);
    report.state = ScanState::Parsed;
    for (const auto& token : result.tokens) {
        report.findings.push_back(scanner.to_finding(token, "", token.line));
    }
    if (result.failure) {
        fail(report, "", *result.failure);
    }
    report.state = ScanState::Classified;
}

void ArtifactScanner::scan_notebook(const Artifact& artifact,
                                    Deadline deadline,
                                    ArtifactReport& report) const {
    source::SourceScanLimits limits;
    limits.max_line_chars = options_.max_source_line;
    limits.deadline = deadline;
    source::SourceScanner scanner(rules_, limits);

    const std::string_view text = artifact.bytes.as_string_view();
    source::NotebookSource notebook;
    bool parsed = true;
    try {
        notebook = source::extract_notebook(text);
    } catch (const source::NotebookFormatError& e) {
        parsed = false;
        Finding f;
        f.artifact_path = artifact.path;
        f.locator = Locator::at_offset("", e.offset());
        f.rule_id = error_rule_id(ScanErrorKind::TruncatedStream);
        f.severity = Severity::Warn;
        f.rationale = "Notebook is not valid JSON; its raw text was scanned instead";
        f.evidence = std::string("InvalidNotebook: ") + e.what();
        report.findings.push_back(std::move(f));
        report.aborted_in = ScanState::Unopened;
    }
    report.state = ScanState::Demultiplexed;

    if (parsed) {
        auto result = scanner.scan(notebook.code, artifact.path);
        report.state = ScanState::Parsed;
        for (const auto& token : result.tokens) {
            source::CellLine origin = notebook.origin(token.line);
            std::string entry = origin.cell > 0 ? "cell " + std::to_string(origin.cell) : "";
            report.findings.push_back(scanner.to_finding(token, entry, origin.line));
        }
        if (result.failure) {
            fail(report, "", *result.failure);
        }
    } else {
        auto result = scanner.scan(text, artifact.path);
        report.state = ScanState::Parsed;
        for (const auto& token : result.tokens) {
            report.findings.push_back(scanner.to_finding(token, "", token.line));
        }
        if (result.failure) {
            fail(report, "", *result.failure);
        }
    }
    report.state = ScanState::Classified;
}

// ============================================================================
// Dependency path
// ============================================================================

void ArtifactScanner::scan_requirements(const Artifact& artifact, ArtifactReport& report) const {
    auto requirements = deps::parse_requirements(artifact.bytes.as_string_view());
    report.state = ScanState::Parsed;

    log_message(parse_log_level(options_.log_level), LogLevel::Debug,
                sanitize_path_for_error(artifact.path) + ": " +
                std::to_string(requirements.size()) + " requirements");

    deps::DependencyScanner scanner(advisories_);
    append(report.findings, scanner.scan(requirements, artifact.path));
    report.state = ScanState::Classified;
}

} // namespace sanityml
