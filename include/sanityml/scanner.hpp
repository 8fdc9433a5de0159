#pragma once

// Artifact pipeline
//
// Runs one artifact through its scan path and converts every
// artifact-local failure into a finding. The states an artifact passes
// through are
//
//     Unopened -> Demultiplexed -> Parsed -> Classified -> Reported
//
// A failure jumps straight to Reported; whatever was built before it is
// still classified.

#include "sanityml/analysis/risk_classifier.hpp"
#include "sanityml/container/demultiplexer.hpp"
#include "sanityml/deps/advisory.hpp"
#include "sanityml/finding.hpp"
#include "sanityml/options.hpp"
#include "sanityml/rules/rule_table.hpp"
#include "sanityml/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sanityml {

enum class ScanState : uint8_t {
    Unopened,
    Demultiplexed,
    Parsed,
    Classified,
    Reported,
};

const char* scan_state_name(ScanState state);

/// One file to scan; `bytes` must outlive the scan
struct Artifact {
    std::string path;
    ArtifactClass kind = ArtifactClass::Model;
    std::string extension;  // lower case, with the dot
    ByteView bytes;
};

/// Outcome of scanning one artifact
struct ArtifactReport {
    std::string path;
    ArtifactClass kind = ArtifactClass::Model;
    ScanState state = ScanState::Unopened;

    /// State in which the first failure was recorded
    std::optional<ScanState> aborted_in;

    /// Deduplicated, in report order
    std::vector<Finding> findings;

    /// Pickle streams inspected (model artifacts)
    size_t streams = 0;
};

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

class ArtifactScanner {
public:
    /// @param rules      Validated rule table, shared read-only
    /// @param options    Limits; must pass validate()
    /// @param advisories Advisory source for requirements files, may be nullptr
    ArtifactScanner(std::shared_ptr<const rules::RuleTable> rules,
                    ScanOptions options,
                    const deps::AdvisorySource* advisories = nullptr);

    /// Scan one artifact. Artifact-local errors never escape; they become
    /// findings. Only resource exhaustion of the process itself propagates.
    ArtifactReport scan(const Artifact& artifact, Deadline deadline = std::nullopt) const;

    const ScanOptions& options() const { return options_; }
    const rules::RuleTable& rules() const { return *rules_; }

private:
    std::shared_ptr<const rules::RuleTable> rules_;
    ScanOptions options_;
    const deps::AdvisorySource* advisories_;
    analysis::RiskClassifier classifier_;
    container::Demultiplexer demux_;

    void scan_model(const Artifact& artifact, Deadline deadline, ArtifactReport& report) const;
    void scan_source(const Artifact& artifact, Deadline deadline, ArtifactReport& report) const;
    void scan_notebook(const Artifact& artifact, Deadline deadline, ArtifactReport& report) const;
    void scan_requirements(const Artifact& artifact, ArtifactReport& report) const;

    /// Read one embedded stream, following concatenated pickles in bare files.
    /// Returns false when a failure must end the whole artifact.
    bool scan_stream(const Artifact& artifact,
                     const container::EmbeddedStream& stream,
                     bool follow_concatenated,
                     Deadline deadline,
                     ArtifactReport& report) const;

    void fail(ArtifactReport& report, const std::string& entry, const ScanFailure& failure) const;
};

} // namespace sanityml
