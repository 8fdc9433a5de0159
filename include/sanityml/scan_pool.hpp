#pragma once

// Scan pool
//
// Fixed set of worker threads. Workers claim artifacts by atomic index and
// own each claimed artifact end to end, writing only their own result
// slot, so no locking is needed until the results are merged.

#include "sanityml/deps/advisory.hpp"
#include "sanityml/options.hpp"
#include "sanityml/rules/rule_table.hpp"
#include "sanityml/scanner.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace sanityml {

/// One file handed to the pool
struct ScanTarget {
    std::filesystem::path path;
    ArtifactClass kind = ArtifactClass::Model;
};

class ScanPool {
public:
    /// Throws OptionsError when `options` do not validate
    ScanPool(std::shared_ptr<const rules::RuleTable> rules,
             ScanOptions options,
             std::shared_ptr<const deps::AdvisorySource> advisories = nullptr);

    /// Scan all targets; reports are returned in target order
    std::vector<ArtifactReport> run(const std::vector<ScanTarget>& targets) const;

    /// Open and scan a single file on the calling thread
    ArtifactReport scan_file(const ScanTarget& target) const;

    /// Workers used for `jobs` artifacts
    size_t worker_count(size_t jobs) const;

    const ScanOptions& options() const { return scanner_.options(); }

private:
    std::shared_ptr<const deps::AdvisorySource> advisories_;
    ArtifactScanner scanner_;
};

/// Flatten reports into one list in report order
std::vector<Finding> merge_findings(const std::vector<ArtifactReport>& reports);

/// Lower-case extension including the dot (".pt"), "" when none
std::string extension_of(const std::filesystem::path& path);

} // namespace sanityml
