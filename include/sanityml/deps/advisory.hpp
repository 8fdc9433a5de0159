#pragma once

// Dependency advisories
//
// AdvisorySource is the boundary to vulnerability data. The library ships
// only a local file-backed implementation; a networked source would
// implement the same interface.
//
// Advisory file format, one advisory range per line, '#' starts a comment:
//
//     package | advisory id | affected specifiers | summary
//
// Affected specifiers use requirement syntax ("<1.13.1", ">=2.0,<2.3");
// alternative ranges are separated by ';' and "*" means every version.

#include "sanityml/deps/requirements.hpp"
#include "sanityml/errors.hpp"
#include "sanityml/finding.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sanityml {
namespace deps {

/// Raised when an advisory file cannot be read or parsed
class AdvisoryLoadError : public SanityMLError {
public:
    AdvisoryLoadError(const std::string& message, int line = -1)
        : SanityMLError(line > 0 ? "Advisory database error at line " + std::to_string(line) +
                                       ": " + message
                                 : "Advisory database error: " + message)
        , line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

struct Advisory {
    std::string package;   // normalized
    std::string id;        // e.g. "PYSEC-2022-123", "CVE-2024-5480"
    std::vector<std::vector<VersionSpec>> affected;  // any range matching means affected
    bool all_versions = false;
    std::string summary;

    bool affects(const std::string& version) const;

    /// Affected ranges as written, "; " separated
    std::string affected_text() const;
};

/// Source of advisories for a set of requirements
class AdvisorySource {
public:
    virtual ~AdvisorySource() = default;

    /// Advisories for the packages named in `requirements`
    virtual std::vector<Advisory> query(const std::vector<Requirement>& requirements) const = 0;

    /// Name used in diagnostics
    virtual std::string name() const = 0;
};

/// Advisories loaded from a local file
class AdvisoryDatabase : public AdvisorySource {
public:
    /// Parse advisory text; throws AdvisoryLoadError on a malformed line
    static std::shared_ptr<const AdvisoryDatabase> parse(const std::string& text,
                                                         const std::string& source = "<advisories>");

    /// Read and parse an advisory file; throws AdvisoryLoadError
    static std::shared_ptr<const AdvisoryDatabase> load_file(const std::string& path);

    std::vector<Advisory> query(const std::vector<Requirement>& requirements) const override;
    std::string name() const override { return source_; }

    size_t size() const { return count_; }

private:
    AdvisoryDatabase() = default;

    std::string source_;
    std::map<std::string, std::vector<Advisory>> by_package_;
    size_t count_ = 0;
};

/// Turns advisories into findings for one requirements file
class DependencyScanner {
public:
    /// @param source Advisory source, or nullptr to only parse requirements
    explicit DependencyScanner(const AdvisorySource* source);

    /// Pinned version inside an affected range: warn, advisory id as rule id.
    /// Requirement without a pin for a package with advisories: info.
    std::vector<Finding> scan(const std::vector<Requirement>& requirements,
                              const std::string& artifact_path) const;

private:
    const AdvisorySource* source_;
};

} // namespace deps
} // namespace sanityml
