#pragma once

// Requirements parsing
//
// Reads pip requirements files into normalized package names and version
// specifiers. Only the subset of PEP 440 / PEP 508 needed to match
// advisories is implemented; anything pip-specific (options, nested files,
// editable installs, bare URLs) is skipped.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sanityml {
namespace deps {

enum class SpecOp : uint8_t {
    Equal,       // ==
    NotEqual,    // !=
    LessEqual,   // <=
    GreaterEqual,// >=
    Less,        // <
    Greater,     // >
    Compatible,  // ~=
    Arbitrary,   // ===
};

const char* spec_op_text(SpecOp op);

/// One version clause, e.g. ">=1.2"
struct VersionSpec {
    SpecOp op = SpecOp::Equal;
    std::string version;   // without a trailing ".*"
    bool wildcard = false; // "==1.2.*" / "!=1.2.*"

    bool matches(const std::string& candidate) const;
    std::string to_string() const;
};

/// Parse "a,b,c" specifier lists; throws std::invalid_argument on a bad clause
std::vector<VersionSpec> parse_specifiers(std::string_view text);

/// True when `version` satisfies every clause (an empty list matches anything)
bool satisfies(const std::string& version, const std::vector<VersionSpec>& specs);

/// Render a clause list as "a,b"
std::string specs_to_string(const std::vector<VersionSpec>& specs);

/// One declared dependency
struct Requirement {
    std::string name;          // PEP 503 normalized
    std::string declared_name; // as written
    std::vector<std::string> extras;
    std::vector<VersionSpec> specs;
    std::string marker;        // environment marker, unevaluated
    bool direct_reference = false;  // "name @ url"
    uint32_t line = 0;         // 1-based line of the requirement

    /// Exact version when pinned with == (no wildcard) or ===
    std::optional<std::string> pinned_version() const;
};

/// Parse a requirements file. Malformed lines are skipped.
std::vector<Requirement> parse_requirements(std::string_view text);

/// PEP 503 normalization: lower case, runs of "-", "_", "." become "-"
std::string normalize_name(std::string_view name);

// ============================================================================
// Versions
// ============================================================================

/// Parsed PEP 440 version (epoch, release, pre, post, dev; local ignored)
struct Version {
    int64_t epoch = 0;
    std::vector<int64_t> release;
    int pre_phase = -1;  // -1 none, 0 alpha, 1 beta, 2 rc
    int64_t pre_number = 0;
    std::optional<int64_t> post;
    std::optional<int64_t> dev;

    bool is_prerelease() const { return pre_phase >= 0 || dev.has_value(); }
};

/// Parse a version; std::nullopt if it is not PEP 440
std::optional<Version> parse_version(std::string_view text);

/// Three-way comparison (<0, 0, >0). Versions that do not parse are
/// compared as plain strings.
int compare_versions(const std::string& a, const std::string& b);

} // namespace deps
} // namespace sanityml
