#pragma once

// Source Pattern Scanner
//
// Line-oriented static matcher for Python source text. It never parses the
// program, so syntactically broken files are scanned as well as valid
// ones. String literals and comments are tracked so that text inside them
// is not mistaken for calls or imports.

#include "sanityml/errors.hpp"
#include "sanityml/finding.hpp"
#include "sanityml/rules/rule_table.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sanityml {
namespace source {

struct SourceScanLimits {
    /// Characters per line handed to matching and to the regex engine
    size_t max_line_chars = 4096;

    /// Cooperative deadline, checked once per line
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/// Tokens found in one text, plus the failure that stopped the scan early
struct SourceScanResult {
    std::vector<SourceToken> tokens;
    std::optional<ScanFailure> failure;
    uint32_t lines = 0;
};

/// Character classes of one masked line
enum class CharClass : uint8_t {
    Code,
    String,       // inside a literal that opened on this line
    BlockString,  // inside a triple-quoted literal carried over from or to another line
    Comment,
};

/// Per-line lexical state carried across lines
struct LexState {
    char triple_quote = 0;  // '"' or '\'' while inside a triple-quoted string
};

/// Classify every character of `line`, updating `state` for the next line
std::vector<CharClass> classify_line(std::string_view line, LexState& state);

class SourceScanner {
public:
    SourceScanner(std::shared_ptr<const rules::RuleTable> rules, SourceScanLimits limits = {});

    /// Scan Python source text. Never throws on malformed input; a deadline
    /// expiry ends the scan and is recorded in the result.
    SourceScanResult scan(std::string_view text, const std::string& file) const;

    /// Convert a token to a finding at (entry, line, column)
    Finding to_finding(const SourceToken& token,
                       const std::string& entry,
                       uint32_t line) const;

    const rules::RuleTable& rules() const { return *rules_; }

private:
    std::shared_ptr<const rules::RuleTable> rules_;
    SourceScanLimits limits_;
};

// ============================================================================
// Import and call span helpers
// ============================================================================

/// Local name -> fully qualified module or symbol
using AliasMap = std::map<std::string, std::string>;

/// One imported module or symbol
struct ImportSpan {
    std::string module;    // module the statement imports from
    std::string symbol;    // fully qualified bound object
    std::string local;     // name bound in the namespace
    uint32_t column = 0;   // 1-based column of the statement
};

/// Parse an import statement on a masked code line; empty if not an import.
/// `pending_from` carries the module of a parenthesized multi-line
/// `from x import (...)` between calls.
std::vector<ImportSpan> parse_imports(std::string_view code, std::string& pending_from);

/// A call expression `dotted.name(`
struct CallSpan {
    std::string dotted;    // callee as written, whitespace removed
    uint32_t column = 0;   // 1-based column of the callee
};

/// Find call spans on a masked code line
std::vector<CallSpan> find_calls(std::string_view code);

/// Resolve a callee through the alias map; bare names not bound by an
/// import resolve to builtins
std::string resolve_call(const std::string& dotted, const AliasMap& aliases);

} // namespace source
} // namespace sanityml
