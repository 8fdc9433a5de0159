#pragma once

// Rule table
//
// Declarative description of what is dangerous. Rules are loaded once at
// startup, validated, and then shared read-only by every worker.
//
// Text format, one rule per line, '#' starts a comment:
//
//     kind | id | severity | target | rationale
//     alias | from_module | to_module
//
// The target may itself contain '|' (regex alternation): kind, id and
// severity end at the first three separators and the rationale starts
// after the last one.

#include "sanityml/errors.hpp"
#include "sanityml/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace sanityml {
namespace rules {

enum class RuleKind : uint8_t {
    Deny,     // symbol is dangerous on both pickle and source paths
    Gadget,   // symbol is dangerous when reconstructed from a pickle
    Allow,    // modules expected in model pickles; anything else is flagged
    Shape,    // structural predicate over the capability graph
    Import,   // module import in source text
    Pattern,  // regular expression over source text
    Layer,    // Keras layer class that embeds code
};

/// Structural predicates over the capability graph
enum class ShapeKind : uint8_t {
    CallOfCall,        // callee is itself the result of a call
    DeniedCallChain,   // callee is the result of calling a denied symbol
    DynamicGlobal,     // import whose module or name is computed on the stack
    UnresolvedCallee,  // callee comes from an unresolved memo entry or buffer
    DottedAttribute,   // import name is an attribute path ("os.system")
};

const char* rule_kind_name(RuleKind kind);
const char* shape_kind_name(ShapeKind kind);

/// One validated rule
struct Rule {
    RuleKind kind = RuleKind::Deny;
    std::string id;
    Severity severity = Severity::Warn;
    std::string target;
    std::string rationale;
    int line = 0;

    // Deny / Gadget: parsed "module:name" target
    std::string module;
    std::string name;          // exact name, or prefix when name_prefix is set
    bool any_name = false;     // "module:*"
    bool name_prefix = false;  // "module:prefix*"

    // Allow: module roots
    std::vector<std::string> modules;

    // Shape
    ShapeKind shape = ShapeKind::CallOfCall;

    // Pattern
    std::shared_ptr<const std::regex> regex;

    /// Deny / Gadget symbol match on an already normalized module
    bool matches_symbol(const std::string& mod, const std::string& sym) const;
};

/// Immutable, validated rule set
class RuleTable {
public:
    /// Parse rule text; throws RuleLoadError naming the offending line
    static std::shared_ptr<const RuleTable> parse(const std::string& text,
                                                  const std::string& source = "<rules>");

    /// Read and parse a rule file; throws RuleLoadError if missing or malformed
    static std::shared_ptr<const RuleTable> load_file(const std::string& path);

    /// Built-in rule set, parsed once per process
    static std::shared_ptr<const RuleTable> defaults();

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }

    /// Rules of one kind, in table order
    std::vector<const Rule*> of_kind(RuleKind kind) const;

    /// Lookup by id; nullptr when absent
    const Rule* find(const std::string& id) const;

    /// First Shape rule for a predicate; nullptr when the table has none
    const Rule* shape(ShapeKind shape) const;

    /// Apply module aliases ("posix" -> "os", "posix.path" -> "os.path")
    std::string normalize_module(const std::string& module) const;

    /// First Deny rule matching, then (for pickles only) the first Gadget rule.
    /// A dotted name is also matched as an attribute path: for "a.b.c" the
    /// pairs (module.a, b.c), (a, b.c), (module.a.b, c) and (a.b, c) are tried.
    /// Returns nullptr when nothing matches.
    const Rule* match_symbol(const std::string& module,
                             const std::string& name,
                             bool pickle_path) const;

    /// True when the table has at least one Allow rule
    bool has_allowlist() const { return first_allow_ >= 0; }

    /// True when the root package of `module` is allowlisted
    bool allowlisted(const std::string& module) const;

    /// The Allow rule used to report non-allowlisted imports
    const Rule* allow_rule() const {
        return first_allow_ >= 0 ? &rules_[static_cast<size_t>(first_allow_)] : nullptr;
    }

    const std::map<std::string, std::string>& aliases() const { return aliases_; }

private:
    RuleTable() = default;

    std::vector<Rule> rules_;
    std::map<std::string, std::string> aliases_;
    std::vector<std::string> allowed_roots_;
    int first_allow_ = -1;

    void index();
};

/// Text of the built-in rule set
const std::string& default_rules_text();

} // namespace rules
} // namespace sanityml
