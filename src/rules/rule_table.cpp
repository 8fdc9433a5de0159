#include "sanityml/rules/rule_table.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace sanityml {
namespace rules {

const char* rule_kind_name(RuleKind kind) {
    switch (kind) {
        case RuleKind::Deny: return "deny";
        case RuleKind::Gadget: return "gadget";
        case RuleKind::Allow: return "allow";
        case RuleKind::Shape: return "shape";
        case RuleKind::Import: return "import";
        case RuleKind::Pattern: return "pattern";
        case RuleKind::Layer: return "layer";
    }
    return "?";
}

const char* shape_kind_name(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::CallOfCall: return "call_of_call";
        case ShapeKind::DeniedCallChain: return "denied_call_chain";
        case ShapeKind::DynamicGlobal: return "dynamic_global";
        case ShapeKind::UnresolvedCallee: return "unresolved_callee";
        case ShapeKind::DottedAttribute: return "dotted_attribute";
    }
    return "?";
}

bool Rule::matches_symbol(const std::string& mod, const std::string& sym) const {
    if (mod != module) {
        return false;
    }
    if (any_name) {
        return true;
    }
    if (name_prefix) {
        return sym.compare(0, name.size(), name) == 0;
    }
    return sym == name;
}

namespace {

constexpr size_t MAX_ATTRIBUTE_SPLITS = 16;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool parse_kind(const std::string& text, RuleKind& kind) {
    static const std::pair<const char*, RuleKind> names[] = {
        {"deny", RuleKind::Deny},       {"gadget", RuleKind::Gadget},
        {"allow", RuleKind::Allow},     {"shape", RuleKind::Shape},
        {"import", RuleKind::Import},   {"pattern", RuleKind::Pattern},
        {"layer", RuleKind::Layer},
    };
    for (const auto& entry : names) {
        if (text == entry.first) {
            kind = entry.second;
            return true;
        }
    }
    return false;
}

bool parse_shape(const std::string& text, ShapeKind& shape) {
    for (ShapeKind s : {ShapeKind::CallOfCall, ShapeKind::DeniedCallChain,
                        ShapeKind::DynamicGlobal, ShapeKind::UnresolvedCallee,
                        ShapeKind::DottedAttribute}) {
        if (text == shape_kind_name(s)) {
            shape = s;
            return true;
        }
    }
    return false;
}

bool valid_identifier(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    });
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string word;
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word += c;
        }
    }
    if (!word.empty()) {
        words.push_back(word);
    }
    return words;
}

std::string root_module(const std::string& module) {
    return module.substr(0, module.find('.'));
}

} // anonymous namespace

std::shared_ptr<const RuleTable> RuleTable::parse(const std::string& text, const std::string& source) {
    std::shared_ptr<RuleTable> table(new RuleTable());
    std::set<std::string> ids;

    std::istringstream in(text);
    std::string raw;
    int line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto fail = [&](const std::string& message) {
            throw RuleLoadError(message, line_no, source);
        };

        size_t p1 = line.find('|');
        if (p1 == std::string::npos) {
            fail("expected '|' separated fields");
        }
        std::string kind_text = trim(line.substr(0, p1));

        if (kind_text == "alias") {
            size_t p2 = line.find('|', p1 + 1);
            if (p2 == std::string::npos || line.find('|', p2 + 1) != std::string::npos) {
                fail("alias lines take exactly two modules");
            }
            std::string from = trim(line.substr(p1 + 1, p2 - p1 - 1));
            std::string to = trim(line.substr(p2 + 1));
            if (from.empty() || to.empty()) {
                fail("alias with empty module name");
            }
            table->aliases_[from] = to;
            continue;
        }

        size_t p2 = line.find('|', p1 + 1);
        size_t p3 = p2 == std::string::npos ? p2 : line.find('|', p2 + 1);
        size_t plast = line.rfind('|');
        if (p3 == std::string::npos || plast == p3) {
            fail("expected 'kind | id | severity | target | rationale'");
        }

        Rule rule;
        rule.line = line_no;
        if (!parse_kind(kind_text, rule.kind)) {
            fail("unknown rule kind '" + kind_text + "'");
        }
        rule.id = trim(line.substr(p1 + 1, p2 - p1 - 1));
        std::string severity_text = trim(line.substr(p2 + 1, p3 - p2 - 1));
        rule.target = trim(line.substr(p3 + 1, plast - p3 - 1));
        rule.rationale = trim(line.substr(plast + 1));

        if (!valid_identifier(rule.id)) {
            fail("invalid rule id '" + rule.id + "'");
        }
        if (!ids.insert(rule.id).second) {
            fail("duplicate rule id '" + rule.id + "'");
        }
        try {
            rule.severity = severity_from_name(severity_text);
        } catch (const std::invalid_argument&) {
            fail("unknown severity '" + severity_text + "'");
        }
        if (rule.target.empty()) {
            fail("rule '" + rule.id + "' has no target");
        }
        if (rule.rationale.empty()) {
            fail("rule '" + rule.id + "' has no rationale");
        }

        switch (rule.kind) {
            case RuleKind::Deny:
            case RuleKind::Gadget: {
                if (rule.severity != Severity::Critical) {
                    fail(std::string(rule_kind_name(rule.kind)) + " rule '" + rule.id +
                         "' must be critical");
                }
                size_t colon = rule.target.find(':');
                if (colon == std::string::npos || colon == 0 || colon + 1 == rule.target.size()) {
                    fail("symbol target must be 'module:name', got '" + rule.target + "'");
                }
                rule.module = rule.target.substr(0, colon);
                rule.name = rule.target.substr(colon + 1);
                if (rule.name == "*") {
                    rule.any_name = true;
                    rule.name.clear();
                } else if (rule.name.back() == '*') {
                    rule.name_prefix = true;
                    rule.name.pop_back();
                }
                if (rule.name.find('*') != std::string::npos) {
                    fail("wildcard only allowed at the end of '" + rule.target + "'");
                }
                break;
            }
            case RuleKind::Allow:
                rule.modules = split_words(rule.target);
                break;
            case RuleKind::Shape:
                if (!parse_shape(rule.target, rule.shape)) {
                    fail("unknown shape predicate '" + rule.target + "'");
                }
                break;
            case RuleKind::Pattern:
                try {
                    rule.regex = std::make_shared<const std::regex>(
                        rule.target, std::regex::ECMAScript | std::regex::optimize);
                } catch (const std::regex_error& e) {
                    fail("invalid pattern in rule '" + rule.id + "': " + e.what());
                }
                break;
            case RuleKind::Import:
            case RuleKind::Layer:
                if (rule.target.find_first_of(" \t") != std::string::npos) {
                    fail("target of rule '" + rule.id + "' must be a single name");
                }
                break;
        }

        table->rules_.push_back(std::move(rule));
    }

    if (table->rules_.empty()) {
        throw RuleLoadError("rule table is empty", -1, source);
    }

    table->index();
    return table;
}

std::shared_ptr<const RuleTable> RuleTable::load_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw RuleLoadError("cannot open rule file", -1, path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw RuleLoadError("cannot read rule file", -1, path);
    }
    return parse(buffer.str(), path);
}

std::shared_ptr<const RuleTable> RuleTable::defaults() {
    static const std::shared_ptr<const RuleTable> table =
        parse(default_rules_text(), "<builtin>");
    return table;
}

void RuleTable::index() {
    for (size_t i = 0; i < rules_.size(); ++i) {
        const Rule& rule = rules_[i];
        if (rule.kind != RuleKind::Allow) {
            continue;
        }
        if (first_allow_ < 0) {
            first_allow_ = static_cast<int>(i);
        }
        for (const auto& module : rule.modules) {
            allowed_roots_.push_back(root_module(normalize_module(module)));
        }
    }
    std::sort(allowed_roots_.begin(), allowed_roots_.end());
    allowed_roots_.erase(std::unique(allowed_roots_.begin(), allowed_roots_.end()),
                         allowed_roots_.end());
}

std::vector<const Rule*> RuleTable::of_kind(RuleKind kind) const {
    std::vector<const Rule*> out;
    for (const auto& rule : rules_) {
        if (rule.kind == kind) {
            out.push_back(&rule);
        }
    }
    return out;
}

const Rule* RuleTable::find(const std::string& id) const {
    for (const auto& rule : rules_) {
        if (rule.id == id) {
            return &rule;
        }
    }
    return nullptr;
}

const Rule* RuleTable::shape(ShapeKind shape) const {
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::Shape && rule.shape == shape) {
            return &rule;
        }
    }
    return nullptr;
}

std::string RuleTable::normalize_module(const std::string& module) const {
    auto it = aliases_.find(module);
    if (it != aliases_.end()) {
        return it->second;
    }
    size_t dot = module.find('.');
    if (dot != std::string::npos) {
        auto root = aliases_.find(module.substr(0, dot));
        if (root != aliases_.end()) {
            return root->second + module.substr(dot);
        }
    }
    return module;
}

const Rule* RuleTable::match_symbol(const std::string& module,
                                    const std::string& name,
                                    bool pickle_path) const {
    // find_class resolves a dotted name as an attribute path, so "torch" +
    // "os.system" reaches os.system: each split of the name is a candidate
    std::vector<std::pair<std::string, std::string>> candidates;
    candidates.emplace_back(normalize_module(module), name);
    size_t splits = 0;
    for (size_t dot = name.find('.'); dot != std::string::npos && splits < MAX_ATTRIBUTE_SPLITS;
         dot = name.find('.', dot + 1), ++splits) {
        std::string path = name.substr(0, dot);
        std::string attr = name.substr(dot + 1);
        candidates.emplace_back(normalize_module(module + "." + path), attr);
        candidates.emplace_back(normalize_module(path), attr);
    }

    auto first_of = [&](RuleKind kind) -> const Rule* {
        for (const auto& rule : rules_) {
            if (rule.kind != kind) {
                continue;
            }
            for (const auto& candidate : candidates) {
                if (rule.matches_symbol(candidate.first, candidate.second)) {
                    return &rule;
                }
            }
        }
        return nullptr;
    };

    if (const Rule* deny = first_of(RuleKind::Deny)) {
        return deny;
    }
    return pickle_path ? first_of(RuleKind::Gadget) : nullptr;
}

bool RuleTable::allowlisted(const std::string& module) const {
    std::string root = root_module(normalize_module(module));
    return std::binary_search(allowed_roots_.begin(), allowed_roots_.end(), root);
}

} // namespace rules
} // namespace sanityml
