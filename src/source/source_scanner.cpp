#include "sanityml/source/source_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <stdexcept>

namespace sanityml {
namespace source {

namespace {

constexpr size_t MAX_SNIPPET_CHARS = 120;

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && (is_space(s.front()) || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (is_space(s.back()) || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

void fill(std::vector<CharClass>& cls, size_t begin, size_t end, CharClass k) {
    end = std::min(end, cls.size());
    for (size_t i = begin; i < end; ++i) {
        cls[i] = k;
    }
}

const std::set<std::string>& python_keywords() {
    static const std::set<std::string> keywords = {
        "and", "as", "assert", "async", "await", "def", "class", "del", "elif",
        "else", "except", "for", "from", "if", "import", "in", "is", "lambda",
        "not", "or", "return", "while", "with", "yield", "print",
    };
    return keywords;
}

/// Text from `column` up to the matching ')' on the same line, capped
std::string call_snippet(std::string_view line, uint32_t column) {
    size_t begin = column > 0 ? column - 1 : 0;
    if (begin >= line.size()) {
        return "";
    }
    int depth = 0;
    size_t end = begin;
    for (; end < line.size() && end - begin < MAX_SNIPPET_CHARS; ++end) {
        char c = line[end];
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) {
                ++end;
                break;
            }
        }
    }
    return std::string(line.substr(begin, end - begin));
}

std::string line_snippet(std::string_view line) {
    std::string_view t = trim_view(line);
    return std::string(t.substr(0, MAX_SNIPPET_CHARS));
}

/// Split "a.b.c as d" into (name, alias)
std::pair<std::string, std::string> split_as(std::string_view item) {
    item = trim_view(item);
    std::string name;
    std::string alias;
    size_t pos = 0;
    // find " as " surrounded by whitespace
    while (pos < item.size()) {
        size_t found = item.find("as", pos);
        if (found == std::string_view::npos) break;
        bool left = found > 0 && is_space(item[found - 1]);
        bool right = found + 2 < item.size() && is_space(item[found + 2]);
        if (left && right) {
            name = std::string(trim_view(item.substr(0, found)));
            alias = std::string(trim_view(item.substr(found + 2)));
            break;
        }
        pos = found + 2;
    }
    if (name.empty()) {
        name = std::string(item);
    }
    name.erase(std::remove_if(name.begin(), name.end(), [](char c) { return is_space(c); }),
               name.end());
    return {name, alias};
}

bool valid_dotted(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_ident_char(c) && c != '.') return false;
    }
    return true;
}

void parse_from_names(std::string_view names,
                      const std::string& module,
                      uint32_t column,
                      std::vector<ImportSpan>& out,
                      std::string& pending_from) {
    bool open = names.find('(') != std::string_view::npos;
    bool close = names.find(')') != std::string_view::npos;

    std::string cleaned;
    for (char c : names) {
        if (c != '(' && c != ')' && c != '\\') cleaned += c;
    }

    size_t start = 0;
    while (start <= cleaned.size()) {
        size_t comma = cleaned.find(',', start);
        std::string_view item = std::string_view(cleaned).substr(
            start, comma == std::string::npos ? std::string::npos : comma - start);
        auto [name, alias] = split_as(item);
        if (name == "*") {
            out.push_back(ImportSpan{module, module + ".*", "", column});
        } else if (valid_dotted(name)) {
            std::string local = alias.empty() ? name : alias;
            out.push_back(ImportSpan{module, module + "." + name, local, column});
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    if (open && !close) {
        pending_from = module;
    } else if (close) {
        pending_from.clear();
    }
}

// Regex recursion depth grows with the searched length, so patterns run
// over bounded windows. A match counts only when REGEX_STEP characters
// follow it inside the window, or the window reaches the end of the line.
constexpr size_t REGEX_WINDOW = 512;
constexpr size_t REGEX_STEP = 256;

/// Offset of the first match of `re` in `text`, or npos
size_t windowed_search(const std::string& text, const std::regex& re) {
    for (size_t offset = 0; offset < text.size(); offset += REGEX_STEP) {
        const size_t end = std::min(text.size(), offset + REGEX_WINDOW);
        const auto flags = offset == 0 ? std::regex_constants::match_default
                                       : std::regex_constants::match_prev_avail;
        std::smatch m;
        if (std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(offset),
                              text.begin() + static_cast<std::ptrdiff_t>(end), m, re, flags)) {
            const size_t at = static_cast<size_t>(m.position(0));
            if (end == text.size() || at < REGEX_STEP) {
                return offset + at;
            }
        }
        if (end == text.size()) {
            break;
        }
    }
    return std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Lexical classification
// ============================================================================

std::vector<CharClass> classify_line(std::string_view line, LexState& state) {
    const size_t n = line.size();
    std::vector<CharClass> cls(n, CharClass::Code);
    size_t i = 0;
    size_t triple_begin = 0;
    bool carried = state.triple_quote != 0;

    while (i < n) {
        if (state.triple_quote) {
            char q = state.triple_quote;
            if (line[i] == '\\') {
                i += 2;
                continue;
            }
            if (line[i] == q && i + 2 < n && line[i + 1] == q && line[i + 2] == q) {
                fill(cls, triple_begin, i + 3, carried ? CharClass::BlockString : CharClass::String);
                state.triple_quote = 0;
                carried = false;
                i += 3;
                continue;
            }
            ++i;
            continue;
        }

        char c = line[i];
        if (c == '#') {
            fill(cls, i, n, CharClass::Comment);
            return cls;
        }
        if (c == '"' || c == '\'') {
            if (i + 2 < n && line[i + 1] == c && line[i + 2] == c) {
                state.triple_quote = c;
                triple_begin = i;
                i += 3;
                continue;
            }
            size_t begin = i++;
            while (i < n && line[i] != c) {
                if (line[i] == '\\') ++i;
                ++i;
            }
            // An unterminated literal ends at the end of the line
            size_t end = std::min(i + 1, n);
            fill(cls, begin, end, CharClass::String);
            i = end;
            continue;
        }
        ++i;
    }

    if (state.triple_quote) {
        fill(cls, triple_begin, n, CharClass::BlockString);
    }
    return cls;
}

// ============================================================================
// Import and call spans
// ============================================================================

std::vector<ImportSpan> parse_imports(std::string_view code, std::string& pending_from) {
    std::vector<ImportSpan> out;

    if (!pending_from.empty()) {
        std::string module = pending_from;
        size_t first = code.find_first_not_of(" \t");
        uint32_t column = first == std::string_view::npos ? 1 : static_cast<uint32_t>(first + 1);
        parse_from_names(code, module, column, out, pending_from);
        return out;
    }

    size_t seg_start = 0;
    while (seg_start <= code.size()) {
        size_t semi = code.find(';', seg_start);
        std::string_view seg = code.substr(
            seg_start, semi == std::string_view::npos ? std::string_view::npos : semi - seg_start);

        size_t lead = 0;
        while (lead < seg.size() && is_space(seg[lead])) ++lead;
        std::string_view stmt = seg.substr(lead);
        uint32_t column = static_cast<uint32_t>(seg_start + lead + 1);

        auto keyword = [&](std::string_view kw) {
            return stmt.size() > kw.size() && stmt.compare(0, kw.size(), kw) == 0 &&
                   is_space(stmt[kw.size()]);
        };

        if (keyword("import")) {
            std::string_view rest = stmt.substr(6);
            size_t start = 0;
            while (start <= rest.size()) {
                size_t comma = rest.find(',', start);
                auto [name, alias] = split_as(rest.substr(
                    start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
                if (valid_dotted(name)) {
                    if (alias.empty()) {
                        std::string root = name.substr(0, name.find('.'));
                        out.push_back(ImportSpan{name, root, root, column});
                    } else {
                        out.push_back(ImportSpan{name, name, alias, column});
                    }
                }
                if (comma == std::string_view::npos) break;
                start = comma + 1;
            }
        } else if (keyword("from")) {
            std::string_view rest = stmt.substr(4);
            size_t imp = std::string_view::npos;
            for (size_t p = rest.find("import"); p != std::string_view::npos;
                 p = rest.find("import", p + 6)) {
                bool left = p > 0 && is_space(rest[p - 1]);
                bool right = p + 6 >= rest.size() || is_space(rest[p + 6]) || rest[p + 6] == '(';
                if (left && right) {
                    imp = p;
                    break;
                }
            }
            if (imp != std::string_view::npos) {
                std::string module(trim_view(rest.substr(0, imp)));
                if (valid_dotted(module)) {
                    parse_from_names(rest.substr(imp + 6), module, column, out, pending_from);
                }
            }
        }

        if (semi == std::string_view::npos) break;
        seg_start = semi + 1;
    }
    return out;
}

std::vector<CallSpan> find_calls(std::string_view code) {
    std::vector<CallSpan> calls;
    const size_t n = code.size();
    size_t i = 0;

    while (i < n) {
        if (!is_ident_start(code[i]) || (i > 0 && is_ident_char(code[i - 1]))) {
            ++i;
            continue;
        }

        size_t begin = i;
        std::string dotted;
        size_t first_end = 0;
        while (true) {
            size_t s = i;
            while (i < n && is_ident_char(code[i])) ++i;
            dotted.append(code.substr(s, i - s));
            if (first_end == 0) first_end = i;
            size_t j = i;
            while (j < n && is_space(code[j])) ++j;
            if (j < n && code[j] == '.') {
                ++j;
                while (j < n && is_space(code[j])) ++j;
                if (j < n && is_ident_start(code[j])) {
                    dotted += '.';
                    i = j;
                    continue;
                }
            }
            break;
        }

        size_t j = i;
        while (j < n && is_space(code[j])) ++j;
        bool is_call = j < n && code[j] == '(';

        // Attribute of a larger expression, e.g. `foo().eval(`
        size_t k = begin;
        while (k > 0 && is_space(code[k - 1])) --k;
        bool attribute = k > 0 && (code[k - 1] == '.');

        // Definitions are not calls
        bool definition = false;
        if (k >= 3) {
            std::string_view before = code.substr(0, k);
            auto ends_with_kw = [&](std::string_view kw) {
                return before.size() >= kw.size() &&
                       before.compare(before.size() - kw.size(), kw.size(), kw) == 0 &&
                       (before.size() == kw.size() ||
                        !is_ident_char(before[before.size() - kw.size() - 1]));
            };
            definition = ends_with_kw("def") || ends_with_kw("class");
        }

        std::string head(code.substr(begin, first_end - begin));
        if (is_call && !attribute && !definition && !python_keywords().count(head)) {
            calls.push_back(CallSpan{dotted, static_cast<uint32_t>(begin + 1)});
        }
    }
    return calls;
}

std::string resolve_call(const std::string& dotted, const AliasMap& aliases) {
    size_t dot = dotted.find('.');
    std::string head = dotted.substr(0, dot);
    auto it = aliases.find(head);
    if (it != aliases.end()) {
        return dot == std::string::npos ? it->second : it->second + dotted.substr(dot);
    }
    if (dot == std::string::npos) {
        return "builtins." + dotted;
    }
    return dotted;
}

// ============================================================================
// SourceScanner
// ============================================================================

SourceScanner::SourceScanner(std::shared_ptr<const rules::RuleTable> rules, SourceScanLimits limits)
    : rules_(std::move(rules))
    , limits_(std::move(limits)) {
    if (!rules_) {
        throw std::invalid_argument("SourceScanner requires a rule table");
    }
}

SourceScanResult SourceScanner::scan(std::string_view text, const std::string& file) const {
    SourceScanResult result;
    const auto patterns = rules_->of_kind(rules::RuleKind::Pattern);
    const auto import_rules = rules_->of_kind(rules::RuleKind::Import);

    LexState state;
    AliasMap aliases;
    std::string pending_from;
    size_t pos = 0;
    uint32_t line_no = 0;

    auto emit = [&](uint32_t column, std::string snippet, const std::string& rule_id) {
        SourceToken token;
        token.file = file;
        token.line = line_no;
        token.column = column;
        token.text = std::move(snippet);
        token.rule_id = rule_id;
        result.tokens.push_back(std::move(token));
    };

    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view line = text.substr(pos, nl == std::string_view::npos
                                                     ? std::string_view::npos : nl - pos);
        size_t line_offset = pos;
        pos = nl == std::string_view::npos ? text.size() : nl + 1;
        ++line_no;

        if (limits_.deadline && std::chrono::steady_clock::now() > *limits_.deadline) {
            result.failure = ScanFailure{ScanErrorKind::ScanTimeout,
                                         "Scan deadline expired at line " + std::to_string(line_no),
                                         line_offset};
            break;
        }

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.size() > limits_.max_line_chars) {
            line = line.substr(0, limits_.max_line_chars);
        }

        auto cls = classify_line(line, state);

        // Masked views: `code` blanks every literal and comment, `pattern_text`
        // keeps single-line literals but drops comments and block strings
        std::string code(line);
        std::string pattern_text(line);
        size_t comment_at = line.size();
        for (size_t i = 0; i < line.size(); ++i) {
            switch (cls[i]) {
                case CharClass::Code:
                    break;
                case CharClass::String:
                    code[i] = ' ';
                    break;
                case CharClass::BlockString:
                    code[i] = ' ';
                    pattern_text[i] = ' ';
                    break;
                case CharClass::Comment:
                    code[i] = ' ';
                    comment_at = std::min(comment_at, i);
                    break;
            }
        }
        pattern_text.resize(comment_at);

        // Imports feed the alias map and import rules
        for (const auto& span : parse_imports(code, pending_from)) {
            if (!span.local.empty()) {
                aliases[span.local] = span.symbol;
            }
            for (const rules::Rule* rule : import_rules) {
                const std::string& t = rule->target;
                if (span.module == t ||
                    (span.module.size() > t.size() && span.module.compare(0, t.size(), t) == 0 &&
                     span.module[t.size()] == '.')) {
                    emit(span.column, line_snippet(line), rule->id);
                }
            }
        }

        // Calls resolved through the alias map against deny rules
        for (const auto& call : find_calls(code)) {
            std::string resolved = resolve_call(call.dotted, aliases);
            size_t dot = resolved.rfind('.');
            if (dot == std::string::npos) {
                continue;
            }
            const rules::Rule* rule = rules_->match_symbol(
                resolved.substr(0, dot), resolved.substr(dot + 1), false);
            if (rule) {
                emit(call.column, call_snippet(line, call.column), rule->id);
            }
        }

        // Regular expression rules over the code text of the line
        if (!trim_view(pattern_text).empty()) {
            for (const rules::Rule* rule : patterns) {
                size_t at = windowed_search(pattern_text, *rule->regex);
                if (at != std::string::npos) {
                    emit(static_cast<uint32_t>(at + 1), line_snippet(line), rule->id);
                }
            }
        }
    }

    result.lines = line_no;
    return result;
}

Finding SourceScanner::to_finding(const SourceToken& token,
                                  const std::string& entry,
                                  uint32_t line) const {
    const rules::Rule* rule = rules_->find(token.rule_id);
    if (!rule) {
        throw std::invalid_argument("Unknown rule id in source token: " + token.rule_id);
    }
    Finding f;
    f.artifact_path = token.file;
    f.locator = Locator::at_line(entry, line, token.column);
    f.rule_id = rule->id;
    f.severity = rule->severity;
    f.rationale = rule->rationale;
    f.evidence = token.text;
    return f;
}

} // namespace source
} // namespace sanityml
