#include "sanityml/deps/requirements.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sanityml {
namespace deps {

namespace {

std::string_view trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

bool is_version_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '*' ||
           c == '+' || c == '!' || c == '-' || c == '_';
}

// Cursor over a lower-cased version string
class VersionCursor {
public:
    explicit VersionCursor(std::string_view text) : s_(text) {}

    bool done() const { return pos_ >= s_.size(); }
    size_t pos() const { return pos_; }
    void reset(size_t pos) { pos_ = pos; }

    bool take(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool take_separator() {
        return take('.') || take('-') || take('_');
    }

    bool take_word(std::string_view w) {
        if (s_.substr(pos_, w.size()) == w) {
            pos_ += w.size();
            return true;
        }
        return false;
    }

    std::optional<int64_t> number() {
        size_t start = pos_;
        int64_t v = 0;
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            if (v > (INT64_MAX - 9) / 10) {
                return std::nullopt;
            }
            v = v * 10 + (s_[pos_] - '0');
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        return v;
    }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

// Tri-state keys following the PEP 440 ordering of pre, post and dev parts
int pre_class(const Version& v) {
    if (v.pre_phase >= 0) return 1;
    if (v.dev && !v.post) return 0;
    return 2;
}

template <typename T>
int cmp(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

int compare_parsed(const Version& a, const Version& b) {
    if (int c = cmp(a.epoch, b.epoch)) return c;

    size_t n = std::max(a.release.size(), b.release.size());
    for (size_t i = 0; i < n; ++i) {
        int64_t x = i < a.release.size() ? a.release[i] : 0;
        int64_t y = i < b.release.size() ? b.release[i] : 0;
        if (int c = cmp(x, y)) return c;
    }

    if (int c = cmp(pre_class(a), pre_class(b))) return c;
    if (a.pre_phase >= 0) {
        if (int c = cmp(a.pre_phase, b.pre_phase)) return c;
        if (int c = cmp(a.pre_number, b.pre_number)) return c;
    }

    if (int c = cmp(a.post.has_value(), b.post.has_value())) return c;
    if (a.post) {
        if (int c = cmp(*a.post, *b.post)) return c;
    }

    // A dev release sorts before the same version without one
    if (int c = cmp(!a.dev.has_value(), !b.dev.has_value())) return c;
    if (a.dev) {
        if (int c = cmp(*a.dev, *b.dev)) return c;
    }
    return 0;
}

bool release_prefix_matches(const std::string& candidate, const std::string& prefix, size_t segments) {
    auto c = parse_version(candidate);
    auto p = parse_version(prefix);
    if (!c || !p) {
        return candidate.compare(0, prefix.size(), prefix) == 0;
    }
    if (c->epoch != p->epoch) {
        return false;
    }
    for (size_t i = 0; i < segments && i < p->release.size(); ++i) {
        int64_t x = i < c->release.size() ? c->release[i] : 0;
        if (x != p->release[i]) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Versions
// ============================================================================

std::optional<Version> parse_version(std::string_view text) {
    std::string s = lower(trim(text));
    if (!s.empty() && s[0] == 'v') {
        s.erase(0, 1);
    }
    size_t plus = s.find('+');
    if (plus != std::string::npos) {
        s.erase(plus);
    }
    if (s.empty()) {
        return std::nullopt;
    }

    Version v;
    VersionCursor cur(s);

    size_t bang = s.find('!');
    if (bang != std::string::npos) {
        auto epoch = cur.number();
        if (!epoch || cur.pos() != bang) {
            return std::nullopt;
        }
        v.epoch = *epoch;
        cur.take('!');
    }

    do {
        auto seg = cur.number();
        if (!seg) {
            return std::nullopt;
        }
        v.release.push_back(*seg);
    } while (!cur.done() && [&] {
        size_t save = cur.pos();
        if (cur.take('.') && !cur.done() && std::isdigit(static_cast<unsigned char>(s[cur.pos()]))) {
            return true;
        }
        cur.reset(save);
        return false;
    }());

    // Pre-release: a1, b2, rc3, alpha, beta, c, pre, preview
    {
        size_t save = cur.pos();
        cur.take_separator();
        static const std::pair<const char*, int> labels[] = {
            {"alpha", 0}, {"a", 0}, {"beta", 1}, {"b", 1},
            {"preview", 2}, {"pre", 2}, {"rc", 2}, {"c", 2},
        };
        bool found = false;
        for (const auto& label : labels) {
            if (cur.take_word(label.first)) {
                v.pre_phase = label.second;
                found = true;
                break;
            }
        }
        if (found) {
            size_t num_save = cur.pos();
            cur.take_separator();
            auto n = cur.number();
            if (n) {
                v.pre_number = *n;
            } else {
                cur.reset(num_save);
            }
        } else {
            cur.reset(save);
        }
    }

    // Post-release: .post1, -1, rev1, r1
    {
        size_t save = cur.pos();
        if (cur.take('-')) {
            auto n = cur.number();
            if (n) {
                v.post = *n;
            } else {
                cur.reset(save);
            }
        }
        if (!v.post) {
            cur.take_separator();
            if (cur.take_word("post") || cur.take_word("rev") || cur.take_word("r")) {
                size_t num_save = cur.pos();
                cur.take_separator();
                auto n = cur.number();
                if (!n) {
                    cur.reset(num_save);
                }
                v.post = n.value_or(0);
            } else {
                cur.reset(save);
            }
        }
    }

    // Development release: .dev3
    {
        size_t save = cur.pos();
        cur.take_separator();
        if (cur.take_word("dev")) {
            auto n = cur.number();
            v.dev = n.value_or(0);
        } else {
            cur.reset(save);
        }
    }

    if (!cur.done()) {
        return std::nullopt;
    }
    return v;
}

int compare_versions(const std::string& a, const std::string& b) {
    auto va = parse_version(a);
    auto vb = parse_version(b);
    if (!va || !vb) {
        return cmp(a, b);
    }
    return compare_parsed(*va, *vb);
}

// ============================================================================
// Specifiers
// ============================================================================

const char* spec_op_text(SpecOp op) {
    switch (op) {
        case SpecOp::Equal: return "==";
        case SpecOp::NotEqual: return "!=";
        case SpecOp::LessEqual: return "<=";
        case SpecOp::GreaterEqual: return ">=";
        case SpecOp::Less: return "<";
        case SpecOp::Greater: return ">";
        case SpecOp::Compatible: return "~=";
        case SpecOp::Arbitrary: return "===";
    }
    return "?";
}

bool VersionSpec::matches(const std::string& candidate) const {
    switch (op) {
        case SpecOp::Arbitrary:
            return candidate == version;
        case SpecOp::Equal:
        case SpecOp::NotEqual: {
            bool equal;
            if (wildcard) {
                auto p = parse_version(version);
                equal = release_prefix_matches(candidate, version, p ? p->release.size() : 0);
            } else {
                equal = compare_versions(candidate, version) == 0;
            }
            return op == SpecOp::Equal ? equal : !equal;
        }
        case SpecOp::LessEqual: return compare_versions(candidate, version) <= 0;
        case SpecOp::GreaterEqual: return compare_versions(candidate, version) >= 0;
        case SpecOp::Less: return compare_versions(candidate, version) < 0;
        case SpecOp::Greater: return compare_versions(candidate, version) > 0;
        case SpecOp::Compatible: {
            if (compare_versions(candidate, version) < 0) {
                return false;
            }
            auto p = parse_version(version);
            if (!p || p->release.size() < 2) {
                return true;
            }
            return release_prefix_matches(candidate, version, p->release.size() - 1);
        }
    }
    return false;
}

std::string VersionSpec::to_string() const {
    return std::string(spec_op_text(op)) + version + (wildcard ? ".*" : "");
}

std::vector<VersionSpec> parse_specifiers(std::string_view text) {
    std::vector<VersionSpec> specs;
    text = trim(text);
    if (text.empty()) {
        return specs;
    }

    static const std::pair<const char*, SpecOp> ops[] = {
        {"===", SpecOp::Arbitrary}, {"~=", SpecOp::Compatible},
        {"==", SpecOp::Equal}, {"!=", SpecOp::NotEqual},
        {"<=", SpecOp::LessEqual}, {">=", SpecOp::GreaterEqual},
        {"<", SpecOp::Less}, {">", SpecOp::Greater},
    };

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        std::string_view clause = trim(text.substr(pos, comma == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : comma - pos));
        if (clause.empty()) {
            throw std::invalid_argument("Empty version clause");
        }

        VersionSpec spec;
        bool found = false;
        for (const auto& op : ops) {
            std::string_view sym(op.first);
            if (clause.substr(0, sym.size()) == sym) {
                spec.op = op.second;
                clause = trim(clause.substr(sym.size()));
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::invalid_argument("Missing comparison operator in '" + std::string(clause) + "'");
        }
        if (clause.empty() || !std::all_of(clause.begin(), clause.end(), is_version_char)) {
            throw std::invalid_argument("Invalid version '" + std::string(clause) + "'");
        }

        std::string version(clause);
        if (version.size() >= 2 && version.compare(version.size() - 2, 2, ".*") == 0) {
            if (spec.op != SpecOp::Equal && spec.op != SpecOp::NotEqual) {
                throw std::invalid_argument("Wildcard only allowed with == and !=");
            }
            spec.wildcard = true;
            version.resize(version.size() - 2);
        }
        if (version.find('*') != std::string::npos) {
            throw std::invalid_argument("Invalid wildcard in '" + version + "'");
        }
        spec.version = std::move(version);
        specs.push_back(std::move(spec));

        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return specs;
}

bool satisfies(const std::string& version, const std::vector<VersionSpec>& specs) {
    return std::all_of(specs.begin(), specs.end(),
                       [&](const VersionSpec& s) { return s.matches(version); });
}

std::string specs_to_string(const std::vector<VersionSpec>& specs) {
    std::string out;
    for (const auto& s : specs) {
        if (!out.empty()) out += ",";
        out += s.to_string();
    }
    return out;
}

// ============================================================================
// Requirements
// ============================================================================

std::optional<std::string> Requirement::pinned_version() const {
    if (specs.size() != 1) {
        return std::nullopt;
    }
    const auto& s = specs.front();
    if ((s.op == SpecOp::Equal && !s.wildcard) || s.op == SpecOp::Arbitrary) {
        return s.version;
    }
    return std::nullopt;
}

std::string normalize_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool in_separator = false;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            in_separator = true;
            continue;
        }
        if (in_separator && !out.empty()) {
            out += '-';
        }
        in_separator = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

namespace {

std::optional<Requirement> parse_requirement_line(std::string_view line, uint32_t line_no) {
    // Options (-r, -c, -e, --index-url, ...), local paths and bare URLs
    if (line[0] == '-' || line[0] == '.' || line[0] == '/' ||
        line.find("://") < line.find_first_of(" @;")) {
        return std::nullopt;
    }

    Requirement req;
    req.line = line_no;

    size_t semi = line.find(';');
    if (semi != std::string_view::npos) {
        req.marker = std::string(trim(line.substr(semi + 1)));
        line = trim(line.substr(0, semi));
    }

    size_t pos = 0;
    while (pos < line.size() && is_name_char(line[pos])) ++pos;
    if (pos == 0 || !std::isalnum(static_cast<unsigned char>(line[0]))) {
        return std::nullopt;
    }
    req.declared_name = std::string(line.substr(0, pos));
    req.name = normalize_name(req.declared_name);

    std::string_view rest = trim(line.substr(pos));
    if (!rest.empty() && rest[0] == '[') {
        size_t close = rest.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view extras = rest.substr(1, close - 1);
        size_t start = 0;
        while (start <= extras.size()) {
            size_t comma = extras.find(',', start);
            std::string_view extra = trim(extras.substr(start, comma == std::string_view::npos
                                                                   ? std::string_view::npos
                                                                   : comma - start));
            if (!extra.empty()) {
                req.extras.push_back(normalize_name(extra));
            }
            if (comma == std::string_view::npos) break;
            start = comma + 1;
        }
        rest = trim(rest.substr(close + 1));
    }

    if (!rest.empty() && rest[0] == '@') {
        req.direct_reference = true;
        return req;
    }
    if (!rest.empty() && rest.front() == '(' && rest.back() == ')') {
        rest = trim(rest.substr(1, rest.size() - 2));
    }

    try {
        req.specs = parse_specifiers(rest);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    return req;
}

} // anonymous namespace

std::vector<Requirement> parse_requirements(std::string_view text) {
    std::vector<Requirement> reqs;

    std::string logical;
    uint32_t logical_start = 0;
    uint32_t line_no = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                                              : nl - pos);
        pos = nl == std::string_view::npos ? text.size() : nl + 1;
        ++line_no;

        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }

        // Comments start at '#' at line start or after whitespace
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1])))) {
                raw = raw.substr(0, i);
                break;
            }
        }

        if (logical.empty()) {
            logical_start = line_no;
        }
        std::string_view piece = trim(raw);
        if (!piece.empty() && piece.back() == '\\') {
            logical.append(piece.substr(0, piece.size() - 1));
            logical += ' ';
            continue;
        }
        logical.append(piece);

        std::string_view line = trim(logical);
        if (!line.empty()) {
            if (auto req = parse_requirement_line(line, logical_start)) {
                reqs.push_back(std::move(*req));
            }
        }
        logical.clear();
    }

    std::string_view tail = trim(logical);
    if (!tail.empty()) {
        if (auto req = parse_requirement_line(tail, logical_start)) {
            reqs.push_back(std::move(*req));
        }
    }
    return reqs;
}

} // namespace deps
} // namespace sanityml
