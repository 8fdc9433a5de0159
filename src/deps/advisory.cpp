#include "sanityml/deps/advisory.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace sanityml {
namespace deps {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, sep)) {
        parts.push_back(trim(cur));
    }
    if (!s.empty() && s.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

bool valid_id(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == ':';
    });
}

} // anonymous namespace

bool Advisory::affects(const std::string& version) const {
    if (all_versions) {
        return true;
    }
    return std::any_of(affected.begin(), affected.end(),
                       [&](const std::vector<VersionSpec>& range) { return satisfies(version, range); });
}

std::string Advisory::affected_text() const {
    if (all_versions) {
        return "*";
    }
    std::string out;
    for (const auto& range : affected) {
        if (!out.empty()) out += "; ";
        out += specs_to_string(range);
    }
    return out;
}

// ============================================================================
// AdvisoryDatabase
// ============================================================================

std::shared_ptr<const AdvisoryDatabase> AdvisoryDatabase::parse(const std::string& text,
                                                                 const std::string& source) {
    std::shared_ptr<AdvisoryDatabase> db(new AdvisoryDatabase());
    db->source_ = source;

    std::istringstream iss(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(iss, raw)) {
        ++line_no;
        size_t hash = raw.find('#');
        std::string line = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
        if (line.empty()) {
            continue;
        }

        auto fields = split(line, '|');
        if (fields.size() != 4) {
            throw AdvisoryLoadError("expected 'package | id | affected | summary', got " +
                                    std::to_string(fields.size()) + " fields", line_no);
        }

        Advisory adv;
        adv.package = normalize_name(fields[0]);
        adv.id = fields[1];
        adv.summary = fields[3];
        if (adv.package.empty()) {
            throw AdvisoryLoadError("empty package name", line_no);
        }
        if (!valid_id(adv.id)) {
            throw AdvisoryLoadError("invalid advisory id '" + adv.id + "'", line_no);
        }
        if (adv.summary.empty()) {
            throw AdvisoryLoadError("empty summary for " + adv.id, line_no);
        }

        if (fields[2] == "*") {
            adv.all_versions = true;
        } else {
            for (const auto& range : split(fields[2], ';')) {
                try {
                    auto specs = parse_specifiers(range);
                    if (specs.empty()) {
                        throw std::invalid_argument("empty range");
                    }
                    adv.affected.push_back(std::move(specs));
                } catch (const std::invalid_argument& e) {
                    throw AdvisoryLoadError("bad affected range '" + range + "' (" + e.what() + ")",
                                            line_no);
                }
            }
        }

        db->by_package_[adv.package].push_back(std::move(adv));
        ++db->count_;
    }
    return db;
}

std::shared_ptr<const AdvisoryDatabase> AdvisoryDatabase::load_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw AdvisoryLoadError("cannot open " + sanitize_path_for_error(path));
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parse(oss.str(), path);
}

std::vector<Advisory> AdvisoryDatabase::query(const std::vector<Requirement>& requirements) const {
    std::vector<Advisory> out;
    std::vector<std::string> seen;
    for (const auto& req : requirements) {
        if (std::find(seen.begin(), seen.end(), req.name) != seen.end()) {
            continue;
        }
        seen.push_back(req.name);
        auto it = by_package_.find(req.name);
        if (it != by_package_.end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    return out;
}

// ============================================================================
// DependencyScanner
// ============================================================================

DependencyScanner::DependencyScanner(const AdvisorySource* source)
    : source_(source) {}

std::vector<Finding> DependencyScanner::scan(const std::vector<Requirement>& requirements,
                                             const std::string& artifact_path) const {
    std::vector<Finding> findings;
    if (!source_ || requirements.empty()) {
        return findings;
    }

    std::map<std::string, std::vector<Advisory>> by_package;
    for (auto& adv : source_->query(requirements)) {
        by_package[adv.package].push_back(std::move(adv));
    }

    for (const auto& req : requirements) {
        auto it = by_package.find(req.name);
        if (it == by_package.end()) {
            continue;
        }
        auto pinned = req.pinned_version();
        for (const auto& adv : it->second) {
            Finding f;
            f.artifact_path = artifact_path;
            f.locator = Locator::at_line("", req.line, 1);
            f.rule_id = adv.id;
            f.rationale = adv.summary;
            if (pinned) {
                if (!adv.affects(*pinned)) {
                    continue;
                }
                f.severity = Severity::Warn;
                f.evidence = req.declared_name + "==" + *pinned + " is within affected range " +
                             adv.affected_text();
            } else {
                f.severity = Severity::Info;
                std::string declared = specs_to_string(req.specs);
                f.evidence = req.declared_name + (declared.empty() ? "" : " " + declared) +
                             " is not pinned; affected range " + adv.affected_text();
            }
            findings.push_back(std::move(f));
        }
    }
    return findings;
}

} // namespace deps
} // namespace sanityml
