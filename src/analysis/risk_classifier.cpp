#include "sanityml/analysis/risk_classifier.hpp"

#include <stdexcept>
#include <unordered_map>

namespace sanityml {
namespace analysis {

using pickle::CallKind;
using pickle::CapabilityGraph;
using pickle::NO_VALUE;
using pickle::Value;
using pickle::ValueId;
using pickle::ValueKind;
using rules::Rule;
using rules::ShapeKind;

namespace {

constexpr size_t MAX_EVIDENCE_CHARS = 200;

/// Call kinds that invoke their callee
bool invokes_callee(CallKind call) {
    switch (call) {
        case CallKind::Reduce:
        case CallKind::NewObj:
        case CallKind::NewObjEx:
        case CallKind::Inst:
        case CallKind::Obj:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

RiskClassifier::RiskClassifier(std::shared_ptr<const rules::RuleTable> rules)
    : rules_(std::move(rules)) {
    if (!rules_) {
        throw std::invalid_argument("RiskClassifier requires a rule table");
    }
}

const Rule* RiskClassifier::match_global(const Value& global) const {
    if (global.kind != ValueKind::GlobalRef || global.dynamic) {
        return nullptr;
    }
    return rules_->match_symbol(global.text, global.name, true);
}

Finding RiskClassifier::make_finding(const Rule& rule,
                                     const std::string& artifact_path,
                                     const std::string& entry,
                                     size_t offset,
                                     std::string evidence) const {
    Finding f;
    f.artifact_path = artifact_path;
    f.locator = Locator::at_offset(entry, offset);
    f.rule_id = rule.id;
    f.severity = rule.severity;
    f.rationale = rule.rationale;
    f.evidence = std::move(evidence);
    return f;
}

std::vector<Finding> RiskClassifier::classify(const CapabilityGraph& graph,
                                              const std::string& artifact_path,
                                              const std::string& entry) const {
    std::vector<Finding> findings;
    const auto& reachable = graph.reachable();

    // First call site of each callee, for call-argument evidence
    std::unordered_map<ValueId, ValueId> first_call;
    for (ValueId id : reachable) {
        const Value& v = graph.value(id);
        if (v.kind == ValueKind::Constructed && invokes_callee(v.call) && v.callee != NO_VALUE) {
            first_call.emplace(v.callee, id);
        }
    }

    const Rule* dynamic_rule = rules_->shape(ShapeKind::DynamicGlobal);
    const Rule* call_of_call = rules_->shape(ShapeKind::CallOfCall);
    const Rule* denied_chain = rules_->shape(ShapeKind::DeniedCallChain);
    const Rule* unresolved = rules_->shape(ShapeKind::UnresolvedCallee);
    const Rule* dotted = rules_->shape(ShapeKind::DottedAttribute);
    const Rule* allow = rules_->allow_rule();

    for (ValueId id : reachable) {
        const Value& v = graph.value(id);

        if (v.kind == ValueKind::GlobalRef) {
            auto call = first_call.find(id);
            std::string evidence = call != first_call.end()
                ? graph.describe(call->second, MAX_EVIDENCE_CHARS)
                : graph.describe(id, MAX_EVIDENCE_CHARS);

            if (v.dynamic) {
                if (dynamic_rule) {
                    findings.push_back(make_finding(*dynamic_rule, artifact_path, entry,
                                                    v.offset, evidence));
                }
                continue;
            }

            if (const Rule* rule = match_global(v)) {
                findings.push_back(make_finding(*rule, artifact_path, entry, v.offset, evidence));
            } else if (v.name.find('.') != std::string::npos) {
                // An allowlisted root does not cover what its attributes reach
                if (const Rule* rule = dotted ? dotted : allow) {
                    findings.push_back(make_finding(*rule, artifact_path, entry, v.offset, evidence));
                }
            } else if (allow && !rules_->allowlisted(v.text)) {
                findings.push_back(make_finding(*allow, artifact_path, entry, v.offset, evidence));
            }
            continue;
        }

        // Constructed: shape predicates over the callee
        if (!invokes_callee(v.call) || v.callee == NO_VALUE) {
            continue;
        }
        const Value& callee = graph.value(v.callee);

        if (callee.kind == ValueKind::Constructed) {
            if (call_of_call) {
                findings.push_back(make_finding(*call_of_call, artifact_path, entry, v.offset,
                                                graph.describe(id, MAX_EVIDENCE_CHARS)));
            }
            if (denied_chain && invokes_callee(callee.call) && callee.callee != NO_VALUE &&
                match_global(graph.value(callee.callee))) {
                findings.push_back(make_finding(*denied_chain, artifact_path, entry, v.offset,
                                                graph.describe(id, MAX_EVIDENCE_CHARS)));
            }
        } else if (callee.kind == ValueKind::Memoized || callee.kind == ValueKind::Unknown) {
            if (unresolved) {
                findings.push_back(make_finding(*unresolved, artifact_path, entry, v.offset,
                                                graph.describe(id, MAX_EVIDENCE_CHARS)));
            }
        }
    }

    return findings;
}

std::vector<Finding> RiskClassifier::classify_layers(std::string_view config_text,
                                                     const std::string& artifact_path,
                                                     const std::string& entry) const {
    std::vector<Finding> findings;
    auto layer_rules = rules_->of_kind(rules::RuleKind::Layer);
    if (layer_rules.empty()) {
        return findings;
    }

    static constexpr std::string_view KEY = "\"class_name\"";
    size_t pos = 0;
    while ((pos = config_text.find(KEY, pos)) != std::string_view::npos) {
        size_t key_offset = pos;
        pos += KEY.size();

        auto skip_ws = [&] {
            while (pos < config_text.size() &&
                   (config_text[pos] == ' ' || config_text[pos] == '\t' ||
                    config_text[pos] == '\n' || config_text[pos] == '\r')) {
                ++pos;
            }
        };
        skip_ws();
        if (pos >= config_text.size() || config_text[pos] != ':') continue;
        ++pos;
        skip_ws();
        if (pos >= config_text.size() || config_text[pos] != '"') continue;
        size_t begin = ++pos;
        size_t end = config_text.find('"', begin);
        if (end == std::string_view::npos || end - begin > 256) continue;
        std::string_view class_name = config_text.substr(begin, end - begin);
        pos = end + 1;

        for (const Rule* rule : layer_rules) {
            if (class_name == rule->target) {
                findings.push_back(make_finding(*rule, artifact_path, entry, key_offset,
                                                "class_name: " + std::string(class_name)));
                break;
            }
        }
    }
    return findings;
}

} // namespace analysis
} // namespace sanityml
