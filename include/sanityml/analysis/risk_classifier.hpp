#pragma once

// Risk Classifier
//
// Matches a capability graph against the rule table. Classification is a
// pure function of (graph, rules): the same inputs always produce the same
// findings in the same order.

#include "sanityml/finding.hpp"
#include "sanityml/pickle/capability_graph.hpp"
#include "sanityml/rules/rule_table.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sanityml {
namespace analysis {

class RiskClassifier {
public:
    explicit RiskClassifier(std::shared_ptr<const rules::RuleTable> rules);

    /// Classify every capability node of a graph.
    /// Locators are (entry, offset of the opcode that produced the node).
    std::vector<Finding> classify(const pickle::CapabilityGraph& graph,
                                  const std::string& artifact_path,
                                  const std::string& entry) const;

    /// Apply layer rules to Keras model configuration text (config.json,
    /// or the raw bytes of an HDF5 file that embed it)
    std::vector<Finding> classify_layers(std::string_view config_text,
                                         const std::string& artifact_path,
                                         const std::string& entry) const;

    const rules::RuleTable& rules() const { return *rules_; }

private:
    std::shared_ptr<const rules::RuleTable> rules_;

    const rules::Rule* match_global(const pickle::Value& global) const;

    Finding make_finding(const rules::Rule& rule,
                         const std::string& artifact_path,
                         const std::string& entry,
                         size_t offset,
                         std::string evidence) const;
};

} // namespace analysis
} // namespace sanityml
