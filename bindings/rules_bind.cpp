#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sanityml/rules/rule_table.hpp"

namespace py = pybind11;
using namespace sanityml;
using namespace sanityml::rules;

void bind_rules(py::module_& m) {
    py::enum_<RuleKind>(m, "RuleKind", "Rule kinds")
        .value("DENY", RuleKind::Deny)
        .value("GADGET", RuleKind::Gadget)
        .value("ALLOW", RuleKind::Allow)
        .value("SHAPE", RuleKind::Shape)
        .value("IMPORT", RuleKind::Import)
        .value("PATTERN", RuleKind::Pattern)
        .value("LAYER", RuleKind::Layer)
        .export_values();

    py::class_<Rule>(m, "Rule", "One validated rule")
        .def_readonly("kind", &Rule::kind)
        .def_readonly("id", &Rule::id)
        .def_readonly("severity", &Rule::severity)
        .def_readonly("target", &Rule::target)
        .def_readonly("rationale", &Rule::rationale)
        .def("__repr__", [](const Rule& r) {
            return "Rule(" + r.id + ", " + rule_kind_name(r.kind) + ", " +
                   severity_name(r.severity) + ")";
        });

    py::class_<RuleTable, std::shared_ptr<RuleTable>>(m, "RuleTable", "Immutable rule set")
        .def_static("parse", [](const std::string& text, const std::string& source) {
                        return std::const_pointer_cast<RuleTable>(RuleTable::parse(text, source));
                    },
                    py::arg("text"), py::arg("source") = "<rules>",
                    "Parse rule text; raises RuleLoadError")
        .def_static("load_file", [](const std::string& path) {
                        return std::const_pointer_cast<RuleTable>(RuleTable::load_file(path));
                    },
                    py::arg("path"), "Load a rule file; raises RuleLoadError")
        .def_static("defaults", []() {
                        return std::const_pointer_cast<RuleTable>(RuleTable::defaults());
                    },
                    "Built-in rule set")
        .def_property_readonly("rules", &RuleTable::rules, py::return_value_policy::reference_internal)
        .def("__len__", &RuleTable::size)
        .def("find", &RuleTable::find, py::arg("id"), py::return_value_policy::reference_internal);

    m.def("default_rules_text", &default_rules_text, "Text of the built-in rule set");
}
