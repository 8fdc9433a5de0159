#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sanityml/errors.hpp"
#include "sanityml/finding.hpp"
#include "sanityml/options.hpp"
#include "sanityml/types.hpp"

namespace py = pybind11;
using namespace sanityml;

void bind_types(py::module_& m) {
    // Severity enum
    py::enum_<Severity>(m, "Severity", "Finding severity")
        .value("INFO", Severity::Info, "Informational")
        .value("WARN", Severity::Warn, "Suspicious, needs review")
        .value("CRITICAL", Severity::Critical, "Known code-execution primitive")
        .export_values();

    // ArtifactClass enum
    py::enum_<ArtifactClass>(m, "ArtifactClass", "Kinds of scanned files")
        .value("SOURCE", ArtifactClass::Source)
        .value("NOTEBOOK", ArtifactClass::Notebook)
        .value("REQUIREMENTS", ArtifactClass::Requirements)
        .value("MODEL", ArtifactClass::Model)
        .export_values();

    // Locator
    py::class_<Locator>(m, "Locator", "Position of a finding inside an artifact")
        .def_readonly("entry", &Locator::entry)
        .def_readonly("offset", &Locator::offset)
        .def_readonly("line", &Locator::line)
        .def_readonly("column", &Locator::column)
        .def("__str__", &Locator::to_string)
        .def("__repr__", [](const Locator& loc) {
            return "Locator('" + loc.to_string() + "')";
        });

    // Finding
    py::class_<Finding>(m, "Finding", "One classified risk observation")
        .def_readonly("artifact_path", &Finding::artifact_path)
        .def_readonly("locator", &Finding::locator)
        .def_readonly("rule_id", &Finding::rule_id)
        .def_readonly("severity", &Finding::severity)
        .def_readonly("rationale", &Finding::rationale)
        .def_readonly("evidence", &Finding::evidence)
        .def("__repr__", [](const Finding& f) {
            return "Finding(" + f.rule_id + ", " + severity_name(f.severity) + ", '" +
                   f.artifact_path + "', " + f.locator.to_string() + ")";
        });

    // ScanOptions
    py::class_<ScanOptions>(m, "ScanOptions", "Limits and concurrency for a scan")
        .def(py::init<>())
        .def_readwrite("max_stream_bytes", &ScanOptions::max_stream_bytes)
        .def_readwrite("max_streams_per_artifact", &ScanOptions::max_streams_per_artifact)
        .def_readwrite("max_stack_depth", &ScanOptions::max_stack_depth)
        .def_readwrite("max_memo_entries", &ScanOptions::max_memo_entries)
        .def_readwrite("max_graph_nodes", &ScanOptions::max_graph_nodes)
        .def_readwrite("max_traversal_depth", &ScanOptions::max_traversal_depth)
        .def_readwrite("max_literal_preview", &ScanOptions::max_literal_preview)
        .def_readwrite("max_artifact_bytes", &ScanOptions::max_artifact_bytes)
        .def_readwrite("max_entry_bytes", &ScanOptions::max_entry_bytes)
        .def_readwrite("max_inflated_bytes", &ScanOptions::max_inflated_bytes)
        .def_readwrite("max_source_line", &ScanOptions::max_source_line)
        .def_readwrite("num_workers", &ScanOptions::num_workers)
        .def_readwrite("artifact_timeout_ms", &ScanOptions::artifact_timeout_ms)
        .def_readwrite("log_level", &ScanOptions::log_level)
        .def("validate", &ScanOptions::validate, "Return a list of validation errors");

    // Exceptions
    py::register_exception<SanityMLError>(m, "SanityMLError");
    py::register_exception<RuleLoadError>(m, "RuleLoadError");
    py::register_exception<OptionsError>(m, "OptionsError");
}
