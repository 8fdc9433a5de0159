#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sanityml/discovery.hpp"
#include "sanityml/scan_pool.hpp"
#include "sanityml/scanner.hpp"

namespace py = pybind11;
using namespace sanityml;

namespace {

std::shared_ptr<const rules::RuleTable> rules_or_default(std::shared_ptr<rules::RuleTable> rules) {
    if (rules) {
        return rules;
    }
    return rules::RuleTable::defaults();
}

} // anonymous namespace

void bind_scan(py::module_& m) {
    m.def("scan_bytes",
          [](py::bytes data, const std::string& extension, ArtifactClass kind,
             const std::string& path, std::shared_ptr<rules::RuleTable> rules,
             const ScanOptions& options) {
              std::string buffer = data;
              ArtifactScanner scanner(rules_or_default(std::move(rules)), options);

              Artifact artifact;
              artifact.path = path;
              artifact.kind = kind;
              artifact.extension = extension;
              artifact.bytes = ByteView(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());

              py::gil_scoped_release release;
              return scanner.scan(artifact).findings;
          },
          py::arg("data"), py::arg("extension") = ".pkl", py::arg("kind") = ArtifactClass::Model,
          py::arg("path") = "<bytes>", py::arg("rules") = nullptr,
          py::arg("options") = ScanOptions(),
          "Scan an in-memory artifact and return its findings");

    m.def("scan_file",
          [](const std::string& path, std::shared_ptr<rules::RuleTable> rules,
             const ScanOptions& options) {
              auto kind = classify_path(path);
              ScanPool pool(rules_or_default(std::move(rules)), options);

              py::gil_scoped_release release;
              return pool.scan_file(ScanTarget{path, kind.value_or(ArtifactClass::Model)}).findings;
          },
          py::arg("path"), py::arg("rules") = nullptr, py::arg("options") = ScanOptions(),
          "Scan one file; the kind is taken from its name");

    m.def("scan_directory",
          [](const std::string& root, std::shared_ptr<rules::RuleTable> rules,
             const ScanOptions& options) {
              Discovery found = discover_targets(root);
              ScanPool pool(rules_or_default(std::move(rules)), options);

              py::gil_scoped_release release;
              return merge_findings(pool.run(found.targets()));
          },
          py::arg("root"), py::arg("rules") = nullptr, py::arg("options") = ScanOptions(),
          "Discover and scan every supported file under a directory");
}
