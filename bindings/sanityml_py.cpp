#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations
void bind_types(py::module_& m);
void bind_rules(py::module_& m);
void bind_scan(py::module_& m);

PYBIND11_MODULE(_sanityml, m) {
    m.doc() = "sanityml - static code-execution risk scanner for ML projects";

    bind_types(m);
    bind_rules(m);
    bind_scan(m);

    m.attr("__version__") = "0.1.0";
}
