#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../source/hurwitz.hpp"

namespace py = pybind11;
using namespace hurwitz;

namespace {

RouthConfig make_config(double epsilon, double zero_row_epsilon, bool normalize_leading) {
    RouthConfig config;
    config.epsilon           = epsilon;
    config.zero_row_epsilon  = zero_row_epsilon;
    config.normalize_leading = normalize_leading;
    return config;
}

// Python callers get an exception instead of an expected<>
RouthResult routh_hurwitz_or_throw(const Polynomial& coeffs, double epsilon, double zero_row_epsilon, bool normalize_leading) {
    auto result = routh_hurwitz(coeffs, make_config(epsilon, zero_row_epsilon, normalize_leading));
    if (!result) {
        throw result.error();
    }
    return std::move(*result);
}

}  // namespace

PYBIND11_MODULE(pyhurwitz, m) {
    m.doc() = "Python bindings for the Routh-Hurwitz stability criterion";

    py::register_exception<InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);

    // RouthConfig
    py::class_<RouthConfig>(m, "RouthConfig")
        .def(py::init(&make_config),
             py::arg("epsilon")           = 1e-6,
             py::arg("zero_row_epsilon")  = 1e-12,
             py::arg("normalize_leading") = true)
        .def_readwrite("epsilon", &RouthConfig::epsilon)
        .def_readwrite("zero_row_epsilon", &RouthConfig::zero_row_epsilon)
        .def_readwrite("normalize_leading", &RouthConfig::normalize_leading);

    // RouthResult
    py::class_<RouthResult>(m, "RouthResult")
        .def_property_readonly("order", &RouthResult::order)
        .def_property_readonly("coefficients", &RouthResult::coefficients)
        .def_property_readonly("table", &RouthResult::table)
        .def_property_readonly("row_labels", &RouthResult::row_labels)
        .def_property_readonly("first_column", &RouthResult::first_column)
        .def_property_readonly("rhp_poles", &RouthResult::rhp_poles)
        .def_property_readonly("is_stable", &RouthResult::is_stable)
        .def_property_readonly("notes", &RouthResult::notes)
        .def("to_string_table", &to_string_table, py::arg("precision") = 4, py::arg("col_width") = 10)
        .def("__str__", [](const RouthResult& r) { return display(r); })
        .def("__repr__", [](const RouthResult& r) {
            return fmt::format("RouthResult(order={}, is_stable={}, rhp_poles={})", r.order(), r.is_stable(), r.rhp_poles());
        });

    // GainSweepResult
    py::class_<GainSweepResult>(m, "GainSweepResult")
        .def_readonly("gains", &GainSweepResult::gains)
        .def_readonly("rhp_poles", &GainSweepResult::rhp_poles)
        .def_readonly("stable", &GainSweepResult::stable)
        .def_readonly("failed", &GainSweepResult::failed);

    m.def("routh_hurwitz",
          &routh_hurwitz_or_throw,
          py::arg("coeffs"),
          py::arg("epsilon")           = 1e-6,
          py::arg("zero_row_epsilon")  = 1e-12,
          py::arg("normalize_leading") = true,
          "Routh-Hurwitz table and stability verdict of a polynomial given highest power first. "
          "Raises InvalidInputError for an empty or all-zero coefficient list.");

    m.def("gain_sweep",
          &gain_sweep,
          py::arg("num"),
          py::arg("den"),
          py::arg("gains"),
          py::arg("config") = RouthConfig{},
          "Routh verdict of the unity feedback loop K*num/den for every gain K (evaluated in parallel).");

    m.def("stable_gain_ranges", &stable_gain_ranges, py::arg("sweep"));
    m.def("poly_to_string", &poly_to_string, py::arg("coeffs"), py::arg("var") = 's');
}
