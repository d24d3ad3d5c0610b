// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>
#include "linopt/analyzer.hpp"
#include "linopt/gadgets.hpp"
#include "linopt/unitary.hpp"

namespace py = pybind11;
using namespace linopt;

static std::vector<std::vector<c64>> to_rows(const Unitary& U){
  std::vector<std::vector<c64>> rows(U.rows, std::vector<c64>(U.cols));
  for (std::size_t i=0;i<U.rows;++i)
    for (std::size_t j=0;j<U.cols;++j) rows[i][j] = U(i,j);
  return rows;
}

static Unitary from_rows(const std::vector<std::vector<c64>>& rows){
  Unitary U(rows.size(), rows.size());
  for (std::size_t i=0;i<rows.size();++i){
    if (rows[i].size() != rows.size()) throw InputError("Unitary must be square");
    for (std::size_t j=0;j<rows.size();++j) U(i,j) = rows[i][j];
  }
  return U;
}

static PermanentMethod method_of(const std::string& s){
  PermanentMethod m;
  if (!parse_method(s, m)) throw InputError("Unknown method '" + s + "'");
  return m;
}

PYBIND11_MODULE(linopt_python, m){
  py::register_exception<ConfigurationError>(m, "ConfigurationError");
  py::register_exception<ValidationError>(m, "ValidationError");
  py::register_exception<InputError>(m, "InputError");

  py::enum_<BSConvention>(m, "BSConvention")
    .value("Rx", BSConvention::Rx)
    .value("Ry", BSConvention::Ry)
    .value("H", BSConvention::H);

  py::class_<ComponentSpec> spec(m, "ComponentSpec");
  py::enum_<ComponentSpec::Kind>(spec, "Kind")
    .value("BeamSplitter", ComponentSpec::Kind::BeamSplitter)
    .value("PhaseShifter", ComponentSpec::Kind::PhaseShifter);
  spec
    .def(py::init([](ComponentSpec::Kind kind, std::vector<int> modes, double angle, BSConvention conv, std::vector<double> phases){
      return ComponentSpec{kind, std::move(modes), angle, conv, std::move(phases)};
    }), py::arg("kind"), py::arg("modes"), py::arg("angle"),
        py::arg("convention") = BSConvention::Rx, py::arg("phases") = std::vector<double>{})
    .def_readwrite("kind", &ComponentSpec::kind)
    .def_readwrite("modes", &ComponentSpec::modes)
    .def_readwrite("angle", &ComponentSpec::angle)
    .def_readwrite("convention", &ComponentSpec::convention)
    .def_readwrite("phases", &ComponentSpec::phases);

  py::class_<Circuit>(m, "Circuit")
    .def_property_readonly("modes", &Circuit::modes)
    .def("__len__", &Circuit::size)
    .def("__str__", &to_circuit_text);

  m.def("build_circuit", &build_circuit, py::arg("modes"), py::arg("specs"));
  m.def("parse_circuit", [](const std::string& text){
    std::string err; auto c = parse_circuit_string(text, err);
    if (!c) throw ConfigurationError(err);
    return *c;
  }, py::arg("text"));
  m.def("order_finding_demo", []{ return gadgets::order_finding_demo().circuit; });
  m.def("unitary_of", [](const Circuit& c){ return to_rows(unitary_of(c)); });
  m.def("amplitude", [](const std::vector<std::vector<c64>>& U, const FockState& in, const FockState& out, const std::string& method){
    return amplitude(from_rows(U), in, out, method_of(method));
  }, py::arg("unitary"), py::arg("input"), py::arg("output"), py::arg("method") = "ryser");

  py::class_<Encoding>(m, "Encoding")
    .def(py::init<int, std::vector<std::pair<int,int>>, std::vector<int>>())
    .def("to_fock", &Encoding::to_fock)
    .def("to_qubit", &Encoding::to_qubit);

  py::class_<TableEntry>(m, "TableEntry")
    .def_readonly("input", &TableEntry::input)
    .def_readonly("output", &TableEntry::output)
    .def_readonly("valid", &TableEntry::valid)
    .def_readonly("error", &TableEntry::error)
    .def_property_readonly("probability", [](const TableEntry& e) -> py::object {
      if (!e.valid) return py::none();
      return py::float_(e.probability);
    });

  py::class_<ProbabilityTable>(m, "ProbabilityTable")
    .def_property_readonly("entries", &ProbabilityTable::entries)
    .def("__len__", &ProbabilityTable::size)
    .def("find", &ProbabilityTable::find, py::return_value_policy::reference_internal)
    .def("row_total", &ProbabilityTable::row_total)
    .def("invalid_count", &ProbabilityTable::invalid_count);

  m.def("distribution", [](const Circuit& c, const std::vector<std::pair<std::string,FockState>>& ins,
                           const std::vector<std::pair<std::string,FockState>>& outs, const std::string& method, int threads){
    std::vector<LabeledState> li, lo;
    for (const auto& [l, f] : ins) li.push_back({l, f});
    for (const auto& [l, f] : outs) lo.push_back({l, f});
    AnalyzerOptions ao; ao.method = method_of(method); ao.threads = threads;
    return distribution(c, li, lo, ao);
  }, py::arg("circuit"), py::arg("inputs"), py::arg("outputs"), py::arg("method") = "ryser", py::arg("threads") = 0);
}
