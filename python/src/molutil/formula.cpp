//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/formula.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <pybind11/gil.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>

#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"
#include "molutil/python/config.h"
#include "molutil/python/core_module.h"
#include "molutil/python/exception.h"

namespace molutil {
namespace python_internal {
namespace {
EmpiricalFormula formula_of_structure(std::string_view structure,
                                      std::string_view format,
                                      std::string_view engine_name) {
  const ChemistryEngine *engine =
      value_or_throw(EngineRegistry::find_or_default(engine_name));

  absl::StatusOr<std::unique_ptr<Structure>> mol;
  {
    const py::gil_scoped_release release;
    mol = engine->parse(structure, format);
  }

  return formula_of(*value_or_throw(std::move(mol)));
}
}  // namespace

void bind_formula(py::module &m) {
  py::class_<EmpiricalFormula>(m, "EmpiricalFormula", R"doc(
    An empirical formula.

    Maps element symbols to (possibly fractional or negative) coefficients.
    Elements with zero coefficient are never stored.

    >>> from molutil import EmpiricalFormula
    >>> f = EmpiricalFormula("C6H12O6")
    >>> f["C"]
    6.0
    >>> str(f * 0.5)
    'C3H6O3'
  )doc")
      .def(py::init<>())
      .def(py::init([](std::string_view str) {
             return value_or_throw(EmpiricalFormula::from_string(str));
           }),
           py::arg("formula"), R"doc(
    Parse a formula such as ``C6H12O6``.

    :raises ValueError: If the formula is not valid.
  )doc")
      .def("__getitem__", &EmpiricalFormula::operator[], py::arg("element"))
      .def(
          "__setitem__",
          [](EmpiricalFormula &self, std::string_view element, double coef) {
            check_status(self.set(element, coef));
          },
          py::arg("element"), py::arg("coefficient"))
      .def("__delitem__",
           [](EmpiricalFormula &self, std::string_view element) {
             check_status(self.set(element, 0));
           })
      .def("__contains__", &EmpiricalFormula::contains)
      .def("__len__", &EmpiricalFormula::size)
      .def(
          "__iter__",
          [](const EmpiricalFormula &self) {
            return py::make_key_iterator(self.begin(), self.end());
          },
          py::keep_alive<0, 1>())
      .def(
          "items",
          [](const EmpiricalFormula &self) {
            return py::make_iterator(self.begin(), self.end());
          },
          py::keep_alive<0, 1>())
      .def_property_readonly(
          "molecular_weight",
          [](const EmpiricalFormula &self) {
            return value_or_throw(self.molecular_weight());
          },
          R"doc(
    :type: float

    The molecular weight (g/mol).

    :raises KeyError: If the formula contains an unknown element.
  )doc")
      .def(py::self + py::self)
      .def(py::self += py::self)
      .def(py::self - py::self)
      .def(py::self -= py::self)
      .def(py::self * double())
      .def(double() * py::self)
      .def(py::self *= double())
      .def(py::self / double())
      .def(py::self /= double())
      .def(py::self == py::self)
      .def(py::self != py::self)
      .def("__str__", &EmpiricalFormula::to_string)
      .def("__repr__", [](const EmpiricalFormula &self) {
        return absl::StrCat("<EmpiricalFormula ", self.to_string(), ">");
      });

  m.def("formula_of", formula_of_structure, py::arg("structure"),
        py::arg("format"), py::arg("engine") = "", R"doc(
    Calculate the empirical formula of a structure, including implicit
    hydrogens.

    :param structure: The structure.
    :param format: The format of ``structure`` (e.g. ``"smiles"``).
    :param engine: The chemistry engine. Defaults to the first registered one.
    :raises ValueError: If the structure could not be parsed.
  )doc");
}
}  // namespace python_internal
}  // namespace molutil
