//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/element.h"

#include <string>
#include <string_view>

#include <absl/strings/str_cat.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>

#include "molutil/python/config.h"
#include "molutil/python/core_module.h"

namespace molutil {
namespace python_internal {
namespace {
const Element &element_from_symbol_or_name(std::string_view symbol_or_name) {
  const Element *elem = kPt.find_element(symbol_or_name);
  if (elem == nullptr) {
    elem = kPt.find_element_of_name(symbol_or_name);
    if (elem == nullptr)
      throw py::key_error(std::string(symbol_or_name));
  }

  return *elem;
}

const Element &element_from_atomic_number(int atomic_number) {
  const Element *elem = kPt.find_element(atomic_number);
  if (elem == nullptr)
    throw py::key_error(absl::StrCat(atomic_number));
  return *elem;
}
}  // namespace

void bind_element(py::module &m) {
  PyProxyCls<Element>(m, "Element", R"doc(
    An element.

    All instances of this class are immutable and singleton; compare them with
    the ``is`` operator.
  )doc")
      .def_property_readonly("atomic_number", &Element::atomic_number,
                             rvp::automatic, ":type: int")
      .def_property_readonly("symbol", &Element::symbol, rvp::automatic,
                             ":type: str")
      .def_property_readonly("name", &Element::name, rvp::automatic,
                             ":type: str")
      .def_property_readonly("atomic_weight", &Element::atomic_weight,
                             rvp::automatic, ":type: float")
      .def("__repr__", [](const Element &elem) {
        return absl::StrCat("<Element ", elem.symbol(), ">");
      });

  const py::arg an("atomic_number"), asn("atomic_symbol_or_name");

  PyProxyCls<PeriodicTable>(m, "PeriodicTable", R"doc(
The periodic table of elements.

Access the singleton via :data:`molutil.periodic_table`. The table maps atomic
numbers, atomic symbols and atomic names, tried in this order, to
:class:`Element` objects:

>>> from molutil import periodic_table
>>> periodic_table["C"].atomic_weight
12.011

Symbols and names are accepted in Titlecase, UPPERCASE or lowercase. A
:exc:`KeyError` is raised for unknown elements.
)doc")
      .def_static("get", &PeriodicTable::get, rvp::reference)
      .def_static("__contains__",
                  py::overload_cast<int>(PeriodicTable::has_element), an)
      .def_static(
          "__contains__",
          [](std::string_view arg) {
            return kPt.has_element(arg) || kPt.has_element_of_name(arg);
          },
          asn)
      .def_static("__getitem__", element_from_atomic_number, rvp::reference,
                  an)
      .def_static("__getitem__", element_from_symbol_or_name, rvp::reference,
                  asn)
      .def_static("__len__", []() { return PeriodicTable::kElementCount_; })
      .def_static("__iter__", []() {
        return py::make_iterator(kPt.begin(), kPt.end(), rvp::reference);
      });

  m.attr("periodic_table") = &kPt;
}
}  // namespace python_internal
}  // namespace molutil
