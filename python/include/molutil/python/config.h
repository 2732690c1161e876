//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_PYTHON_CONFIG_H_
#define MOLUTIL_PYTHON_CONFIG_H_

#include <memory>

#include <pybind11/pybind11.h>

#ifndef MOLUTIL_PYTHON_MODULE_NAME
#error "MOLUTIL_PYTHON_MODULE_NAME is not defined"
#endif

#define MOLUTIL_PYTHON_MODULE(m) PYBIND11_MODULE(MOLUTIL_PYTHON_MODULE_NAME, m)

namespace molutil {
namespace python_internal {
// NOLINTNEXTLINE(misc-unused-alias-decls)
namespace py = pybind11;

using rvp = py::return_value_policy;

// Bindings for objects owned by the C++ side (e.g. the periodic table)
template <class CppType, class... Args>
using PyProxyCls =
    py::class_<CppType, std::unique_ptr<CppType, py::nodelete>, Args...>;
}  // namespace python_internal
}  // namespace molutil

#endif /* MOLUTIL_PYTHON_CONFIG_H_ */
