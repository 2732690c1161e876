//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef MOLUTIL_PYTHON_CORE_MODULE_H_
#define MOLUTIL_PYTHON_CORE_MODULE_H_

#include <pybind11/pybind11.h>

#include "molutil/python/config.h"

namespace molutil {
namespace python_internal {
extern void bind_element(py::module &m);

extern void bind_formula(py::module &m);

extern void bind_chem(py::module &m);
}  // namespace python_internal
}  // namespace molutil

#endif /* MOLUTIL_PYTHON_CORE_MODULE_H_ */
